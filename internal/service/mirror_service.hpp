#pragma once

#include "forecast/sync/v1.hpp"
#include "service_context.hpp"

namespace forecast::service {

class MirrorService {
 public:
  explicit MirrorService(ServiceContext ctx);

  forecast::sync::v1::GetMergedViewsResponse GetMergedViews(const forecast::sync::v1::GetMergedViewsRequest& req);

  forecast::sync::v1::GetCountResponse GetCount(const forecast::sync::v1::GetCountRequest& req);

  forecast::sync::v1::SaveDraftResponse SaveDraft(const forecast::sync::v1::SaveDraftRequest& req);

  forecast::sync::v1::CommitDraftsResponse CommitDrafts(const forecast::sync::v1::CommitDraftsRequest& req);

  forecast::sync::v1::DiscardDraftsResponse DiscardDrafts(const forecast::sync::v1::DiscardDraftsRequest& req);

  forecast::sync::v1::GetDraftCountResponse GetDraftCount(const forecast::sync::v1::GetDraftCountRequest& req);

  forecast::sync::v1::GetModificationHistoryResponse GetModificationHistory(const forecast::sync::v1::GetModificationHistoryRequest& req);

  forecast::sync::v1::PromoteMirrorResponse PromoteMirror(const forecast::sync::v1::PromoteMirrorRequest& req);

  forecast::sync::v1::IngestRawRecordsResponse IngestRawRecords(const forecast::sync::v1::IngestRawRecordsRequest& req);

  forecast::sync::v1::GetMirrorHistoryResponse GetMirrorHistory(const forecast::sync::v1::GetMirrorHistoryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace forecast::service
