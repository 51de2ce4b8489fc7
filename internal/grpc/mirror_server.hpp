#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "forecast/sync/v1.hpp"
#include "forecast/sync/v1/mirror_service.grpc.pb.h"
#include "internal/service/mirror_service.hpp"

namespace forecast::grpc {

// Thin transport adapter over MirrorService.
class MirrorServer final : public forecast::sync::v1::ForecastMirrorService::Service {
 public:
  explicit MirrorServer(std::shared_ptr<forecast::service::MirrorService> svc);

  ::grpc::Status GetMergedViews(::grpc::ServerContext*, const forecast::sync::v1::GetMergedViewsRequest*, forecast::sync::v1::GetMergedViewsResponse*) override;

  ::grpc::Status GetCount(::grpc::ServerContext*, const forecast::sync::v1::GetCountRequest*, forecast::sync::v1::GetCountResponse*) override;

  ::grpc::Status SaveDraft(::grpc::ServerContext*, const forecast::sync::v1::SaveDraftRequest*, forecast::sync::v1::SaveDraftResponse*) override;

  ::grpc::Status CommitDrafts(::grpc::ServerContext*, const forecast::sync::v1::CommitDraftsRequest*, forecast::sync::v1::CommitDraftsResponse*) override;

  ::grpc::Status DiscardDrafts(::grpc::ServerContext*, const forecast::sync::v1::DiscardDraftsRequest*, forecast::sync::v1::DiscardDraftsResponse*) override;

  ::grpc::Status GetDraftCount(::grpc::ServerContext*, const forecast::sync::v1::GetDraftCountRequest*, forecast::sync::v1::GetDraftCountResponse*) override;

  ::grpc::Status GetModificationHistory(::grpc::ServerContext*, const forecast::sync::v1::GetModificationHistoryRequest*, forecast::sync::v1::GetModificationHistoryResponse*) override;

  ::grpc::Status PromoteMirror(::grpc::ServerContext*, const forecast::sync::v1::PromoteMirrorRequest*, forecast::sync::v1::PromoteMirrorResponse*) override;

  ::grpc::Status IngestRawRecords(::grpc::ServerContext*, const forecast::sync::v1::IngestRawRecordsRequest*, forecast::sync::v1::IngestRawRecordsResponse*) override;

  ::grpc::Status GetMirrorHistory(::grpc::ServerContext*, const forecast::sync::v1::GetMirrorHistoryRequest*, forecast::sync::v1::GetMirrorHistoryResponse*) override;

 private:
  std::shared_ptr<forecast::service::MirrorService> service_;
};

} // namespace forecast::grpc
