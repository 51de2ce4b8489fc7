#include "mirror_service.hpp"

#include "internal/core/delta_manager.hpp"
#include "internal/core/mirror_store.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/time.hpp"

namespace forecast::service {

using namespace forecast::sync::v1;

namespace {

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

} // namespace

MirrorService::MirrorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetMergedViewsResponse MirrorService::GetMergedViews(const GetMergedViewsRequest& req) {
  return ObserveRpc("MirrorService.GetMergedViews", req.organization_id(), [&] {
    GetMergedViewsResponse resp;
    for (const auto& view : ctx_.mirrors->GetMergedViews(req.organization_id(), FromProto(req.filter()), NonEmpty(req.user_id()))) {
      *resp.add_views() = ToProto(view);
    }
    return resp;
  });
}

GetCountResponse MirrorService::GetCount(const GetCountRequest& req) {
  return ObserveRpc("MirrorService.GetCount", req.organization_id(), [&] {
    GetCountResponse resp;
    resp.set_count(ctx_.mirrors->GetCount(req.organization_id(), FromProto(req.filter())));
    return resp;
  });
}

SaveDraftResponse MirrorService::SaveDraft(const SaveDraftRequest& req) {
  return ObserveRpc("MirrorService.SaveDraft", req.organization_id(), [&] {
    const auto record = ctx_.deltas->SaveDraft(req.organization_id(), req.user_id(), req.entity_id(), model::FromProto(req.delta()),
                                               NonEmpty(req.session_id()), NonEmpty(req.change_reason()));
    SaveDraftResponse resp;
    *resp.mutable_modification() = ToProto(record, req.entity_id(), req.user_id());
    return resp;
  });
}

CommitDraftsResponse MirrorService::CommitDrafts(const CommitDraftsRequest& req) {
  return ObserveRpc("MirrorService.CommitDrafts", req.selector().organization_id(), [&] {
    CommitDraftsResponse resp;
    resp.set_committed(ctx_.deltas->CommitDrafts(FromProto(req.selector())));
    return resp;
  });
}

DiscardDraftsResponse MirrorService::DiscardDrafts(const DiscardDraftsRequest& req) {
  return ObserveRpc("MirrorService.DiscardDrafts", req.selector().organization_id(), [&] {
    DiscardDraftsResponse resp;
    resp.set_discarded(ctx_.deltas->DiscardDrafts(FromProto(req.selector())));
    return resp;
  });
}

GetDraftCountResponse MirrorService::GetDraftCount(const GetDraftCountRequest& req) {
  return ObserveRpc("MirrorService.GetDraftCount", req.organization_id(), [&] {
    GetDraftCountResponse resp;
    resp.set_count(ctx_.deltas->GetDraftCount(req.organization_id(), req.user_id()));
    return resp;
  });
}

GetModificationHistoryResponse MirrorService::GetModificationHistory(const GetModificationHistoryRequest& req) {
  return ObserveRpc("MirrorService.GetModificationHistory", req.organization_id(), [&] {
    GetModificationHistoryResponse resp;
    for (const auto& entry : ctx_.deltas->GetModificationHistory(req.organization_id(), req.entity_id())) {
      *resp.add_modifications() = ToProto(entry.record, entry.entity_id, entry.username);
    }
    return resp;
  });
}

PromoteMirrorResponse MirrorService::PromoteMirror(const PromoteMirrorRequest& req) {
  return ObserveRpc("MirrorService.PromoteMirror", req.organization_id(), [&] {
    std::optional<uint64_t> remote_version;
    if (req.remote_version() > 0) {
      remote_version = req.remote_version();
    }
    const auto changed_by = req.changed_by().empty() ? std::string("upstream") : req.changed_by();

    const auto result =
        ctx_.mirrors->PromoteMirror(req.organization_id(), req.entity_id(), model::FromProto(req.document()), remote_version, changed_by);

    PromoteMirrorResponse resp;
    resp.set_mirror_id(result.mirror_id);
    resp.set_version(result.version);
    resp.set_created(result.created);
    return resp;
  });
}

IngestRawRecordsResponse MirrorService::IngestRawRecords(const IngestRawRecordsRequest& req) {
  return ObserveRpc("MirrorService.IngestRawRecords", req.organization_id(), [&] {
    std::vector<core::RawPayload> payloads;
    payloads.reserve(static_cast<std::size_t>(req.records_size()));
    for (const auto& record : req.records()) {
      core::RawPayload payload;
      payload.payload = record.payload();
      if (record.has_ingested_at()) {
        payload.ingested_at_ms = util::UnixMillisFromProto(record.ingested_at());
      }
      payloads.push_back(std::move(payload));
    }

    IngestRawRecordsResponse resp;
    for (auto& id : ctx_.mirrors->IngestRaw(req.organization_id(), payloads)) {
      resp.add_ids(std::move(id));
    }
    return resp;
  });
}

GetMirrorHistoryResponse MirrorService::GetMirrorHistory(const GetMirrorHistoryRequest& req) {
  return ObserveRpc("MirrorService.GetMirrorHistory", req.organization_id(), [&] {
    GetMirrorHistoryResponse resp;
    for (const auto& snapshot : ctx_.mirrors->GetMirrorHistory(req.organization_id(), req.entity_id())) {
      *resp.add_snapshots() = ToProto(snapshot);
    }
    return resp;
  });
}

} // namespace forecast::service
