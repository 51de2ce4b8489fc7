#include "sync_admin_service.hpp"

#include "internal/core/conflict_resolver.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forecast::service {

using namespace forecast::sync::v1;

SyncAdminService::SyncAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RunSyncCycleResponse SyncAdminService::RunSyncCycle(const RunSyncCycleRequest&) {
  return ObserveRpc("SyncAdminService.RunSyncCycle", "", [&] {
    RunSyncCycleResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.sync_worker->RunCycle());
    return resp;
  });
}

GetSyncStatusResponse SyncAdminService::GetSyncStatus(const GetSyncStatusRequest& req) {
  return ObserveRpc("SyncAdminService.GetSyncStatus", req.organization_id(), [&] {
    const auto status = ctx_.sync_worker->GetSyncStatus(req.organization_id());

    GetSyncStatusResponse resp;
    for (const auto& [state, count] : status.counts) {
      auto* entry = resp.add_counts();
      entry->set_state(ToProto(state));
      entry->set_count(count);
    }
    for (const auto& failed : status.failed) {
      *resp.add_failed() = ToProto(failed.record, failed.entity_id, failed.username);
    }
    return resp;
  });
}

ListConflictsResponse SyncAdminService::ListConflicts(const ListConflictsRequest& req) {
  return ObserveRpc("SyncAdminService.ListConflicts", req.organization_id(), [&] {
    ListConflictsResponse resp;
    for (const auto& conflict : ctx_.sync_worker->ListConflicts(req.organization_id())) {
      *resp.add_conflicts() = ToProto(conflict);
    }
    return resp;
  });
}

ResolveConflictsResponse SyncAdminService::ResolveConflicts(const ResolveConflictsRequest& req) {
  return ObserveRpc("SyncAdminService.ResolveConflicts", req.organization_id(), [&] {
    std::vector<core::FieldResolution> resolutions;
    resolutions.reserve(static_cast<std::size_t>(req.resolutions_size()));
    for (const auto& resolution : req.resolutions()) {
      resolutions.push_back(FromProto(resolution));
    }

    const auto outcome = ctx_.resolver->ResolveConflicts(req.organization_id(), req.modification_id(), resolutions, req.resolved_by());

    ResolveConflictsResponse resp;
    *resp.mutable_modification() = ToProto(outcome.modification, outcome.entity_id, outcome.modification.user_id);
    return resp;
  });
}

RequeueFailedResponse SyncAdminService::RequeueFailed(const RequeueFailedRequest& req) {
  return ObserveRpc("SyncAdminService.RequeueFailed", req.organization_id(), [&] {
    const std::vector<std::string> ids(req.modification_ids().begin(), req.modification_ids().end());

    RequeueFailedResponse resp;
    resp.set_requeued(ctx_.sync_worker->RequeueFailed(req.organization_id(), ids));
    return resp;
  });
}

RunRetentionResponse SyncAdminService::RunRetention(const RunRetentionRequest& req) {
  return ObserveRpc("SyncAdminService.RunRetention", "", [&] {
    std::optional<bool> dry_run;
    if (req.dry_run()) {
      dry_run = true;
    }

    RunRetentionResponse resp;
    *resp.mutable_summary() = ToProto(ctx_.retention->Run({}, dry_run));
    return resp;
  });
}

GetRetentionStatsResponse SyncAdminService::GetRetentionStats(const GetRetentionStatsRequest&) {
  return ObserveRpc("SyncAdminService.GetRetentionStats", "", [&] {
    const auto stats = ctx_.retention->GetRetentionStats();

    GetRetentionStatsResponse resp;
    resp.set_eligible(stats.eligible);
    resp.set_total(stats.total);
    if (stats.total > 0) {
      *resp.mutable_oldest() = util::TimestampFromUnixMillis(stats.oldest_ingest_ms);
      *resp.mutable_newest() = util::TimestampFromUnixMillis(stats.newest_ingest_ms);
    }
    *resp.mutable_cutoff() = util::TimestampFromUnixMillis(stats.cutoff_ms);
    resp.set_retention_days(stats.retention_days);
    return resp;
  });
}

GetScheduleStatusResponse SyncAdminService::GetScheduleStatus(const GetScheduleStatusRequest&) {
  return ObserveRpc("SyncAdminService.GetScheduleStatus", "", [&] {
    GetScheduleStatusResponse resp;
    if (ctx_.scheduler) {
      for (const auto& job : ctx_.scheduler->Jobs()) {
        *resp.add_jobs() = ToProto(job->Status());
      }
    }
    return resp;
  });
}

SetJobEnabledResponse SyncAdminService::SetJobEnabled(const SetJobEnabledRequest& req) {
  return ObserveRpc("SyncAdminService.SetJobEnabled", "", [&] {
    auto job = ctx_.scheduler ? ctx_.scheduler->Find(req.name()) : nullptr;
    if (!job) {
      throw util::NotFound("job " + req.name());
    }
    job->SetEnabled(req.enabled());

    SetJobEnabledResponse resp;
    *resp.mutable_job() = ToProto(job->Status());
    return resp;
  });
}

} // namespace forecast::service
