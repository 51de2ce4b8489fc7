#pragma once

#include "forecast/sync/v1.hpp"
#include "service_context.hpp"

namespace forecast::service {

class SyncAdminService {
 public:
  explicit SyncAdminService(ServiceContext ctx);

  forecast::sync::v1::RunSyncCycleResponse RunSyncCycle(const forecast::sync::v1::RunSyncCycleRequest& req);

  forecast::sync::v1::GetSyncStatusResponse GetSyncStatus(const forecast::sync::v1::GetSyncStatusRequest& req);

  forecast::sync::v1::ListConflictsResponse ListConflicts(const forecast::sync::v1::ListConflictsRequest& req);

  forecast::sync::v1::ResolveConflictsResponse ResolveConflicts(const forecast::sync::v1::ResolveConflictsRequest& req);

  forecast::sync::v1::RequeueFailedResponse RequeueFailed(const forecast::sync::v1::RequeueFailedRequest& req);

  forecast::sync::v1::RunRetentionResponse RunRetention(const forecast::sync::v1::RunRetentionRequest& req);

  forecast::sync::v1::GetRetentionStatsResponse GetRetentionStats(const forecast::sync::v1::GetRetentionStatsRequest& req);

  forecast::sync::v1::GetScheduleStatusResponse GetScheduleStatus(const forecast::sync::v1::GetScheduleStatusRequest& req);

  forecast::sync::v1::SetJobEnabledResponse SetJobEnabled(const forecast::sync::v1::SetJobEnabledRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace forecast::service
