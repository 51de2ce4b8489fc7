#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "forecast/sync/v1.hpp"
#include "forecast/sync/v1/sync_admin_service.grpc.pb.h"
#include "internal/service/sync_admin_service.hpp"

namespace forecast::grpc {

// Thin transport adapter over the operator service.
class SyncAdminServer final : public forecast::sync::v1::SyncAdminService::Service {
 public:
  explicit SyncAdminServer(std::shared_ptr<forecast::service::SyncAdminService> svc);

  ::grpc::Status RunSyncCycle(::grpc::ServerContext*, const forecast::sync::v1::RunSyncCycleRequest*, forecast::sync::v1::RunSyncCycleResponse*) override;

  ::grpc::Status GetSyncStatus(::grpc::ServerContext*, const forecast::sync::v1::GetSyncStatusRequest*, forecast::sync::v1::GetSyncStatusResponse*) override;

  ::grpc::Status ListConflicts(::grpc::ServerContext*, const forecast::sync::v1::ListConflictsRequest*, forecast::sync::v1::ListConflictsResponse*) override;

  ::grpc::Status ResolveConflicts(::grpc::ServerContext*, const forecast::sync::v1::ResolveConflictsRequest*, forecast::sync::v1::ResolveConflictsResponse*) override;

  ::grpc::Status RequeueFailed(::grpc::ServerContext*, const forecast::sync::v1::RequeueFailedRequest*, forecast::sync::v1::RequeueFailedResponse*) override;

  ::grpc::Status RunRetention(::grpc::ServerContext*, const forecast::sync::v1::RunRetentionRequest*, forecast::sync::v1::RunRetentionResponse*) override;

  ::grpc::Status GetRetentionStats(::grpc::ServerContext*, const forecast::sync::v1::GetRetentionStatsRequest*, forecast::sync::v1::GetRetentionStatsResponse*) override;

  ::grpc::Status GetScheduleStatus(::grpc::ServerContext*, const forecast::sync::v1::GetScheduleStatusRequest*, forecast::sync::v1::GetScheduleStatusResponse*) override;

  ::grpc::Status SetJobEnabled(::grpc::ServerContext*, const forecast::sync::v1::SetJobEnabledRequest*, forecast::sync::v1::SetJobEnabledResponse*) override;

 private:
  std::shared_ptr<forecast::service::SyncAdminService> service_;
};

} // namespace forecast::grpc
