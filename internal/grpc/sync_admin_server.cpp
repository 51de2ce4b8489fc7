#include "sync_admin_server.hpp"

#include "grpc_error.hpp"

namespace forecast::grpc {

using namespace forecast::sync::v1;

SyncAdminServer::SyncAdminServer(std::shared_ptr<forecast::service::SyncAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status SyncAdminServer::RunSyncCycle(::grpc::ServerContext*, const RunSyncCycleRequest* req, RunSyncCycleResponse* resp) {
  try {
    *resp = service_->RunSyncCycle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::GetSyncStatus(::grpc::ServerContext*, const GetSyncStatusRequest* req, GetSyncStatusResponse* resp) {
  try {
    *resp = service_->GetSyncStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::ListConflicts(::grpc::ServerContext*, const ListConflictsRequest* req, ListConflictsResponse* resp) {
  try {
    *resp = service_->ListConflicts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::ResolveConflicts(::grpc::ServerContext*, const ResolveConflictsRequest* req, ResolveConflictsResponse* resp) {
  try {
    *resp = service_->ResolveConflicts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::RequeueFailed(::grpc::ServerContext*, const RequeueFailedRequest* req, RequeueFailedResponse* resp) {
  try {
    *resp = service_->RequeueFailed(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::RunRetention(::grpc::ServerContext*, const RunRetentionRequest* req, RunRetentionResponse* resp) {
  try {
    *resp = service_->RunRetention(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::GetRetentionStats(::grpc::ServerContext*, const GetRetentionStatsRequest* req, GetRetentionStatsResponse* resp) {
  try {
    *resp = service_->GetRetentionStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::GetScheduleStatus(::grpc::ServerContext*, const GetScheduleStatusRequest* req, GetScheduleStatusResponse* resp) {
  try {
    *resp = service_->GetScheduleStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SyncAdminServer::SetJobEnabled(::grpc::ServerContext*, const SetJobEnabledRequest* req, SetJobEnabledResponse* resp) {
  try {
    *resp = service_->SetJobEnabled(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace forecast::grpc
