#include "mirror_server.hpp"

#include "grpc_error.hpp"

namespace forecast::grpc {

using namespace forecast::sync::v1;

MirrorServer::MirrorServer(std::shared_ptr<forecast::service::MirrorService> svc) : service_(std::move(svc)) {
}

::grpc::Status MirrorServer::GetMergedViews(::grpc::ServerContext*, const GetMergedViewsRequest* req, GetMergedViewsResponse* resp) {
  try {
    *resp = service_->GetMergedViews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::GetCount(::grpc::ServerContext*, const GetCountRequest* req, GetCountResponse* resp) {
  try {
    *resp = service_->GetCount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::SaveDraft(::grpc::ServerContext*, const SaveDraftRequest* req, SaveDraftResponse* resp) {
  try {
    *resp = service_->SaveDraft(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::CommitDrafts(::grpc::ServerContext*, const CommitDraftsRequest* req, CommitDraftsResponse* resp) {
  try {
    *resp = service_->CommitDrafts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::DiscardDrafts(::grpc::ServerContext*, const DiscardDraftsRequest* req, DiscardDraftsResponse* resp) {
  try {
    *resp = service_->DiscardDrafts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::GetDraftCount(::grpc::ServerContext*, const GetDraftCountRequest* req, GetDraftCountResponse* resp) {
  try {
    *resp = service_->GetDraftCount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::GetModificationHistory(::grpc::ServerContext*, const GetModificationHistoryRequest* req, GetModificationHistoryResponse* resp) {
  try {
    *resp = service_->GetModificationHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::PromoteMirror(::grpc::ServerContext*, const PromoteMirrorRequest* req, PromoteMirrorResponse* resp) {
  try {
    *resp = service_->PromoteMirror(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::IngestRawRecords(::grpc::ServerContext*, const IngestRawRecordsRequest* req, IngestRawRecordsResponse* resp) {
  try {
    *resp = service_->IngestRawRecords(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MirrorServer::GetMirrorHistory(::grpc::ServerContext*, const GetMirrorHistoryRequest* req, GetMirrorHistoryResponse* resp) {
  try {
    *resp = service_->GetMirrorHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace forecast::grpc
