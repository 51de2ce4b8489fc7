#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "forecast/sync/v1.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/mirror_server.hpp"
#include "internal/grpc/sync_admin_server.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/service/mirror_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/sync_admin_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture.hpp"

namespace {

using forecast::testing::kOrg;
namespace v1 = forecast::sync::v1;

forecast::service::ServiceContext BuildServiceContext(forecast::testing::Fixture& fx) {
  forecast::service::ServiceContext ctx;
  ctx.mirrors     = fx.mirrors;
  ctx.deltas      = fx.deltas;
  ctx.resolver    = fx.resolver;
  ctx.sync_worker = fx.worker;
  ctx.retention   = std::make_shared<forecast::retention::RetentionManager>(fx.repository, nullptr, fx.clock, forecast::retention::RetentionOptions{});
  ctx.scheduler   = std::make_shared<forecast::runtime::JobScheduler>();
  return ctx;
}

void TestExceptionMapping() {
  using namespace forecast::util;
  using forecast::grpc::ToStatus;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(ConfigurationError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestValidationErrorsRideInMessage() {
  const forecast::util::ValidationFailed failure("delta rejected", {{"monthlyRate", "monthlyRate must be non-negative", "INVALID_VALUE"},
                                                                    {"forecastEnd", "forecastEnd must not precede forecastStart", "DATE_ORDER"}});
  const auto status = forecast::grpc::ToStatus(failure);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() ==
         "delta rejected: monthlyRate: monthlyRate must be non-negative (INVALID_VALUE); forecastEnd: forecastEnd must not precede "
         "forecastStart (DATE_ORDER)");
}

void TestMirrorServerReportsStatusCodes() {
  forecast::testing::Fixture fx;
  auto                       ctx = BuildServiceContext(fx);
  forecast::grpc::MirrorServer server(std::make_shared<forecast::service::MirrorService>(ctx));
  ::grpc::ServerContext        grpc_ctx;

  v1::SaveDraftRequest save;
  save.set_organization_id(kOrg);
  save.set_user_id("alice");
  save.set_entity_id("missing");
  (*save.mutable_delta()->mutable_fields())["monthlyRate"].set_number_value(1.0);
  v1::SaveDraftResponse save_resp;
  assert(server.SaveDraft(&grpc_ctx, &save, &save_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::PromoteMirrorRequest promote;
  promote.set_organization_id(kOrg);
  promote.set_entity_id("E-1");
  *promote.mutable_document() = forecast::model::ToProto(forecast::testing::EquipmentDoc("Acme", 100.0));
  v1::PromoteMirrorResponse promote_resp;
  assert(server.PromoteMirror(&grpc_ctx, &promote, &promote_resp).ok());
  assert(promote_resp.version() == 1);

  // Same version again is stale.
  promote.set_remote_version(1);
  assert(server.PromoteMirror(&grpc_ctx, &promote, &promote_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  save.set_entity_id("E-1");
  (*save.mutable_delta()->mutable_fields())["monthlyRate"].set_number_value(-5.0);
  assert(server.SaveDraft(&grpc_ctx, &save, &save_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  (*save.mutable_delta()->mutable_fields())["monthlyRate"].set_number_value(125.0);
  assert(server.SaveDraft(&grpc_ctx, &save, &save_resp).ok());
  assert(save_resp.modification().sync_state() == v1::SYNC_STATE_DRAFT);

  v1::GetCountRequest count;
  v1::GetCountResponse count_resp;
  assert(server.GetCount(&grpc_ctx, &count, &count_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  count.set_organization_id(kOrg);
  assert(server.GetCount(&grpc_ctx, &count, &count_resp).ok());
  assert(count_resp.count() == 1);
}

void TestSyncAdminServerReportsStatusCodes() {
  forecast::testing::Fixture fx;
  auto                       ctx = BuildServiceContext(fx);
  forecast::grpc::SyncAdminServer server(std::make_shared<forecast::service::SyncAdminService>(ctx));
  ::grpc::ServerContext           grpc_ctx;

  v1::ResolveConflictsRequest resolve;
  resolve.set_organization_id(kOrg);
  resolve.set_modification_id("missing");
  resolve.set_resolved_by("alice");
  auto* decision = resolve.add_resolutions();
  decision->set_field("monthlyRate");
  decision->set_choice(v1::RESOLUTION_CHOICE_KEEP_LOCAL);
  v1::ResolveConflictsResponse resolve_resp;
  assert(server.ResolveConflicts(&grpc_ctx, &resolve, &resolve_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  decision->set_choice(v1::RESOLUTION_CHOICE_UNSPECIFIED);
  assert(server.ResolveConflicts(&grpc_ctx, &resolve, &resolve_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::SetJobEnabledRequest job;
  job.set_name("sync");
  v1::SetJobEnabledResponse job_resp;
  assert(server.SetJobEnabled(&grpc_ctx, &job, &job_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::RunSyncCycleRequest cycle;
  v1::RunSyncCycleResponse cycle_resp;
  assert(server.RunSyncCycle(&grpc_ctx, &cycle, &cycle_resp).ok());
  assert(cycle_resp.summary().claimed() == 0);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestValidationErrorsRideInMessage();
  TestMirrorServerReportsStatusCodes();
  TestSyncAdminServerReportsStatusCodes();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
