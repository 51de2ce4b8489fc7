#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "forecast/sync/v1.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/service/mirror_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/sync_admin_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/fixture.hpp"

namespace {

using namespace forecast::sync::v1;
using forecast::testing::ExpectThrows;
using forecast::testing::Fixture;
using forecast::testing::kOrg;

namespace f = forecast::model::fields;

struct Services {
  Services() {
    forecast::service::ServiceContext ctx;
    ctx.mirrors     = fx.mirrors;
    ctx.deltas      = fx.deltas;
    ctx.resolver    = fx.resolver;
    ctx.sync_worker = fx.worker;
    ctx.retention   = std::make_shared<forecast::retention::RetentionManager>(fx.repository, nullptr, fx.clock, forecast::retention::RetentionOptions{});
    ctx.scheduler   = std::make_shared<forecast::runtime::JobScheduler>();
    ctx.scheduler->Start(forecast::runtime::JobSpec{
        .name = "sync", .interval = std::chrono::hours(1), .enabled = false, .fn = [](std::stop_token) {}});

    scheduler = ctx.scheduler;
    mirror    = std::make_shared<forecast::service::MirrorService>(ctx);
    admin     = std::make_shared<forecast::service::SyncAdminService>(ctx);
  }

  Fixture                                             fx;
  std::shared_ptr<forecast::runtime::JobScheduler>    scheduler;
  std::shared_ptr<forecast::service::MirrorService>   mirror;
  std::shared_ptr<forecast::service::SyncAdminService> admin;
};

void Promote(Services& s, const std::string& entity, double rate) {
  PromoteMirrorRequest req;
  req.set_organization_id(kOrg);
  req.set_entity_id(entity);
  *req.mutable_document() = forecast::model::ToProto(forecast::testing::EquipmentDoc("Acme", rate));
  req.set_changed_by("upstream");

  const auto resp = s.mirror->PromoteMirror(req);
  assert(resp.created());
  assert(resp.version() == 1);
}

SaveDraftRequest Draft(const std::string& user, const std::string& entity, double rate) {
  SaveDraftRequest req;
  req.set_organization_id(kOrg);
  req.set_user_id(user);
  req.set_entity_id(entity);
  (*req.mutable_delta()->mutable_fields())[f::kMonthlyRate].set_number_value(rate);
  return req;
}

void TestDraftCommitSyncRoundTrip() {
  Services s;
  Promote(s, "E-1", 100.0);

  const auto saved = s.mirror->SaveDraft(Draft("alice", "E-1", 150.0));
  assert(saved.modification().sync_state() == SYNC_STATE_DRAFT);
  assert(saved.modification().entity_id() == "E-1");
  assert(saved.modification().edit_count() == 1);

  GetMergedViewsRequest views_req;
  views_req.set_organization_id(kOrg);
  auto views = s.mirror->GetMergedViews(views_req);
  assert(views.views_size() == 1);
  assert(views.views(0).has_modification());
  assert(views.views(0).sync_state() == SYNC_STATE_DRAFT);
  assert(views.views(0).document().fields().at(f::kMonthlyRate).number_value() == 150.0);

  GetDraftCountRequest count_req;
  count_req.set_organization_id(kOrg);
  count_req.set_user_id("alice");
  assert(s.mirror->GetDraftCount(count_req).count() == 1);

  CommitDraftsRequest commit;
  commit.mutable_selector()->set_organization_id(kOrg);
  commit.mutable_selector()->set_user_id("alice");
  assert(s.mirror->CommitDrafts(commit).committed() == 1);

  const auto cycle = s.admin->RunSyncCycle(RunSyncCycleRequest{});
  assert(cycle.summary().synced() == 1);

  views = s.mirror->GetMergedViews(views_req);
  assert(!views.views(0).has_modification());
  assert(views.views(0).sync_state() == SYNC_STATE_PRISTINE);
  assert(views.views(0).mirror_version() == 2);

  GetSyncStatusRequest status_req;
  status_req.set_organization_id(kOrg);
  const auto status = s.admin->GetSyncStatus(status_req);
  assert(status.counts_size() == 1);
  assert(status.counts(0).state() == SYNC_STATE_SYNCED);
  assert(status.failed_size() == 0);

  GetMirrorHistoryRequest history_req;
  history_req.set_organization_id(kOrg);
  history_req.set_entity_id("E-1");
  assert(s.mirror->GetMirrorHistory(history_req).snapshots_size() == 1);

  GetModificationHistoryRequest mods_req;
  mods_req.set_organization_id(kOrg);
  mods_req.set_entity_id("E-1");
  const auto mods = s.mirror->GetModificationHistory(mods_req);
  assert(mods.modifications_size() == 1);
  assert(mods.modifications(0).username() == "alice");
  assert(mods.modifications(0).has_synced_at());
}

void TestConflictResolutionThroughAdmin() {
  Services s;
  Promote(s, "E-1", 100.0);
  s.mirror->SaveDraft(Draft("alice", "E-1", 150.0));

  CommitDraftsRequest commit;
  commit.mutable_selector()->set_organization_id(kOrg);
  commit.mutable_selector()->set_user_id("alice");
  s.mirror->CommitDrafts(commit);

  s.fx.external->ApplyRemoteEdit(kOrg, "E-1", forecast::model::Document{{f::kMonthlyRate, 200.0}}, "erp-user");
  assert(s.admin->RunSyncCycle(RunSyncCycleRequest{}).summary().conflicts() == 1);

  ListConflictsRequest list;
  list.set_organization_id(kOrg);
  const auto conflicts = s.admin->ListConflicts(list);
  assert(conflicts.conflicts_size() == 1);
  assert(conflicts.conflicts(0).remote_value().number_value() == 200.0);
  assert(conflicts.conflicts(0).local_version() == 1);
  assert(conflicts.conflicts(0).remote_version() == 2);

  ResolveConflictsRequest resolve;
  resolve.set_organization_id(kOrg);
  resolve.set_modification_id(conflicts.conflicts(0).modification_id());
  resolve.set_resolved_by("alice");
  auto* decision = resolve.add_resolutions();
  decision->set_field(f::kMonthlyRate);
  decision->set_choice(RESOLUTION_CHOICE_MANUAL);

  // MANUAL without a value is refused before anything changes.
  ExpectThrows<forecast::util::InvalidArgument>([&] { s.admin->ResolveConflicts(resolve); });

  decision->mutable_manual_value()->set_number_value(175.0);
  const auto resolved = s.admin->ResolveConflicts(resolve);
  assert(resolved.modification().sync_state() == SYNC_STATE_COMMITTED);
  assert(resolved.modification().base_version() == 2);
  assert(resolved.modification().entity_id() == "E-1");

  assert(s.admin->RunSyncCycle(RunSyncCycleRequest{}).summary().synced() == 1);
}

void TestErrorsPropagateAsTypedExceptions() {
  Services s;

  ExpectThrows<forecast::util::NotFound>([&] { s.mirror->SaveDraft(Draft("alice", "missing", 1.0)); });

  Promote(s, "E-1", 100.0);
  ExpectThrows<forecast::util::ValidationFailed>([&] { s.mirror->SaveDraft(Draft("alice", "E-1", -1.0)); });

  GetCountRequest count;
  ExpectThrows<forecast::util::InvalidArgument>([&] { s.mirror->GetCount(count); });

  SetJobEnabledRequest job;
  job.set_name("nope");
  ExpectThrows<forecast::util::NotFound>([&] { s.admin->SetJobEnabled(job); });
}

void TestAdminSurfaces() {
  Services s;

  IngestRawRecordsRequest ingest;
  ingest.set_organization_id(kOrg);
  auto* old = ingest.add_records();
  old->set_payload("old");
  *old->mutable_ingested_at() = forecast::util::TimestampFromUnixMillis(forecast::testing::kStartMs - 100LL * 24 * 60 * 60 * 1000);
  ingest.add_records()->set_payload("new");
  assert(s.mirror->IngestRawRecords(ingest).ids_size() == 2);

  const auto stats = s.admin->GetRetentionStats(GetRetentionStatsRequest{});
  assert(stats.eligible() == 1);
  assert(stats.total() == 2);
  assert(stats.retention_days() == 90);

  RunRetentionRequest dry;
  dry.set_dry_run(true);
  auto run = s.admin->RunRetention(dry);
  assert(run.summary().dry_run());
  assert(run.summary().deleted() == 0);

  run = s.admin->RunRetention(RunRetentionRequest{});
  assert(run.summary().deleted() == 1);

  auto schedule = s.admin->GetScheduleStatus(GetScheduleStatusRequest{});
  assert(schedule.jobs_size() == 1);
  assert(schedule.jobs(0).name() == "sync");
  assert(!schedule.jobs(0).enabled());

  SetJobEnabledRequest enable;
  enable.set_name("sync");
  enable.set_enabled(true);
  assert(s.admin->SetJobEnabled(enable).job().enabled());
}

} // namespace

int main() {
  TestDraftCommitSyncRoundTrip();
  TestConflictResolutionThroughAdmin();
  TestErrorsPropagateAsTypedExceptions();
  TestAdminSurfaces();

  std::cout << "service_test: pass\n";
  return 0;
}
