#pragma once

#include <cassert>
#include <memory>
#include <string>
#include <utility>

#include "internal/core/conflict_resolver.hpp"
#include "internal/core/delta_manager.hpp"
#include "internal/core/mirror_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/external/simulated_external_system.hpp"
#include "internal/model/forecast_fields.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/forecast_rule_validator.hpp"

namespace forecast::testing {

inline constexpr int64_t kStartMs = 1'700'000'000'000;

inline constexpr const char* kOrg = "org-1";

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const E&) {
    thrown = true;
  }
  assert(thrown);
}

inline model::Document EquipmentDoc(const std::string& manufacturer, double monthly_rate) {
  return model::Document{
      {model::fields::kCategory, std::string("Heavy")},
      {model::fields::kClass, std::string("Excavator")},
      {model::fields::kSource, std::string("Rental")},
      {model::fields::kDor, std::string("PROJECT")},
      {model::fields::kManufacturer, manufacturer},
      {model::fields::kModel, std::string("X-100")},
      {model::fields::kMonthlyRate, monthly_rate},
      {model::fields::kForecastStart, model::Timestamp{kStartMs}},
      {model::fields::kForecastEnd, model::Timestamp{kStartMs + 86'400'000}},
      {model::fields::kIsActualized, false},
  };
}

/*
  Everything above the repository wired against the in-memory backend,
  a manual clock and the simulated system of record.
*/
struct Fixture {
  explicit Fixture(sync::SyncWorkerOptions sync_options = FastSyncOptions(),
                   std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>(),
                   external::SimulatedExternalSystem::Options external_options = {})
      : repository(std::move(repo)),
        clock(std::make_shared<util::ManualTimeSource>(kStartMs)),
        validator(std::make_shared<validation::ForecastRuleValidator>()),
        external(std::make_shared<external::SimulatedExternalSystem>(external_options)),
        mirrors(std::make_shared<core::MirrorStore>(repository, clock)),
        deltas(std::make_shared<core::DeltaManager>(repository, validator, clock)),
        resolver(std::make_shared<core::ConflictResolver>(repository, validator, clock)),
        worker(std::make_shared<sync::SyncWorker>(repository, external, clock, sync_options)) {
    auto sim = external;
    mirrors->SetPromotionListener([sim](const db::model::MirrorRecord& m) { sim->Seed(m.organization_id, m.entity_id, m.document, m.version); });
  }

  static sync::SyncWorkerOptions FastSyncOptions() {
    sync::SyncWorkerOptions options;
    options.rate_limit_per_second = 0;
    options.backoff_base          = std::chrono::seconds(1);
    options.max_attempts          = 3;
    options.call_timeout          = std::chrono::seconds(2);
    options.cycle_timeout         = std::chrono::seconds(30);
    return options;
  }

  core::PromoteResult Promote(const std::string& entity_id, model::Document doc, uint64_t version = 0) {
    return mirrors->PromoteMirror(kOrg, entity_id, std::move(doc), version, "upstream");
  }

  db::model::ModificationRecord SaveAndCommit(const std::string& user_id, const std::string& entity_id, const model::Document& delta) {
    auto saved = deltas->SaveDraft(kOrg, user_id, entity_id, delta);
    core::DraftSelector selector{.organization_id = kOrg, .user_id = user_id, .entity_ids = {entity_id}};
    assert(deltas->CommitDrafts(selector) == 1);
    return saved;
  }

  db::model::MirrorRecord Mirror(const std::string& entity_id) {
    auto tx     = repository->Begin();
    auto mirror = repository->GetMirrorByEntity(*tx, kOrg, entity_id);
    tx->Commit();
    assert(mirror.has_value());
    return *mirror;
  }

  db::model::ModificationRecord Modification(const std::string& id) {
    auto tx  = repository->Begin();
    auto row = repository->GetModification(*tx, id);
    tx->Commit();
    assert(row.has_value());
    return *row;
  }

  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<util::ManualTimeSource>           clock;
  std::shared_ptr<validation::ForecastRuleValidator> validator;
  std::shared_ptr<external::SimulatedExternalSystem> external;
  std::shared_ptr<core::MirrorStore>                mirrors;
  std::shared_ptr<core::DeltaManager>               deltas;
  std::shared_ptr<core::ConflictResolver>           resolver;
  std::shared_ptr<sync::SyncWorker>                 worker;
};

} // namespace forecast::testing
