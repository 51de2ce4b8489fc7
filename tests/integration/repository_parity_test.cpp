#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if FORECAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if FORECAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using forecast::db::ErrorCode;
using forecast::db::Repository;
using forecast::db::memory::MemoryRepository;
using forecast::db::model::MirrorHistoryRecord;
using forecast::db::model::MirrorRecord;
using forecast::db::model::ModificationRecord;
using forecast::db::model::RawIntakeRecord;
using forecast::db::model::SyncConflictRecord;
using forecast::db::model::UserRecord;
using forecast::model::Document;
using forecast::model::SyncState;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

MirrorRecord MakeMirror(const std::string& prefix, const std::string& entity, const std::string& manufacturer) {
  MirrorRecord m;
  m.id              = prefix + "-mirror-" + entity;
  m.organization_id = prefix + "-org";
  m.entity_id       = entity;
  m.document        = Document{
      {"category", std::string("Heavy")},
      {"class", std::string("Excavator")},
      {"source", std::string("Rental")},
      {"dor", std::string("PROJECT")},
      {"manufacturer", manufacturer},
      {"model", std::string("X-100")},
      {"monthlyRate", 100.0},
      {"isActualized", false},
      {"hasPlan", std::monostate{}},
  };
  m.version       = 1;
  m.created_at_ms = 1000;
  m.updated_at_ms = 1000;
  return m;
}

ModificationRecord MakeModification(const MirrorRecord& mirror, const std::string& id, const std::string& user, SyncState state) {
  ModificationRecord r;
  r.id              = id;
  r.mirror_id       = mirror.id;
  r.organization_id = mirror.organization_id;
  r.user_id         = user;
  r.delta           = Document{{"monthlyRate", 150.0}, {"dor", std::string("BEO")}};
  r.modified_fields = {"monthlyRate", "dor"};
  r.session_id      = "session-1";
  r.base_version    = mirror.version;
  r.edit_count      = 1;
  r.sync_state      = state;
  r.created_at_ms   = 2000;
  r.updated_at_ms   = 2000;
  return r;
}

void SeedUser(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.UpsertUser(*tx, UserRecord{id, id, "User " + id}));
  tx->Commit();
}

// Search folds ASCII letters only, so every backend agrees on non-ASCII
// names whatever its collation would do.
void VerifySearchFoldsAsciiOnly(Repository& repo, const std::string& prefix) {
  auto ebene            = MakeMirror(prefix, "E-1", "\xC3\x89" "b\xC3\xA8" "ne Maschinen");
  ebene.organization_id = prefix + "-intl-org";
  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, ebene));
    tx->Commit();
  }

  auto                       tx = repo.Begin();
  forecast::db::MirrorFilter search;
  search.search = "\xC3\x89" "b\xC3\xA8" "ne";
  assert(repo.CountMirrors(*tx, ebene.organization_id, search) == 1);
  search.search = "MASCHINEN";
  assert(repo.CountMirrors(*tx, ebene.organization_id, search) == 1);
  // Upper and lower case E-acute are different letters to an ASCII fold.
  search.search = "\xC3\xA9" "b\xC3\xA8" "ne";
  assert(repo.CountMirrors(*tx, ebene.organization_id, search) == 0);
  tx->Commit();
}

void VerifyMirrorReadWrite(Repository& repo, const std::string& prefix) {
  const auto acme  = MakeMirror(prefix, "E-1", "Acme");
  const auto other = MakeMirror(prefix, "E-2", "Bolt_Works");

  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, acme));
    assert(repo.InsertMirror(*tx, other));

    auto duplicate = acme;
    duplicate.id   = prefix + "-mirror-dup";
    assert(!repo.InsertMirror(*tx, duplicate));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, acme));
    assert(repo.InsertMirror(*tx, other));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto by_entity = repo.GetMirrorByEntity(*tx, acme.organization_id, "E-1");
  assert(by_entity.has_value());
  assert(by_entity->id == acme.id);
  assert(by_entity->document == acme.document);
  assert(by_entity->version == 1);
  assert(!repo.GetMirrorByEntity(*tx, "someone-else", "E-1").has_value());

  forecast::db::MirrorFilter all;
  const auto                 listed = repo.ListMirrors(*tx, acme.organization_id, all);
  assert(listed.size() == 2);
  assert(listed[0].entity_id == "E-1");
  assert(listed[1].entity_id == "E-2");

  forecast::db::MirrorFilter search;
  search.search = "bolt_";
  assert(repo.CountMirrors(*tx, acme.organization_id, search) == 1);
  search.search = "ACME";
  assert(repo.ListMirrors(*tx, acme.organization_id, search).front().entity_id == "E-1");
  // The underscore is literal, not a wildcard.
  search.search = "acm_";
  assert(repo.CountMirrors(*tx, acme.organization_id, search) == 0);

  forecast::db::MirrorFilter paged;
  paged.limit  = 1;
  paged.offset = 1;
  const auto page = repo.ListMirrors(*tx, acme.organization_id, paged);
  assert(page.size() == 1);
  assert(page[0].entity_id == "E-2");
  assert(repo.CountMirrors(*tx, acme.organization_id, paged) == 2);

  forecast::db::MirrorFilter dor;
  dor.dor = "BEO";
  assert(repo.CountMirrors(*tx, acme.organization_id, dor) == 0);

  // Replace and snapshot.
  MirrorHistoryRecord snapshot{.id              = prefix + "-history-1",
                               .mirror_id       = acme.id,
                               .organization_id = acme.organization_id,
                               .document        = acme.document,
                               .version         = 1,
                               .changed_by      = "upstream",
                               .change_reason   = "promotion",
                               .archived_at_ms  = 3000};
  assert(repo.InsertMirrorHistory(*tx, snapshot));

  auto next     = acme;
  next.version  = 2;
  next.document["dor"] = std::string("BEO");
  next.updated_at_ms   = 3000;
  assert(repo.UpdateMirror(*tx, next));

  assert(repo.CountMirrors(*tx, acme.organization_id, dor) == 1);
  const auto reread = repo.GetMirror(*tx, acme.id);
  assert(reread.has_value());
  assert(reread->version == 2);

  const auto history = repo.ListMirrorHistory(*tx, acme.id);
  assert(history.size() == 1);
  assert(history[0].version == 1);
  assert(history[0].document == acme.document);
  assert(history[0].changed_by == "upstream");

  tx->Commit();
}

void VerifyModificationLifecycle(Repository& repo, const std::string& prefix) {
  const auto mirror = MakeMirror(prefix, "E-1", "Acme");
  SeedUser(repo, prefix + "-alice");
  SeedUser(repo, prefix + "-bob");

  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, mirror));
    tx->Commit();
  }

  const auto alice = MakeModification(mirror, prefix + "-mod-a", prefix + "-alice", SyncState::kDraft);
  const auto bob   = MakeModification(mirror, prefix + "-mod-b", prefix + "-bob", SyncState::kDraft);

  {
    auto tx = repo.Begin();
    assert(repo.InsertModification(*tx, alice));
    assert(repo.InsertModification(*tx, bob));

    // One active row per (mirror, user).
    auto second = alice;
    second.id   = prefix + "-mod-a2";
    const auto result = repo.InsertModification(*tx, second);
    assert(!result);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertModification(*tx, alice));
    assert(repo.InsertModification(*tx, bob));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto active = repo.GetActiveModification(*tx, mirror.id, prefix + "-alice");
  assert(active.has_value());
  assert(active->delta == alice.delta);
  assert(active->modified_fields == alice.modified_fields);
  assert(active->sync_state == SyncState::kDraft);
  assert(active->session_id == "session-1");

  assert(repo.ListActiveModifications(*tx, {mirror.id}, std::nullopt).size() == 2);
  assert(repo.ListActiveModifications(*tx, {mirror.id}, prefix + "-bob").size() == 1);
  assert(repo.ListActiveModifications(*tx, {}, std::nullopt).empty());

  forecast::db::ModificationQuery drafts;
  drafts.organization_id = mirror.organization_id;
  drafts.user_id         = prefix + "-alice";
  drafts.states          = {SyncState::kDraft};
  assert(repo.CountModifications(*tx, drafts) == 1);

  auto committed            = *active;
  committed.sync_state      = SyncState::kCommitted;
  committed.committed_at_ms = 2500;
  assert(repo.UpdateModification(*tx, committed));
  assert(repo.CountModifications(*tx, drafts) == 0);

  const auto counts = repo.CountModificationsByState(*tx, mirror.organization_id);
  assert(counts.at(SyncState::kDraft) == 1);
  assert(counts.at(SyncState::kCommitted) == 1);

  // Synced rows no longer count as active, so a new draft may follow.
  committed.sync_state   = SyncState::kSynced;
  committed.synced_at_ms = 2600;
  assert(repo.UpdateModification(*tx, committed));
  assert(!repo.GetActiveModification(*tx, mirror.id, prefix + "-alice").has_value());

  auto follow_up          = MakeModification(mirror, prefix + "-mod-a3", prefix + "-alice", SyncState::kDraft);
  follow_up.created_at_ms = 2700;
  assert(repo.InsertModification(*tx, follow_up));

  const auto history = repo.ListModificationsForMirror(*tx, mirror.id);
  assert(history.size() == 3);
  assert(history[0].id == follow_up.id);

  assert(repo.DeleteModification(*tx, bob.id));
  assert(!repo.GetModification(*tx, bob.id).has_value());

  const auto user = repo.GetUser(*tx, prefix + "-alice");
  assert(user.has_value());
  assert(user->display_name == "User " + prefix + "-alice");

  tx->Commit();
}

void VerifyClaimAndRelease(Repository& repo, const std::string& prefix) {
  const auto mirror = MakeMirror(prefix, "E-1", "Acme");

  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, mirror));
    for (int i = 0; i < 4; ++i) {
      auto r               = MakeModification(mirror, prefix + "-claim-" + std::to_string(i), prefix + "-user-" + std::to_string(i),
                                              SyncState::kCommitted);
      r.committed_at_ms    = 100 + i;
      r.next_attempt_at_ms = i == 3 ? 10'000 : 0;
      assert(repo.InsertModification(*tx, r));
    }
    tx->Commit();
  }

  std::vector<ModificationRecord> claimed;
  {
    auto tx = repo.Begin();
    claimed = repo.ClaimDueModifications(*tx, 5'000, 2);
    tx->Commit();
  }
  assert(claimed.size() == 2);
  assert(claimed[0].id == prefix + "-claim-0");
  assert(claimed[1].id == prefix + "-claim-1");
  assert(claimed[0].sync_state == SyncState::kSyncing);
  assert(claimed[0].claimed_at_ms == 5'000);

  {
    auto tx   = repo.Begin();
    auto rest = repo.ClaimDueModifications(*tx, 6'000, 10);
    assert(rest.size() == 1);
    assert(rest[0].id == prefix + "-claim-2");

    // Claims from 5'000 are stale at 5'500; the one at 6'000 is not.
    assert(repo.ReleaseStaleClaims(*tx, 5'500) == 2);
    const auto released = repo.GetModification(*tx, prefix + "-claim-0");
    assert(released->sync_state == SyncState::kCommitted);
    assert(released->claimed_at_ms == 0);
    tx->Commit();
  }
}

void VerifyConflicts(Repository& repo, const std::string& prefix) {
  const auto mirror = MakeMirror(prefix, "E-1", "Acme");
  auto       mod    = MakeModification(mirror, prefix + "-conflicted", prefix + "-alice", SyncState::kConflict);

  auto tx = repo.Begin();
  assert(repo.InsertMirror(*tx, mirror));
  assert(repo.InsertModification(*tx, mod));

  for (const auto& field : {std::string("monthlyRate"), std::string("dor")}) {
    SyncConflictRecord c;
    c.id                 = prefix + "-conflict-" + field;
    c.modification_id    = mod.id;
    c.mirror_id          = mirror.id;
    c.organization_id    = mirror.organization_id;
    c.entity_id          = mirror.entity_id;
    c.field              = field;
    c.local_value        = mod.delta.at(field);
    c.remote_value       = field == "dor" ? forecast::model::FieldValue{std::monostate{}} : forecast::model::FieldValue{200.0};
    c.local_version      = 1;
    c.remote_version     = 3;
    c.remote_modified_by = "erp-user";
    c.created_at_ms      = 4000;
    assert(repo.InsertConflict(*tx, c));
  }

  const auto listed = repo.ListConflicts(*tx, mirror.organization_id);
  assert(listed.size() == 2);
  assert(listed[0].field == "dor");
  assert(std::holds_alternative<std::monostate>(listed[0].remote_value));
  assert(listed[1].field == "monthlyRate");
  assert(std::get<double>(listed[1].remote_value) == 200.0);
  assert(listed[1].remote_version == 3);

  assert(repo.ListConflictsForModification(*tx, mod.id).size() == 2);
  assert(repo.DeleteConflictsForModification(*tx, mod.id));
  assert(repo.ListConflicts(*tx, mirror.organization_id).empty());
  tx->Commit();
}

void VerifyRawIntakePaging(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      RawIntakeRecord r{.id              = prefix + "-raw-" + std::to_string(i),
                        .organization_id = prefix + "-org",
                        .ingested_at_ms  = i < 3 ? 100 : 900 + i,
                        .payload         = std::string("bytes\0", 6) + std::to_string(i)};
      assert(repo.InsertRawIntake(*tx, r));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.CountRawIntakeBefore(*tx, 500) == 3);

  const auto first = repo.ListRawIntakeBefore(*tx, 500, std::nullopt, 2);
  assert(first.size() == 2);
  assert(first[0].id == prefix + "-raw-0");
  assert(first[0].payload == std::string("bytes\0", 6) + "0");

  const forecast::db::model::IntakeCursor cursor{first.back().ingested_at_ms, first.back().id};
  const auto                              second = repo.ListRawIntakeBefore(*tx, 500, cursor, 2);
  assert(second.size() == 1);
  assert(second[0].id == prefix + "-raw-2");

  const auto stats = repo.GetIntakeStats(*tx, 500);
  assert(stats.eligible == 3);
  assert(stats.total == 5);
  assert(stats.oldest_ingest_ms == 100);
  assert(stats.newest_ingest_ms == 904);

  assert(repo.DeleteRawIntake(*tx, {first[0].id, first[1].id}));
  assert(repo.CountRawIntakeBefore(*tx, 500) == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto mirror = MakeMirror(prefix, "E-rollback", "Acme");
  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, mirror));
    tx->Rollback();
  }
  {
    // Dropped without commit.
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, mirror));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetMirror(*check_tx, mirror.id).has_value());
  check_tx->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  auto mirror = MakeMirror(prefix, "E-race", "Acme");
  {
    auto tx = repo.Begin();
    assert(repo.InsertMirror(*tx, mirror));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const forecast::util::TransactionConflict&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetMirror(*tx1, mirror.id);
  auto r2 = repo.GetMirror(*tx2, mirror.id);
  assert(r1.has_value() && r2.has_value());

  r1->version = 2;
  r2->version = 3;
  assert(repo.UpdateMirror(*tx1, *r1));
  tx1->Commit();

  // First committer wins; the second surfaces a conflict the caller retries.
  bool conflicted = false;
  try {
    if (repo.UpdateMirror(*tx2, *r2)) {
      tx2->Commit();
    } else {
      conflicted = true;
    }
  } catch (const forecast::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify_tx = repo.Begin();
  assert(repo.GetMirror(*verify_tx, mirror.id)->version == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo   = backend.make_repository();
  const auto mirror = MakeMirror(prefix, "E-durable", "Acme");
  SeedUser(*repo, prefix + "-alice");
  {
    auto tx = repo->Begin();
    assert(repo->InsertMirror(*tx, mirror));
    assert(repo->InsertModification(*tx, MakeModification(mirror, prefix + "-durable-mod", prefix + "-alice", SyncState::kCommitted)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  const auto m = repo->GetMirror(*tx, mirror.id);
  assert(m.has_value());
  assert(m->document == mirror.document);

  const auto mod = repo->GetModification(*tx, prefix + "-durable-mod");
  assert(mod.has_value());
  assert(mod->sync_state == SyncState::kCommitted);
  assert(mod->delta.at("monthlyRate") == forecast::model::FieldValue{150.0});
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if FORECAST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("forecast_sync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<forecast::db::sqlite::SqliteDB>(db_path, std::chrono::milliseconds(200));
    forecast::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<forecast::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if FORECAST_DB_POSTGRES
std::optional<BackendFactory> MakePostgresFactory() {
  const char* uri = std::getenv("FORECAST_TEST_POSTGRES_URI");
  if (!uri || std::string(uri).empty()) {
    return std::nullopt;
  }
  const std::string conninfo = uri;

  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<forecast::db::postgres::PgPool>(conninfo, 4);
    forecast::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<forecast::db::postgres::PgRepository>(pool);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunParity(BackendFactory backend) {
  // Unique prefixes keep runs against a shared Postgres database apart.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  auto repo = backend.make_repository();
  VerifyMirrorReadWrite(*repo, prefix + "-m");
  VerifySearchFoldsAsciiOnly(*repo, prefix + "-u");
  VerifyModificationLifecycle(*repo, prefix + "-l");
  VerifyClaimAndRelease(*repo, prefix + "-c");
  VerifyConflicts(*repo, prefix + "-x");
  VerifyRawIntakePaging(*repo, prefix + "-r");
  VerifyRollbackBehavior(*repo, prefix + "-b");
  VerifyConcurrentWriters(*repo, prefix + "-w", backend.supports_parallel_transactions);
  repo.reset();

  VerifyRestartDurability(backend, prefix + "-d");
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunParity(MakeMemoryFactory());

#if FORECAST_DB_SQLITE
  RunParity(MakeSqliteFactory());
#endif

#if FORECAST_DB_POSTGRES
  if (auto postgres = MakePostgresFactory()) {
    RunParity(*postgres);
  } else {
    std::cout << "  postgres: skipped (FORECAST_TEST_POSTGRES_URI not set)\n";
  }
#endif

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
