#include "sqlite_schema.hpp"

#include <chrono>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace forecast::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
    db_.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  bool IsApplied(int version) override {
    sqlite3_stmt* st = db_.Prepare("SELECT 1 FROM schema_migrations WHERE version=?;");
    sqlite3_bind_int(st, 1, version);
    const bool applied = sqlite3_step(st) == SQLITE_ROW;
    sqlite3_finalize(st);
    return applied;
  }

  void MarkApplied(int version) override {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    db_.Exec("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(version) + ", " + std::to_string(now) + ");");
  }

 private:
  SqliteDB& db_;
};

const std::vector<sql::Migration>& Migrations() {
  static const std::vector<sql::Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS raw_intake (id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, ingested_at_ms INTEGER NOT NULL, payload BLOB NOT NULL);",
           "CREATE INDEX IF NOT EXISTS raw_intake_age_idx ON raw_intake(ingested_at_ms, id);",

           "CREATE TABLE IF NOT EXISTS app_user (id TEXT PRIMARY KEY, username TEXT NOT NULL, display_name TEXT NOT NULL DEFAULT '');",

           "CREATE TABLE IF NOT EXISTS mirror (id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, entity_id TEXT NOT NULL, document TEXT NOT NULL, "
           "version INTEGER NOT NULL, category TEXT NOT NULL DEFAULT '', class_name TEXT NOT NULL DEFAULT '', source TEXT NOT NULL DEFAULT '', "
           "dor TEXT NOT NULL DEFAULT '', manufacturer TEXT NOT NULL DEFAULT '', model TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, "
           "updated_at_ms INTEGER NOT NULL, last_synced_at_ms INTEGER NOT NULL DEFAULT 0, UNIQUE(organization_id, entity_id));",
           "CREATE INDEX IF NOT EXISTS mirror_filter_idx ON mirror(organization_id, category, class_name, source, dor);",

           "CREATE TABLE IF NOT EXISTS mirror_history (id TEXT PRIMARY KEY, mirror_id TEXT NOT NULL REFERENCES mirror(id) ON DELETE CASCADE, "
           "organization_id TEXT NOT NULL, document TEXT NOT NULL, version INTEGER NOT NULL, changed_by TEXT NOT NULL DEFAULT '', "
           "change_reason TEXT NOT NULL DEFAULT '', archived_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS mirror_history_mirror_idx ON mirror_history(mirror_id, version);",

           "CREATE TABLE IF NOT EXISTS modification (id TEXT PRIMARY KEY, mirror_id TEXT NOT NULL REFERENCES mirror(id) ON DELETE CASCADE, "
           "organization_id TEXT NOT NULL, user_id TEXT NOT NULL, delta TEXT NOT NULL, modified_fields TEXT NOT NULL, session_id TEXT NOT NULL DEFAULT '', "
           "change_reason TEXT NOT NULL DEFAULT '', base_version INTEGER NOT NULL, edit_count INTEGER NOT NULL DEFAULT 1, sync_state TEXT NOT NULL, "
           "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, committed_at_ms INTEGER NOT NULL DEFAULT 0, "
           "attempt_count INTEGER NOT NULL DEFAULT 0, next_attempt_at_ms INTEGER NOT NULL DEFAULT 0, claimed_at_ms INTEGER NOT NULL DEFAULT 0, "
           "synced_at_ms INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '');",
           "CREATE UNIQUE INDEX IF NOT EXISTS modification_active_idx ON modification(mirror_id, user_id) "
           "WHERE sync_state IN ('draft','committed','syncing');",
           "CREATE INDEX IF NOT EXISTS modification_due_idx ON modification(sync_state, next_attempt_at_ms, committed_at_ms);",
           "CREATE INDEX IF NOT EXISTS modification_owner_idx ON modification(organization_id, user_id, sync_state);",

           "CREATE TABLE IF NOT EXISTS sync_conflict (id TEXT PRIMARY KEY, modification_id TEXT NOT NULL REFERENCES modification(id) ON DELETE CASCADE, "
           "mirror_id TEXT NOT NULL, organization_id TEXT NOT NULL, entity_id TEXT NOT NULL, field TEXT NOT NULL, local_value TEXT NOT NULL, "
           "remote_value TEXT NOT NULL, local_version INTEGER NOT NULL, remote_version INTEGER NOT NULL, remote_modified_by TEXT NOT NULL DEFAULT '', "
           "created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS sync_conflict_org_idx ON sync_conflict(organization_id, created_at_ms);",
       }},
  };
  return kMigrations;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  SqliteMigrationExecutor executor(db);
  sql::RunMigrations(executor, Migrations());
}

} // namespace forecast::db::sqlite
