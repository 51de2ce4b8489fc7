#pragma once

#include <string>
#include <vector>

namespace forecast::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports whether a schema version
  was already applied.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual bool IsApplied(int version) = 0;

  virtual void MarkApplied(int version) = 0;
};

struct Migration {
  int                      version;
  std::vector<std::string> statements;
};

/*
  Runs migrations in order, skipping versions already recorded.
*/
inline void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  for (const auto& migration : ordered) {
    if (executor.IsApplied(migration.version)) {
      continue;
    }
    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }
    executor.MarkApplied(migration.version);
  }
}

} // namespace forecast::db::sql
