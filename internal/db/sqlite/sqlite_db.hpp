#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace forecast::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of the process, so
  transactions serialize on ConnectionLock(). A transaction that cannot
  get the lock within the busy timeout fails instead of waiting forever.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000), bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  std::timed_mutex& ConnectionLock() {
    return connection_mutex_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return busy_timeout_;
  }

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          connection_mutex_;
};

} // namespace forecast::db::sqlite
