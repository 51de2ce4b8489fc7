#include "pg_pool.hpp"

namespace forecast::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        // dropped by the server; replace it below
        --live_connections_;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_mirror",
               "SELECT id,organization_id,entity_id,document::text,version,created_at_ms,updated_at_ms,last_synced_at_ms "
               "FROM mirror WHERE id=$1");

  conn.prepare("get_mirror_by_entity",
               "SELECT id,organization_id,entity_id,document::text,version,created_at_ms,updated_at_ms,last_synced_at_ms "
               "FROM mirror WHERE organization_id=$1 AND entity_id=$2");

  conn.prepare("insert_raw_intake",
               "INSERT INTO raw_intake(id,organization_id,ingested_at_ms,payload) VALUES($1,$2,$3,decode($4,'hex'))");

  conn.prepare("delete_raw_intake", "DELETE FROM raw_intake WHERE id = ANY($1::text[])");

  conn.prepare("release_stale_claims",
               "UPDATE modification SET sync_state='committed', claimed_at_ms=0 WHERE sync_state='syncing' AND claimed_at_ms<$1");

  conn.prepare("delete_modification", "DELETE FROM modification WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace forecast::db::postgres
