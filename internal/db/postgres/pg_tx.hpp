#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace forecast::db::postgres {

/*
  One pooled connection plus a REPEATABLE READ transaction, so every read of
  a transaction sees the same snapshot. Concurrent writers surface as
  serialization failures, reported as util::TransactionConflict.
*/
class PgTransaction final : public db::Transaction {
public:
  using Work = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  Work& Tx() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<Work> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
