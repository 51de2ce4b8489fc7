#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace forecast::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<Work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      FORECAST_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the transaction must be gone before the connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
