#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace forecast::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_shared<MemoryRepository::State>(*snapshot_);
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }

  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::TransactionConflict("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace forecast::db::memory
