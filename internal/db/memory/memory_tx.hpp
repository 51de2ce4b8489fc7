#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace forecast::db::memory {

/*
  Transaction = immutable snapshot + lazily cloned write set.

  Read-only transactions never copy and always commit. A writing
  transaction commits only if nothing else committed since its snapshot.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::shared_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace forecast::db::memory
