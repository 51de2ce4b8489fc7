#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>

#include "internal/archive/archival_backend.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace forecast::retention {

struct RetentionOptions {
  uint32_t    retention_days   = 90;
  std::size_t batch_size       = 1000;
  bool        archival_enabled = false;
  bool        dry_run          = false;

  // Zero means no time box.
  std::chrono::milliseconds run_timeout{0};
};

struct RetentionSummary {
  uint64_t eligible       = 0;
  uint64_t archived       = 0;
  uint64_t deleted        = 0;
  uint64_t errors         = 0;
  uint32_t batches        = 0;
  uint32_t failed_batches = 0;
  int64_t  cutoff_ms      = 0;
  bool     dry_run        = false;
  bool     cancelled      = false;
  int64_t  duration_ms    = 0;
};

struct RetentionStats {
  uint64_t eligible         = 0;
  uint64_t total            = 0;
  int64_t  oldest_ingest_ms = 0;
  int64_t  newest_ingest_ms = 0;
  int64_t  cutoff_ms        = 0;
  uint32_t retention_days   = 0;
};

/*
  Ages raw intake out of the store.

  Records older than the retention window are walked oldest first in
  batches. With archival enabled a batch is deleted only after the backend
  stored it; a failed batch is counted and skipped. Every batch commits on
  its own.
*/
class RetentionManager {
 public:
  RetentionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<archive::ArchivalBackend> backend,
                   std::shared_ptr<util::TimeSource> clock, RetentionOptions options);

  RetentionSummary Run(std::stop_token stop = {}, std::optional<bool> dry_run = std::nullopt);

  RetentionStats GetRetentionStats();

  const RetentionOptions& Options() const {
    return options_;
  }

 private:
  int64_t Cutoff(int64_t now_ms) const;

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<archive::ArchivalBackend> backend_;
  std::shared_ptr<util::TimeSource>         clock_;
  RetentionOptions                          options_;
};

} // namespace forecast::retention
