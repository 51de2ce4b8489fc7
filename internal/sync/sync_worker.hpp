#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/external/external_system_client.hpp"
#include "internal/sync/rate_limiter.hpp"
#include "internal/util/time.hpp"

namespace forecast::sync {

struct SyncWorkerOptions {
  std::size_t batch_size   = 50;
  uint32_t    max_attempts = 5;

  std::chrono::milliseconds backoff_base{std::chrono::seconds(30)};
  double                    rate_limit_per_second = 10.0;

  std::chrono::milliseconds call_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds cycle_timeout{std::chrono::minutes(5)};

  // Syncing rows claimed longer ago than this are assumed orphaned.
  std::chrono::milliseconds claim_timeout{std::chrono::minutes(10)};
};

struct SyncCycleSummary {
  uint32_t claimed        = 0;
  uint32_t synced         = 0;
  uint32_t conflicts      = 0;
  uint32_t retried        = 0;
  uint32_t failed         = 0;
  uint32_t released       = 0;
  uint32_t stale_released = 0;
  int64_t  duration_ms    = 0;
};

struct FailedModification {
  db::model::ModificationRecord record;
  std::string                   entity_id;
  std::string                   username;
};

struct SyncStatus {
  std::map<model::SyncState, uint64_t> counts;
  std::vector<FailedModification>      failed;
};

/*
  Write-back of committed modifications to the external system.

  A cycle claims due rows (committed -> syncing) in one transaction, then
  settles each claimed row on its own:

    remote version == base version   push, fold the result into the mirror
    remote version moved             record per-field conflicts
    transient failure                back to committed with backoff, or
                                     sync_error once attempts run out
    rejected                         sync_error

  Claims left unprocessed when the cycle is stopped or runs out of time go
  back to committed without spending an attempt.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<external::ExternalSystemClient> client,
             std::shared_ptr<util::TimeSource> clock, SyncWorkerOptions options);

  SyncCycleSummary RunCycle(std::stop_token stop = {});

  SyncStatus GetSyncStatus(const std::string& organization_id);

  std::vector<db::model::SyncConflictRecord> ListConflicts(const std::string& organization_id);

  // sync_error -> committed with a fresh attempt budget. Empty `ids`
  // requeues every failed row of the organization.
  uint32_t RequeueFailed(const std::string& organization_id, const std::vector<std::string>& ids);

  const SyncWorkerOptions& Options() const {
    return options_;
  }

 private:
  enum class Outcome { kSynced, kConflict, kRetried, kFailed, kReleased };

  Outcome Process(const db::model::ModificationRecord& claimed, std::stop_token stop, std::chrono::steady_clock::time_point cycle_deadline);

  Outcome ApplyPushed(const db::model::ModificationRecord& claimed, const external::RemoteState& base, const external::PushResult& pushed);
  Outcome AdoptRemote(const db::model::ModificationRecord& claimed, const external::RemoteState& remote);
  Outcome RecordConflicts(const db::model::ModificationRecord& claimed, const external::RemoteState& remote, const std::vector<std::string>& fields);
  Outcome RecordFailure(const db::model::ModificationRecord& claimed, const std::string& error, bool retryable);
  Outcome Release(const db::model::ModificationRecord& claimed);

  std::chrono::milliseconds Backoff(uint32_t attempt) const;

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<external::ExternalSystemClient>   client_;
  std::shared_ptr<util::TimeSource>                 clock_;
  SyncWorkerOptions                                 options_;
  RateLimiter                                       limiter_;
};

} // namespace forecast::sync
