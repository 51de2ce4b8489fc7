#include "sync_worker.hpp"

#include <algorithm>
#include <optional>

#include "internal/core/mirror_store.hpp"
#include "internal/core/transact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace forecast::sync {

using model::SyncState;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kMaxBackoffShift = 20;

/*
  Runs `fn(tx, row)` against the current copy of a claimed row and writes
  it back. Returns false without touching anything when the claim no
  longer belongs to this cycle (released as stale, requeued by an operator).
*/
template <typename Fn>
bool Settle(db::Repository& repo, const db::model::ModificationRecord& claimed, Fn&& fn) {
  return core::Transact(repo, [&](db::Transaction& tx) {
    auto row = repo.GetModification(tx, claimed.id);
    if (!row || row->sync_state != SyncState::kSyncing || row->claimed_at_ms != claimed.claimed_at_ms) {
      FORECAST_LOG_WARN("Sync claim lost before settling", {StringField("modification_id", claimed.id)});
      return false;
    }
    fn(tx, *row);
    row->claimed_at_ms = 0;
    core::ThrowIfDbError(repo.UpdateModification(tx, *row), "settle modification " + claimed.id);
    return true;
  });
}

} // namespace

SyncWorker::SyncWorker(std::shared_ptr<db::Repository> repository, std::shared_ptr<external::ExternalSystemClient> client,
                       std::shared_ptr<util::TimeSource> clock, SyncWorkerOptions options)
    : repository_(std::move(repository)),
      client_(std::move(client)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      limiter_(options_.rate_limit_per_second) {
  if (options_.batch_size == 0) {
    throw util::ConfigurationError("sync batch size must be positive");
  }
  if (options_.max_attempts == 0) {
    throw util::ConfigurationError("sync max attempts must be positive");
  }
}

std::chrono::milliseconds SyncWorker::Backoff(uint32_t attempt) const {
  const auto shift = std::min(attempt == 0 ? 0u : attempt - 1, kMaxBackoffShift);
  return options_.backoff_base * (int64_t{1} << shift);
}

SyncCycleSummary SyncWorker::RunCycle(std::stop_token stop) {
  observability::SpanScope span("sync.cycle");

  const auto started  = std::chrono::steady_clock::now();
  const auto deadline = started + options_.cycle_timeout;
  const auto now_ms   = clock_->NowMillis();

  SyncCycleSummary summary;
  summary.stale_released = static_cast<uint32_t>(core::Transact(
      *repository_, [&](db::Transaction& tx) { return repository_->ReleaseStaleClaims(tx, now_ms - options_.claim_timeout.count()); }));
  if (summary.stale_released > 0) {
    FORECAST_LOG_WARN("Released stale sync claims", {IntField("count", summary.stale_released)});
  }

  const auto claimed = core::Transact(
      *repository_, [&](db::Transaction& tx) { return repository_->ClaimDueModifications(tx, now_ms, options_.batch_size); });
  summary.claimed = static_cast<uint32_t>(claimed.size());

  for (const auto& row : claimed) {
    Outcome outcome = Outcome::kReleased;
    try {
      outcome = Process(row, stop, deadline);
    } catch (const std::exception& ex) {
      FORECAST_LOG_ERROR("Sync item failed", {StringField("modification_id", row.id), StringField("error", ex.what())});
      try {
        outcome = RecordFailure(row, ex.what(), true);
      } catch (const std::exception& inner) {
        // Stays syncing until the stale-claim sweep returns it.
        FORECAST_LOG_ERROR("Could not record sync failure", {StringField("modification_id", row.id), StringField("error", inner.what())});
        continue;
      }
    }

    switch (outcome) {
      case Outcome::kSynced:
        ++summary.synced;
        break;
      case Outcome::kConflict:
        ++summary.conflicts;
        break;
      case Outcome::kRetried:
        ++summary.retried;
        break;
      case Outcome::kFailed:
        ++summary.failed;
        break;
      case Outcome::kReleased:
        ++summary.released;
        break;
    }
  }

  summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSyncOutcome("synced", summary.synced);
  metrics.RecordSyncOutcome("conflict", summary.conflicts);
  metrics.RecordSyncOutcome("retried", summary.retried);
  metrics.RecordSyncOutcome("failed", summary.failed);
  metrics.RecordSyncOutcome("released", summary.released + summary.stale_released);
  metrics.ObserveSyncCycleDurationMs(static_cast<double>(summary.duration_ms));

  span.SetAttribute("sync.claimed", static_cast<int64_t>(summary.claimed));
  if (summary.claimed > 0) {
    FORECAST_LOG_INFO("Sync cycle finished",
                      {IntField("claimed", summary.claimed), IntField("synced", summary.synced), IntField("conflicts", summary.conflicts),
                       IntField("retried", summary.retried), IntField("failed", summary.failed), IntField("released", summary.released),
                       IntField("duration_ms", summary.duration_ms)});
  }
  return summary;
}

SyncWorker::Outcome SyncWorker::Process(const db::model::ModificationRecord& claimed, std::stop_token stop,
                                        std::chrono::steady_clock::time_point cycle_deadline) {
  if (stop.stop_requested() || std::chrono::steady_clock::now() >= cycle_deadline) {
    return Release(claimed);
  }

  const auto call_context = [&] {
    external::CallContext ctx;
    ctx.deadline = std::min(std::chrono::steady_clock::now() + options_.call_timeout, cycle_deadline);
    ctx.stop     = stop;
    return ctx;
  };

  const auto mirror = core::Transact(*repository_, [&](db::Transaction& tx) { return repository_->GetMirror(tx, claimed.mirror_id); });
  if (!mirror) {
    return RecordFailure(claimed, "mirror " + claimed.mirror_id + " no longer exists", false);
  }

  if (!limiter_.Acquire(stop, cycle_deadline)) {
    return Release(claimed);
  }

  external::RemoteState remote;
  try {
    remote = client_->FetchCurrentState(claimed.organization_id, mirror->entity_id, call_context());
  } catch (const std::exception& ex) {
    return RecordFailure(claimed, std::string("fetch: ") + ex.what(), true);
  }

  switch (remote.status) {
    case external::CallStatus::kOk:
      break;
    case external::CallStatus::kRejected:
      return RecordFailure(claimed, "fetch rejected: " + remote.error, false);
    case external::CallStatus::kConflict:
    case external::CallStatus::kTransient:
      return RecordFailure(claimed, "fetch: " + remote.error, true);
  }

  // An entity the remote has never seen is created from the full mirror
  // record on the first push.
  model::Document payload = claimed.delta;
  if (!remote.exists) {
    remote.document = mirror->document;
    remote.version  = claimed.base_version;
    payload         = model::Merge(mirror->document, claimed.delta);
  } else if (remote.version != claimed.base_version) {
    const auto divergent = model::DivergentFields(claimed.delta, remote.document);
    if (divergent.empty()) {
      return AdoptRemote(claimed, remote);
    }
    return RecordConflicts(claimed, remote, divergent);
  } else if (model::DivergentFields(claimed.delta, remote.document).empty()) {
    // Nothing left to push, e.g. every conflict resolved to the remote value.
    return AdoptRemote(claimed, remote);
  }

  if (!limiter_.Acquire(stop, cycle_deadline)) {
    return Release(claimed);
  }

  external::PushResult pushed;
  try {
    pushed = client_->PushDelta(claimed.organization_id, mirror->entity_id, payload, claimed.base_version, call_context());
  } catch (const std::exception& ex) {
    return RecordFailure(claimed, std::string("push: ") + ex.what(), true);
  }

  switch (pushed.status) {
    case external::CallStatus::kOk:
      return ApplyPushed(claimed, remote, pushed);
    case external::CallStatus::kRejected:
      return RecordFailure(claimed, "push rejected: " + pushed.error, false);
    case external::CallStatus::kConflict:
      // The row moved between fetch and push; the next attempt sees it.
      return RecordFailure(claimed, "push conflict: " + pushed.error, true);
    case external::CallStatus::kTransient:
      return RecordFailure(claimed, "push: " + pushed.error, true);
  }
  return RecordFailure(claimed, "push: unknown status", true);
}

SyncWorker::Outcome SyncWorker::ApplyPushed(const db::model::ModificationRecord& claimed, const external::RemoteState& base,
                                            const external::PushResult& pushed) {
  const auto now = clock_->NowMillis();

  // `base` is the remote record the push was applied to, so merging the
  // delta onto it reproduces the new remote record when none is echoed.
  const bool settled = Settle(*repository_, claimed, [&](db::Transaction& tx, db::model::ModificationRecord& row) {
    auto mirror = repository_->GetMirror(tx, row.mirror_id);
    if (!mirror) {
      throw util::NotFound("mirror " + row.mirror_id);
    }

    if (base.exists && base.version > mirror->version) {
      *mirror = core::ReplaceMirrorDocument(*repository_, tx, *mirror, base.document, base.version, base.last_modified_by, "adopted remote", now,
                                            true);
    }

    const auto version = pushed.new_version > 0 ? pushed.new_version : base.version + 1;
    if (version > mirror->version) {
      auto document = pushed.confirmed ? *pushed.confirmed : model::Merge(base.document, row.delta);
      core::ReplaceMirrorDocument(*repository_, tx, *mirror, std::move(document), version, row.user_id, "write-back " + row.id, now, true);
    } else {
      FORECAST_LOG_WARN("Mirror moved past the pushed version, keeping it",
                        {StringField("modification_id", row.id), IntField("mirror_version", static_cast<int64_t>(mirror->version)),
                         IntField("pushed_version", static_cast<int64_t>(version))});
    }

    row.sync_state    = SyncState::kSynced;
    row.synced_at_ms  = now;
    row.updated_at_ms = now;
    row.last_error.clear();
  });
  return settled ? Outcome::kSynced : Outcome::kReleased;
}

SyncWorker::Outcome SyncWorker::AdoptRemote(const db::model::ModificationRecord& claimed, const external::RemoteState& remote) {
  const auto now = clock_->NowMillis();

  // The remote already holds every value of the delta; only the mirror is
  // behind.
  const bool settled = Settle(*repository_, claimed, [&](db::Transaction& tx, db::model::ModificationRecord& row) {
    auto mirror = repository_->GetMirror(tx, row.mirror_id);
    if (!mirror) {
      throw util::NotFound("mirror " + row.mirror_id);
    }
    if (remote.version > mirror->version) {
      core::ReplaceMirrorDocument(*repository_, tx, *mirror, remote.document, remote.version, remote.last_modified_by, "adopted remote", now, true);
    }

    row.sync_state    = SyncState::kSynced;
    row.synced_at_ms  = now;
    row.updated_at_ms = now;
    row.last_error.clear();
  });
  return settled ? Outcome::kSynced : Outcome::kReleased;
}

SyncWorker::Outcome SyncWorker::RecordConflicts(const db::model::ModificationRecord& claimed, const external::RemoteState& remote,
                                                const std::vector<std::string>& fields) {
  const auto now = clock_->NowMillis();

  std::string entity_id;
  const bool  settled = Settle(*repository_, claimed, [&](db::Transaction& tx, db::model::ModificationRecord& row) {
    auto mirror = repository_->GetMirror(tx, row.mirror_id);
    entity_id   = mirror ? mirror->entity_id : std::string{};

    core::ThrowIfDbError(repository_->DeleteConflictsForModification(tx, row.id), "clear conflicts of " + row.id);
    for (const auto& field : fields) {
      db::model::SyncConflictRecord conflict;
      conflict.id                 = util::NewId();
      conflict.modification_id    = row.id;
      conflict.mirror_id          = row.mirror_id;
      conflict.organization_id    = row.organization_id;
      conflict.entity_id          = entity_id;
      conflict.field              = field;
      conflict.local_value        = model::ValueOr(row.delta, field);
      conflict.remote_value       = model::ValueOr(remote.document, field);
      conflict.local_version      = row.base_version;
      conflict.remote_version     = remote.version;
      conflict.remote_modified_by = remote.last_modified_by;
      conflict.created_at_ms      = now;
      core::ThrowIfDbError(repository_->InsertConflict(tx, conflict), "record conflict on " + field);
    }

    row.sync_state    = SyncState::kConflict;
    row.updated_at_ms = now;
    row.last_error    = "remote version " + std::to_string(remote.version) + " differs from base version " + std::to_string(row.base_version);
  });

  if (!settled) {
    return Outcome::kReleased;
  }
  FORECAST_LOG_WARN("Sync conflict", {StringField("modification_id", claimed.id), StringField("entity_id", entity_id),
                                      IntField("fields", static_cast<int64_t>(fields.size())),
                                      IntField("local_version", static_cast<int64_t>(claimed.base_version)),
                                      IntField("remote_version", static_cast<int64_t>(remote.version))});
  return Outcome::kConflict;
}

SyncWorker::Outcome SyncWorker::RecordFailure(const db::model::ModificationRecord& claimed, const std::string& error, bool retryable) {
  const auto now = clock_->NowMillis();

  Outcome    outcome = Outcome::kFailed;
  const bool settled = Settle(*repository_, claimed, [&](db::Transaction&, db::model::ModificationRecord& row) {
    row.attempt_count += 1;
    row.updated_at_ms = now;
    row.last_error    = error;
    if (retryable && row.attempt_count < options_.max_attempts) {
      row.sync_state         = SyncState::kCommitted;
      row.next_attempt_at_ms = now + Backoff(row.attempt_count).count();
      outcome                = Outcome::kRetried;
    } else {
      row.sync_state = SyncState::kSyncError;
      outcome        = Outcome::kFailed;
    }
  });

  if (!settled) {
    return Outcome::kReleased;
  }
  if (outcome == Outcome::kFailed) {
    FORECAST_LOG_ERROR("Sync gave up on modification", {StringField("modification_id", claimed.id), StringField("error", error)});
  } else {
    FORECAST_LOG_WARN("Sync attempt failed, will retry", {StringField("modification_id", claimed.id), StringField("error", error)});
  }
  return outcome;
}

SyncWorker::Outcome SyncWorker::Release(const db::model::ModificationRecord& claimed) {
  const auto now = clock_->NowMillis();
  Settle(*repository_, claimed, [&](db::Transaction&, db::model::ModificationRecord& row) {
    row.sync_state    = SyncState::kCommitted;
    row.updated_at_ms = now;
  });
  return Outcome::kReleased;
}

SyncStatus SyncWorker::GetSyncStatus(const std::string& organization_id) {
  if (organization_id.empty()) {
    throw util::InvalidArgument("organization id must not be empty");
  }

  db::ModificationQuery query;
  query.organization_id = organization_id;
  query.states          = {SyncState::kSyncError};

  return core::Transact(*repository_, [&](db::Transaction& tx) {
    SyncStatus status;
    status.counts = repository_->CountModificationsByState(tx, organization_id);
    for (auto& row : repository_->ListModifications(tx, query)) {
      auto mirror = repository_->GetMirror(tx, row.mirror_id);
      auto user   = repository_->GetUser(tx, row.user_id);

      FailedModification failed;
      failed.entity_id = mirror ? mirror->entity_id : std::string{};
      failed.username  = user ? user->username : row.user_id;
      failed.record    = std::move(row);
      status.failed.push_back(std::move(failed));
    }
    return status;
  });
}

std::vector<db::model::SyncConflictRecord> SyncWorker::ListConflicts(const std::string& organization_id) {
  if (organization_id.empty()) {
    throw util::InvalidArgument("organization id must not be empty");
  }
  return core::Transact(*repository_, [&](db::Transaction& tx) { return repository_->ListConflicts(tx, organization_id); });
}

uint32_t SyncWorker::RequeueFailed(const std::string& organization_id, const std::vector<std::string>& ids) {
  if (organization_id.empty()) {
    throw util::InvalidArgument("organization id must not be empty");
  }

  const auto requeued = core::Transact(*repository_, [&](db::Transaction& tx) {
    std::vector<db::model::ModificationRecord> rows;
    if (ids.empty()) {
      db::ModificationQuery query;
      query.organization_id = organization_id;
      query.states          = {SyncState::kSyncError};
      rows                  = repository_->ListModifications(tx, query);
    } else {
      for (const auto& id : ids) {
        auto row = repository_->GetModification(tx, id);
        if (!row || row->organization_id != organization_id) {
          throw util::NotFound("modification " + id);
        }
        rows.push_back(std::move(*row));
      }
    }

    const auto now   = clock_->NowMillis();
    uint32_t   count = 0;
    for (auto& row : rows) {
      if (row.sync_state != SyncState::kSyncError) {
        continue;
      }
      if (auto other = repository_->GetActiveModification(tx, row.mirror_id, row.user_id)) {
        FORECAST_LOG_WARN("Requeue skipped, user has a newer active modification",
                          {StringField("modification_id", row.id), StringField("active_id", other->id)});
        continue;
      }
      row.sync_state         = SyncState::kCommitted;
      row.attempt_count      = 0;
      row.next_attempt_at_ms = now;
      row.committed_at_ms    = now;
      row.updated_at_ms      = now;
      core::ThrowIfDbError(repository_->UpdateModification(tx, row), "requeue " + row.id);
      ++count;
    }
    return count;
  });

  if (requeued > 0) {
    FORECAST_LOG_INFO("Failed modifications requeued", {StringField("organization_id", organization_id), IntField("count", requeued)});
  }
  return requeued;
}

} // namespace forecast::sync
