#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace forecast::model {

/*
  Modification sync state machine.

    draft -> committed -> syncing -> synced
                            |     -> sync_error
                            |     -> conflict
                            '-----> committed   (retry backoff, released claim)

    conflict   -> draft      (resolution)
    sync_error -> committed  (operator requeue)

  synced is the retired state; the row stays for history.
*/
enum class SyncState : std::uint8_t {
  kDraft     = 1,
  kCommitted = 2,
  kSyncing   = 3,
  kSynced    = 4,
  kSyncError = 5,
  kConflict  = 6,
};

// Active rows are the ones overlaid on merged views; at most one per (mirror, user).
constexpr bool IsActive(SyncState state) {
  return state == SyncState::kDraft || state == SyncState::kCommitted || state == SyncState::kSyncing;
}

constexpr bool CanTransition(SyncState from, SyncState to) {
  switch (from) {
    case SyncState::kDraft:
      return to == SyncState::kDraft || to == SyncState::kCommitted;
    case SyncState::kCommitted:
      return to == SyncState::kCommitted || to == SyncState::kSyncing;
    case SyncState::kSyncing:
      return to == SyncState::kSynced || to == SyncState::kSyncError || to == SyncState::kConflict || to == SyncState::kCommitted;
    case SyncState::kConflict:
      return to == SyncState::kDraft;
    case SyncState::kSyncError:
      return to == SyncState::kCommitted;
    case SyncState::kSynced:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(SyncState state) {
  switch (state) {
    case SyncState::kDraft:
      return "draft";
    case SyncState::kCommitted:
      return "committed";
    case SyncState::kSyncing:
      return "syncing";
    case SyncState::kSynced:
      return "synced";
    case SyncState::kSyncError:
      return "sync_error";
    case SyncState::kConflict:
      return "conflict";
  }
  return "unknown";
}

inline std::optional<SyncState> ParseSyncState(std::string_view text) {
  for (auto state : {SyncState::kDraft, SyncState::kCommitted, SyncState::kSyncing, SyncState::kSynced, SyncState::kSyncError, SyncState::kConflict}) {
    if (ToString(state) == text) {
      return state;
    }
  }
  return std::nullopt;
}

} // namespace forecast::model
