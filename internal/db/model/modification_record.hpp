#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "internal/model/document.hpp"
#include "internal/model/state_machine.hpp"

namespace forecast::db::model {

/*
  Per-user overlay (delta) on one mirror row.

  base_version is the mirror version the delta was written against;
  edit_count only counts local saves and carries no concurrency meaning.
*/
struct ModificationRecord {
  std::string id;
  std::string mirror_id;
  std::string organization_id;
  std::string user_id;

  forecast::model::Document delta;
  std::set<std::string>     modified_fields;

  std::string session_id;
  std::string change_reason;

  uint64_t base_version = 0;
  uint32_t edit_count   = 0;

  forecast::model::SyncState sync_state = forecast::model::SyncState::kDraft;

  int64_t created_at_ms   = 0;
  int64_t updated_at_ms   = 0;
  int64_t committed_at_ms = 0;

  // Write-back bookkeeping
  uint32_t    attempt_count      = 0;
  int64_t     next_attempt_at_ms = 0;
  int64_t     claimed_at_ms      = 0;
  int64_t     synced_at_ms       = 0;
  std::string last_error;
};

} // namespace forecast::db::model
