#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "internal/model/forecast_fields.hpp"
#include "memory_tx.hpp"

namespace forecast::db::memory {

using forecast::model::SyncState;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool Contains(const std::string& haystack, const std::string& lowered_needle) {
  return Lower(haystack).find(lowered_needle) != std::string::npos;
}

bool MatchesFilter(const model::MirrorRecord& m, const MirrorFilter& f) {
  const auto idx = forecast::model::ExtractIndexedColumns(m.document);
  if (f.category && idx.category != *f.category) return false;
  if (f.class_name && idx.class_name != *f.class_name) return false;
  if (f.source && idx.source != *f.source) return false;
  if (f.dor && idx.dor != *f.dor) return false;

  if (f.search && !f.search->empty()) {
    const auto needle = Lower(*f.search);
    if (!Contains(m.entity_id, needle) && !Contains(idx.manufacturer, needle) && !Contains(idx.model, needle)) {
      return false;
    }
  }
  return true;
}

bool MatchesQuery(const model::ModificationRecord& r, const ModificationQuery& q,
                  const std::unordered_set<std::string>& mirror_ids) {
  if (r.organization_id != q.organization_id) return false;
  if (q.user_id && r.user_id != *q.user_id) return false;
  if (q.session_id && r.session_id != *q.session_id) return false;
  if (!mirror_ids.empty() && !mirror_ids.contains(r.mirror_id)) return false;
  if (!q.states.empty() && std::find(q.states.begin(), q.states.end(), r.sync_state) == q.states.end()) return false;
  return true;
}

void SortNewestFirst(std::vector<model::ModificationRecord>& rows) {
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Raw intake
// ------------------------------------------------------------------

Result MemoryRepository::InsertRawIntake(Transaction& t, const model::RawIntakeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.raw_intake_time.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "raw intake " + r.id);
  s.raw_intake_time[r.id]                 = r.ingested_at_ms;
  s.raw_intake[{r.ingested_at_ms, r.id}] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountRawIntakeBefore(Transaction& t, int64_t cutoff_ms) {
  const auto& s   = TX(t).View();
  auto        end = s.raw_intake.lower_bound({cutoff_ms, std::string{}});
  return static_cast<uint64_t>(std::distance(s.raw_intake.begin(), end));
}

std::vector<model::RawIntakeRecord> MemoryRepository::ListRawIntakeBefore(Transaction& t, int64_t cutoff_ms,
                                                                          const std::optional<model::IntakeCursor>& after,
                                                                          std::size_t limit) {
  const auto& s  = TX(t).View();
  auto        it = after ? s.raw_intake.upper_bound({after->ingested_at_ms, after->id}) : s.raw_intake.begin();

  std::vector<model::RawIntakeRecord> out;
  for (; it != s.raw_intake.end() && out.size() < limit; ++it) {
    if (it->first.first >= cutoff_ms) break;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteRawIntake(Transaction& t, const std::vector<std::string>& ids) {
  auto& s = TX(t).Mutable();
  for (const auto& id : ids) {
    auto it = s.raw_intake_time.find(id);
    if (it == s.raw_intake_time.end()) continue;
    s.raw_intake.erase({it->second, id});
    s.raw_intake_time.erase(it);
  }
  return Result::Ok();
}

model::IntakeStats MemoryRepository::GetIntakeStats(Transaction& t, int64_t cutoff_ms) {
  const auto&        s = TX(t).View();
  model::IntakeStats stats;
  stats.total    = s.raw_intake.size();
  stats.eligible = CountRawIntakeBefore(t, cutoff_ms);
  if (!s.raw_intake.empty()) {
    stats.oldest_ingest_ms = s.raw_intake.begin()->first.first;
    stats.newest_ingest_ms = s.raw_intake.rbegin()->first.first;
  }
  return stats;
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result MemoryRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(r.organization_id, r.entity_id);
  if (s.mirrors.contains(r.id) || s.mirror_by_entity.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "mirror " + r.organization_id + "/" + r.entity_id);
  }
  s.mirrors[r.id]         = r;
  s.mirror_by_entity[key] = r.id;
  return Result::Ok();
}

Result MemoryRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.mirrors.find(r.id);
  if (it == s.mirrors.end()) return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
  if (it->second.organization_id != r.organization_id || it->second.entity_id != r.entity_id) {
    return Result::Err(ErrorCode::ConstraintViolation, "mirror identity is immutable");
  }
  it->second = r;
  return Result::Ok();
}

std::optional<model::MirrorRecord> MemoryRepository::GetMirror(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.mirrors.find(id);
  if (it == s.mirrors.end()) return std::nullopt;
  return it->second;
}

std::optional<model::MirrorRecord> MemoryRepository::GetMirrorByEntity(Transaction& t, const std::string& organization_id,
                                                                       const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.mirror_by_entity.find({organization_id, entity_id});
  if (it == s.mirror_by_entity.end()) return std::nullopt;
  return s.mirrors.at(it->second);
}

std::vector<model::MirrorRecord> MemoryRepository::ListMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
  const auto& s = TX(t).View();

  std::vector<model::MirrorRecord> out;
  std::size_t                      skipped = 0;
  // mirror_by_entity is ordered by (organization, entity id)
  for (auto it = s.mirror_by_entity.lower_bound({organization_id, std::string{}});
       it != s.mirror_by_entity.end() && it->first.first == organization_id && out.size() < filter.limit; ++it) {
    const auto& mirror = s.mirrors.at(it->second);
    if (!MatchesFilter(mirror, filter)) continue;
    if (skipped < filter.offset) {
      ++skipped;
      continue;
    }
    out.push_back(mirror);
  }
  return out;
}

uint64_t MemoryRepository::CountMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
  const auto& s     = TX(t).View();
  uint64_t    count = 0;
  for (auto it = s.mirror_by_entity.lower_bound({organization_id, std::string{}});
       it != s.mirror_by_entity.end() && it->first.first == organization_id; ++it) {
    if (MatchesFilter(s.mirrors.at(it->second), filter)) ++count;
  }
  return count;
}

Result MemoryRepository::InsertMirrorHistory(Transaction& t, const model::MirrorHistoryRecord& r) {
  TX(t).Mutable().mirror_history[r.mirror_id].push_back(r);
  return Result::Ok();
}

std::vector<model::MirrorHistoryRecord> MemoryRepository::ListMirrorHistory(Transaction& t, const std::string& mirror_id) {
  const auto& s  = TX(t).View();
  auto        it = s.mirror_history.find(mirror_id);
  if (it == s.mirror_history.end()) return {};

  std::vector<model::MirrorHistoryRecord> out(it->second.rbegin(), it->second.rend());
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.version > b.version; });
  return out;
}

// ------------------------------------------------------------------
// Modifications
// ------------------------------------------------------------------

Result MemoryRepository::InsertModification(Transaction& t, const model::ModificationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.modifications.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "modification " + r.id);

  if (forecast::model::IsActive(r.sync_state)) {
    for (const auto& [_, existing] : s.modifications) {
      if (existing.mirror_id == r.mirror_id && existing.user_id == r.user_id && forecast::model::IsActive(existing.sync_state)) {
        return Result::Err(ErrorCode::ConstraintViolation, "active modification already exists for mirror " + r.mirror_id);
      }
    }
  }

  s.modifications[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateModification(Transaction& t, const model::ModificationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.modifications.find(r.id);
  if (it == s.modifications.end()) return Result::Err(ErrorCode::NotFound, "modification " + r.id);

  if (forecast::model::IsActive(r.sync_state) && !forecast::model::IsActive(it->second.sync_state)) {
    for (const auto& [id, existing] : s.modifications) {
      if (id != r.id && existing.mirror_id == r.mirror_id && existing.user_id == r.user_id && forecast::model::IsActive(existing.sync_state)) {
        return Result::Err(ErrorCode::ConstraintViolation, "active modification already exists for mirror " + r.mirror_id);
      }
    }
  }

  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteModification(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.modifications.erase(id);
  std::erase_if(s.conflicts, [&](const auto& entry) { return entry.second.modification_id == id; });
  return Result::Ok();
}

std::optional<model::ModificationRecord> MemoryRepository::GetModification(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.modifications.find(id);
  if (it == s.modifications.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ModificationRecord> MemoryRepository::GetActiveModification(Transaction& t, const std::string& mirror_id,
                                                                                 const std::string& user_id) {
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (r.mirror_id == mirror_id && r.user_id == user_id && forecast::model::IsActive(r.sync_state)) return r;
  }
  return std::nullopt;
}

std::vector<model::ModificationRecord> MemoryRepository::ListActiveModifications(Transaction& t, const std::vector<std::string>& mirror_ids,
                                                                                 const std::optional<std::string>& user_id) {
  const std::unordered_set<std::string> wanted(mirror_ids.begin(), mirror_ids.end());

  std::vector<model::ModificationRecord> out;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (!wanted.contains(r.mirror_id) || !forecast::model::IsActive(r.sync_state)) continue;
    if (user_id && r.user_id != *user_id) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

std::vector<model::ModificationRecord> MemoryRepository::ListModifications(Transaction& t, const ModificationQuery& q) {
  const std::unordered_set<std::string> mirror_ids(q.mirror_ids.begin(), q.mirror_ids.end());

  std::vector<model::ModificationRecord> out;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (MatchesQuery(r, q, mirror_ids)) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

uint64_t MemoryRepository::CountModifications(Transaction& t, const ModificationQuery& q) {
  const std::unordered_set<std::string> mirror_ids(q.mirror_ids.begin(), q.mirror_ids.end());

  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (MatchesQuery(r, q, mirror_ids)) ++count;
  }
  return count;
}

std::vector<model::ModificationRecord> MemoryRepository::ListModificationsForMirror(Transaction& t, const std::string& mirror_id) {
  std::vector<model::ModificationRecord> out;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (r.mirror_id == mirror_id) out.push_back(r);
  }
  SortNewestFirst(out);
  return out;
}

std::vector<model::ModificationRecord> MemoryRepository::ClaimDueModifications(Transaction& t, int64_t now_ms, std::size_t limit) {
  const auto is_due = [now_ms](const model::ModificationRecord& r) {
    return r.sync_state == SyncState::kCommitted && r.next_attempt_at_ms <= now_ms;
  };

  // Only clone the snapshot when something is actually due.
  const auto& view = TX(t).View().modifications;
  if (std::none_of(view.begin(), view.end(), [&](const auto& entry) { return is_due(entry.second); })) return {};

  std::vector<model::ModificationRecord*> due;
  for (auto& [_, r] : TX(t).Mutable().modifications) {
    if (is_due(r)) due.push_back(&r);
  }
  std::sort(due.begin(), due.end(), [](const auto* a, const auto* b) {
    if (a->committed_at_ms != b->committed_at_ms) return a->committed_at_ms < b->committed_at_ms;
    return a->id < b->id;
  });
  if (due.size() > limit) due.resize(limit);

  std::vector<model::ModificationRecord> claimed;
  claimed.reserve(due.size());
  for (auto* r : due) {
    r->sync_state    = SyncState::kSyncing;
    r->claimed_at_ms = now_ms;
    claimed.push_back(*r);
  }
  return claimed;
}

uint64_t MemoryRepository::ReleaseStaleClaims(Transaction& t, int64_t claimed_before_ms) {
  bool any = false;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (r.sync_state == SyncState::kSyncing && r.claimed_at_ms < claimed_before_ms) {
      any = true;
      break;
    }
  }
  if (!any) return 0;

  uint64_t released = 0;
  for (auto& [_, r] : TX(t).Mutable().modifications) {
    if (r.sync_state == SyncState::kSyncing && r.claimed_at_ms < claimed_before_ms) {
      r.sync_state    = SyncState::kCommitted;
      r.claimed_at_ms = 0;
      ++released;
    }
  }
  return released;
}

std::map<SyncState, uint64_t> MemoryRepository::CountModificationsByState(Transaction& t, const std::string& organization_id) {
  std::map<SyncState, uint64_t> counts;
  for (const auto& [_, r] : TX(t).View().modifications) {
    if (r.organization_id == organization_id) ++counts[r.sync_state];
  }
  return counts;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result MemoryRepository::InsertConflict(Transaction& t, const model::SyncConflictRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.conflicts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "conflict " + r.id);
  s.conflicts[r.id] = r;
  return Result::Ok();
}

std::vector<model::SyncConflictRecord> MemoryRepository::ListConflicts(Transaction& t, const std::string& organization_id) {
  std::vector<model::SyncConflictRecord> out;
  for (const auto& [_, c] : TX(t).View().conflicts) {
    if (c.organization_id == organization_id) out.push_back(c);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    if (a.modification_id != b.modification_id) return a.modification_id < b.modification_id;
    return a.field < b.field;
  });
  return out;
}

std::vector<model::SyncConflictRecord> MemoryRepository::ListConflictsForModification(Transaction& t, const std::string& modification_id) {
  std::vector<model::SyncConflictRecord> out;
  for (const auto& [_, c] : TX(t).View().conflicts) {
    if (c.modification_id == modification_id) out.push_back(c);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.field < b.field; });
  return out;
}

Result MemoryRepository::DeleteConflictsForModification(Transaction& t, const std::string& modification_id) {
  std::erase_if(TX(t).Mutable().conflicts, [&](const auto& entry) { return entry.second.modification_id == modification_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result MemoryRepository::UpsertUser(Transaction& t, const model::UserRecord& r) {
  TX(t).Mutable().users[r.id] = r;
  return Result::Ok();
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

} // namespace forecast::db::memory
