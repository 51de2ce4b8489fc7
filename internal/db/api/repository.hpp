#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/mirror_history_record.hpp"
#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/modification_record.hpp"
#include "internal/db/model/raw_intake_record.hpp"
#include "internal/db/model/sync_conflict_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace forecast::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Readers never observe a partially written modification
  - ClaimDueModifications is exclusive: two overlapping transactions can
    never both claim the same row

  Writes report failures through Result. Reads throw on backend failure.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Raw intake
  // ---------------------------------------------------------------------

  virtual Result InsertRawIntake(Transaction&, const model::RawIntakeRecord&) = 0;

  virtual uint64_t CountRawIntakeBefore(Transaction&, int64_t cutoff_ms) = 0;

  // Oldest first, strictly after `after` in (ingested_at_ms, id) order.
  virtual std::vector<model::RawIntakeRecord> ListRawIntakeBefore(Transaction&, int64_t cutoff_ms, const std::optional<model::IntakeCursor>& after,
                                                                  std::size_t limit) = 0;

  virtual Result DeleteRawIntake(Transaction&, const std::vector<std::string>& ids) = 0;

  virtual model::IntakeStats GetIntakeStats(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Mirror
  // ---------------------------------------------------------------------

  virtual Result InsertMirror(Transaction&, const model::MirrorRecord&) = 0;

  // Whole-row replace keyed by id.
  virtual Result UpdateMirror(Transaction&, const model::MirrorRecord&) = 0;

  virtual std::optional<model::MirrorRecord> GetMirror(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::MirrorRecord> GetMirrorByEntity(Transaction&, const std::string& organization_id, const std::string& entity_id) = 0;

  // Ordered by entity id ascending, paged by filter.limit / filter.offset.
  virtual std::vector<model::MirrorRecord> ListMirrors(Transaction&, const std::string& organization_id, const MirrorFilter&) = 0;

  // Ignores filter.limit / filter.offset.
  virtual uint64_t CountMirrors(Transaction&, const std::string& organization_id, const MirrorFilter&) = 0;

  virtual Result InsertMirrorHistory(Transaction&, const model::MirrorHistoryRecord&) = 0;

  // Newest first.
  virtual std::vector<model::MirrorHistoryRecord> ListMirrorHistory(Transaction&, const std::string& mirror_id) = 0;

  // ---------------------------------------------------------------------
  // Modifications
  // ---------------------------------------------------------------------

  virtual Result InsertModification(Transaction&, const model::ModificationRecord&) = 0;

  virtual Result UpdateModification(Transaction&, const model::ModificationRecord&) = 0;

  virtual Result DeleteModification(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ModificationRecord> GetModification(Transaction&, const std::string& id) = 0;

  // The draft/committed/syncing row for (mirror, user), if any.
  virtual std::optional<model::ModificationRecord> GetActiveModification(Transaction&, const std::string& mirror_id, const std::string& user_id) = 0;

  // Active rows for the given mirrors; all users unless `user_id` is set.
  virtual std::vector<model::ModificationRecord> ListActiveModifications(Transaction&, const std::vector<std::string>& mirror_ids,
                                                                         const std::optional<std::string>& user_id) = 0;

  virtual std::vector<model::ModificationRecord> ListModifications(Transaction&, const ModificationQuery&) = 0;

  virtual uint64_t CountModifications(Transaction&, const ModificationQuery&) = 0;

  // Every modification ever made to the mirror, newest first.
  virtual std::vector<model::ModificationRecord> ListModificationsForMirror(Transaction&, const std::string& mirror_id) = 0;

  // Moves up to `limit` committed rows due at `now_ms` to syncing, oldest
  // commit first, stamping claimed_at_ms. Returns the claimed rows.
  virtual std::vector<model::ModificationRecord> ClaimDueModifications(Transaction&, int64_t now_ms, std::size_t limit) = 0;

  // Returns syncing rows claimed before `claimed_before_ms` to committed.
  virtual uint64_t ReleaseStaleClaims(Transaction&, int64_t claimed_before_ms) = 0;

  virtual std::map<forecast::model::SyncState, uint64_t> CountModificationsByState(Transaction&, const std::string& organization_id) = 0;

  // ---------------------------------------------------------------------
  // Conflicts
  // ---------------------------------------------------------------------

  virtual Result InsertConflict(Transaction&, const model::SyncConflictRecord&) = 0;

  virtual std::vector<model::SyncConflictRecord> ListConflicts(Transaction&, const std::string& organization_id) = 0;

  virtual std::vector<model::SyncConflictRecord> ListConflictsForModification(Transaction&, const std::string& modification_id) = 0;

  virtual Result DeleteConflictsForModification(Transaction&, const std::string& modification_id) = 0;

  // ---------------------------------------------------------------------
  // Users (identity join only)
  // ---------------------------------------------------------------------

  virtual Result UpsertUser(Transaction&, const model::UserRecord&) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, const std::string& id) = 0;
};

} // namespace forecast::db
