#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace forecast::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRawIntake(Transaction&, const model::RawIntakeRecord&) override;
  uint64_t CountRawIntakeBefore(Transaction&, int64_t cutoff_ms) override;
  std::vector<model::RawIntakeRecord> ListRawIntakeBefore(Transaction&, int64_t cutoff_ms,
                                                          const std::optional<model::IntakeCursor>& after,
                                                          std::size_t limit) override;
  Result DeleteRawIntake(Transaction&, const std::vector<std::string>& ids) override;
  model::IntakeStats GetIntakeStats(Transaction&, int64_t cutoff_ms) override;

  Result InsertMirror(Transaction&, const model::MirrorRecord&) override;
  Result UpdateMirror(Transaction&, const model::MirrorRecord&) override;
  std::optional<model::MirrorRecord> GetMirror(Transaction&, const std::string& id) override;
  std::optional<model::MirrorRecord> GetMirrorByEntity(Transaction&, const std::string& organization_id,
                                                       const std::string& entity_id) override;
  std::vector<model::MirrorRecord> ListMirrors(Transaction&, const std::string& organization_id, const MirrorFilter&) override;
  uint64_t CountMirrors(Transaction&, const std::string& organization_id, const MirrorFilter&) override;
  Result InsertMirrorHistory(Transaction&, const model::MirrorHistoryRecord&) override;
  std::vector<model::MirrorHistoryRecord> ListMirrorHistory(Transaction&, const std::string& mirror_id) override;

  Result InsertModification(Transaction&, const model::ModificationRecord&) override;
  Result UpdateModification(Transaction&, const model::ModificationRecord&) override;
  Result DeleteModification(Transaction&, const std::string& id) override;
  std::optional<model::ModificationRecord> GetModification(Transaction&, const std::string& id) override;
  std::optional<model::ModificationRecord> GetActiveModification(Transaction&, const std::string& mirror_id,
                                                                 const std::string& user_id) override;
  std::vector<model::ModificationRecord> ListActiveModifications(Transaction&, const std::vector<std::string>& mirror_ids,
                                                                 const std::optional<std::string>& user_id) override;
  std::vector<model::ModificationRecord> ListModifications(Transaction&, const ModificationQuery&) override;
  uint64_t CountModifications(Transaction&, const ModificationQuery&) override;
  std::vector<model::ModificationRecord> ListModificationsForMirror(Transaction&, const std::string& mirror_id) override;
  std::vector<model::ModificationRecord> ClaimDueModifications(Transaction&, int64_t now_ms, std::size_t limit) override;
  uint64_t ReleaseStaleClaims(Transaction&, int64_t claimed_before_ms) override;
  std::map<forecast::model::SyncState, uint64_t> CountModificationsByState(Transaction&, const std::string& organization_id) override;

  Result InsertConflict(Transaction&, const model::SyncConflictRecord&) override;
  std::vector<model::SyncConflictRecord> ListConflicts(Transaction&, const std::string& organization_id) override;
  std::vector<model::SyncConflictRecord> ListConflictsForModification(Transaction&, const std::string& modification_id) override;
  Result DeleteConflictsForModification(Transaction&, const std::string& modification_id) override;

  Result UpsertUser(Transaction&, const model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, const std::string& id) override;

private:
  friend class MemoryTransaction;

  using IntakeKey = std::pair<int64_t, std::string>;

  struct State {
    std::map<IntakeKey, model::RawIntakeRecord>  raw_intake;
    std::unordered_map<std::string, int64_t>     raw_intake_time;

    std::unordered_map<std::string, model::MirrorRecord>                  mirrors;
    std::map<std::pair<std::string, std::string>, std::string>            mirror_by_entity;
    std::unordered_map<std::string, std::vector<model::MirrorHistoryRecord>> mirror_history;

    std::unordered_map<std::string, model::ModificationRecord> modifications;
    std::map<std::string, model::SyncConflictRecord>           conflicts;
    std::unordered_map<std::string, model::UserRecord>         users;
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

}
