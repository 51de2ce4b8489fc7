#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace forecast::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
