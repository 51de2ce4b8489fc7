#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/validator.hpp"

namespace forecast::core {

// Which drafts a commit or discard applies to.
struct DraftSelector {
  std::string organization_id;
  std::string user_id;

  std::optional<std::string> session_id;

  // Empty means every draft of the user.
  std::vector<std::string> entity_ids;
};

struct ModificationHistoryEntry {
  db::model::ModificationRecord record;
  std::string                   entity_id;
  std::string                   username;
};

/*
  Draft / commit / discard lifecycle of per-user deltas.

  Nothing here talks to the external system. Committed rows are picked up
  later by the sync worker.
*/
class DeltaManager {
 public:
  DeltaManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<validation::Validator> validator, std::shared_ptr<util::TimeSource> clock);

  // Creates the user's draft on the entity or folds `delta` into the
  // existing one. A committed or syncing modification by the same user
  // blocks new drafts until it settles (InvalidState).
  db::model::ModificationRecord SaveDraft(const std::string& organization_id, const std::string& user_id, const std::string& entity_id,
                                          const model::Document& delta, const std::optional<std::string>& session_id = std::nullopt,
                                          const std::optional<std::string>& change_reason = std::nullopt);

  // All-or-nothing: every selected draft is validated before any of them
  // moves to committed.
  uint32_t CommitDrafts(const DraftSelector& selector);

  uint32_t DiscardDrafts(const DraftSelector& selector);

  uint64_t GetDraftCount(const std::string& organization_id, const std::string& user_id);

  // Newest first.
  std::vector<ModificationHistoryEntry> GetModificationHistory(const std::string& organization_id, const std::string& entity_id);

 private:
  // Drafts picked by `selector`, read inside `tx`. Unknown entity ids match
  // nothing.
  std::vector<db::model::ModificationRecord> SelectDrafts(db::Transaction& tx, const DraftSelector& selector);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<validation::Validator> validator_;
  std::shared_ptr<util::TimeSource>      clock_;
};

} // namespace forecast::core
