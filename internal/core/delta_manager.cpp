#include "delta_manager.hpp"

#include <unordered_map>

#include "internal/core/transact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace forecast::core {

using model::SyncState;

namespace {

void RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
}

void RequireSelector(const DraftSelector& selector) {
  RequireNonEmpty(selector.organization_id, "organization id");
  RequireNonEmpty(selector.user_id, "user id");
}

void EnsureUser(db::Repository& repo, db::Transaction& tx, const std::string& user_id) {
  if (repo.GetUser(tx, user_id)) {
    return;
  }
  ThrowIfDbError(repo.UpsertUser(tx, db::model::UserRecord{user_id, user_id, user_id}), "register user " + user_id);
}

} // namespace

DeltaManager::DeltaManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<validation::Validator> validator,
                           std::shared_ptr<util::TimeSource> clock)
    : repository_(std::move(repository)), validator_(std::move(validator)), clock_(std::move(clock)) {
}

db::model::ModificationRecord DeltaManager::SaveDraft(const std::string& organization_id, const std::string& user_id, const std::string& entity_id,
                                                      const model::Document& delta, const std::optional<std::string>& session_id,
                                                      const std::optional<std::string>& change_reason) {
  RequireNonEmpty(organization_id, "organization id");
  RequireNonEmpty(user_id, "user id");
  RequireNonEmpty(entity_id, "entity id");
  if (delta.empty()) {
    throw util::InvalidArgument("delta must contain at least one field");
  }

  auto saved = Transact(*repository_, [&](db::Transaction& tx) {
    auto mirror = repository_->GetMirrorByEntity(tx, organization_id, entity_id);
    if (!mirror) {
      throw util::NotFound("mirror " + organization_id + "/" + entity_id);
    }

    const auto now      = clock_->NowMillis();
    auto       existing = repository_->GetActiveModification(tx, mirror->id, user_id);
    if (existing && existing->sync_state != SyncState::kDraft) {
      throw util::InvalidState("entity " + entity_id + " has a pending " + std::string(model::ToString(existing->sync_state)) +
                               " modification by " + user_id);
    }

    db::model::ModificationRecord record;
    if (existing) {
      record       = *existing;
      record.delta = model::Merge(record.delta, delta);
      record.edit_count += 1;
    } else {
      record.id              = util::NewId();
      record.mirror_id       = mirror->id;
      record.organization_id = organization_id;
      record.user_id         = user_id;
      record.delta           = delta;
      record.base_version    = mirror->version;
      record.edit_count      = 1;
      record.sync_state      = SyncState::kDraft;
      record.created_at_ms   = now;
    }

    for (const auto& [field, _] : delta) {
      record.modified_fields.insert(field);
    }
    record.updated_at_ms = now;
    if (session_id) record.session_id = *session_id;
    if (change_reason) record.change_reason = *change_reason;

    const auto report = validator_->Validate(record.delta, mirror->document);
    if (!report.Valid()) {
      throw util::ValidationFailed("delta for " + entity_id + " failed validation", report.errors);
    }

    EnsureUser(*repository_, tx, user_id);
    if (existing) {
      ThrowIfDbError(repository_->UpdateModification(tx, record), "update draft " + record.id);
    } else {
      ThrowIfDbError(repository_->InsertModification(tx, record), "insert draft on " + entity_id);
    }
    return record;
  });

  return saved;
}

std::vector<db::model::ModificationRecord> DeltaManager::SelectDrafts(db::Transaction& tx, const DraftSelector& selector) {
  db::ModificationQuery query;
  query.organization_id = selector.organization_id;
  query.user_id         = selector.user_id;
  query.session_id      = selector.session_id;
  query.states          = {SyncState::kDraft};

  if (!selector.entity_ids.empty()) {
    for (const auto& entity_id : selector.entity_ids) {
      if (auto mirror = repository_->GetMirrorByEntity(tx, selector.organization_id, entity_id)) {
        query.mirror_ids.push_back(mirror->id);
      }
    }
    if (query.mirror_ids.empty()) {
      return {};
    }
  }

  return repository_->ListModifications(tx, query);
}

uint32_t DeltaManager::CommitDrafts(const DraftSelector& selector) {
  RequireSelector(selector);

  const auto committed = Transact(*repository_, [&](db::Transaction& tx) {
    auto drafts = SelectDrafts(tx, selector);

    std::vector<util::FieldError> errors;
    for (const auto& draft : drafts) {
      auto mirror = repository_->GetMirror(tx, draft.mirror_id);
      if (!mirror) {
        throw util::NotFound("mirror " + draft.mirror_id);
      }
      for (auto& error : validator_->Validate(draft.delta, mirror->document).errors) {
        error.field = mirror->entity_id + "." + error.field;
        errors.push_back(std::move(error));
      }
    }
    if (!errors.empty()) {
      throw util::ValidationFailed("commit rejected: " + std::to_string(errors.size()) + " validation error(s)", std::move(errors));
    }

    const auto now = clock_->NowMillis();
    for (auto& draft : drafts) {
      draft.sync_state         = SyncState::kCommitted;
      draft.committed_at_ms    = now;
      draft.updated_at_ms      = now;
      draft.next_attempt_at_ms = now;
      draft.attempt_count      = 0;
      draft.last_error.clear();
      ThrowIfDbError(repository_->UpdateModification(tx, draft), "commit draft " + draft.id);
    }
    return static_cast<uint32_t>(drafts.size());
  });

  if (committed > 0) {
    FORECAST_LOG_INFO("Drafts committed", {observability::StringField("organization_id", selector.organization_id),
                                           observability::StringField("user_id", selector.user_id),
                                           observability::IntField("count", committed)});
  }
  return committed;
}

uint32_t DeltaManager::DiscardDrafts(const DraftSelector& selector) {
  RequireSelector(selector);

  return Transact(*repository_, [&](db::Transaction& tx) {
    const auto drafts = SelectDrafts(tx, selector);
    for (const auto& draft : drafts) {
      ThrowIfDbError(repository_->DeleteModification(tx, draft.id), "discard draft " + draft.id);
    }
    return static_cast<uint32_t>(drafts.size());
  });
}

uint64_t DeltaManager::GetDraftCount(const std::string& organization_id, const std::string& user_id) {
  RequireNonEmpty(organization_id, "organization id");
  RequireNonEmpty(user_id, "user id");

  db::ModificationQuery query;
  query.organization_id = organization_id;
  query.user_id         = user_id;
  query.states          = {SyncState::kDraft};
  return Transact(*repository_, [&](db::Transaction& tx) { return repository_->CountModifications(tx, query); });
}

std::vector<ModificationHistoryEntry> DeltaManager::GetModificationHistory(const std::string& organization_id, const std::string& entity_id) {
  RequireNonEmpty(organization_id, "organization id");
  RequireNonEmpty(entity_id, "entity id");

  return Transact(*repository_, [&](db::Transaction& tx) {
    auto mirror = repository_->GetMirrorByEntity(tx, organization_id, entity_id);
    if (!mirror) {
      throw util::NotFound("mirror " + organization_id + "/" + entity_id);
    }

    std::unordered_map<std::string, std::string> usernames;
    std::vector<ModificationHistoryEntry>        history;
    for (auto& record : repository_->ListModificationsForMirror(tx, mirror->id)) {
      auto it = usernames.find(record.user_id);
      if (it == usernames.end()) {
        auto user = repository_->GetUser(tx, record.user_id);
        it        = usernames.emplace(record.user_id, user ? user->username : record.user_id).first;
      }
      history.push_back(ModificationHistoryEntry{std::move(record), entity_id, it->second});
    }
    return history;
  });
}

} // namespace forecast::core
