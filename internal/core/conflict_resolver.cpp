#include "conflict_resolver.hpp"

#include <algorithm>
#include <map>

#include "internal/core/transact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace forecast::core {

using model::SyncState;

namespace {

void Transition(db::model::ModificationRecord& record, SyncState to) {
  if (!model::CanTransition(record.sync_state, to)) {
    throw util::InvalidState("modification " + record.id + " cannot move from " + std::string(model::ToString(record.sync_state)) + " to " +
                             std::string(model::ToString(to)));
  }
  record.sync_state = to;
}

} // namespace

ConflictResolver::ConflictResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<validation::Validator> validator,
                                   std::shared_ptr<util::TimeSource> clock)
    : repository_(std::move(repository)), validator_(std::move(validator)), clock_(std::move(clock)) {
}

ResolutionOutcome ConflictResolver::ResolveConflicts(const std::string& organization_id, const std::string& modification_id,
                                                     const std::vector<FieldResolution>& resolutions, const std::string& resolved_by) {
  if (organization_id.empty() || modification_id.empty()) {
    throw util::InvalidArgument("organization id and modification id are required");
  }

  std::map<std::string, const FieldResolution*> decisions;
  for (const auto& resolution : resolutions) {
    if (!decisions.emplace(resolution.field, &resolution).second) {
      throw util::InvalidArgument("duplicate decision for field " + resolution.field);
    }
  }

  auto outcome = Transact(*repository_, [&](db::Transaction& tx) {
    auto record = repository_->GetModification(tx, modification_id);
    if (!record || record->organization_id != organization_id) {
      throw util::NotFound("modification " + modification_id);
    }
    if (record->sync_state != SyncState::kConflict) {
      throw util::InvalidState("modification " + modification_id + " is " + std::string(model::ToString(record->sync_state)) + ", not in conflict");
    }

    const auto conflicts = repository_->ListConflictsForModification(tx, modification_id);
    if (conflicts.empty()) {
      throw util::InvalidState("modification " + modification_id + " has no recorded conflicts");
    }

    uint64_t rebase_version = 0;
    for (const auto& conflict : conflicts) {
      if (!decisions.contains(conflict.field)) {
        throw util::InvalidArgument("missing decision for conflicting field " + conflict.field);
      }
      rebase_version = std::max(rebase_version, conflict.remote_version);
    }
    for (const auto& [field, _] : decisions) {
      const bool known = std::any_of(conflicts.begin(), conflicts.end(), [&](const auto& c) { return c.field == field; });
      if (!known) {
        throw util::InvalidArgument("field " + field + " is not in conflict");
      }
    }

    for (const auto& conflict : conflicts) {
      const auto& decision = *decisions.at(conflict.field);
      switch (decision.choice) {
        case ResolutionChoice::kKeepLocal:
          break;
        case ResolutionChoice::kKeepRemote:
          // The mirror may still be behind the remote; the draft carries the
          // value until the worker catches the mirror up.
          record->delta[conflict.field] = conflict.remote_value;
          break;
        case ResolutionChoice::kManual:
          record->delta[conflict.field] = decision.manual_value;
          break;
      }
      record->modified_fields.insert(conflict.field);
    }

    ThrowIfDbError(repository_->DeleteConflictsForModification(tx, modification_id), "delete conflicts of " + modification_id);

    auto mirror = repository_->GetMirror(tx, record->mirror_id);
    if (!mirror) {
      throw util::NotFound("mirror " + record->mirror_id);
    }

    if (auto other = repository_->GetActiveModification(tx, record->mirror_id, record->user_id)) {
      throw util::InvalidState("user " + record->user_id + " already has an active modification " + other->id + " on " + mirror->entity_id);
    }

    const auto report = validator_->Validate(record->delta, mirror->document);
    if (!report.Valid()) {
      throw util::ValidationFailed("resolved delta for " + mirror->entity_id + " failed validation", report.errors);
    }

    const auto now = clock_->NowMillis();
    Transition(*record, SyncState::kDraft);
    Transition(*record, SyncState::kCommitted);
    // A base past the mirror means the remote moved; the worker folds that
    // remote version into the mirror before pushing on top of it.
    record->base_version       = std::max(rebase_version, mirror->version);
    record->edit_count        += 1;
    record->attempt_count      = 0;
    record->claimed_at_ms      = 0;
    record->next_attempt_at_ms = now;
    record->committed_at_ms    = now;
    record->updated_at_ms      = now;
    record->last_error.clear();
    ThrowIfDbError(repository_->UpdateModification(tx, *record), "requeue resolved modification " + modification_id);

    return ResolutionOutcome{*record, mirror->entity_id};
  });

  FORECAST_LOG_INFO("Conflicts resolved", {observability::StringField("modification_id", modification_id),
                                           observability::StringField("resolved_by", resolved_by),
                                           observability::IntField("fields", static_cast<int64_t>(decisions.size())),
                                           observability::IntField("base_version", static_cast<int64_t>(outcome.modification.base_version))});
  return outcome;
}

} // namespace forecast::core
