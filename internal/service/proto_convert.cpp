#include "proto_convert.hpp"

#include "internal/model/document_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace forecast::service {

namespace v1 = forecast::sync::v1;

namespace {

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

// Zero means "never" and stays unset on the wire.
template <typename Setter>
void SetTime(int64_t unix_ms, Setter&& mutable_field) {
  if (unix_ms != 0) {
    *mutable_field() = util::TimestampFromUnixMillis(unix_ms);
  }
}

} // namespace

v1::SyncState ToProto(model::SyncState state) {
  switch (state) {
    case model::SyncState::kDraft:
      return v1::SYNC_STATE_DRAFT;
    case model::SyncState::kCommitted:
      return v1::SYNC_STATE_COMMITTED;
    case model::SyncState::kSyncing:
      return v1::SYNC_STATE_SYNCING;
    case model::SyncState::kSynced:
      return v1::SYNC_STATE_SYNCED;
    case model::SyncState::kSyncError:
      return v1::SYNC_STATE_SYNC_ERROR;
    case model::SyncState::kConflict:
      return v1::SYNC_STATE_CONFLICT;
  }
  return v1::SYNC_STATE_UNSPECIFIED;
}

v1::SyncState ToProto(const std::optional<model::SyncState>& state) {
  return state ? ToProto(*state) : v1::SYNC_STATE_PRISTINE;
}

std::optional<model::SyncState> FromProto(v1::SyncState state) {
  switch (state) {
    case v1::SYNC_STATE_DRAFT:
      return model::SyncState::kDraft;
    case v1::SYNC_STATE_COMMITTED:
      return model::SyncState::kCommitted;
    case v1::SYNC_STATE_SYNCING:
      return model::SyncState::kSyncing;
    case v1::SYNC_STATE_SYNCED:
      return model::SyncState::kSynced;
    case v1::SYNC_STATE_SYNC_ERROR:
      return model::SyncState::kSyncError;
    case v1::SYNC_STATE_CONFLICT:
      return model::SyncState::kConflict;
    default:
      return std::nullopt;
  }
}

db::MirrorFilter FromProto(const v1::MirrorFilter& filter) {
  db::MirrorFilter out;
  out.category   = NonEmpty(filter.category());
  out.class_name = NonEmpty(filter.class_name());
  out.source     = NonEmpty(filter.source());
  out.dor        = NonEmpty(filter.dor());
  out.search     = NonEmpty(filter.search());
  if (filter.limit() > 0) {
    out.limit = filter.limit();
  }
  out.offset = filter.offset();
  return out;
}

core::DraftSelector FromProto(const v1::DraftSelector& selector) {
  core::DraftSelector out;
  out.organization_id = selector.organization_id();
  out.user_id         = selector.user_id();
  out.session_id      = NonEmpty(selector.session_id());
  out.entity_ids.assign(selector.entity_ids().begin(), selector.entity_ids().end());
  return out;
}

core::FieldResolution FromProto(const v1::FieldResolution& resolution) {
  if (resolution.field().empty()) {
    throw util::InvalidArgument("resolution field must not be empty");
  }

  core::FieldResolution out;
  out.field = resolution.field();
  switch (resolution.choice()) {
    case v1::RESOLUTION_CHOICE_KEEP_LOCAL:
      out.choice = core::ResolutionChoice::kKeepLocal;
      break;
    case v1::RESOLUTION_CHOICE_KEEP_REMOTE:
      out.choice = core::ResolutionChoice::kKeepRemote;
      break;
    case v1::RESOLUTION_CHOICE_MANUAL:
      if (!resolution.has_manual_value()) {
        throw util::InvalidArgument("manual resolution of " + resolution.field() + " needs a value");
      }
      out.choice       = core::ResolutionChoice::kManual;
      out.manual_value = model::FromProto(resolution.manual_value());
      break;
    default:
      throw util::InvalidArgument("resolution of " + resolution.field() + " has no choice");
  }
  return out;
}

v1::MergedView ToProto(const core::MergedView& view) {
  v1::MergedView out;
  out.set_mirror_id(view.mirror_id);
  out.set_entity_id(view.entity_id);
  out.set_mirror_version(view.mirror_version);
  *out.mutable_document() = model::ToProto(view.document);
  out.set_has_modification(view.has_modification);
  out.set_sync_state(ToProto(view.sync_state));
  out.set_modification_id(view.modification_id);
  out.set_modified_by(view.modified_by);
  SetTime(view.last_modified_at_ms, [&] { return out.mutable_last_modified_at(); });
  for (const auto& field : view.modified_fields) {
    out.add_modified_fields(field);
  }
  return out;
}

v1::Modification ToProto(const db::model::ModificationRecord& record, const std::string& entity_id, const std::string& username) {
  v1::Modification out;
  out.set_id(record.id);
  out.set_mirror_id(record.mirror_id);
  out.set_entity_id(entity_id);
  out.set_user_id(record.user_id);
  out.set_username(username);
  *out.mutable_delta() = model::ToProto(record.delta);
  for (const auto& field : record.modified_fields) {
    out.add_modified_fields(field);
  }
  out.set_session_id(record.session_id);
  out.set_change_reason(record.change_reason);
  out.set_base_version(record.base_version);
  out.set_edit_count(record.edit_count);
  out.set_sync_state(ToProto(record.sync_state));
  out.set_attempt_count(record.attempt_count);
  out.set_last_error(record.last_error);
  SetTime(record.created_at_ms, [&] { return out.mutable_created_at(); });
  SetTime(record.updated_at_ms, [&] { return out.mutable_updated_at(); });
  SetTime(record.committed_at_ms, [&] { return out.mutable_committed_at(); });
  SetTime(record.synced_at_ms, [&] { return out.mutable_synced_at(); });
  return out;
}

v1::MirrorSnapshot ToProto(const db::model::MirrorHistoryRecord& snapshot) {
  v1::MirrorSnapshot out;
  out.set_mirror_id(snapshot.mirror_id);
  out.set_version(snapshot.version);
  *out.mutable_document() = model::ToProto(snapshot.document);
  out.set_changed_by(snapshot.changed_by);
  out.set_change_reason(snapshot.change_reason);
  SetTime(snapshot.archived_at_ms, [&] { return out.mutable_archived_at(); });
  return out;
}

v1::SyncConflict ToProto(const db::model::SyncConflictRecord& conflict) {
  v1::SyncConflict out;
  out.set_id(conflict.id);
  out.set_modification_id(conflict.modification_id);
  out.set_mirror_id(conflict.mirror_id);
  out.set_entity_id(conflict.entity_id);
  out.set_field(conflict.field);
  *out.mutable_local_value()  = model::ToProto(conflict.local_value);
  *out.mutable_remote_value() = model::ToProto(conflict.remote_value);
  out.set_local_version(conflict.local_version);
  out.set_remote_version(conflict.remote_version);
  out.set_remote_modified_by(conflict.remote_modified_by);
  SetTime(conflict.created_at_ms, [&] { return out.mutable_created_at(); });
  return out;
}

v1::SyncCycleSummary ToProto(const sync::SyncCycleSummary& summary) {
  v1::SyncCycleSummary out;
  out.set_claimed(summary.claimed);
  out.set_synced(summary.synced);
  out.set_conflicts(summary.conflicts);
  out.set_retried(summary.retried);
  out.set_failed(summary.failed);
  out.set_released(summary.released);
  out.set_stale_released(summary.stale_released);
  out.set_duration_ms(static_cast<uint64_t>(summary.duration_ms));
  return out;
}

v1::RetentionSummary ToProto(const retention::RetentionSummary& summary) {
  v1::RetentionSummary out;
  out.set_eligible(summary.eligible);
  out.set_archived(summary.archived);
  out.set_deleted(summary.deleted);
  out.set_errors(summary.errors);
  out.set_batches(summary.batches);
  out.set_failed_batches(summary.failed_batches);
  *out.mutable_cutoff() = util::TimestampFromUnixMillis(summary.cutoff_ms);
  out.set_dry_run(summary.dry_run);
  out.set_cancelled(summary.cancelled);
  out.set_duration_ms(static_cast<uint64_t>(summary.duration_ms));
  return out;
}

v1::JobStatus ToProto(const runtime::JobStatus& status) {
  v1::JobStatus out;
  out.set_name(status.name);
  out.set_enabled(status.enabled);
  out.set_running(status.running);
  SetTime(status.next_run_ms, [&] { return out.mutable_next_run(); });
  SetTime(status.last_run_ms, [&] { return out.mutable_last_run(); });
  out.set_run_count(status.run_count);
  out.set_failure_count(status.failure_count);
  out.set_last_error(status.last_error);
  return out;
}

} // namespace forecast::service
