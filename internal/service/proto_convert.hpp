#pragma once

#include <optional>
#include <string>

#include "forecast/sync/v1.hpp"
#include "internal/core/conflict_resolver.hpp"
#include "internal/core/delta_manager.hpp"
#include "internal/core/merge_engine.hpp"
#include "internal/db/api/query.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/runtime/scheduler.hpp"
#include "internal/sync/sync_worker.hpp"

namespace forecast::service {

/*
  Conversions between the wire types of forecast.sync.v1 and the internal
  records. Requests that cannot be mapped throw util::InvalidArgument.
*/

forecast::sync::v1::SyncState ToProto(model::SyncState state);

// Unset converts to SYNC_STATE_PRISTINE.
forecast::sync::v1::SyncState ToProto(const std::optional<model::SyncState>& state);

std::optional<model::SyncState> FromProto(forecast::sync::v1::SyncState state);

db::MirrorFilter FromProto(const forecast::sync::v1::MirrorFilter& filter);

core::DraftSelector FromProto(const forecast::sync::v1::DraftSelector& selector);

core::FieldResolution FromProto(const forecast::sync::v1::FieldResolution& resolution);

forecast::sync::v1::MergedView ToProto(const core::MergedView& view);

forecast::sync::v1::Modification ToProto(const db::model::ModificationRecord& record, const std::string& entity_id, const std::string& username);

forecast::sync::v1::MirrorSnapshot ToProto(const db::model::MirrorHistoryRecord& snapshot);

forecast::sync::v1::SyncConflict ToProto(const db::model::SyncConflictRecord& conflict);

forecast::sync::v1::SyncCycleSummary ToProto(const sync::SyncCycleSummary& summary);

forecast::sync::v1::RetentionSummary ToProto(const retention::RetentionSummary& summary);

forecast::sync::v1::JobStatus ToProto(const runtime::JobStatus& status);

} // namespace forecast::service
