#include "mirror_store.hpp"

#include "internal/core/transact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace forecast::core {

namespace {

void RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
}

} // namespace

db::model::MirrorRecord ReplaceMirrorDocument(db::Repository& repo, db::Transaction& tx, const db::model::MirrorRecord& current, model::Document document,
                                              uint64_t version, const std::string& changed_by, const std::string& change_reason, int64_t now_ms,
                                              bool synced) {
  if (version <= current.version) {
    throw util::InvalidState("mirror " + current.entity_id + " version must increase: " + std::to_string(current.version) + " -> " +
                             std::to_string(version));
  }

  db::model::MirrorHistoryRecord snapshot;
  snapshot.id              = util::NewId();
  snapshot.mirror_id       = current.id;
  snapshot.organization_id = current.organization_id;
  snapshot.document        = current.document;
  snapshot.version         = current.version;
  snapshot.changed_by      = changed_by;
  snapshot.change_reason   = change_reason;
  snapshot.archived_at_ms  = now_ms;
  ThrowIfDbError(repo.InsertMirrorHistory(tx, snapshot), "insert mirror history");

  auto next          = current;
  next.document      = std::move(document);
  next.version       = version;
  next.updated_at_ms = now_ms;
  if (synced) {
    next.last_synced_at_ms = now_ms;
  }
  ThrowIfDbError(repo.UpdateMirror(tx, next), "update mirror");
  return next;
}

MirrorStore::MirrorStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void MirrorStore::SetPromotionListener(PromotionListener listener) {
  on_promote_ = std::move(listener);
}

std::vector<MergedView> MirrorStore::GetMergedViews(const std::string& organization_id, const db::MirrorFilter& filter,
                                                    const std::optional<std::string>& user_id) {
  RequireNonEmpty(organization_id, "organization id");

  // Mirrors and overlays come from one transaction so a concurrent save is
  // seen whole or not at all.
  return Transact(*repository_, [&](db::Transaction& tx) {
    auto mirrors = repository_->ListMirrors(tx, organization_id, filter);
    if (mirrors.empty()) {
      return std::vector<MergedView>{};
    }

    std::vector<std::string> mirror_ids;
    mirror_ids.reserve(mirrors.size());
    for (const auto& mirror : mirrors) {
      mirror_ids.push_back(mirror.id);
    }

    const auto active = repository_->ListActiveModifications(tx, mirror_ids, user_id);
    return MergeEngine::Build(mirrors, active);
  });
}

uint64_t MirrorStore::GetCount(const std::string& organization_id, const db::MirrorFilter& filter) {
  RequireNonEmpty(organization_id, "organization id");
  return Transact(*repository_, [&](db::Transaction& tx) { return repository_->CountMirrors(tx, organization_id, filter); });
}

PromoteResult MirrorStore::PromoteMirror(const std::string& organization_id, const std::string& entity_id, model::Document document,
                                         std::optional<uint64_t> remote_version, const std::string& changed_by) {
  RequireNonEmpty(organization_id, "organization id");
  RequireNonEmpty(entity_id, "entity id");
  if (remote_version && *remote_version == 0) {
    remote_version.reset();
  }

  const auto now = clock_->NowMillis();

  auto promoted = Transact(*repository_, [&](db::Transaction& tx) {
    auto current = repository_->GetMirrorByEntity(tx, organization_id, entity_id);
    if (!current) {
      db::model::MirrorRecord mirror;
      mirror.id                = util::NewId();
      mirror.organization_id   = organization_id;
      mirror.entity_id         = entity_id;
      mirror.document          = document;
      mirror.version           = remote_version.value_or(1);
      mirror.created_at_ms     = now;
      mirror.updated_at_ms     = now;
      mirror.last_synced_at_ms = now;
      ThrowIfDbError(repository_->InsertMirror(tx, mirror), "insert mirror " + entity_id);
      return std::make_pair(mirror, true);
    }

    const auto version = remote_version.value_or(current->version + 1);
    if (version <= current->version) {
      throw util::InvalidState("stale promotion of " + entity_id + ": version " + std::to_string(version) + " is not newer than " +
                               std::to_string(current->version));
    }
    auto next = ReplaceMirrorDocument(*repository_, tx, *current, document, version, changed_by, "promotion", now, true);
    return std::make_pair(next, false);
  });

  FORECAST_LOG_INFO("Mirror promoted", {observability::StringField("organization_id", organization_id),
                                        observability::StringField("entity_id", entity_id),
                                        observability::IntField("version", static_cast<int64_t>(promoted.first.version)),
                                        observability::BoolField("created", promoted.second)});

  if (on_promote_) {
    on_promote_(promoted.first);
  }
  return PromoteResult{promoted.first.id, promoted.first.version, promoted.second};
}

std::vector<std::string> MirrorStore::IngestRaw(const std::string& organization_id, const std::vector<RawPayload>& payloads) {
  RequireNonEmpty(organization_id, "organization id");
  if (payloads.empty()) {
    return {};
  }

  const auto now = clock_->NowMillis();

  std::vector<db::model::RawIntakeRecord> records;
  records.reserve(payloads.size());
  for (const auto& payload : payloads) {
    records.push_back(db::model::RawIntakeRecord{
        .id              = util::NewId(),
        .organization_id = organization_id,
        .ingested_at_ms  = payload.ingested_at_ms.value_or(now),
        .payload         = payload.payload,
    });
  }

  Transact(*repository_, [&](db::Transaction& tx) {
    for (const auto& record : records) {
      ThrowIfDbError(repository_->InsertRawIntake(tx, record), "insert raw intake");
    }
  });

  std::vector<std::string> ids;
  ids.reserve(records.size());
  for (const auto& record : records) {
    ids.push_back(record.id);
  }
  return ids;
}

std::vector<db::model::MirrorHistoryRecord> MirrorStore::GetMirrorHistory(const std::string& organization_id, const std::string& entity_id) {
  RequireNonEmpty(organization_id, "organization id");
  RequireNonEmpty(entity_id, "entity id");

  return Transact(*repository_, [&](db::Transaction& tx) {
    auto mirror = repository_->GetMirrorByEntity(tx, organization_id, entity_id);
    if (!mirror) {
      throw util::NotFound("mirror " + organization_id + "/" + entity_id);
    }
    return repository_->ListMirrorHistory(tx, mirror->id);
  });
}

} // namespace forecast::core
