#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/merge_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace forecast::core {

struct RawPayload {
  std::string payload;

  // Unset stamps the record with the current time.
  std::optional<int64_t> ingested_at_ms;
};

struct PromoteResult {
  std::string mirror_id;
  uint64_t    version = 0;
  bool        created = false;
};

/*
  Replaces a mirror document wholesale inside `tx`.

  Snapshots the previous document into mirror history first. The new
  version must be greater than the current one.
*/
db::model::MirrorRecord ReplaceMirrorDocument(db::Repository& repo, db::Transaction& tx, const db::model::MirrorRecord& current, model::Document document,
                                              uint64_t version, const std::string& changed_by, const std::string& change_reason, int64_t now_ms,
                                              bool synced);

/*
  Read side of the layered store plus the two ways a mirror row changes
  outside write-back: promotion from upstream and raw intake.
*/
class MirrorStore {
 public:
  // Called after every committed promotion.
  using PromotionListener = std::function<void(const db::model::MirrorRecord&)>;

  MirrorStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock);

  // Mirror rows with at most one active delta overlaid. Scoped to one
  // user's deltas when `user_id` is set.
  std::vector<MergedView> GetMergedViews(const std::string& organization_id, const db::MirrorFilter& filter,
                                         const std::optional<std::string>& user_id = std::nullopt);

  uint64_t GetCount(const std::string& organization_id, const db::MirrorFilter& filter);

  // Creates the row at `remote_version` (or 1), or replaces it with a
  // version bump. A remote version not newer than the stored one is
  // rejected with InvalidState.
  PromoteResult PromoteMirror(const std::string& organization_id, const std::string& entity_id, model::Document document,
                              std::optional<uint64_t> remote_version, const std::string& changed_by);

  std::vector<std::string> IngestRaw(const std::string& organization_id, const std::vector<RawPayload>& payloads);

  // Newest first.
  std::vector<db::model::MirrorHistoryRecord> GetMirrorHistory(const std::string& organization_id, const std::string& entity_id);

  void SetPromotionListener(PromotionListener listener);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;
  PromotionListener                 on_promote_;
};

} // namespace forecast::core
