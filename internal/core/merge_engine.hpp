#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/modification_record.hpp"
#include "internal/model/document.hpp"
#include "internal/model/state_machine.hpp"

namespace forecast::core {

/*
  What a user sees for one mirror row: the mirror document with at most one
  active delta overlaid.
*/
struct MergedView {
  std::string mirror_id;
  std::string entity_id;
  uint64_t    mirror_version = 0;

  model::Document document;

  bool has_modification = false;

  // Unset means pristine.
  std::optional<model::SyncState> sync_state;

  std::string           modification_id;
  std::string           modified_by;
  int64_t               last_modified_at_ms = 0;
  std::set<std::string> modified_fields;
};

class MergeEngine {
 public:
  static MergedView Overlay(const db::model::MirrorRecord& mirror, const db::model::ModificationRecord* delta);

  // The overlay to apply per mirror id. When several users hold active
  // deltas on one row, the most recently updated one wins.
  static std::unordered_map<std::string, const db::model::ModificationRecord*> SelectOverlays(
      const std::vector<db::model::ModificationRecord>& active);

  static std::vector<MergedView> Build(const std::vector<db::model::MirrorRecord>& mirrors,
                                       const std::vector<db::model::ModificationRecord>& active);
};

} // namespace forecast::core
