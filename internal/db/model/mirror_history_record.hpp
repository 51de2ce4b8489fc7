#pragma once

#include <cstdint>
#include <string>

#include "internal/model/document.hpp"

namespace forecast::db::model {

// Snapshot of a mirror document taken right before it was replaced.
struct MirrorHistoryRecord {
  std::string id;
  std::string mirror_id;
  std::string organization_id;

  forecast::model::Document document;
  uint64_t                  version = 0;

  std::string changed_by;
  std::string change_reason;
  int64_t     archived_at_ms = 0;
};

} // namespace forecast::db::model
