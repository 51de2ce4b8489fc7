#pragma once

#include <cstdint>
#include <string>

#include "internal/model/document.hpp"

namespace forecast::db::model {

// One divergent field found by the write-back worker. Lives until resolved.
struct SyncConflictRecord {
  std::string id;
  std::string modification_id;
  std::string mirror_id;
  std::string organization_id;
  std::string entity_id;
  std::string field;

  forecast::model::FieldValue local_value;
  forecast::model::FieldValue remote_value;

  uint64_t local_version  = 0;
  uint64_t remote_version = 0;

  std::string remote_modified_by;
  int64_t     created_at_ms = 0;
};

} // namespace forecast::db::model
