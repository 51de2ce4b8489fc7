#pragma once

#include <cstdint>
#include <string>

#include "internal/model/document.hpp"

namespace forecast::db::model {

/*
  Canonical local copy of an external record.

  IMPORTANT:
  - The document is only ever replaced wholesale (promotion or confirmed
    write-back) and every replacement bumps version.
  - version is the optimistic-concurrency axis against the external system.
*/
struct MirrorRecord {
  std::string id;
  std::string organization_id;
  std::string entity_id;

  forecast::model::Document document;

  uint64_t version = 0;

  int64_t created_at_ms     = 0;
  int64_t updated_at_ms     = 0;
  int64_t last_synced_at_ms = 0;
};

} // namespace forecast::db::model
