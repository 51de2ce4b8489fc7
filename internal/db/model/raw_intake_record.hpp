#pragma once

#include <cstdint>
#include <string>

namespace forecast::db::model {

/*
  Immutable raw intake row.

  Append-only. The retention manager is the only deleter, and only after a
  successful archive when archival is enabled.
*/
struct RawIntakeRecord {
  std::string id;
  std::string organization_id;
  int64_t     ingested_at_ms = 0;

  // Opaque upstream payload.
  std::string payload;
};

// Keyset position for oldest-first paging: (ingested_at_ms, id).
struct IntakeCursor {
  int64_t     ingested_at_ms = 0;
  std::string id;
};

struct IntakeStats {
  uint64_t eligible         = 0;
  uint64_t total            = 0;
  int64_t  oldest_ingest_ms = 0;
  int64_t  newest_ingest_ms = 0;
};

} // namespace forecast::db::model
