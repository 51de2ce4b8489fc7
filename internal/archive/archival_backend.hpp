#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/raw_intake_record.hpp"

namespace forecast::archive {

struct ArchiveReceipt {
  std::string archive_id;
  uint64_t    record_count      = 0;
  uint64_t    compressed_size   = 0;
  uint64_t    uncompressed_size = 0;
  int64_t     archived_at_ms    = 0;
};

/*
  Durable home for raw intake batches before they are deleted.

  ArchiveBatch either stores the whole batch or throws
  util::ArchivalError; callers delete a batch only after it returned.
*/
class ArchivalBackend {
 public:
  virtual ~ArchivalBackend() = default;

  virtual ArchiveReceipt ArchiveBatch(const std::vector<db::model::RawIntakeRecord>& records) = 0;

  virtual std::vector<db::model::RawIntakeRecord> Retrieve(const std::string& archive_id) = 0;

  // Oldest first.
  virtual std::vector<ArchiveReceipt> List() = 0;
};

} // namespace forecast::archive
