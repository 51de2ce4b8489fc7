#pragma once

#include <arrow/type_fwd.h>
#include <arrow/util/compression.h>

#include <filesystem>
#include <memory>

#include "internal/archive/archival_backend.hpp"
#include "internal/util/time.hpp"

namespace forecast::archive {

/*
  Archive on local disk, one Arrow IPC file per batch.

  Properties:
    - columns: id, organization_id, ingested_at (ms timestamp), payload
    - body buffers compressed with the configured codec
    - write tmp -> close -> rename, so a listed archive is always complete
*/
class FilesystemArrowArchive final : public ArchivalBackend {
 public:
  FilesystemArrowArchive(std::filesystem::path root, arrow::Compression::type compression, std::shared_ptr<util::TimeSource> clock);

  ArchiveReceipt ArchiveBatch(const std::vector<db::model::RawIntakeRecord>& records) override;

  std::vector<db::model::RawIntakeRecord> Retrieve(const std::string& archive_id) override;

  std::vector<ArchiveReceipt> List() override;

  static std::shared_ptr<arrow::Schema> Schema();

 private:
  std::filesystem::path ArchivePath(const std::string& archive_id) const;

  std::filesystem::path             root_;
  arrow::Compression::type          compression_;
  std::shared_ptr<util::TimeSource> clock_;
};

} // namespace forecast::archive
