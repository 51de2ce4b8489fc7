#include "filesystem_arrow_archive.hpp"

#include <arrow/api.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>
#include <string>
#include <system_error>

#include "internal/archive/arrow_utils.hpp"
#include "internal/util/uuid.hpp"

namespace forecast::archive {

namespace {

constexpr const char* kExtension = ".arrow";

constexpr const char* kMetaRecordCount      = "forecast.record_count";
constexpr const char* kMetaUncompressedSize = "forecast.uncompressed_size";
constexpr const char* kMetaArchivedAt       = "forecast.archived_at_ms";

int64_t MetaInt(const arrow::KeyValueMetadata* metadata, const char* key) {
  if (!metadata) return 0;
  auto value = metadata->Get(key);
  if (!value.ok()) return 0;
  return std::stoll(*value);
}

std::shared_ptr<arrow::ipc::RecordBatchFileReader> OpenReader(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return Unwrap(arrow::ipc::RecordBatchFileReader::Open(file));
}

} // namespace

FilesystemArrowArchive::FilesystemArrowArchive(std::filesystem::path root, arrow::Compression::type compression,
                                               std::shared_ptr<util::TimeSource> clock)
    : root_(std::move(root)), compression_(compression), clock_(std::move(clock)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Schema> FilesystemArrowArchive::Schema() {
  static const auto schema = arrow::schema({
      arrow::field("id", arrow::utf8(), false),
      arrow::field("organization_id", arrow::utf8(), false),
      arrow::field("ingested_at", arrow::timestamp(arrow::TimeUnit::MILLI), false),
      arrow::field("payload", arrow::binary(), false),
  });
  return schema;
}

std::filesystem::path FilesystemArrowArchive::ArchivePath(const std::string& archive_id) const {
  ValidateArchiveId(archive_id);
  return root_ / (archive_id + kExtension);
}

ArchiveReceipt FilesystemArrowArchive::ArchiveBatch(const std::vector<db::model::RawIntakeRecord>& records) {
  if (records.empty()) {
    throw util::InvalidArgument("cannot archive an empty batch");
  }

  arrow::StringBuilder    ids;
  arrow::StringBuilder    orgs;
  arrow::TimestampBuilder ingested(arrow::timestamp(arrow::TimeUnit::MILLI), arrow::default_memory_pool());
  arrow::BinaryBuilder    payloads;

  uint64_t uncompressed = 0;
  for (const auto& record : records) {
    Unwrap(ids.Append(record.id));
    Unwrap(orgs.Append(record.organization_id));
    Unwrap(ingested.Append(record.ingested_at_ms));
    Unwrap(payloads.Append(record.payload));
    uncompressed += record.id.size() + record.organization_id.size() + sizeof(int64_t) + record.payload.size();
  }

  std::shared_ptr<arrow::Array> id_array, org_array, ingested_array, payload_array;
  Unwrap(ids.Finish(&id_array));
  Unwrap(orgs.Finish(&org_array));
  Unwrap(ingested.Finish(&ingested_array));
  Unwrap(payloads.Finish(&payload_array));

  const auto archived_at = clock_->NowMillis();
  const auto archive_id  = "raw-intake-" + std::to_string(records.front().ingested_at_ms) + "-" + util::NewId();

  auto metadata = arrow::key_value_metadata({kMetaRecordCount, kMetaUncompressedSize, kMetaArchivedAt},
                                            {std::to_string(records.size()), std::to_string(uncompressed), std::to_string(archived_at)});
  auto schema   = Schema()->WithMetadata(metadata);
  auto batch    = arrow::RecordBatch::Make(schema, static_cast<int64_t>(records.size()), {id_array, org_array, ingested_array, payload_array});

  auto options = arrow::ipc::IpcWriteOptions::Defaults();
  if (compression_ != arrow::Compression::UNCOMPRESSED) {
    options.codec = Unwrap(arrow::util::Codec::Create(compression_));
  }

  const auto final_path = ArchivePath(archive_id);
  const auto tmp_path   = final_path.string() + ".tmp";

  try {
    auto out    = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    auto writer = Unwrap(arrow::ipc::MakeFileWriter(out, schema, options));
    Unwrap(writer->WriteRecordBatch(*batch));
    Unwrap(writer->Close());
    Unwrap(out->Close());
    std::filesystem::rename(tmp_path, final_path);
  } catch (const std::exception& ex) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw util::ArchivalError("archive " + archive_id + ": " + ex.what());
  }

  return ArchiveReceipt{
      .archive_id        = archive_id,
      .record_count      = records.size(),
      .compressed_size   = static_cast<uint64_t>(std::filesystem::file_size(final_path)),
      .uncompressed_size = uncompressed,
      .archived_at_ms    = archived_at,
  };
}

std::vector<db::model::RawIntakeRecord> FilesystemArrowArchive::Retrieve(const std::string& archive_id) {
  const auto path = ArchivePath(archive_id);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("archive " + archive_id);
  }

  auto reader = OpenReader(path);

  std::vector<db::model::RawIntakeRecord> records;
  for (int i = 0; i < reader->num_record_batches(); ++i) {
    auto batch = Unwrap(reader->ReadRecordBatch(i));

    auto ids      = std::static_pointer_cast<arrow::StringArray>(batch->column(0));
    auto orgs     = std::static_pointer_cast<arrow::StringArray>(batch->column(1));
    auto ingested = std::static_pointer_cast<arrow::TimestampArray>(batch->column(2));
    auto payloads = std::static_pointer_cast<arrow::BinaryArray>(batch->column(3));

    for (int64_t row = 0; row < batch->num_rows(); ++row) {
      records.push_back(db::model::RawIntakeRecord{
          .id              = ids->GetString(row),
          .organization_id = orgs->GetString(row),
          .ingested_at_ms  = ingested->Value(row),
          .payload         = payloads->GetString(row),
      });
    }
  }
  return records;
}

std::vector<ArchiveReceipt> FilesystemArrowArchive::List() {
  std::vector<ArchiveReceipt> receipts;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_regular_file() || entry.path().extension() != kExtension) {
      continue;
    }

    auto       reader   = OpenReader(entry.path());
    const auto metadata = reader->schema()->metadata();
    receipts.push_back(ArchiveReceipt{
        .archive_id        = entry.path().stem().string(),
        .record_count      = static_cast<uint64_t>(MetaInt(metadata.get(), kMetaRecordCount)),
        .compressed_size   = static_cast<uint64_t>(entry.file_size()),
        .uncompressed_size = static_cast<uint64_t>(MetaInt(metadata.get(), kMetaUncompressedSize)),
        .archived_at_ms    = MetaInt(metadata.get(), kMetaArchivedAt),
    });
  }

  std::sort(receipts.begin(), receipts.end(), [](const auto& a, const auto& b) {
    if (a.archived_at_ms != b.archived_at_ms) return a.archived_at_ms < b.archived_at_ms;
    return a.archive_id < b.archive_id;
  });
  return receipts;
}

} // namespace forecast::archive
