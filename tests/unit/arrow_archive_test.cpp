#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/archive/arrow_utils.hpp"
#include "internal/archive/filesystem_arrow_archive.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture.hpp"

namespace {

using forecast::archive::FilesystemArrowArchive;
using forecast::db::model::RawIntakeRecord;
using forecast::testing::ExpectThrows;

std::filesystem::path FreshRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "forecast_sync_archive_tests" / name;
  std::filesystem::remove_all(root);
  return root;
}

std::vector<RawIntakeRecord> Batch(int64_t first_ms, int n) {
  std::vector<RawIntakeRecord> records;
  for (int i = 0; i < n; ++i) {
    records.push_back(RawIntakeRecord{
        .id              = "raw-" + std::to_string(first_ms + i),
        .organization_id = "org-1",
        .ingested_at_ms  = first_ms + i,
        .payload         = std::string("payload\0with-nul-", 17) + std::to_string(i),
    });
  }
  return records;
}

void TestArchiveAndRetrieve(arrow::Compression::type compression, const std::string& name) {
  auto clock = std::make_shared<forecast::util::ManualTimeSource>(forecast::testing::kStartMs);
  FilesystemArrowArchive archive(FreshRoot(name), compression, clock);

  const auto records = Batch(1000, 50);
  const auto receipt = archive.ArchiveBatch(records);
  assert(receipt.record_count == 50);
  assert(receipt.archived_at_ms == forecast::testing::kStartMs);
  assert(receipt.compressed_size > 0);
  assert(receipt.uncompressed_size > 0);
  assert(receipt.archive_id.rfind("raw-intake-1000-", 0) == 0);

  const auto restored = archive.Retrieve(receipt.archive_id);
  assert(restored.size() == records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    assert(restored[i].id == records[i].id);
    assert(restored[i].organization_id == records[i].organization_id);
    assert(restored[i].ingested_at_ms == records[i].ingested_at_ms);
    assert(restored[i].payload == records[i].payload);
  }
}

void TestListIsOldestFirstAndSkipsForeignFiles() {
  auto       clock = std::make_shared<forecast::util::ManualTimeSource>(forecast::testing::kStartMs);
  const auto root  = FreshRoot("list");
  FilesystemArrowArchive archive(root, arrow::Compression::UNCOMPRESSED, clock);

  const auto first = archive.ArchiveBatch(Batch(1, 3));
  clock->Advance(std::chrono::seconds(5));
  const auto second = archive.ArchiveBatch(Batch(100, 7));

  // Neither a stray file nor a leftover tmp shows up.
  { std::ofstream(root / "notes.txt") << "x"; }
  { std::ofstream(root / "raw-intake-9.arrow.tmp") << "partial"; }

  const auto listed = archive.List();
  assert(listed.size() == 2);
  assert(listed[0].archive_id == first.archive_id);
  assert(listed[0].record_count == 3);
  assert(listed[1].archive_id == second.archive_id);
  assert(listed[1].record_count == 7);
  assert(listed[1].archived_at_ms == forecast::testing::kStartMs + 5000);
}

void TestErrors() {
  auto clock = std::make_shared<forecast::util::ManualTimeSource>(forecast::testing::kStartMs);
  FilesystemArrowArchive archive(FreshRoot("errors"), arrow::Compression::UNCOMPRESSED, clock);

  ExpectThrows<forecast::util::InvalidArgument>([&] { archive.ArchiveBatch({}); });
  ExpectThrows<forecast::util::NotFound>([&] { archive.Retrieve("raw-intake-missing"); });
  ExpectThrows<forecast::util::InvalidArgument>([&] { archive.Retrieve("../etc/passwd"); });
  ExpectThrows<forecast::util::InvalidArgument>([&] { archive.Retrieve(".."); });
  ExpectThrows<forecast::util::InvalidArgument>([&] { archive.Retrieve(""); });
}

void TestCompressionResolution() {
  using forecast::runtime::config::ArchiveCompression;
  const auto none = forecast::archive::ResolveCompression(ArchiveCompression::ARCHIVE_COMPRESSION_NONE);
  assert(none.ok());
  assert(*none == arrow::Compression::UNCOMPRESSED);

  const auto fallback = forecast::archive::ResolveCompression(ArchiveCompression::ARCHIVE_COMPRESSION_UNSPECIFIED);
  if (fallback.ok()) {
    assert(*fallback == arrow::Compression::ZSTD);
  }
}

} // namespace

int main() {
  TestArchiveAndRetrieve(arrow::Compression::UNCOMPRESSED, "uncompressed");
  if (arrow::util::Codec::IsAvailable(arrow::Compression::ZSTD)) {
    TestArchiveAndRetrieve(arrow::Compression::ZSTD, "zstd");
  }
  TestListIsOldestFirstAndSkipsForeignFiles();
  TestErrors();
  TestCompressionResolution();

  std::cout << "arrow_archive_test: pass\n";
  return 0;
}
