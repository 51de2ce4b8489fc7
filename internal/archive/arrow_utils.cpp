#include "arrow_utils.hpp"

namespace forecast::archive {

arrow::Result<arrow::Compression::type> ResolveCompression(forecast::runtime::config::ArchiveCompression compression) {
  using forecast::runtime::config::ArchiveCompression;

  arrow::Compression::type type = arrow::Compression::ZSTD;
  switch (compression) {
    case ArchiveCompression::ARCHIVE_COMPRESSION_NONE:
      return arrow::Compression::UNCOMPRESSED;
    case ArchiveCompression::ARCHIVE_COMPRESSION_LZ4_FRAME:
      type = arrow::Compression::LZ4_FRAME;
      break;
    case ArchiveCompression::ARCHIVE_COMPRESSION_ZSTD:
    case ArchiveCompression::ARCHIVE_COMPRESSION_UNSPECIFIED:
    default:
      type = arrow::Compression::ZSTD;
      break;
  }

  if (!arrow::util::Codec::IsAvailable(type)) {
    return arrow::Status::NotImplemented("Arrow was built without ", arrow::util::Codec::GetCodecAsString(type), " support");
  }
  return type;
}

void ValidateArchiveId(const std::string& archive_id) {
  if (archive_id.empty()) {
    throw util::InvalidArgument("archive id must not be empty");
  }
  for (char c : archive_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("archive id contains invalid character");
    }
  }
  if (archive_id == "." || archive_id == "..") {
    throw util::InvalidArgument("archive id must not be a relative path component");
  }
}

} // namespace forecast::archive
