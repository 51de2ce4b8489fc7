#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace forecast::archive {

/*
  Helper: unwrap Arrow Result<T> or throw util::ArchivalError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::ArchivalError(result.status().ToString());
  return result.MoveValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::ArchivalError(status.ToString());
}

// Unspecified falls back to zstd.
arrow::Result<arrow::Compression::type> ResolveCompression(forecast::runtime::config::ArchiveCompression compression);

// Archive ids double as file stems; reject anything that could escape the
// archive root.
void ValidateArchiveId(const std::string& archive_id);

} // namespace forecast::archive
