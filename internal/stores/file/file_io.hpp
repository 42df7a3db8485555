#pragma once

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace msgstore::stores::file {

// Buffer size for recovery scans and compaction rewrites.
inline constexpr int64_t kDefaultBufSize = 10 * 1024 * 1024;

/*
  Helper: unwrap Arrow Result<T> or throw util::IOError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::IOError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::IOError(status.ToString());
}

/*
  Reads up to `size` bytes, looping over short reads. Returns fewer bytes
  only at end of stream.
*/
int64_t ReadFull(arrow::io::InputStream& in, void* out, int64_t size);

void SyncFile(arrow::io::FileOutputStream& file);

int64_t FileSize(const std::filesystem::path& path);

/*
  Opens `path` for appending. An existing file must start with a supported
  version, a new one gets the current version written.
*/
std::shared_ptr<arrow::io::FileOutputStream> OpenFile(const std::filesystem::path& path);

/*
  Creates or truncates `path` and writes the current version.
*/
std::shared_ptr<arrow::io::FileOutputStream> CreateFile(const std::filesystem::path& path);

/*
  Opens `path` for a sequential scan, positioned after the version header.
*/
std::shared_ptr<arrow::io::InputStream> OpenReader(const std::filesystem::path& path, int64_t buffer_size);

std::shared_ptr<arrow::io::ReadableFile> OpenRandomAccess(const std::filesystem::path& path);

struct TempFile {
  std::filesystem::path                        path;
  std::shared_ptr<arrow::io::FileOutputStream> stream;
};

// New file in `dir` named `prefix` plus a random suffix, version included.
TempFile CreateTempFile(const std::filesystem::path& dir, const std::string& prefix);

/*
  Replaces `active_path` with the temporary file. `active` is closed and
  reopened in place, even when the rename fails. The temporary file is
  always removed.
*/
void SwapFiles(TempFile& tmp, const std::filesystem::path& active_path, std::shared_ptr<arrow::io::FileOutputStream>& active);

/*
  Rethrows the in-flight exception with `context` prepended to its
  message. Store errors keep their type; filesystem errors become
  util::IOError. Call from a catch block only.
*/
[[noreturn]] void RethrowWithContext(const std::string& context);

} // namespace msgstore::stores::file
