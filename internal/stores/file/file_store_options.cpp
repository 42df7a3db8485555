#include "file_store_options.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace msgstore::stores::file {

namespace {

void CheckNonNegative(const char* name, int64_t value) {
  if (value < 0) {
    throw util::InvalidConfig(fmt::format("file store option {} can't be negative, got {}", name, value));
  }
}

} // namespace

void Validate(const FileStoreOptions& opts) {
  CheckNonNegative("BufferSize", opts.buffer_size);
  CheckNonNegative("CompactInterval", opts.compact_interval.count());
  CheckNonNegative("CompactFragmentation", opts.compact_fragmentation);
  CheckNonNegative("CompactMinFileSize", opts.compact_min_file_size);
  CheckNonNegative("SliceMaxMsgs", opts.slice_max_msgs);
  CheckNonNegative("SliceMaxBytes", opts.slice_max_bytes);
  CheckNonNegative("SliceMaxAge", opts.slice_max_age.count());
}

FileStoreOption BufferSize(int64_t size) {
  CheckNonNegative("BufferSize", size);
  return [size](FileStoreOptions& o) { o.buffer_size = size; };
}

FileStoreOption CompactEnabled(bool enabled) {
  return [enabled](FileStoreOptions& o) { o.compact_enabled = enabled; };
}

FileStoreOption CompactInterval(int64_t seconds) {
  CheckNonNegative("CompactInterval", seconds);
  return [seconds](FileStoreOptions& o) { o.compact_interval = std::chrono::seconds(seconds); };
}

FileStoreOption CompactFragmentation(int64_t fragmentation) {
  CheckNonNegative("CompactFragmentation", fragmentation);
  return [fragmentation](FileStoreOptions& o) { o.compact_fragmentation = fragmentation; };
}

FileStoreOption CompactMinFileSize(int64_t file_size) {
  CheckNonNegative("CompactMinFileSize", file_size);
  return [file_size](FileStoreOptions& o) { o.compact_min_file_size = file_size; };
}

FileStoreOption DoCRC(bool enabled) {
  return [enabled](FileStoreOptions& o) { o.do_crc = enabled; };
}

FileStoreOption CRCPolynomial(int64_t polynomial) {
  if (polynomial <= 0 || polynomial > 0xFFFFFFFF) {
    throw util::InvalidConfig(fmt::format("file store option CRCPolynomial out of range, got {}", polynomial));
  }
  return [polynomial](FileStoreOptions& o) { o.crc_polynomial = static_cast<uint32_t>(polynomial); };
}

FileStoreOption DoSync(bool enabled) {
  return [enabled](FileStoreOptions& o) { o.do_sync = enabled; };
}

FileStoreOption SliceConfig(int64_t max_msgs, int64_t max_bytes, std::chrono::nanoseconds max_age, std::string script) {
  CheckNonNegative("SliceMaxMsgs", max_msgs);
  CheckNonNegative("SliceMaxBytes", max_bytes);
  CheckNonNegative("SliceMaxAge", max_age.count());
  return [=](FileStoreOptions& o) {
    o.slice_max_msgs       = max_msgs;
    o.slice_max_bytes      = max_bytes;
    o.slice_max_age        = max_age;
    o.slice_archive_script = script;
  };
}

FileStoreOption AllOptions(const FileStoreOptions& opts) {
  Validate(opts);
  return [opts](FileStoreOptions& o) { o = opts; };
}

} // namespace msgstore::stores::file
