#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/stores/file/crc32.hpp"

namespace msgstore::stores::file {

struct FileStoreOptions {
  // Max size of the write buffers, 0 disables buffering.
  int64_t buffer_size = 2 * 1024 * 1024;

  bool                 compact_enabled = true;
  std::chrono::seconds compact_interval{300};
  // Percentage of deleted records required before compacting.
  int64_t compact_fragmentation = 50;
  // 0 means no minimum.
  int64_t compact_min_file_size = 1024 * 1024;

  // Verify checksums on reads.
  bool     do_crc         = true;
  uint32_t crc_polynomial = Crc32Table::kIEEE;
  // fsync on flush.
  bool do_sync = true;

  // Message log slicing. When all three are 0 they derive from the
  // channel limits.
  int64_t                  slice_max_msgs  = 0;
  int64_t                  slice_max_bytes = 64 * 1024 * 1024;
  std::chrono::nanoseconds slice_max_age{0};
  // Invoked with the channel and the renamed data and index files of a
  // removed slice, instead of deleting them.
  std::string slice_archive_script;
};

// Throws util::InvalidConfig on a negative value.
void Validate(const FileStoreOptions& opts);

using FileStoreOption = std::function<void(FileStoreOptions&)>;

// Each builder throws util::InvalidConfig right away when given a negative value.
FileStoreOption BufferSize(int64_t size);
FileStoreOption CompactEnabled(bool enabled);
FileStoreOption CompactInterval(int64_t seconds);
FileStoreOption CompactFragmentation(int64_t fragmentation);
FileStoreOption CompactMinFileSize(int64_t file_size);
FileStoreOption DoCRC(bool enabled);
FileStoreOption CRCPolynomial(int64_t polynomial);
FileStoreOption DoSync(bool enabled);
FileStoreOption SliceConfig(int64_t max_msgs, int64_t max_bytes, std::chrono::nanoseconds max_age, std::string script);
FileStoreOption AllOptions(const FileStoreOptions& opts);

} // namespace msgstore::stores::file
