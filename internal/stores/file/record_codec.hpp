#pragma once

#include <arrow/io/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "internal/stores/file/crc32.hpp"

namespace msgstore::stores::file {

// ------------------------------------------------------------
// On disk layout constants (little-endian throughout)
// ------------------------------------------------------------

inline constexpr uint32_t kFileVersion = 1;

// 4 bytes type/size, 4 bytes CRC-32 of the payload.
inline constexpr int64_t kRecordHeaderSize = 8;
// seq(8) offset(8) timestamp(8) size(4) crc(4)
inline constexpr int64_t kMsgIndexRecSize = 32;
inline constexpr int64_t kCrcSize         = 4;
// Accounted per stored message on top of its payload.
inline constexpr int64_t kMsgRecordOverhead = kRecordHeaderSize + kMsgIndexRecSize;

inline constexpr uint32_t kMaxTypedRecordSize = 0xFFFFFF;

using RecordType = uint8_t;

inline constexpr RecordType kRecNoType = 0;

// Subscriptions file
inline constexpr RecordType kSubRecNew    = 1;
inline constexpr RecordType kSubRecUpdate = 2;
inline constexpr RecordType kSubRecDel    = 3;
inline constexpr RecordType kSubRecAck    = 4;
inline constexpr RecordType kSubRecMsg    = 5;

// Clients file
inline constexpr RecordType kClientRecAdd = 1;
inline constexpr RecordType kClientRecDel = 2;

void     PutUint32(uint8_t* out, uint32_t v);
void     PutUint64(uint8_t* out, uint64_t v);
uint32_t GetUint32(const uint8_t* in);
uint64_t GetUint64(const uint8_t* in);

void WriteFileVersion(arrow::io::OutputStream& out);

/*
  Reads and validates the 4 byte version header.
  Throws util::Corruption on a short read or an unsupported version.
*/
void CheckFileVersion(arrow::io::InputStream& in);

/*
  Encodes `rec` as one record and writes it with a single call.

  `scratch` is reused across calls and only ever grows. When `out` is a
  buffered stream holding data that the record would not fit in, the
  buffer is flushed first to reduce the risk of partial writes.

  Returns the number of bytes written (header included).
*/
int64_t WriteRecord(arrow::io::OutputStream& out, std::vector<uint8_t>& scratch, RecordType type,
                    const google::protobuf::MessageLite& rec, const Crc32Table& crc_table);

struct RecordHeader {
  RecordType type = kRecNoType;
  uint32_t   size = 0;
};

/*
  Reads one record into `scratch`, the payload being the first `size` bytes.

  Returns std::nullopt on a clean end of stream. A truncated record or a
  checksum mismatch throws util::Corruption.
*/
std::optional<RecordHeader> ReadRecord(arrow::io::InputStream& in, std::vector<uint8_t>& scratch, bool typed,
                                       const Crc32Table& crc_table, bool check_crc);

// ------------------------------------------------------------
// Message index records
// ------------------------------------------------------------

struct MsgIndex {
  uint64_t seq       = 0;
  int64_t  offset    = 0;
  int64_t  timestamp = 0;
  uint32_t size      = 0;
};

void EncodeIndex(uint8_t* out, const MsgIndex& idx, const Crc32Table& crc_table);

// Throws util::Corruption when `check_crc` is set and the checksum differs.
MsgIndex DecodeIndex(const uint8_t* in, const Crc32Table& crc_table, bool check_crc);

} // namespace msgstore::stores::file
