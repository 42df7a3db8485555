#include "record_codec.hpp"

#include <arrow/io/buffered.h>
#include <spdlog/fmt/fmt.h>

#include "internal/stores/file/file_io.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::stores::file {

namespace {

std::string CrcMismatch(uint32_t expected, uint32_t got) {
  return fmt::format("corrupted data, expected crc to be 0x{:08x}, got 0x{:08x}", expected, got);
}

} // namespace

void PutUint32(uint8_t* out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>(v >> (8 * i));
  }
}

void PutUint64(uint8_t* out, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>(v >> (8 * i));
  }
}

uint32_t GetUint32(const uint8_t* in) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i) {
    v = (v << 8) | in[i];
  }
  return v;
}

uint64_t GetUint64(const uint8_t* in) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | in[i];
  }
  return v;
}

void WriteFileVersion(arrow::io::OutputStream& out) {
  uint8_t buf[4];
  PutUint32(buf, kFileVersion);
  Unwrap(out.Write(buf, sizeof(buf)));
}

void CheckFileVersion(arrow::io::InputStream& in) {
  uint8_t buf[4];
  int64_t n = 0;
  try {
    n = ReadFull(in, buf, sizeof(buf));
  } catch (const util::IOError& e) {
    throw util::Corruption(fmt::format("unable to verify file version: {}", e.what()));
  }
  if (n != static_cast<int64_t>(sizeof(buf))) {
    throw util::Corruption("unable to verify file version: unexpected end of file");
  }
  const uint32_t version = GetUint32(buf);
  if (version == 0 || version > kFileVersion) {
    throw util::Corruption(fmt::format("unsupported file version: {} (supports [1..{}])", version, kFileVersion));
  }
}

int64_t WriteRecord(arrow::io::OutputStream& out, std::vector<uint8_t>& scratch, RecordType type,
                    const google::protobuf::MessageLite& rec, const Crc32Table& crc_table) {
  const size_t  rec_size   = rec.ByteSizeLong();
  const int64_t total_size = kRecordHeaderSize + static_cast<int64_t>(rec_size);
  if (scratch.size() < static_cast<size_t>(total_size)) {
    scratch.resize(total_size);
  }

  uint32_t header = static_cast<uint32_t>(rec_size);
  if (type != kRecNoType) {
    if (rec_size > kMaxTypedRecordSize) {
      throw util::InvalidState(fmt::format("record size too big: {} bytes", rec_size));
    }
    // Type goes in the high byte.
    header = static_cast<uint32_t>(type) << 24 | static_cast<uint32_t>(rec_size);
  }
  PutUint32(scratch.data(), header);

  uint8_t* payload = scratch.data() + kRecordHeaderSize;
  if (!rec.SerializeToArray(payload, static_cast<int>(rec_size))) {
    throw util::InvalidState("unable to serialize record");
  }
  PutUint32(scratch.data() + 4, crc_table.Checksum(payload, rec_size));

  if (auto* buffered = dynamic_cast<arrow::io::BufferedOutputStream*>(&out)) {
    const int64_t used = buffered->bytes_buffered();
    if (used > 0 && buffered->buffer_size() - used < total_size) {
      Unwrap(buffered->Flush());
    }
  }
  Unwrap(out.Write(scratch.data(), total_size));
  return total_size;
}

std::optional<RecordHeader> ReadRecord(arrow::io::InputStream& in, std::vector<uint8_t>& scratch, bool typed,
                                       const Crc32Table& crc_table, bool check_crc) {
  uint8_t       header[kRecordHeaderSize];
  const int64_t n = ReadFull(in, header, kRecordHeaderSize);
  if (n == 0) {
    return std::nullopt;
  }
  if (n != kRecordHeaderSize) {
    throw util::Corruption("unexpected end of file reading record header");
  }

  RecordHeader   rec;
  const uint32_t first = GetUint32(header);
  if (typed) {
    rec.type = static_cast<RecordType>(first >> 24 & 0xFF);
    rec.size = first & kMaxTypedRecordSize;
  } else {
    rec.size = first;
  }
  const uint32_t crc = GetUint32(header + 4);

  if (scratch.size() < rec.size) {
    scratch.resize(rec.size);
  }
  if (ReadFull(in, scratch.data(), rec.size) != static_cast<int64_t>(rec.size)) {
    throw util::Corruption(fmt::format("unexpected end of file reading record of {} bytes", rec.size));
  }
  if (check_crc) {
    const uint32_t got = crc_table.Checksum(scratch.data(), rec.size);
    if (got != crc) {
      throw util::Corruption(CrcMismatch(crc, got));
    }
  }
  return rec;
}

void EncodeIndex(uint8_t* out, const MsgIndex& idx, const Crc32Table& crc_table) {
  PutUint64(out, idx.seq);
  PutUint64(out + 8, static_cast<uint64_t>(idx.offset));
  PutUint64(out + 16, static_cast<uint64_t>(idx.timestamp));
  PutUint32(out + 24, idx.size);
  PutUint32(out + kMsgIndexRecSize - kCrcSize, crc_table.Checksum(out, kMsgIndexRecSize - kCrcSize));
}

MsgIndex DecodeIndex(const uint8_t* in, const Crc32Table& crc_table, bool check_crc) {
  if (check_crc) {
    const uint32_t stored = GetUint32(in + kMsgIndexRecSize - kCrcSize);
    const uint32_t got    = crc_table.Checksum(in, kMsgIndexRecSize - kCrcSize);
    if (stored != got) {
      throw util::Corruption(CrcMismatch(stored, got));
    }
  }
  MsgIndex idx;
  idx.seq       = GetUint64(in);
  idx.offset    = static_cast<int64_t>(GetUint64(in + 8));
  idx.timestamp = static_cast<int64_t>(GetUint64(in + 16));
  idx.size      = GetUint32(in + 24);
  return idx;
}

} // namespace msgstore::stores::file
