#include "internal/stores/file/record_codec.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/stores/file/crc32.hpp"
#include "internal/stores/file/file_io.hpp"
#include "internal/util/errors.hpp"
#include "msgstore/v1/server.pb.h"

namespace {

using namespace msgstore::stores::file;
using msgstore::util::Corruption;

std::shared_ptr<arrow::Buffer> Encode(RecordType type, const google::protobuf::MessageLite& rec, const Crc32Table& crc) {
  auto                 out = Unwrap(arrow::io::BufferOutputStream::Create());
  std::vector<uint8_t> scratch;
  const int64_t        n = WriteRecord(*out, scratch, type, rec, crc);
  assert(n == kRecordHeaderSize + static_cast<int64_t>(rec.ByteSizeLong()));
  return Unwrap(out->Finish());
}

std::shared_ptr<arrow::Buffer> Mutable(const std::shared_ptr<arrow::Buffer>& buf) {
  auto copy = Unwrap(arrow::AllocateBuffer(buf->size()));
  std::memcpy(copy->mutable_data(), buf->data(), buf->size());
  return std::shared_ptr<arrow::Buffer>(std::move(copy));
}

void TestCrcCheckValues() {
  const char* check = "123456789";
  assert(Crc32Table().Checksum(check, 9) == 0xCBF43926);
  assert(Crc32Table(Crc32Table::kCastagnoli).Checksum(check, 9) == 0xE3069283);
}

void TestTypedRecordHeader() {
  Crc32Table               crc;
  msgstore::v1::ClientInfo info;
  info.set_id("me");
  info.set_hb_inbox("hb.me");

  auto buf = Encode(kClientRecAdd, info, crc);
  // Type in the high byte, size in the low 3 bytes.
  const uint32_t header = GetUint32(buf->data());
  assert((header >> 24) == kClientRecAdd);
  assert((header & kMaxTypedRecordSize) == info.ByteSizeLong());

  arrow::io::BufferReader in(buf);
  std::vector<uint8_t>    scratch;
  auto                    rec = ReadRecord(in, scratch, true, crc, true);
  assert(rec.has_value());
  assert(rec->type == kClientRecAdd);

  msgstore::v1::ClientInfo decoded;
  assert(decoded.ParseFromArray(scratch.data(), static_cast<int>(rec->size)));
  assert(decoded.id() == "me");
  assert(decoded.hb_inbox() == "hb.me");

  // Clean end of stream.
  assert(!ReadRecord(in, scratch, true, crc, true).has_value());
}

void TestCrcMismatchDetectedOnlyWhenEnabled() {
  Crc32Table               crc;
  msgstore::v1::ServerInfo info;
  info.set_cluster_id("test-cluster");

  auto buf = Mutable(Encode(kRecNoType, info, crc));
  // Flip a bit of the payload.
  buf->mutable_data()[kRecordHeaderSize + 3] ^= 0x01;

  std::vector<uint8_t> scratch;
  {
    arrow::io::BufferReader in(buf);
    bool                    threw = false;
    try {
      (void)ReadRecord(in, scratch, false, crc, true);
    } catch (const Corruption& e) {
      threw = std::string(e.what()).find("corrupted data") != std::string::npos;
    }
    assert(threw && "flipped payload bit must be reported");
  }
  {
    arrow::io::BufferReader in(buf);
    auto                    rec = ReadRecord(in, scratch, false, crc, false);
    assert(rec.has_value());
  }
}

void TestTruncatedRecord() {
  Crc32Table               crc;
  msgstore::v1::ServerInfo info;
  info.set_cluster_id("truncated");

  auto buf       = Encode(kRecNoType, info, crc);
  auto short_buf = arrow::SliceBuffer(buf, 0, buf->size() - 2);

  arrow::io::BufferReader in(short_buf);
  std::vector<uint8_t>    scratch;
  bool                    threw = false;
  try {
    (void)ReadRecord(in, scratch, false, crc, true);
  } catch (const Corruption&) {
    threw = true;
  }
  assert(threw);
}

void TestFileVersion() {
  auto out = Unwrap(arrow::io::BufferOutputStream::Create());
  WriteFileVersion(*out);
  auto good = Unwrap(out->Finish());
  assert(good->size() == 4);
  {
    arrow::io::BufferReader in(good);
    CheckFileVersion(in);
  }

  uint8_t bad[4];
  PutUint32(bad, kFileVersion + 1);
  arrow::io::BufferReader in(std::make_shared<arrow::Buffer>(bad, 4));
  bool                    threw = false;
  try {
    CheckFileVersion(in);
  } catch (const Corruption& e) {
    threw = std::string(e.what()).find("unsupported file version") != std::string::npos;
  }
  assert(threw);
}

void TestIndexRecord() {
  Crc32Table crc;
  uint8_t    buf[kMsgIndexRecSize];
  EncodeIndex(buf, {42, 1234, 987654321, 77}, crc);

  const MsgIndex idx = DecodeIndex(buf, crc, true);
  assert(idx.seq == 42);
  assert(idx.offset == 1234);
  assert(idx.timestamp == 987654321);
  assert(idx.size == 77);

  buf[9] ^= 0x80;
  bool threw = false;
  try {
    (void)DecodeIndex(buf, crc, true);
  } catch (const Corruption&) {
    threw = true;
  }
  assert(threw);
  // Not verified when disabled.
  (void)DecodeIndex(buf, crc, false);
}

} // namespace

int main() {
  TestCrcCheckValues();
  TestTypedRecordHeader();
  TestCrcMismatchDetectedOnlyWhenEnabled();
  TestTruncatedRecord();
  TestFileVersion();
  TestIndexRecord();

  std::cout << "msgstore_unit_record_codec: pass\n";
  return 0;
}
