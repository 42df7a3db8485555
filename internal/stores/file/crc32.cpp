#include "crc32.hpp"

namespace msgstore::stores::file {

Crc32Table::Crc32Table(uint32_t polynomial) : polynomial_(polynomial) {
  for (uint32_t i = 0; i < table_.size(); ++i) {
    uint32_t crc = i;
    for (int j = 0; j < 8; ++j) {
      const uint32_t mask = (crc & 1) ? 0xFFFFFFFF : 0;
      crc                 = (crc >> 1) ^ (polynomial_ & mask);
    }
    table_[i] = crc;
  }
}

uint32_t Crc32Table::Checksum(const void* data, size_t size) const {
  const auto* bytes = static_cast<const uint8_t*>(data);
  uint32_t    crc   = 0xFFFFFFFF;
  for (size_t i = 0; i < size; ++i) {
    crc = table_[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
  }
  return ~crc;
}

} // namespace msgstore::stores::file
