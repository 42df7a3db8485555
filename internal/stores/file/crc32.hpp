#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace msgstore::stores::file {

/*
  Table driven CRC-32 over a reflected polynomial.

  The default polynomial is IEEE, the one used by zlib and Ethernet.
  Thread-safety: immutable once built.
*/
class Crc32Table {
 public:
  static constexpr uint32_t kIEEE       = 0xedb88320;
  static constexpr uint32_t kCastagnoli = 0x82f63b78;

  explicit Crc32Table(uint32_t polynomial = kIEEE);

  uint32_t Checksum(const void* data, size_t size) const;

  uint32_t polynomial() const {
    return polynomial_;
  }

 private:
  uint32_t                 polynomial_;
  std::array<uint32_t, 256> table_{};
};

} // namespace msgstore::stores::file
