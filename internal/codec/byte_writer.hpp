#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "internal/chain/address.hpp"

namespace rvault::codec {

// Little-endian append buffer for instruction payloads.
class ByteWriter {
 public:
  void WriteBytes(std::span<const std::uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  }

  void WriteU8(std::uint8_t v) {
    buffer_.push_back(v);
  }
  void WriteU16(std::uint16_t v) {
    WriteLe(v);
  }
  void WriteU32(std::uint32_t v) {
    WriteLe(v);
  }
  void WriteI32(std::int32_t v) {
    WriteLe(static_cast<std::uint32_t>(v));
  }
  void WriteU64(std::uint64_t v) {
    WriteLe(v);
  }
  void WriteI64(std::int64_t v) {
    WriteLe(static_cast<std::uint64_t>(v));
  }

  void WriteAddress(const chain::Address& address) {
    WriteBytes(address.bytes());
  }

  void WriteZeros(std::size_t n) {
    buffer_.insert(buffer_.end(), n, 0);
  }

  std::size_t size() const {
    return buffer_.size();
  }

  chain::Bytes Take() {
    return std::move(buffer_);
  }

 private:
  template <typename T>
  void WriteLe(T v) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      buffer_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
    }
  }

  chain::Bytes buffer_;
};

} // namespace rvault::codec
