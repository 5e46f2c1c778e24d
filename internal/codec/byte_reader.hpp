#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>

#include "internal/chain/address.hpp"
#include "internal/util/errors.hpp"

namespace rvault::codec {

/*
  Bounds-checked little-endian cursor over an account buffer.

  Every read past the end throws DecodeError{kTooShort}; decoders never see
  partially populated records.
*/
class ByteReader {
 public:
  explicit ByteReader(std::span<const std::uint8_t> data, std::size_t offset = 0) : data_(data), offset_(offset) {
  }

  std::size_t offset() const {
    return offset_;
  }

  std::size_t remaining() const {
    return offset_ >= data_.size() ? 0 : data_.size() - offset_;
  }

  void Require(std::size_t n) const {
    if (remaining() < n) {
      throw util::DecodeError(util::DecodeFailure::kTooShort,
                              "buffer too short: need " + std::to_string(n) + " bytes at offset "
                                  + std::to_string(offset_) + ", have " + std::to_string(remaining()));
    }
  }

  void Skip(std::size_t n) {
    Require(n);
    offset_ += n;
  }

  void Seek(std::size_t offset) {
    if (offset > data_.size()) {
      throw util::DecodeError(util::DecodeFailure::kTooShort,
                              "offset " + std::to_string(offset) + " beyond buffer of " + std::to_string(data_.size()));
    }
    offset_ = offset;
  }

  std::uint8_t ReadU8() {
    return ReadLe<std::uint8_t>();
  }
  std::uint16_t ReadU16() {
    return ReadLe<std::uint16_t>();
  }
  std::uint32_t ReadU32() {
    return ReadLe<std::uint32_t>();
  }
  std::int32_t ReadI32() {
    return static_cast<std::int32_t>(ReadLe<std::uint32_t>());
  }
  std::uint64_t ReadU64() {
    return ReadLe<std::uint64_t>();
  }
  std::int64_t ReadI64() {
    return static_cast<std::int64_t>(ReadLe<std::uint64_t>());
  }

  bool ReadBool() {
    return ReadU8() != 0;
  }

  chain::Address ReadAddress() {
    Require(chain::kAddressSize);
    const auto out = chain::Address::FromBytes(data_.subspan(offset_, chain::kAddressSize));
    offset_ += chain::kAddressSize;
    return out;
  }

  // 1-byte presence flag followed by 32 bytes, consumed only when present.
  std::optional<chain::Address> ReadOptionalAddress() {
    if (ReadU8() == 0) return std::nullopt;
    return ReadAddress();
  }

 private:
  template <typename T>
  T ReadLe() {
    Require(sizeof(T));
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<T>(static_cast<T>(data_[offset_ + i]) << (8 * i));
    }
    offset_ += sizeof(T);
    return value;
  }

  std::span<const std::uint8_t> data_;
  std::size_t offset_;
};

} // namespace rvault::codec
