#pragma once

#include <cstdint>
#include <span>

#include "internal/model/records.hpp"

namespace rvault::codec {

// Anchor-serialized price update account. Throws DecodeError{kTooShort}
// or DecodeError{kUnsupportedTag}.
model::PriceFeed DecodeGenericPriceFeed(std::span<const std::uint8_t> data);

// Legacy price account. Throws DecodeError{kTooShort}, {kBadMagicOrVersion}
// or {kZeroOrInvalidPrice}.
model::PriceFeed DecodeLegacyPriceFeed(std::span<const std::uint8_t> data);

// Generic layout first, legacy second. When both fail, the legacy error is
// reported only for buffers that start with the legacy magic.
model::PriceFeed DecodePriceFeed(std::span<const std::uint8_t> data);

} // namespace rvault::codec
