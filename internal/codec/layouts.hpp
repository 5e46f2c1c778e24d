#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rvault::codec::layout {

constexpr std::size_t kDiscriminatorSize = 8;

// Minimum account lengths, discriminator included.
constexpr std::size_t kVaultConfigMinSize  = kDiscriminatorSize + 269;
constexpr std::size_t kVaultConfigFullSize = kVaultConfigMinSize + 2;
constexpr std::size_t kPartnerSize         = kDiscriminatorSize + 207;
constexpr std::size_t kUserLedgerSize      = kDiscriminatorSize + 121;
constexpr std::size_t kPopProfileSize      = kDiscriminatorSize + 42;
constexpr std::size_t kClaimGuardSize      = kDiscriminatorSize + 99;
constexpr std::size_t kMockOracleSize      = kDiscriminatorSize + 28;
constexpr std::size_t kMockPoolSize        = kDiscriminatorSize + 24;

// SPL token account: mint, owner, amount; the rest is not read.
constexpr std::size_t kTokenAccountMinSize = 72;
constexpr std::size_t kTokenAccountSize    = 165;

// Anchor-serialized price update (generic feed).
constexpr std::size_t kGenericFeedHeader  = kDiscriminatorSize + 32;
constexpr std::size_t kGenericFeedMinSize = kDiscriminatorSize + 32 + 1 + 32 + 8 + 8 + 4 + 8;
constexpr std::uint8_t kGenericTagPartial = 0;
constexpr std::uint8_t kGenericTagFull    = 1;

// Legacy price account.
constexpr std::uint32_t kLegacyMagic        = 0xa1b2c3d4;
constexpr std::uint32_t kLegacyAccountPrice = 3;
constexpr std::size_t kLegacyExponentOffset = 20;
constexpr std::size_t kLegacyAggOffset      = 208;
constexpr std::size_t kLegacyMinSize        = 240;

constexpr std::array<std::uint8_t, 8> kConvertDiscriminator = {112, 238, 195, 2, 143, 214, 143, 89};
constexpr std::array<std::uint8_t, 8> kClaimDiscriminator   = {89, 196, 234, 5, 100, 197, 24, 219};

} // namespace rvault::codec::layout
