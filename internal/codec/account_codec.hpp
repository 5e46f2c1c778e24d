#pragma once

#include <cstdint>
#include <span>

#include "internal/model/records.hpp"

namespace rvault::codec {

/*
  Decoders for every account kind the vault program owns, plus SPL token
  accounts used as pool reserves.

  All decoders skip the 8-byte discriminator without validating it and throw
  util::DecodeError{kTooShort} when the buffer is below the record's minimum
  length. Extra trailing bytes are ignored.
*/

model::VaultConfig DecodeVaultConfig(std::span<const std::uint8_t> data);
model::PartnerRecord DecodePartner(std::span<const std::uint8_t> data);
model::UserLedger DecodeUserLedger(std::span<const std::uint8_t> data);
model::PopProfile DecodePopProfile(std::span<const std::uint8_t> data);
model::ClaimGuard DecodeClaimGuard(std::span<const std::uint8_t> data);
model::MockOracleSolUsd DecodeMockOracle(std::span<const std::uint8_t> data);
model::MockPoolForcaSol DecodeMockPool(std::span<const std::uint8_t> data);
model::TokenAccount DecodeTokenAccount(std::span<const std::uint8_t> data);

} // namespace rvault::codec
