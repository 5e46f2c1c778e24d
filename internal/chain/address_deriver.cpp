#include "internal/chain/address_deriver.hpp"

#include <sodium.h>

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rvault::chain {

namespace {

constexpr std::string_view kPdaMarker = "ProgramDerivedAddress";

void EnsureSodium() {
  static const int rc = sodium_init();
  if (rc < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

std::span<const std::uint8_t> AsBytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

void ValidateSeeds(std::span<const std::span<const std::uint8_t>> seed_list, std::size_t reserved) {
  if (seed_list.size() + reserved > kMaxSeeds) {
    throw util::AddressDerivationError("too many seeds: " + std::to_string(seed_list.size()));
  }
  for (const auto& seed : seed_list) {
    if (seed.size() > kMaxSeedLength) {
      throw util::AddressDerivationError("seed exceeds 32 bytes: " + std::to_string(seed.size()));
    }
  }
}

Address::Raw HashSeeds(std::span<const std::span<const std::uint8_t>> seed_list,
                       std::span<const std::uint8_t> bump,
                       const Address& program_id) {
  crypto_hash_sha256_state state;
  crypto_hash_sha256_init(&state);
  for (const auto& seed : seed_list) {
    crypto_hash_sha256_update(&state, seed.data(), seed.size());
  }
  crypto_hash_sha256_update(&state, bump.data(), bump.size());
  crypto_hash_sha256_update(&state, program_id.bytes().data(), program_id.bytes().size());
  const auto marker = AsBytes(kPdaMarker);
  crypto_hash_sha256_update(&state, marker.data(), marker.size());

  Address::Raw digest{};
  crypto_hash_sha256_final(&state, digest.data());
  return digest;
}

} // namespace

bool IsOnCurve(std::span<const std::uint8_t> candidate) {
  if (candidate.size() != crypto_core_ed25519_BYTES) return false;
  EnsureSodium();

  // crypto_core_ed25519_is_valid_point also demands the prime-order subgroup,
  // which is stricter than decompression. Point addition only requires both
  // operands to decode onto the curve.
  unsigned char sum[crypto_core_ed25519_BYTES];
  return crypto_core_ed25519_add(sum, candidate.data(), candidate.data()) == 0;
}

std::optional<Address> CreateProgramAddress(std::span<const std::span<const std::uint8_t>> seed_list,
                                            const Address& program_id) {
  ValidateSeeds(seed_list, 0);
  EnsureSodium();

  const auto digest = HashSeeds(seed_list, {}, program_id);
  if (IsOnCurve(digest)) return std::nullopt;
  return Address(digest);
}

ProgramAddress FindProgramAddress(std::span<const std::span<const std::uint8_t>> seed_list,
                                  const Address& program_id) {
  // One slot is taken by the bump seed.
  ValidateSeeds(seed_list, 1);
  EnsureSodium();

  for (int bump = 255; bump >= 0; --bump) {
    const std::uint8_t bump_seed[1] = {static_cast<std::uint8_t>(bump)};
    const auto digest               = HashSeeds(seed_list, bump_seed, program_id);
    if (!IsOnCurve(digest)) {
      return ProgramAddress{Address(digest), static_cast<std::uint8_t>(bump)};
    }
  }

  throw util::AddressDerivationError("no viable bump seed for program " + program_id.ToBase58());
}

AddressDeriver::AddressDeriver(const Address& program_id) : program_id_(program_id) {
}

AddressDeriver AddressDeriver::FromBase58(std::string_view program_id) {
  return AddressDeriver(Address::FromBase58(program_id));
}

ProgramAddress AddressDeriver::Derive(std::string_view seed_tag, std::span<const Address> keys) const {
  std::vector<std::span<const std::uint8_t>> seed_list;
  seed_list.reserve(keys.size() + 1);
  seed_list.push_back(AsBytes(seed_tag));
  for (const auto& key : keys) seed_list.emplace_back(key.bytes());
  return FindProgramAddress(seed_list, program_id_);
}

Address AddressDeriver::VaultState() const {
  return Derive(seeds::kVaultState).address;
}

Address AddressDeriver::VaultSigner() const {
  return Derive(seeds::kVaultSigner).address;
}

Address AddressDeriver::Ally(const Address& partner_mint) const {
  const Address keys[] = {partner_mint};
  return Derive(seeds::kAlly, keys).address;
}

Address AddressDeriver::AllyVault(const Address& partner_mint) const {
  const Address keys[] = {partner_mint};
  return Derive(seeds::kAllyVault, keys).address;
}

Address AddressDeriver::PopProfile(const Address& user) const {
  const Address keys[] = {user};
  return Derive(seeds::kPop, keys).address;
}

Address AddressDeriver::UserLedger(const Address& user, const Address& partner_mint) const {
  const Address keys[] = {user, partner_mint};
  return Derive(seeds::kUserLedger, keys).address;
}

Address AddressDeriver::ClaimGuard(const Address& user, const Address& partner_mint) const {
  const Address keys[] = {user, partner_mint};
  return Derive(seeds::kClaimGuard, keys).address;
}

Address AddressDeriver::MockOracleSol() const {
  return Derive(seeds::kMockOracleSol).address;
}

Address AddressDeriver::MockPoolForca() const {
  return Derive(seeds::kMockPoolForca).address;
}

} // namespace rvault::chain
