#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "internal/chain/address.hpp"

namespace rvault::chain {

constexpr std::size_t kMaxSeedLength = 32;
constexpr std::size_t kMaxSeeds      = 16;

struct ProgramAddress {
  Address address;
  std::uint8_t bump = 0;
};

namespace seeds {

inline constexpr std::string_view kVaultState    = "vault_state";
inline constexpr std::string_view kVaultSigner   = "vault_signer";
inline constexpr std::string_view kAlly          = "ally";
inline constexpr std::string_view kAllyVault     = "ally_vault";
inline constexpr std::string_view kPop           = "pop";
inline constexpr std::string_view kUserLedger    = "user_ledger";
inline constexpr std::string_view kClaimGuard    = "claim_guard";
inline constexpr std::string_view kMockOracleSol = "mock_oracle_sol";
inline constexpr std::string_view kMockPoolForca = "mock_pool_forca";

} // namespace seeds

// True when the 32 bytes decompress to a point on the ed25519 curve.
bool IsOnCurve(std::span<const std::uint8_t> candidate);

// Hash of seeds and bump; nullopt when the hash lands on the curve.
std::optional<Address> CreateProgramAddress(std::span<const std::span<const std::uint8_t>> seed_list,
                                            const Address& program_id);

// Searches bump 255 down to 0 for the first off-curve hash.
ProgramAddress FindProgramAddress(std::span<const std::span<const std::uint8_t>> seed_list,
                                  const Address& program_id);

/*
  Deterministic addresses of every account owned by the vault program.

  Stateless apart from the owner program id; safe to share across threads.
*/
class AddressDeriver {
 public:
  explicit AddressDeriver(const Address& program_id);

  // Throws util::AddressDerivationError for a malformed program id.
  static AddressDeriver FromBase58(std::string_view program_id);

  ProgramAddress Derive(std::string_view seed_tag, std::span<const Address> keys = {}) const;

  Address VaultState() const;
  Address VaultSigner() const;
  Address Ally(const Address& partner_mint) const;
  Address AllyVault(const Address& partner_mint) const;
  Address PopProfile(const Address& user) const;
  Address UserLedger(const Address& user, const Address& partner_mint) const;
  Address ClaimGuard(const Address& user, const Address& partner_mint) const;
  Address MockOracleSol() const;
  Address MockPoolForca() const;

  const Address& program_id() const {
    return program_id_;
  }

 private:
  Address program_id_;
};

} // namespace rvault::chain
