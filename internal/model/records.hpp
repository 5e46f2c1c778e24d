#pragma once

#include <cstdint>

#include "internal/chain/address.hpp"

namespace rvault::model {

using chain::Address;

// Singleton vault configuration ("vault_state").
struct VaultConfig {
  Address pop_admin;
  Address econ_admin;
  Address forca_mint;

  std::uint16_t fee_c_bps = 0;
  std::uint16_t tax_d_bps = 0;
  std::uint16_t margin_b_bps = 0;
  bool paused = false;
  std::uint8_t vault_signer_bump = 0;

  std::uint64_t soft_daily_cap_usd_e6 = 0;
  std::uint64_t soft_cooldown_secs = 0;
  std::uint64_t forca_usd_e6 = 0;

  bool verify_prices = false;
  std::uint16_t oracle_tolerance_bps = 0;
  Address price_feed;
  Address canonical_pool;
  Address pool_forca_reserve;
  Address pool_sol_reserve;
  bool use_mock_oracle = false;
  bool mock_oracle_locked = false;
  std::uint64_t max_stale_secs = 0;
  // Trailing field; zero on accounts created before it existed.
  std::uint16_t max_confidence_bps = 0;
};

// Per-partner configuration and balances ("ally").
struct PartnerRecord {
  Address nft_mint;
  Address ops_authority;
  Address withdraw_authority;
  Address treasury_ata;
  Address vault_ata;

  std::uint8_t role = 0;
  std::uint64_t balance_forca = 0;
  std::uint64_t rp_reserved = 0;
  std::uint8_t benefit_mode = 0;
  std::uint16_t benefit_bps = 0;

  bool pop_enforced = false;
  std::uint64_t soft_daily_cap_usd_e6 = 0;
  std::uint64_t soft_cooldown_secs = 0;
  std::uint16_t monthly_claim_limit = 0;
  std::uint64_t hard_kyc_threshold_usd_e6 = 0;
};

struct UserLedger {
  Address user;
  Address partner_mint;

  std::uint64_t rp_claimable = 0;
  std::uint64_t pp_balance = 0;
  std::uint64_t hwm_claimed = 0;
  std::uint64_t tax_hwm = 0;
  std::uint64_t total_claimed_forca = 0;

  std::uint8_t bump = 0;
  std::int64_t created_ts = 0;
  std::int64_t updated_ts = 0;
};

struct PopProfile {
  Address user;
  std::uint8_t level = 0;
  std::uint8_t bump = 0;
  std::int64_t last_set_ts = 0;
};

struct ClaimGuard {
  Address user;
  Address partner_mint;

  std::int64_t day = 0;
  std::uint64_t used_usd_e6 = 0;
  std::int64_t last_claim_ts = 0;
  std::int64_t month_index = 0;
  std::uint16_t month_claims = 0;
  std::uint8_t bump = 0;
};

struct MockOracleSolUsd {
  std::uint64_t sol_usd_e6 = 0;
  std::int32_t exponent = 0;
  std::uint64_t conf_e8 = 0;
  std::int64_t publish_ts = 0;
};

struct MockPoolForcaSol {
  std::uint64_t forca_per_sol_e6 = 0;
  std::uint64_t reserve_forca_e6 = 0;
  std::uint64_t reserve_sol_e9 = 0;
};

struct TokenAccount {
  Address mint;
  Address owner;
  std::uint64_t amount = 0;
};

// Normalized view of either price feed layout.
struct PriceFeed {
  std::int64_t price = 0;
  std::uint64_t confidence = 0;
  std::int32_t exponent = 0;
  std::int64_t publish_time = 0;
};

} // namespace rvault::model
