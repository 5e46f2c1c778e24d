#include "internal/codec/account_codec.hpp"

#include <string>

#include "internal/codec/byte_reader.hpp"
#include "internal/codec/layouts.hpp"

namespace rvault::codec {

namespace {

ByteReader OpenRecord(std::span<const std::uint8_t> data, std::size_t min_size, const char* kind) {
  if (data.size() < min_size) {
    throw util::DecodeError(util::DecodeFailure::kTooShort, std::string(kind) + " account too short: "
                                                                + std::to_string(data.size()) + " < "
                                                                + std::to_string(min_size));
  }
  return ByteReader(data, layout::kDiscriminatorSize);
}

} // namespace

model::VaultConfig DecodeVaultConfig(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kVaultConfigMinSize, "vault config");

  model::VaultConfig v;
  v.pop_admin             = r.ReadAddress();
  v.econ_admin            = r.ReadAddress();
  v.forca_mint            = r.ReadAddress();
  v.fee_c_bps             = r.ReadU16();
  v.tax_d_bps             = r.ReadU16();
  v.margin_b_bps          = r.ReadU16();
  v.paused                = r.ReadBool();
  v.vault_signer_bump     = r.ReadU8();
  v.soft_daily_cap_usd_e6 = r.ReadU64();
  v.soft_cooldown_secs    = r.ReadU64();
  v.forca_usd_e6          = r.ReadU64();
  v.verify_prices         = r.ReadBool();
  v.oracle_tolerance_bps  = r.ReadU16();
  v.price_feed            = r.ReadAddress();
  v.canonical_pool        = r.ReadAddress();
  v.pool_forca_reserve    = r.ReadAddress();
  v.pool_sol_reserve      = r.ReadAddress();
  v.use_mock_oracle       = r.ReadBool();
  v.mock_oracle_locked    = r.ReadBool();
  v.max_stale_secs        = r.ReadU64();
  if (r.remaining() >= sizeof(std::uint16_t)) {
    v.max_confidence_bps = r.ReadU16();
  }
  return v;
}

model::PartnerRecord DecodePartner(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kPartnerSize, "partner");

  model::PartnerRecord p;
  p.nft_mint                  = r.ReadAddress();
  p.ops_authority             = r.ReadAddress();
  p.withdraw_authority        = r.ReadAddress();
  p.treasury_ata              = r.ReadAddress();
  p.vault_ata                 = r.ReadAddress();
  p.role                      = r.ReadU8();
  p.balance_forca             = r.ReadU64();
  p.rp_reserved               = r.ReadU64();
  p.benefit_mode              = r.ReadU8();
  p.benefit_bps               = r.ReadU16();
  p.pop_enforced              = r.ReadBool();
  p.soft_daily_cap_usd_e6     = r.ReadU64();
  p.soft_cooldown_secs        = r.ReadU64();
  p.monthly_claim_limit       = r.ReadU16();
  p.hard_kyc_threshold_usd_e6 = r.ReadU64();
  return p;
}

model::UserLedger DecodeUserLedger(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kUserLedgerSize, "user ledger");

  model::UserLedger l;
  l.user                = r.ReadAddress();
  l.partner_mint        = r.ReadAddress();
  l.rp_claimable        = r.ReadU64();
  l.pp_balance          = r.ReadU64();
  l.hwm_claimed         = r.ReadU64();
  l.tax_hwm             = r.ReadU64();
  l.total_claimed_forca = r.ReadU64();
  l.bump                = r.ReadU8();
  l.created_ts          = r.ReadI64();
  l.updated_ts          = r.ReadI64();
  return l;
}

model::PopProfile DecodePopProfile(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kPopProfileSize, "pop profile");

  model::PopProfile p;
  p.user        = r.ReadAddress();
  p.level       = r.ReadU8();
  p.bump        = r.ReadU8();
  p.last_set_ts = r.ReadI64();
  return p;
}

model::ClaimGuard DecodeClaimGuard(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kClaimGuardSize, "claim guard");

  model::ClaimGuard g;
  g.user          = r.ReadAddress();
  g.partner_mint  = r.ReadAddress();
  g.day           = r.ReadI64();
  g.used_usd_e6   = r.ReadU64();
  g.last_claim_ts = r.ReadI64();
  g.month_index   = r.ReadI64();
  g.month_claims  = r.ReadU16();
  g.bump          = r.ReadU8();
  return g;
}

model::MockOracleSolUsd DecodeMockOracle(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kMockOracleSize, "mock oracle");

  model::MockOracleSolUsd m;
  m.sol_usd_e6 = r.ReadU64();
  m.exponent   = r.ReadI32();
  m.conf_e8    = r.ReadU64();
  m.publish_ts = r.ReadI64();
  return m;
}

model::MockPoolForcaSol DecodeMockPool(std::span<const std::uint8_t> data) {
  auto r = OpenRecord(data, layout::kMockPoolSize, "mock pool");

  model::MockPoolForcaSol m;
  m.forca_per_sol_e6 = r.ReadU64();
  m.reserve_forca_e6 = r.ReadU64();
  m.reserve_sol_e9   = r.ReadU64();
  return m;
}

model::TokenAccount DecodeTokenAccount(std::span<const std::uint8_t> data) {
  if (data.size() < layout::kTokenAccountMinSize) {
    throw util::DecodeError(util::DecodeFailure::kTooShort,
                            "token account too short: " + std::to_string(data.size()));
  }
  ByteReader r(data);

  model::TokenAccount t;
  t.mint   = r.ReadAddress();
  t.owner  = r.ReadAddress();
  t.amount = r.ReadU64();
  return t;
}

} // namespace rvault::codec
