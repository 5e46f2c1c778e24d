#include "internal/service/proto_mapping.hpp"

#include <stdexcept>
#include <string>

#include "internal/model/pop_tier.hpp"
#include "internal/util/errors.hpp"

namespace rvault::service {

namespace v1 = rvault::reader::v1;

namespace {

template <typename Record>
void SetSlotError(const snapshot::Slot<Record>& slot, v1::SlotError* out) {
  out->set_kind(slot.error->kind);
  out->set_message(slot.error->message);
}

v1::PopProfile PopToProto(const snapshot::Slot<model::PopProfile>& slot) {
  v1::PopProfile out;
  out.set_address(slot.address.ToBase58());
  out.set_exists(slot.exists);
  if (slot.error) SetSlotError(slot, out.mutable_error());
  if (!slot.record) {
    out.set_level_label(std::string(model::PopLevelLabel(0xff)));
    return out;
  }
  out.set_level(slot.record->level);
  out.set_level_label(std::string(model::PopLevelLabel(slot.record->level)));
  out.set_allocation_allowed(model::PopAllowsAllocation(slot.record->level));
  if (slot.record->last_set_ts > 0) out.set_last_set_ts(slot.record->last_set_ts);
  return out;
}

v1::LedgerEntry LedgerToProto(const snapshot::Slot<model::UserLedger>& slot) {
  v1::LedgerEntry out;
  out.set_address(slot.address.ToBase58());
  out.set_exists(slot.exists);
  if (slot.error) SetSlotError(slot, out.mutable_error());

  const auto& ledger = slot.value_or_default();
  out.set_rp_claimable(ledger.rp_claimable);
  out.set_pp_balance(ledger.pp_balance);
  out.set_hwm_claimed(ledger.hwm_claimed);
  out.set_tax_hwm(ledger.tax_hwm);
  out.set_total_claimed_forca(ledger.total_claimed_forca);
  if (ledger.created_ts > 0) out.set_created_ts(ledger.created_ts);
  if (ledger.updated_ts > 0) out.set_updated_ts(ledger.updated_ts);
  return out;
}

v1::ClaimGuardEntry GuardToProto(const snapshot::Slot<model::ClaimGuard>& slot) {
  v1::ClaimGuardEntry out;
  out.set_address(slot.address.ToBase58());
  out.set_exists(slot.exists);
  if (slot.error) SetSlotError(slot, out.mutable_error());
  if (!slot.record) return out;

  out.set_day(slot.record->day);
  out.set_used_usd_e6(slot.record->used_usd_e6);
  if (slot.record->last_claim_ts > 0) out.set_last_claim_ts(slot.record->last_claim_ts);
  out.set_month_index(slot.record->month_index);
  out.set_month_claims(slot.record->month_claims);
  return out;
}

} // namespace

v1::Snapshot ToProto(const snapshot::Snapshot& snapshot) {
  v1::Snapshot out;
  out.set_user(snapshot.user.ToBase58());
  *out.mutable_pop_profile() = PopToProto(snapshot.pop_profile);

  for (const auto& entry : snapshot.partners) {
    auto* partner = out.add_partners();
    partner->set_partner_mint(entry.partner.mint.ToBase58());
    partner->set_label(entry.partner.label);
    *partner->mutable_ledger() = LedgerToProto(entry.ledger);
    *partner->mutable_guard()  = GuardToProto(entry.guard);
    if (entry.allowance) {
      *partner->mutable_allowance() = ToProto(*entry.allowance);
    }
  }
  return out;
}

v1::ClaimAllowance ToProto(const guard::ClaimAllowance& allowance) {
  v1::ClaimAllowance out;
  out.set_guard_applies(allowance.guard_applies);
  if (allowance.remaining_usd_e6) out.set_remaining_usd_e6(*allowance.remaining_usd_e6);
  if (allowance.remaining_forca) out.set_remaining_forca(*allowance.remaining_forca);
  out.set_effective_claimable(allowance.effective_claimable);
  if (allowance.remaining_month_claims) out.set_remaining_month_claims(*allowance.remaining_month_claims);
  out.set_cooldown_remaining_secs(allowance.cooldown_remaining_secs);
  return out;
}

v1::Quote ToProto(const oracle::Quote& quote) {
  v1::Quote out;
  out.set_sol_usd_e6(quote.sol_usd_e6);
  out.set_forca_per_sol_e6(quote.forca_per_sol_e6);
  out.set_forca_usd_e6(quote.forca_usd_e6);
  out.set_source(std::string(oracle::ToString(quote.source)));
  out.set_computed_at(quote.computed_at);
  return out;
}

v1::VaultConfig ToProto(const chain::Address& address, const model::VaultConfig& vault) {
  v1::VaultConfig out;
  out.set_address(address.ToBase58());
  out.set_pop_admin(vault.pop_admin.ToBase58());
  out.set_econ_admin(vault.econ_admin.ToBase58());
  out.set_forca_mint(vault.forca_mint.ToBase58());
  out.set_fee_c_bps(vault.fee_c_bps);
  out.set_tax_d_bps(vault.tax_d_bps);
  out.set_margin_b_bps(vault.margin_b_bps);
  out.set_paused(vault.paused);
  out.set_soft_daily_cap_usd_e6(vault.soft_daily_cap_usd_e6);
  out.set_soft_cooldown_secs(vault.soft_cooldown_secs);
  out.set_forca_usd_e6(vault.forca_usd_e6);
  out.set_verify_prices(vault.verify_prices);
  out.set_oracle_tolerance_bps(vault.oracle_tolerance_bps);
  out.set_price_feed(vault.price_feed.ToBase58());
  out.set_canonical_pool(vault.canonical_pool.ToBase58());
  out.set_pool_forca_reserve(vault.pool_forca_reserve.ToBase58());
  out.set_pool_sol_reserve(vault.pool_sol_reserve.ToBase58());
  out.set_use_mock_oracle(vault.use_mock_oracle);
  out.set_mock_oracle_locked(vault.mock_oracle_locked);
  out.set_max_stale_secs(vault.max_stale_secs);
  out.set_max_confidence_bps(vault.max_confidence_bps);
  return out;
}

v1::Partner ToProto(const chain::Address& address, const model::PartnerRecord& partner) {
  v1::Partner out;
  out.set_address(address.ToBase58());
  out.set_nft_mint(partner.nft_mint.ToBase58());
  out.set_ops_authority(partner.ops_authority.ToBase58());
  out.set_withdraw_authority(partner.withdraw_authority.ToBase58());
  out.set_treasury_ata(partner.treasury_ata.ToBase58());
  out.set_vault_ata(partner.vault_ata.ToBase58());
  out.set_role(partner.role);
  out.set_balance_forca(partner.balance_forca);
  out.set_rp_reserved(partner.rp_reserved);
  out.set_benefit_mode(partner.benefit_mode);
  out.set_benefit_bps(partner.benefit_bps);
  out.set_pop_enforced(partner.pop_enforced);
  out.set_soft_daily_cap_usd_e6(partner.soft_daily_cap_usd_e6);
  out.set_soft_cooldown_secs(partner.soft_cooldown_secs);
  out.set_monthly_claim_limit(partner.monthly_claim_limit);
  out.set_hard_kyc_threshold_usd_e6(partner.hard_kyc_threshold_usd_e6);
  return out;
}

v1::Instruction ToProto(const codec::Instruction& instruction) {
  v1::Instruction out;
  out.set_program_id(instruction.program_id.ToBase58());
  for (const auto& meta : instruction.accounts) {
    auto* account = out.add_accounts();
    account->set_pubkey(meta.pubkey.ToBase58());
    account->set_is_signer(meta.is_signer);
    account->set_is_writable(meta.is_writable);
  }
  out.set_data(std::string(instruction.data.begin(), instruction.data.end()));
  return out;
}

chain::Address ParseAddressField(std::string_view value, std::string_view field) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(field) + " is required");
  }
  try {
    return chain::Address::FromBase58(value);
  } catch (const util::AddressDerivationError& e) {
    throw std::invalid_argument(std::string(field) + ": " + e.what());
  }
}

} // namespace rvault::service
