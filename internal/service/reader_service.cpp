#include "reader_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/codec/account_codec.hpp"
#include "internal/codec/instruction_codec.hpp"
#include "internal/guard/claim_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/oracle/price_oracle.hpp"
#include "internal/rpc/typed_reads.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/snapshot/snapshot_assembler.hpp"
#include "internal/util/amount_format.hpp"
#include "internal/util/errors.hpp"

namespace rvault::service {

using namespace rvault::reader::v1;

namespace {

constexpr unsigned kRewardDecimals = 6;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* subject, Fn&& fn) {
  rvault::observability::SpanScope span(route);
  if (subject && !subject->empty()) {
    span.SetAttribute("rvault.subject", *subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    rvault::observability::Metrics::Instance().RecordRequest(route, success);
    rvault::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RVAULT_LOG_ERROR("RPC failed", {rvault::observability::StringField("route", route),
                                    rvault::observability::StringField("error", ex.what()),
                                    rvault::observability::StringField("subject", subject ? *subject : "")});
    finish(false);
    throw;
  }
}

void RequirePositiveAmount(std::int64_t amount) {
  if (amount <= 0) {
    throw std::invalid_argument("amount_forca must be positive");
  }
}

void LogAllowanceSkipped(const chain::Address& partner, std::string_view reason) {
  RVAULT_LOG_WARN("claim allowance skipped", {rvault::observability::AddressField("partner", partner),
                                              rvault::observability::StringField("reason", reason)});
}

chain::Address OrFallback(const chain::Address& preferred, const chain::Address& fallback) {
  return preferred.IsZero() ? fallback : preferred;
}

} // namespace

ReaderService::ReaderService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::optional<model::VaultConfig> ReaderService::TryReadVault() const {
  return rpc::ReadDecoded(*ctx_.reader, ctx_.deriver->VaultState(), ctx_.commitment, "vault_config",
                          codec::DecodeVaultConfig);
}

std::pair<chain::Address, model::VaultConfig> ReaderService::RequireVault() const {
  const auto address = ctx_.deriver->VaultState();
  auto vault         = TryReadVault();
  if (!vault) {
    throw util::NotFound("vault state " + address.ToBase58() + " is not initialized");
  }
  return {address, std::move(*vault)};
}

std::pair<chain::Address, model::PartnerRecord> ReaderService::RequirePartner(const chain::Address& mint) const {
  const auto address = ctx_.deriver->Ally(mint);
  auto partner       = rpc::ReadDecoded(*ctx_.reader, address, ctx_.commitment, "partner", codec::DecodePartner);
  if (!partner) {
    throw util::NotFound("partner " + mint.ToBase58() + " is not registered");
  }
  return {address, std::move(*partner)};
}

GetSnapshotResponse ReaderService::GetSnapshot(const GetSnapshotRequest& req) {
  return ObserveRpc("ReaderService.GetSnapshot", &req.user(), [&] {
    const auto user = ParseAddressField(req.user(), "user");
    auto snapshot   = ctx_.assembler->Assemble(user);

    std::optional<model::VaultConfig> vault;
    try {
      vault = TryReadVault();
    } catch (const util::ReadError& e) {
      RVAULT_LOG_WARN("claim allowance skipped", {rvault::observability::StringField("reason", e.what())});
    } catch (const util::DecodeError& e) {
      RVAULT_LOG_WARN("claim allowance skipped", {rvault::observability::StringField("reason", e.what())});
    }

    // Without a readable PoP level a Strong user would be shown a capped preview.
    if (vault && snapshot.pop_profile.error) {
      RVAULT_LOG_WARN("claim allowance skipped",
                      {rvault::observability::StringField("reason", "pop profile " + snapshot.pop_profile.error->kind),
                       rvault::observability::StringField("error", snapshot.pop_profile.error->message)});
      vault.reset();
    }

    if (vault) {
      const auto now = ctx_.clock();
      std::optional<std::uint8_t> pop_level;
      if (snapshot.pop_profile.record) pop_level = snapshot.pop_profile.record->level;

      for (auto& entry : snapshot.partners) {
        // A preview over unreadable ledger or guard bytes would be misleading.
        if (entry.ledger.error || entry.guard.error) continue;

        std::optional<model::PartnerRecord> partner;
        try {
          partner = rpc::ReadDecoded(*ctx_.reader, ctx_.deriver->Ally(entry.partner.mint), ctx_.commitment, "partner",
                                     codec::DecodePartner);
        } catch (const util::ReadError& e) {
          LogAllowanceSkipped(entry.partner.mint, e.what());
          continue;
        } catch (const util::DecodeError& e) {
          LogAllowanceSkipped(entry.partner.mint, e.what());
          continue;
        }
        if (!partner) continue;

        const auto claimable = entry.ledger.value_or_default().rp_claimable;
        entry.allowance =
            guard::ReconstructAllowance(entry.guard.record, *partner, *vault, pop_level, claimable, now);
        RVAULT_LOG_DEBUG("claim allowance",
                         {rvault::observability::AddressField("partner", entry.partner.mint),
                          rvault::observability::StringField(
                              "claimable", util::FormatAmount(entry.allowance->effective_claimable, kRewardDecimals)),
                          rvault::observability::BoolField("guard_applies", entry.allowance->guard_applies)});
      }
    }

    GetSnapshotResponse resp;
    *resp.mutable_snapshot() = ToProto(snapshot);
    return resp;
  });
}

GetQuoteResponse ReaderService::GetQuote(const GetQuoteRequest&) {
  return ObserveRpc("ReaderService.GetQuote", nullptr, [&] {
    const auto vault = RequireVault().second;
    GetQuoteResponse resp;
    *resp.mutable_quote() = ToProto(ctx_.oracle->GetQuote(vault, ctx_.clock()));
    return resp;
  });
}

GetVaultConfigResponse ReaderService::GetVaultConfig(const GetVaultConfigRequest&) {
  return ObserveRpc("ReaderService.GetVaultConfig", nullptr, [&] {
    const auto [address, vault] = RequireVault();
    GetVaultConfigResponse resp;
    *resp.mutable_vault_config() = ToProto(address, vault);
    return resp;
  });
}

GetPartnerResponse ReaderService::GetPartner(const GetPartnerRequest& req) {
  return ObserveRpc("ReaderService.GetPartner", &req.partner_mint(), [&] {
    const auto mint               = ParseAddressField(req.partner_mint(), "partner_mint");
    const auto [address, partner] = RequirePartner(mint);
    GetPartnerResponse resp;
    *resp.mutable_partner() = ToProto(address, partner);
    return resp;
  });
}

DeriveAddressesResponse ReaderService::DeriveAddresses(const DeriveAddressesRequest& req) {
  return ObserveRpc("ReaderService.DeriveAddresses", &req.user(), [&] {
    std::optional<chain::Address> user;
    if (!req.user().empty()) user = ParseAddressField(req.user(), "user");

    const auto& deriver = *ctx_.deriver;
    DeriveAddressesResponse resp;
    auto* out = resp.mutable_addresses();
    out->set_vault_state(deriver.VaultState().ToBase58());
    out->set_vault_signer(deriver.VaultSigner().ToBase58());
    out->set_mock_oracle_sol(deriver.MockOracleSol().ToBase58());
    out->set_mock_pool_forca(deriver.MockPoolForca().ToBase58());
    if (user) out->set_pop_profile(deriver.PopProfile(*user).ToBase58());

    for (const auto& partner : ctx_.assembler->partners()) {
      auto* entry = out->add_partners();
      entry->set_partner_mint(partner.mint.ToBase58());
      entry->set_ally(deriver.Ally(partner.mint).ToBase58());
      entry->set_ally_vault(deriver.AllyVault(partner.mint).ToBase58());
      if (user) {
        entry->set_user_ledger(deriver.UserLedger(*user, partner.mint).ToBase58());
        entry->set_claim_guard(deriver.ClaimGuard(*user, partner.mint).ToBase58());
      }
    }
    return resp;
  });
}

BuildInstructionResponse ReaderService::BuildConvertInstruction(const BuildConvertInstructionRequest& req) {
  return ObserveRpc("ReaderService.BuildConvertInstruction", &req.user(), [&] {
    const auto user          = ParseAddressField(req.user(), "user");
    const auto token_account = ParseAddressField(req.user_token_account(), "user_token_account");
    const auto mint          = ParseAddressField(req.partner_mint(), "partner_mint");
    RequirePositiveAmount(req.amount_forca());

    if (req.sol_usd_e6() < 0) throw std::invalid_argument("sol_usd_e6 must not be negative");
    if (req.forca_per_sol_e6() < 0) throw std::invalid_argument("forca_per_sol_e6 must not be negative");
    auto sol_usd_e6       = static_cast<std::uint64_t>(req.sol_usd_e6());
    auto forca_per_sol_e6 = static_cast<std::uint64_t>(req.forca_per_sol_e6());
    if ((sol_usd_e6 == 0) != (forca_per_sol_e6 == 0)) {
      throw std::invalid_argument("sol_usd_e6 and forca_per_sol_e6 must be set together");
    }

    const auto [vault_address, vault]  = RequireVault();
    const auto [ally_address, partner] = RequirePartner(mint);
    const auto& options                = ctx_.oracle->options();

    if (sol_usd_e6 == 0) {
      const auto quote = ctx_.oracle->GetQuote(vault, ctx_.clock());
      sol_usd_e6       = quote.sol_usd_e6;
      forca_per_sol_e6 = quote.forca_per_sol_e6;
    }

    const auto pool_sol = options.pool_base_reserve.value_or(vault.pool_sol_reserve);
    if (pool_sol.IsZero()) {
      throw util::NotFound("pool SOL reserve address is not configured");
    }

    codec::ConvertAccounts accounts;
    accounts.user               = user;
    accounts.user_token_account = token_account;
    accounts.vault_state        = vault_address;
    accounts.ally               = ally_address;
    accounts.nft_mint           = partner.nft_mint;
    accounts.ally_vault         = partner.vault_ata;
    accounts.user_ledger        = ctx_.deriver->UserLedger(user, mint);
    accounts.token_program      = chain::programs::TokenProgram();
    accounts.system_program     = chain::programs::SystemProgram();
    accounts.price_feed         = OrFallback(vault.price_feed, vault_address);
    accounts.canonical_pool     = OrFallback(vault.canonical_pool, vault_address);
    accounts.mock_oracle_sol    = ctx_.deriver->MockOracleSol();
    accounts.mock_pool_forca    = ctx_.deriver->MockPoolForca();
    accounts.pool_forca_reserve =
        OrFallback(options.pool_reward_reserve.value_or(vault.pool_forca_reserve), partner.vault_ata);
    accounts.pool_sol_reserve = pool_sol;

    RVAULT_LOG_INFO("convert instruction built",
                    {rvault::observability::AddressField("user", user),
                     rvault::observability::AddressField("partner", mint),
                     rvault::observability::StringField(
                         "amount", util::FormatAmount(req.amount_forca(), kRewardDecimals, "FORCA")),
                     rvault::observability::StringField("sol_usd",
                                                        util::FormatAmount(sol_usd_e6, kRewardDecimals, "USD"))});

    BuildInstructionResponse resp;
    *resp.mutable_instruction() = ToProto(codec::BuildConvertInstruction(ctx_.deriver->program_id(), accounts,
                                                                         req.amount_forca(), sol_usd_e6,
                                                                         forca_per_sol_e6));
    return resp;
  });
}

BuildInstructionResponse ReaderService::BuildClaimInstruction(const BuildClaimInstructionRequest& req) {
  return ObserveRpc("ReaderService.BuildClaimInstruction", &req.user(), [&] {
    const auto user          = ParseAddressField(req.user(), "user");
    const auto token_account = ParseAddressField(req.user_token_account(), "user_token_account");
    const auto mint          = ParseAddressField(req.partner_mint(), "partner_mint");
    RequirePositiveAmount(req.amount_forca());

    const auto [vault_address, vault]  = RequireVault();
    const auto [ally_address, partner] = RequirePartner(mint);
    const auto& options                = ctx_.oracle->options();

    codec::ClaimAccounts accounts;
    accounts.user               = user;
    accounts.user_token_account = token_account;
    accounts.ally               = ally_address;
    accounts.vault_state        = vault_address;
    accounts.vault_signer       = ctx_.deriver->VaultSigner();
    accounts.ally_vault         = partner.vault_ata;
    accounts.user_ledger        = ctx_.deriver->UserLedger(user, mint);
    accounts.token_program      = chain::programs::TokenProgram();
    accounts.pop_profile        = ctx_.deriver->PopProfile(user);
    accounts.claim_guard        = ctx_.deriver->ClaimGuard(user, mint);
    accounts.price_feed         = OrFallback(vault.price_feed, vault_address);
    accounts.canonical_pool     = OrFallback(vault.canonical_pool, vault_address);
    accounts.mock_oracle_sol    = ctx_.deriver->MockOracleSol();
    accounts.mock_pool_forca    = ctx_.deriver->MockPoolForca();
    accounts.pool_forca_reserve =
        OrFallback(options.pool_reward_reserve.value_or(vault.pool_forca_reserve), partner.vault_ata);
    // The claim path only reads the SOL reserve when pricing through the pool.
    accounts.pool_sol_reserve = OrFallback(options.pool_base_reserve.value_or(vault.pool_sol_reserve), token_account);
    accounts.system_program   = chain::programs::SystemProgram();

    RVAULT_LOG_INFO("claim instruction built",
                    {rvault::observability::AddressField("user", user),
                     rvault::observability::AddressField("partner", mint),
                     rvault::observability::StringField(
                         "amount", util::FormatAmount(req.amount_forca(), kRewardDecimals, "FORCA"))});

    BuildInstructionResponse resp;
    *resp.mutable_instruction() =
        ToProto(codec::BuildClaimInstruction(ctx_.deriver->program_id(), accounts, req.amount_forca()));
    return resp;
  });
}

} // namespace rvault::service
