#pragma once

#include <cstdint>
#include <vector>

#include "internal/chain/address.hpp"

namespace rvault::codec {

struct AccountMeta {
  chain::Address pubkey;
  bool is_signer = false;
  bool is_writable = false;
};

struct Instruction {
  chain::Address program_id;
  std::vector<AccountMeta> accounts;
  chain::Bytes data;
};

struct ConvertAccounts {
  chain::Address user;
  chain::Address user_token_account;
  chain::Address vault_state;
  chain::Address ally;
  chain::Address nft_mint;
  chain::Address ally_vault;
  chain::Address user_ledger;
  chain::Address token_program;
  chain::Address system_program;
  chain::Address price_feed;
  chain::Address canonical_pool;
  chain::Address mock_oracle_sol;
  chain::Address mock_pool_forca;
  chain::Address pool_forca_reserve;
  chain::Address pool_sol_reserve;
};

struct ClaimAccounts {
  chain::Address user;
  chain::Address user_token_account;
  chain::Address ally;
  chain::Address vault_state;
  chain::Address vault_signer;
  chain::Address ally_vault;
  chain::Address user_ledger;
  chain::Address token_program;
  chain::Address pop_profile;
  chain::Address claim_guard;
  chain::Address price_feed;
  chain::Address canonical_pool;
  chain::Address mock_oracle_sol;
  chain::Address mock_pool_forca;
  chain::Address pool_forca_reserve;
  chain::Address pool_sol_reserve;
  chain::Address system_program;
};

// Amounts are signed so that caller input can be checked; negative values
// throw std::invalid_argument. Prices come from a quote and stay unsigned.
chain::Bytes EncodeConvertData(std::int64_t amount_forca, std::uint64_t sol_usd_e6, std::uint64_t forca_per_sol_e6);
chain::Bytes EncodeClaimData(std::int64_t amount_forca);

Instruction BuildConvertInstruction(const chain::Address& program_id,
                                    const ConvertAccounts& accounts,
                                    std::int64_t amount_forca,
                                    std::uint64_t sol_usd_e6,
                                    std::uint64_t forca_per_sol_e6);

Instruction BuildClaimInstruction(const chain::Address& program_id,
                                  const ClaimAccounts& accounts,
                                  std::int64_t amount_forca);

} // namespace rvault::codec
