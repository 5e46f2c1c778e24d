#include "internal/codec/instruction_codec.hpp"

#include <stdexcept>
#include <string>

#include "internal/codec/byte_writer.hpp"
#include "internal/codec/layouts.hpp"

namespace rvault::codec {

namespace {

void WriteUnsigned(ByteWriter& w, std::int64_t value, const char* field) {
  if (value < 0) {
    throw std::invalid_argument(std::string(field) + " must not be negative");
  }
  w.WriteU64(static_cast<std::uint64_t>(value));
}

AccountMeta Readonly(const chain::Address& a) {
  return AccountMeta{a, false, false};
}

AccountMeta Writable(const chain::Address& a) {
  return AccountMeta{a, false, true};
}

AccountMeta Payer(const chain::Address& a) {
  return AccountMeta{a, true, true};
}

} // namespace

chain::Bytes EncodeConvertData(std::int64_t amount_forca, std::uint64_t sol_usd_e6, std::uint64_t forca_per_sol_e6) {
  ByteWriter w;
  w.WriteBytes(layout::kConvertDiscriminator);
  WriteUnsigned(w, amount_forca, "amount_forca");
  w.WriteU64(sol_usd_e6);
  w.WriteU64(forca_per_sol_e6);
  return w.Take();
}

chain::Bytes EncodeClaimData(std::int64_t amount_forca) {
  ByteWriter w;
  w.WriteBytes(layout::kClaimDiscriminator);
  WriteUnsigned(w, amount_forca, "amount_forca");
  return w.Take();
}

Instruction BuildConvertInstruction(const chain::Address& program_id,
                                    const ConvertAccounts& a,
                                    std::int64_t amount_forca,
                                    std::uint64_t sol_usd_e6,
                                    std::uint64_t forca_per_sol_e6) {
  Instruction ix;
  ix.program_id = program_id;
  ix.data       = EncodeConvertData(amount_forca, sol_usd_e6, forca_per_sol_e6);
  ix.accounts   = {
      Payer(a.user),
      Writable(a.user_token_account),
      Readonly(a.vault_state),
      Writable(a.ally),
      Readonly(a.nft_mint),
      Writable(a.ally_vault),
      Writable(a.user_ledger),
      Readonly(a.token_program),
      Readonly(a.system_program),
      Readonly(a.price_feed),
      Readonly(a.canonical_pool),
      Readonly(a.mock_oracle_sol),
      Readonly(a.mock_pool_forca),
      Readonly(a.pool_forca_reserve),
      Readonly(a.pool_sol_reserve),
  };
  return ix;
}

Instruction BuildClaimInstruction(const chain::Address& program_id, const ClaimAccounts& a, std::int64_t amount_forca) {
  Instruction ix;
  ix.program_id = program_id;
  ix.data       = EncodeClaimData(amount_forca);
  ix.accounts   = {
      Payer(a.user),
      Writable(a.user_token_account),
      Writable(a.ally),
      Readonly(a.vault_state),
      Readonly(a.vault_signer),
      Writable(a.ally_vault),
      Writable(a.user_ledger),
      Readonly(a.token_program),
      Writable(a.pop_profile),
      Writable(a.claim_guard),
      Readonly(a.price_feed),
      Readonly(a.canonical_pool),
      Readonly(a.mock_oracle_sol),
      Readonly(a.mock_pool_forca),
      Readonly(a.pool_forca_reserve),
      Readonly(a.pool_sol_reserve),
      Readonly(a.system_program),
  };
  return ix;
}

} // namespace rvault::codec
