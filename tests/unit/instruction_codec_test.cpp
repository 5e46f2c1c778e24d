#include "internal/codec/instruction_codec.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "account_builders.hpp"
#include "internal/codec/layouts.hpp"

namespace {

using rvault::codec::AccountMeta;
using rvault::testing::AddressOf;

std::uint64_t ReadU64At(const rvault::chain::Bytes& data, std::size_t offset) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(data[offset + i]) << (8 * i);
  return v;
}

bool Is(const AccountMeta& meta, std::uint8_t fill, bool signer, bool writable) {
  return meta.pubkey == AddressOf(fill) && meta.is_signer == signer && meta.is_writable == writable;
}

void TestConvertPayloadLayout() {
  const auto data = rvault::codec::EncodeConvertData(1'500'000, 150'000'000, 2'000'000'000);
  assert(data.size() == 32);
  for (std::size_t i = 0; i < 8; ++i) assert(data[i] == rvault::codec::layout::kConvertDiscriminator[i]);
  assert(ReadU64At(data, 8) == 1'500'000);
  assert(ReadU64At(data, 16) == 150'000'000);
  assert(ReadU64At(data, 24) == 2'000'000'000);
}

void TestClaimPayloadLayout() {
  const auto data = rvault::codec::EncodeClaimData(42);
  assert(data.size() == 16);
  for (std::size_t i = 0; i < 8; ++i) assert(data[i] == rvault::codec::layout::kClaimDiscriminator[i]);
  assert(ReadU64At(data, 8) == 42);
}

void TestPricesAboveSignedRangeAreWritten() {
  const auto data = rvault::codec::EncodeConvertData(1, std::numeric_limits<std::uint64_t>::max(), 1ULL << 63);
  assert(ReadU64At(data, 16) == std::numeric_limits<std::uint64_t>::max());
  assert(ReadU64At(data, 24) == 1ULL << 63);
}

void TestNegativeAmountsAreRejected() {
  bool threw = false;
  try {
    (void)rvault::codec::EncodeConvertData(-1, 1, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)rvault::codec::EncodeClaimData(-5);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestConvertAccountOrder() {
  rvault::codec::ConvertAccounts a;
  a.user               = AddressOf(1);
  a.user_token_account = AddressOf(2);
  a.vault_state        = AddressOf(3);
  a.ally               = AddressOf(4);
  a.nft_mint           = AddressOf(5);
  a.ally_vault         = AddressOf(6);
  a.user_ledger        = AddressOf(7);
  a.token_program      = AddressOf(8);
  a.system_program     = AddressOf(9);
  a.price_feed         = AddressOf(10);
  a.canonical_pool     = AddressOf(11);
  a.mock_oracle_sol    = AddressOf(12);
  a.mock_pool_forca    = AddressOf(13);
  a.pool_forca_reserve = AddressOf(14);
  a.pool_sol_reserve   = AddressOf(15);

  const auto ix = rvault::codec::BuildConvertInstruction(AddressOf(99), a, 10, 20, 30);
  assert(ix.program_id == AddressOf(99));
  assert(ix.accounts.size() == 15);
  assert(Is(ix.accounts[0], 1, true, true));
  assert(Is(ix.accounts[1], 2, false, true));
  assert(Is(ix.accounts[2], 3, false, false));
  assert(Is(ix.accounts[3], 4, false, true));
  assert(Is(ix.accounts[4], 5, false, false));
  assert(Is(ix.accounts[5], 6, false, true));
  assert(Is(ix.accounts[6], 7, false, true));
  for (std::size_t i = 7; i < 15; ++i) {
    assert(Is(ix.accounts[i], static_cast<std::uint8_t>(i + 1), false, false));
  }
  assert(ReadU64At(ix.data, 24) == 30);
}

void TestClaimAccountOrder() {
  rvault::codec::ClaimAccounts a;
  a.user               = AddressOf(1);
  a.user_token_account = AddressOf(2);
  a.ally               = AddressOf(3);
  a.vault_state        = AddressOf(4);
  a.vault_signer       = AddressOf(5);
  a.ally_vault         = AddressOf(6);
  a.user_ledger        = AddressOf(7);
  a.token_program      = AddressOf(8);
  a.pop_profile        = AddressOf(9);
  a.claim_guard        = AddressOf(10);
  a.price_feed         = AddressOf(11);
  a.canonical_pool     = AddressOf(12);
  a.mock_oracle_sol    = AddressOf(13);
  a.mock_pool_forca    = AddressOf(14);
  a.pool_forca_reserve = AddressOf(15);
  a.pool_sol_reserve   = AddressOf(16);
  a.system_program     = AddressOf(17);

  const auto ix = rvault::codec::BuildClaimInstruction(AddressOf(99), a, 7);
  assert(ix.accounts.size() == 17);
  assert(Is(ix.accounts[0], 1, true, true));
  assert(Is(ix.accounts[1], 2, false, true));
  assert(Is(ix.accounts[2], 3, false, true));
  assert(Is(ix.accounts[3], 4, false, false));
  assert(Is(ix.accounts[4], 5, false, false));
  assert(Is(ix.accounts[5], 6, false, true));
  assert(Is(ix.accounts[6], 7, false, true));
  assert(Is(ix.accounts[7], 8, false, false));
  assert(Is(ix.accounts[8], 9, false, true));
  assert(Is(ix.accounts[9], 10, false, true));
  for (std::size_t i = 10; i < 17; ++i) {
    assert(Is(ix.accounts[i], static_cast<std::uint8_t>(i + 1), false, false));
  }
  assert(ReadU64At(ix.data, 8) == 7);
}

} // namespace

int main() {
  TestConvertPayloadLayout();
  TestClaimPayloadLayout();
  TestPricesAboveSignedRangeAreWritten();
  TestNegativeAmountsAreRejected();
  TestConvertAccountOrder();
  TestClaimAccountOrder();

  std::cout << "rvault_unit_instruction_codec: pass\n";
  return 0;
}
