#include "internal/snapshot/snapshot_assembler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "account_builders.hpp"
#include "internal/rpc/memory_account_reader.hpp"

namespace {

using namespace rvault;
using rvault::testing::AddressOf;

const chain::Address kUser     = AddressOf(0x11);
const chain::Address kPartnerA = AddressOf(0x21);
const chain::Address kPartnerB = AddressOf(0x22);

struct Fixture {
  std::shared_ptr<rpc::MemoryAccountReader> reader = std::make_shared<rpc::MemoryAccountReader>();
  chain::AddressDeriver deriver = chain::AddressDeriver::FromBase58("2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7");

  snapshot::SnapshotAssembler Assembler() const {
    std::vector<model::PartnerRef> partners = {{kPartnerA, "Alpha"}, {kPartnerB, "Beta"}};
    return snapshot::SnapshotAssembler(reader, deriver, std::move(partners), rpc::Commitment::kConfirmed);
  }

  void PutLedger(const chain::Address& user, const chain::Address& mint, std::uint64_t claimable,
                 const chain::Address& at) {
    model::UserLedger l;
    l.user         = user;
    l.partner_mint = mint;
    l.rp_claimable = claimable;
    l.created_ts   = 1'700'000'000;
    reader->Put(at, testing::EncodeUserLedger(l));
  }
};

void TestEmptyLedgerReadsAsDefaults() {
  Fixture f;
  const auto snap = f.Assembler().Assemble(kUser);

  assert(snap.user == kUser);
  assert(snap.pop_profile.address == f.deriver.PopProfile(kUser));
  assert(!snap.pop_profile.exists && !snap.pop_profile.error);
  assert(snap.partners.size() == 2);
  for (const auto& entry : snap.partners) {
    assert(!entry.ledger.exists && !entry.ledger.error);
    assert(!entry.guard.exists && !entry.guard.error);
    assert(entry.ledger.value_or_default().rp_claimable == 0);
    assert(!entry.allowance.has_value());
  }
  assert(snap.partners[0].partner.label == "Alpha");
  assert(snap.partners[1].ledger.address == f.deriver.UserLedger(kUser, kPartnerB));
  assert(snap.partners[1].guard.address == f.deriver.ClaimGuard(kUser, kPartnerB));
  assert(f.reader->read_count() == 5);
}

void TestPopulatedSlots() {
  Fixture f;
  model::PopProfile pop;
  pop.user  = kUser;
  pop.level = 2;
  f.reader->Put(f.deriver.PopProfile(kUser), testing::EncodePopProfile(pop));
  f.PutLedger(kUser, kPartnerA, 1'234, f.deriver.UserLedger(kUser, kPartnerA));

  // A guard allocated while enforcement was off is still zero-filled.
  f.reader->Put(f.deriver.ClaimGuard(kUser, kPartnerA), testing::EncodeClaimGuard(model::ClaimGuard{}));

  const auto snap = f.Assembler().Assemble(kUser);
  assert(snap.pop_profile.exists && snap.pop_profile.record->level == 2);
  assert(snap.partners[0].ledger.exists);
  assert(snap.partners[0].ledger.record->rp_claimable == 1'234);
  assert(snap.partners[0].guard.exists && !snap.partners[0].guard.error);
  assert(!snap.partners[1].ledger.exists);
}

void TestFailuresStayInTheirSlot() {
  Fixture f;
  f.reader->Put(f.deriver.UserLedger(kUser, kPartnerA), chain::Bytes(20, 0));
  f.reader->FailWith(f.deriver.ClaimGuard(kUser, kPartnerB), "rpc timeout");
  f.PutLedger(kUser, kPartnerB, 55, f.deriver.UserLedger(kUser, kPartnerB));

  const auto snap = f.Assembler().Assemble(kUser);

  const auto& bad_ledger = snap.partners[0].ledger;
  assert(bad_ledger.exists);
  assert(bad_ledger.error && bad_ledger.error->kind == "TooShort");
  assert(!bad_ledger.record);

  const auto& failed_guard = snap.partners[1].guard;
  assert(!failed_guard.exists);
  assert(failed_guard.error && failed_guard.error->kind == "ReadFailure");
  assert(failed_guard.error->message == "rpc timeout");

  assert(snap.partners[1].ledger.record->rp_claimable == 55);
  assert(!snap.pop_profile.error);
}

void TestIdentityMismatchIsReported() {
  Fixture f;
  // Ledger written for partner B stored at partner A's address.
  f.PutLedger(kUser, kPartnerB, 99, f.deriver.UserLedger(kUser, kPartnerA));

  model::PopProfile other;
  other.user  = AddressOf(0x99);
  other.level = 2;
  f.reader->Put(f.deriver.PopProfile(kUser), testing::EncodePopProfile(other));

  const auto snap = f.Assembler().Assemble(kUser);
  assert(snap.partners[0].ledger.exists);
  assert(!snap.partners[0].ledger.record);
  assert(snap.partners[0].ledger.error->kind == "IdentityMismatch");
  assert(snap.pop_profile.error->kind == "IdentityMismatch");
  assert(!snap.pop_profile.record);
}

} // namespace

int main() {
  TestEmptyLedgerReadsAsDefaults();
  TestPopulatedSlots();
  TestFailuresStayInTheirSlot();
  TestIdentityMismatchIsReported();

  std::cout << "rvault_unit_snapshot_assembler: pass\n";
  return 0;
}
