#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/chain/address_deriver.hpp"
#include "internal/guard/claim_guard.hpp"
#include "internal/model/partner.hpp"
#include "internal/model/records.hpp"
#include "internal/rpc/account_reader.hpp"

namespace rvault::snapshot {

struct SlotError {
  // TooShort, UnsupportedTag, BadMagicOrVersion, ZeroOrInvalidPrice,
  // IdentityMismatch or ReadFailure.
  std::string kind;
  std::string message;
};

/*
  One account of the snapshot.

  exists=false with no error: the account has not been created yet and the
  record reads as all defaults. exists=true with an error: the bytes were
  present but unusable. A read failure leaves exists=false with an error.
*/
template <typename Record>
struct Slot {
  chain::Address address;
  bool exists = false;
  std::optional<Record> record;
  std::optional<SlotError> error;

  const Record& value_or_default() const {
    static const Record kEmpty{};
    return record ? *record : kEmpty;
  }
};

struct PartnerSlot {
  model::PartnerRef partner;
  Slot<model::UserLedger> ledger;
  Slot<model::ClaimGuard> guard;
  // Filled in by callers that also hold the vault and partner records.
  std::optional<guard::ClaimAllowance> allowance;
};

struct Snapshot {
  chain::Address user;
  Slot<model::PopProfile> pop_profile;
  std::vector<PartnerSlot> partners;
};

/*
  Builds the per-user view across all configured partners.

  All reads are issued concurrently and joined before returning. No read is
  retried, and no failure of one slot fails the whole snapshot; only
  AddressDerivationError (a programming or configuration fault) escapes.
*/
class SnapshotAssembler {
 public:
  SnapshotAssembler(std::shared_ptr<rpc::AccountReader> reader,
                    chain::AddressDeriver deriver,
                    std::vector<model::PartnerRef> partners,
                    rpc::Commitment commitment);

  Snapshot Assemble(const chain::Address& user) const;

  const std::vector<model::PartnerRef>& partners() const {
    return partners_;
  }

 private:
  std::shared_ptr<rpc::AccountReader> reader_;
  chain::AddressDeriver deriver_;
  std::vector<model::PartnerRef> partners_;
  rpc::Commitment commitment_;
};

} // namespace rvault::snapshot
