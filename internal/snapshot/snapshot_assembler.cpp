#include "internal/snapshot/snapshot_assembler.hpp"

#include <future>
#include <utility>

#include "internal/codec/account_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rpc/typed_reads.hpp"
#include "internal/util/errors.hpp"

namespace rvault::snapshot {

namespace {

constexpr const char* kIdentityMismatch = "IdentityMismatch";
constexpr const char* kReadFailure      = "ReadFailure";

template <typename Record, typename Decoder>
Slot<Record> LoadSlot(const std::shared_ptr<rpc::AccountReader>& reader,
                      const chain::Address& address,
                      rpc::Commitment commitment,
                      const char* kind,
                      Decoder decode) {
  Slot<Record> slot;
  slot.address = address;
  try {
    slot.record = rpc::ReadDecoded(*reader, address, commitment, kind, decode);
    slot.exists = slot.record.has_value();
  } catch (const util::ReadError& e) {
    slot.error = SlotError{kReadFailure, e.what()};
  } catch (const util::DecodeError& e) {
    slot.exists = true;
    slot.error  = SlotError{std::string(util::ToString(e.failure())), e.what()};
  }
  return slot;
}

template <typename Record, typename Decoder>
std::future<Slot<Record>> LoadSlotAsync(const std::shared_ptr<rpc::AccountReader>& reader,
                                        const chain::Address& address,
                                        rpc::Commitment commitment,
                                        const char* kind,
                                        Decoder decode) {
  return std::async(std::launch::async, [reader, address, commitment, kind, decode]() {
    return LoadSlot<Record>(reader, address, commitment, kind, decode);
  });
}

template <typename Record>
void RejectRecord(Slot<Record>& slot, std::string message) {
  slot.record.reset();
  slot.error = SlotError{kIdentityMismatch, std::move(message)};
}

void CheckLedgerIdentity(Slot<model::UserLedger>& slot, const chain::Address& user, const chain::Address& mint) {
  if (!slot.record) return;
  if (slot.record->user != user || slot.record->partner_mint != mint) {
    RejectRecord(slot, "ledger " + slot.address.ToBase58() + " belongs to another user or partner");
  }
}

void CheckGuardIdentity(Slot<model::ClaimGuard>& slot, const chain::Address& user, const chain::Address& mint) {
  // A guard created while enforcement was off is still all zeros.
  if (!slot.record || slot.record->user.IsZero()) return;
  if (slot.record->user != user || slot.record->partner_mint != mint) {
    RejectRecord(slot, "claim guard " + slot.address.ToBase58() + " belongs to another user or partner");
  }
}

void CheckPopIdentity(Slot<model::PopProfile>& slot, const chain::Address& user) {
  if (!slot.record) return;
  if (slot.record->user != user) {
    RejectRecord(slot, "pop profile " + slot.address.ToBase58() + " belongs to another user");
  }
}

template <typename Record>
void LogSlotError(const char* what, const Slot<Record>& slot) {
  if (!slot.error) return;
  RVAULT_LOG_WARN("snapshot slot unavailable", {observability::StringField("slot", what),
                                                observability::AddressField("address", slot.address),
                                                observability::StringField("kind", slot.error->kind),
                                                observability::StringField("detail", slot.error->message)});
}

} // namespace

SnapshotAssembler::SnapshotAssembler(std::shared_ptr<rpc::AccountReader> reader,
                                     chain::AddressDeriver deriver,
                                     std::vector<model::PartnerRef> partners,
                                     rpc::Commitment commitment)
    : reader_(std::move(reader)), deriver_(std::move(deriver)), partners_(std::move(partners)), commitment_(commitment) {
}

Snapshot SnapshotAssembler::Assemble(const chain::Address& user) const {
  observability::SpanScope span("snapshot.assemble");
  span.SetAttribute("partner.count", static_cast<std::int64_t>(partners_.size()));

  // Derivation happens up front so that a bad key fails before any read.
  const auto pop_address = deriver_.PopProfile(user);
  std::vector<std::pair<chain::Address, chain::Address>> partner_addresses;
  partner_addresses.reserve(partners_.size());
  for (const auto& partner : partners_) {
    partner_addresses.emplace_back(deriver_.UserLedger(user, partner.mint), deriver_.ClaimGuard(user, partner.mint));
  }

  auto pop_future = LoadSlotAsync<model::PopProfile>(reader_, pop_address, commitment_, "pop_profile",
                                                     codec::DecodePopProfile);

  std::vector<std::future<Slot<model::UserLedger>>> ledger_futures;
  std::vector<std::future<Slot<model::ClaimGuard>>> guard_futures;
  ledger_futures.reserve(partners_.size());
  guard_futures.reserve(partners_.size());
  for (const auto& [ledger_address, guard_address] : partner_addresses) {
    ledger_futures.push_back(LoadSlotAsync<model::UserLedger>(reader_, ledger_address, commitment_, "user_ledger",
                                                              codec::DecodeUserLedger));
    guard_futures.push_back(LoadSlotAsync<model::ClaimGuard>(reader_, guard_address, commitment_, "claim_guard",
                                                             codec::DecodeClaimGuard));
  }

  Snapshot snapshot;
  snapshot.user        = user;
  snapshot.pop_profile = pop_future.get();
  CheckPopIdentity(snapshot.pop_profile, user);
  LogSlotError("pop_profile", snapshot.pop_profile);

  snapshot.partners.reserve(partners_.size());
  std::size_t slot_errors = snapshot.pop_profile.error ? 1 : 0;
  for (std::size_t i = 0; i < partners_.size(); ++i) {
    PartnerSlot entry;
    entry.partner = partners_[i];
    entry.ledger  = ledger_futures[i].get();
    entry.guard   = guard_futures[i].get();

    CheckLedgerIdentity(entry.ledger, user, entry.partner.mint);
    CheckGuardIdentity(entry.guard, user, entry.partner.mint);
    LogSlotError("user_ledger", entry.ledger);
    LogSlotError("claim_guard", entry.guard);
    slot_errors += (entry.ledger.error ? 1 : 0) + (entry.guard.error ? 1 : 0);

    snapshot.partners.push_back(std::move(entry));
  }

  span.SetAttribute("slot.errors", static_cast<std::int64_t>(slot_errors));
  return snapshot;
}

} // namespace rvault::snapshot
