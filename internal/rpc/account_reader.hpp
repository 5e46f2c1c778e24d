#pragma once

#include <optional>
#include <string_view>

#include "internal/chain/address.hpp"

namespace rvault::rpc {

enum class Commitment {
  kProcessed,
  kConfirmed,
  kFinalized,
};

constexpr std::string_view ToString(Commitment c) {
  switch (c) {
    case Commitment::kProcessed:
      return "processed";
    case Commitment::kFinalized:
      return "finalized";
    case Commitment::kConfirmed:
    default:
      return "confirmed";
  }
}

/*
  Read primitive over ledger account state.

  nullopt means the account does not exist. Transport failures are reported
  by throwing util::ReadError. Implementations must be safe to call from
  several threads at once.
*/
class AccountReader {
 public:
  virtual ~AccountReader() = default;

  virtual std::optional<chain::Bytes> ReadAccount(const chain::Address& address, Commitment commitment) = 0;
};

} // namespace rvault::rpc
