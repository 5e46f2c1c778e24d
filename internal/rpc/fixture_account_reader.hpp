#pragma once

#include <string>
#include <unordered_map>

#include "internal/rpc/account_reader.hpp"

namespace YAML {
class Node;
}

namespace rvault::rpc {

/*
  Immutable account set loaded once from a YAML capture.

    accounts:
      - address: <base58>
        base64: <account data>      # or hex: <account data>
      - address: <base58>
        error: "rpc timeout"        # reads of this address raise ReadError

  Addresses not listed read as absent.
*/
class FixtureAccountReader final : public AccountReader {
 public:
  // Throws std::runtime_error for an unreadable or malformed file.
  static FixtureAccountReader LoadFromYaml(const std::string& path);
  static FixtureAccountReader LoadFromString(const std::string& yaml);

  std::optional<chain::Bytes> ReadAccount(const chain::Address& address, Commitment commitment) override;

  std::size_t size() const {
    return accounts_.size();
  }

 private:
  FixtureAccountReader() = default;

  void Populate(const YAML::Node& root, const std::string& origin);

  std::unordered_map<chain::Address, chain::Bytes, chain::AddressHash> accounts_;
  std::unordered_map<chain::Address, std::string, chain::AddressHash> failures_;
};

} // namespace rvault::rpc
