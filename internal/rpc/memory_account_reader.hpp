#pragma once

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/rpc/account_reader.hpp"

namespace rvault::rpc {

// In-process account store. Failures can be injected per address.
class MemoryAccountReader final : public AccountReader {
 public:
  std::optional<chain::Bytes> ReadAccount(const chain::Address& address, Commitment commitment) override;

  void Put(const chain::Address& address, chain::Bytes data);
  void Erase(const chain::Address& address);
  void FailWith(const chain::Address& address, std::string message);

  std::uint64_t read_count() const {
    return reads_.load();
  }

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<chain::Address, chain::Bytes, chain::AddressHash> accounts_;
  std::unordered_map<chain::Address, std::string, chain::AddressHash> failures_;
  std::atomic<std::uint64_t> reads_{0};
};

} // namespace rvault::rpc
