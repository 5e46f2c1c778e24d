#include "internal/rpc/memory_account_reader.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace rvault::rpc {

std::optional<chain::Bytes> MemoryAccountReader::ReadAccount(const chain::Address& address, Commitment) {
  reads_.fetch_add(1);
  std::shared_lock lock(mutex_);

  if (auto failure = failures_.find(address); failure != failures_.end()) {
    throw util::ReadError(failure->second);
  }

  const auto it = accounts_.find(address);
  if (it == accounts_.end()) return std::nullopt;
  return it->second;
}

void MemoryAccountReader::Put(const chain::Address& address, chain::Bytes data) {
  std::unique_lock lock(mutex_);
  failures_.erase(address);
  accounts_[address] = std::move(data);
}

void MemoryAccountReader::Erase(const chain::Address& address) {
  std::unique_lock lock(mutex_);
  accounts_.erase(address);
  failures_.erase(address);
}

void MemoryAccountReader::FailWith(const chain::Address& address, std::string message) {
  std::unique_lock lock(mutex_);
  failures_[address] = std::move(message);
}

} // namespace rvault::rpc
