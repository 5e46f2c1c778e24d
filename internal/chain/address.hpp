#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rvault::chain {

constexpr std::size_t kAddressSize = 32;

using Bytes = std::vector<std::uint8_t>;

/*
  32-byte ledger address (public key or program derived address).

  The all-zero value is the system program id and also the "unset" marker
  used by vault configuration fields.
*/
class Address {
 public:
  using Raw = std::array<std::uint8_t, kAddressSize>;

  Address() = default;
  explicit Address(const Raw& bytes) : bytes_(bytes) {
  }

  // Throws util::AddressDerivationError on bad alphabet or wrong length.
  static Address FromBase58(std::string_view encoded);
  static Address FromBytes(std::span<const std::uint8_t> bytes);

  std::string ToBase58() const;

  // First and last four characters, as used for unlabeled partners.
  std::string ShortForm() const;

  const Raw& bytes() const {
    return bytes_;
  }

  bool IsZero() const;

  bool operator==(const Address&) const = default;
  bool operator<(const Address& other) const {
    return bytes_ < other.bytes_;
  }

 private:
  Raw bytes_{};
};

std::string EncodeBase58(std::span<const std::uint8_t> data);
std::optional<Bytes> DecodeBase58(std::string_view encoded);

struct AddressHash {
  std::size_t operator()(const Address& address) const noexcept;
};

namespace programs {

Address TokenProgram();
Address SystemProgram();

} // namespace programs

} // namespace rvault::chain
