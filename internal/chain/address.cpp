#include "internal/chain/address.hpp"

#include <algorithm>
#include <cstring>

#include "internal/util/errors.hpp"

namespace rvault::chain {

namespace {

constexpr std::string_view kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int AlphabetIndex(char c) {
  const auto pos = kAlphabet.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

} // namespace

std::string EncodeBase58(std::span<const std::uint8_t> data) {
  std::size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) ++zeros;

  // log(256) / log(58) < 1.38
  std::vector<std::uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
  std::size_t length = 0;

  for (std::size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    std::size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
      carry += 256 * (*it);
      *it   = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != digits.end() && *it == 0) ++it;

  std::string out(zeros, '1');
  out.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
  for (; it != digits.end(); ++it) out.push_back(kAlphabet[*it]);
  return out;
}

std::optional<Bytes> DecodeBase58(std::string_view encoded) {
  std::size_t ones = 0;
  while (ones < encoded.size() && encoded[ones] == '1') ++ones;

  // log(58) / log(256) < 0.733
  std::vector<std::uint8_t> bytes((encoded.size() - ones) * 733 / 1000 + 1, 0);
  std::size_t length = 0;

  for (std::size_t i = ones; i < encoded.size(); ++i) {
    int carry = AlphabetIndex(encoded[i]);
    if (carry < 0) return std::nullopt;

    std::size_t j = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it   = static_cast<std::uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
  while (it != bytes.end() && *it == 0) ++it;

  Bytes out(ones, 0);
  out.insert(out.end(), it, bytes.end());
  return out;
}

Address Address::FromBase58(std::string_view encoded) {
  if (encoded.empty()) {
    throw util::AddressDerivationError("malformed identifier: empty address");
  }
  const auto decoded = DecodeBase58(encoded);
  if (!decoded) {
    throw util::AddressDerivationError("malformed identifier: invalid base58 '" + std::string(encoded) + "'");
  }
  if (decoded->size() != kAddressSize) {
    throw util::AddressDerivationError("malformed identifier: '" + std::string(encoded) + "' decodes to "
                                       + std::to_string(decoded->size()) + " bytes");
  }
  return FromBytes(*decoded);
}

Address Address::FromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kAddressSize) {
    throw util::AddressDerivationError("malformed identifier: expected 32 bytes, got " + std::to_string(bytes.size()));
  }
  Raw raw{};
  std::copy(bytes.begin(), bytes.end(), raw.begin());
  return Address(raw);
}

std::string Address::ToBase58() const {
  return EncodeBase58(bytes_);
}

std::string Address::ShortForm() const {
  const auto full = ToBase58();
  if (full.size() <= 8) return full;
  return full.substr(0, 4) + "..." + full.substr(full.size() - 4);
}

bool Address::IsZero() const {
  return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::size_t AddressHash::operator()(const Address& address) const noexcept {
  // Addresses are hash outputs or curve points, so any 8 bytes spread well.
  std::size_t h = 0;
  std::memcpy(&h, address.bytes().data(), sizeof(h));
  return h;
}

namespace programs {

Address TokenProgram() {
  static const Address kToken = Address::FromBase58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  return kToken;
}

Address SystemProgram() {
  return Address{};
}

} // namespace programs

} // namespace rvault::chain
