#include "internal/util/amount_format.hpp"

#include <stdexcept>

namespace rvault::util {

namespace {

constexpr unsigned kMaxDecimals         = 19;
constexpr std::size_t kMaxFractionDigits = 6;

std::string FormatMagnitude(std::uint64_t magnitude, bool negative, unsigned decimals, std::string_view unit) {
  if (decimals > kMaxDecimals) {
    throw std::invalid_argument("decimals must be at most 19");
  }

  std::uint64_t base = 1;
  for (unsigned i = 0; i < decimals; ++i) base *= 10;

  const std::uint64_t whole = magnitude / base;
  std::string fraction      = decimals == 0 ? std::string() : std::to_string(magnitude % base);
  if (!fraction.empty()) {
    fraction.insert(0, decimals - fraction.size(), '0');
    if (fraction.size() > kMaxFractionDigits) fraction.resize(kMaxFractionDigits);
    while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
  }

  std::string out = negative ? "-" : "";
  out += std::to_string(whole);
  if (!fraction.empty()) {
    out += '.';
    out += fraction;
  }
  if (!unit.empty()) {
    out += ' ';
    out += unit;
  }
  return out;
}

} // namespace

std::string FormatAmount(std::int64_t value, unsigned decimals, std::string_view unit) {
  const bool negative           = value < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
  return FormatMagnitude(magnitude, negative, decimals, unit);
}

std::string FormatAmount(std::uint64_t value, unsigned decimals, std::string_view unit) {
  return FormatMagnitude(value, false, decimals, unit);
}

} // namespace rvault::util
