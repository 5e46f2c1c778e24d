#include "internal/util/amount_format.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace {

using rvault::util::FormatAmount;

void TestTrailingZerosAreDropped() {
  assert(FormatAmount(std::uint64_t{1'500'000}, 6, "FORCA") == "1.5 FORCA");
  assert(FormatAmount(std::uint64_t{2'000'000}, 6) == "2");
  assert(FormatAmount(std::uint64_t{0}, 6) == "0");
  assert(FormatAmount(std::uint64_t{1}, 6) == "0.000001");
}

void TestFractionIsTruncatedToSixDigits() {
  // 1.00000001 SOL in lamports.
  assert(FormatAmount(std::uint64_t{1'000'000'010}, 9, "SOL") == "1 SOL");
  assert(FormatAmount(std::uint64_t{1'234'567'899}, 9) == "1.234567");
}

void TestSignedValues() {
  assert(FormatAmount(std::int64_t{-2'500'000}, 6, "USD") == "-2.5 USD");
  assert(FormatAmount(INT64_MIN, 0) == "-9223372036854775808");
}

void TestZeroDecimals() {
  assert(FormatAmount(std::uint64_t{42}, 0, "RP") == "42 RP");
}

void TestTooManyDecimalsThrows() {
  bool threw = false;
  try {
    (void)FormatAmount(std::uint64_t{1}, 20);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTrailingZerosAreDropped();
  TestFractionIsTruncatedToSixDigits();
  TestSignedValues();
  TestZeroDecimals();
  TestTooManyDecimalsThrows();

  std::cout << "rvault_unit_amount_format: pass\n";
  return 0;
}
