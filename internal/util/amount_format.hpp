#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rvault::util {

// Fixed-point amount as a decimal string: trailing zeros dropped, at most six
// fractional digits kept (truncated), optional " unit" suffix.
// FormatAmount(1'500'000, 6, "FORCA") == "1.5 FORCA".
std::string FormatAmount(std::int64_t value, unsigned decimals, std::string_view unit = {});
std::string FormatAmount(std::uint64_t value, unsigned decimals, std::string_view unit = {});

} // namespace rvault::util
