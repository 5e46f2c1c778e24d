#pragma once

#include <cstdint>
#include <string_view>

namespace rvault::model {

enum class PopTier : std::uint8_t {
  kSuspicious = 0,
  kSoft = 1,
  kStrong = 2,
};

constexpr std::string_view PopLevelLabel(std::uint8_t level) {
  switch (level) {
    case static_cast<std::uint8_t>(PopTier::kSuspicious):
      return "Suspicious";
    case static_cast<std::uint8_t>(PopTier::kSoft):
      return "Soft";
    case static_cast<std::uint8_t>(PopTier::kStrong):
      return "Strong";
    default:
      return "Unknown";
  }
}

// Points allocation is open to Soft and Strong profiles.
constexpr bool PopAllowsAllocation(std::uint8_t level) {
  return level == static_cast<std::uint8_t>(PopTier::kSoft) || level == static_cast<std::uint8_t>(PopTier::kStrong);
}

} // namespace rvault::model
