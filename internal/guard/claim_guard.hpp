#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/records.hpp"

namespace rvault::guard {

constexpr std::int64_t kSecondsPerDay = 86'400;

// floor(ts / 86400), also for timestamps before the epoch.
std::int64_t DayIndex(std::int64_t unix_ts);

// year * 12 + (month - 1) of the UTC civil date containing unix_ts.
std::int64_t MonthIndex(std::int64_t unix_ts);

struct ClaimAllowance {
  // Partner enforces PoP and the user is not Strong.
  bool guard_applies = false;

  // Absent when the partner has no daily cap or the reward price is unknown.
  std::optional<std::uint64_t> remaining_usd_e6;
  std::optional<std::uint64_t> remaining_forca;
  std::uint64_t effective_claimable = 0;

  // Absent when the partner sets no monthly limit.
  std::optional<std::uint32_t> remaining_month_claims;
  std::int64_t cooldown_remaining_secs = 0;

  std::int64_t day_index = 0;
  std::int64_t month_index = 0;
  std::uint64_t used_usd_today_e6 = 0;
  std::uint16_t month_claims = 0;
};

/*
  Previews what the writer program's claim path would allow right now.

  Pure function of its inputs. pop_level is nullopt when the user has no PoP
  profile, which counts as below Strong. The token allowance is priced with
  the vault's stored reward token USD price; zero means unknown.
*/
ClaimAllowance ReconstructAllowance(const std::optional<model::ClaimGuard>& guard,
                                    const model::PartnerRecord& partner,
                                    const model::VaultConfig& vault,
                                    std::optional<std::uint8_t> pop_level,
                                    std::uint64_t ledger_claimable,
                                    std::int64_t now);

} // namespace rvault::guard
