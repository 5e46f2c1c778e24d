#include "internal/guard/claim_guard.hpp"

#include <algorithm>

#include "internal/model/pop_tier.hpp"

namespace rvault::guard {

namespace {

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

} // namespace

std::int64_t DayIndex(std::int64_t unix_ts) {
  return FloorDiv(unix_ts, kSecondsPerDay);
}

std::int64_t MonthIndex(std::int64_t unix_ts) {
  // Civil-from-days over 400-year eras, March-based years.
  const std::int64_t z   = DayIndex(unix_ts) + 719'468;
  const std::int64_t era = FloorDiv(z, 146'097);
  const std::int64_t doe = z - era * 146'097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36'524 - doe / 146'096) / 365;
  const std::int64_t y   = yoe + era * 400;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp  = (5 * doy + 2) / 153;
  const std::int64_t m   = mp + (mp < 10 ? 3 : -9);
  const std::int64_t year = y + (m <= 2 ? 1 : 0);
  return year * 12 + (m - 1);
}

ClaimAllowance ReconstructAllowance(const std::optional<model::ClaimGuard>& guard,
                                    const model::PartnerRecord& partner,
                                    const model::VaultConfig& vault,
                                    std::optional<std::uint8_t> pop_level,
                                    std::uint64_t ledger_claimable,
                                    std::int64_t now) {
  ClaimAllowance out;
  out.day_index   = DayIndex(now);
  out.month_index = MonthIndex(now);

  const bool strong = pop_level && *pop_level == static_cast<std::uint8_t>(model::PopTier::kStrong);
  out.guard_applies = partner.pop_enforced && !strong;

  if (guard && guard->day == out.day_index) {
    out.used_usd_today_e6 = guard->used_usd_e6;
  }
  if (guard && guard->month_index == out.month_index) {
    out.month_claims = guard->month_claims;
  }

  const std::uint64_t cap = partner.soft_daily_cap_usd_e6;
  const std::uint64_t price = vault.forca_usd_e6;
  if (cap > 0 && price > 0) {
    const std::uint64_t remaining_usd = cap > out.used_usd_today_e6 ? cap - out.used_usd_today_e6 : 0;
    const auto tokens = static_cast<unsigned __int128>(remaining_usd) * 1'000'000 / price;
    out.remaining_usd_e6 = remaining_usd;
    out.remaining_forca  = tokens > UINT64_MAX ? UINT64_MAX : static_cast<std::uint64_t>(tokens);
  }

  if (out.guard_applies && out.remaining_forca) {
    out.effective_claimable = std::min(ledger_claimable, *out.remaining_forca);
  } else {
    out.effective_claimable = ledger_claimable;
  }

  if (partner.monthly_claim_limit > 0) {
    out.remaining_month_claims =
        partner.monthly_claim_limit > out.month_claims ? partner.monthly_claim_limit - out.month_claims : 0u;
  }

  if (out.guard_applies && partner.soft_cooldown_secs > 0 && guard && guard->last_claim_ts > 0) {
    const auto ready_at = static_cast<__int128>(guard->last_claim_ts) + partner.soft_cooldown_secs;
    const auto left     = ready_at - now;
    out.cooldown_remaining_secs = left > 0 ? static_cast<std::int64_t>(std::min<__int128>(left, INT64_MAX)) : 0;
  }

  return out;
}

} // namespace rvault::guard
