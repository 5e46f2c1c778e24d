#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/chain/address_deriver.hpp"
#include "internal/model/records.hpp"
#include "internal/rpc/account_reader.hpp"

namespace rvault::oracle {

constexpr std::uint64_t kMicroScale     = 1'000'000;
constexpr std::uint64_t kLamportScale   = 1'000'000'000;
constexpr std::uint64_t kBpsDenominator = 10'000;

enum class QuoteSource {
  kMockOracle,
  kVerifiedFeed,
  kStoredPrice,
  kFallbackFeed,
};

std::string_view ToString(QuoteSource source);

struct Quote {
  std::uint64_t sol_usd_e6 = 0;
  std::uint64_t forca_per_sol_e6 = 0;
  // Reward token price implied by the two values above.
  std::uint64_t forca_usd_e6 = 0;
  QuoteSource source = QuoteSource::kMockOracle;
  std::int64_t computed_at = 0;
};

struct OracleOptions {
  // Reserve token accounts; the vault's canonical reserves when unset.
  std::optional<chain::Address> pool_base_reserve;
  std::optional<chain::Address> pool_reward_reserve;
  // Feed used when neither verification nor a stored price applies.
  std::optional<chain::Address> fallback_price_feed;
  // Used when the vault does not carry its own staleness bound.
  std::uint64_t max_stale_secs = 60;
  rpc::Commitment commitment = rpc::Commitment::kConfirmed;
};

// price * 10^(exponent + 6), truncating toward zero. Throws
// QuoteError{kInvalidScaledPrice} for negative or out-of-range results.
std::uint64_t ScalePriceToE6(std::int64_t price, std::int32_t exponent);

// conf * 10000 / |price|; nullopt when price is zero.
std::optional<std::uint64_t> ConfidenceBps(std::int64_t price, std::uint64_t confidence);

// reward_reserve * 1e9 / base_reserve. Throws QuoteError{kEmptyReserve}
// or QuoteError{kZeroDerivedRate}.
std::uint64_t DeriveExchangeRate(std::uint64_t reward_reserve, std::uint64_t base_reserve);

// Rejects stale or overly uncertain feed values.
void ValidateFeed(const model::PriceFeed& feed, std::int64_t now, std::uint64_t max_stale_secs,
                  std::uint16_t max_confidence_bps);

/*
  Computes the (base asset USD price, exchange rate) pair the writer program
  would accept for a conversion.

  Each call reads fresh account state; nothing is cached or retried.
  Failures are util::QuoteError; util::ReadError and util::DecodeError from
  non-feed accounts propagate unchanged.
*/
class PriceOracleEngine {
 public:
  PriceOracleEngine(std::shared_ptr<rpc::AccountReader> reader, chain::AddressDeriver deriver, OracleOptions options);

  Quote GetQuote(const model::VaultConfig& vault, std::int64_t now) const;

  const OracleOptions& options() const {
    return options_;
  }

 private:
  Quote QuoteFromMocks(std::int64_t now) const;
  Quote QuoteFromReserves(const model::VaultConfig& vault, std::int64_t now) const;
  std::uint64_t ReadReserve(const chain::Address& address, std::string_view which) const;
  std::uint64_t ReadFeedPriceE6(const chain::Address& feed, const model::VaultConfig& vault, std::int64_t now) const;

  std::shared_ptr<rpc::AccountReader> reader_;
  chain::AddressDeriver deriver_;
  OracleOptions options_;
};

} // namespace rvault::oracle
