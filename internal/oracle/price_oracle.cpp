#include "internal/oracle/price_oracle.hpp"

#include <limits>
#include <utility>
#include <string>

#include "internal/codec/account_codec.hpp"
#include "internal/codec/price_feed_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rpc/typed_reads.hpp"
#include "internal/util/errors.hpp"

namespace rvault::oracle {

namespace {

using u128 = unsigned __int128;
using i128 = __int128;

constexpr u128 kU64Max = std::numeric_limits<std::uint64_t>::max();

[[noreturn]] void Fail(util::QuoteFailure failure, const std::string& message) {
  throw util::QuoteError(failure, message);
}

std::uint64_t NarrowOrFail(u128 value, const char* what) {
  if (value > kU64Max) {
    Fail(util::QuoteFailure::kInvalidScaledPrice, std::string(what) + " overflows 64 bits");
  }
  return static_cast<std::uint64_t>(value);
}

std::uint64_t ImpliedRewardPrice(std::uint64_t sol_usd_e6, std::uint64_t forca_per_sol_e6) {
  if (forca_per_sol_e6 == 0) return 0;
  const u128 value = static_cast<u128>(sol_usd_e6) * kMicroScale / forca_per_sol_e6;
  return value > kU64Max ? std::numeric_limits<std::uint64_t>::max() : static_cast<std::uint64_t>(value);
}

} // namespace

std::string_view ToString(QuoteSource source) {
  switch (source) {
    case QuoteSource::kMockOracle:
      return "mock_oracle";
    case QuoteSource::kVerifiedFeed:
      return "verified_feed";
    case QuoteSource::kStoredPrice:
      return "stored_price";
    case QuoteSource::kFallbackFeed:
      return "fallback_feed";
  }
  return "unknown";
}

std::uint64_t ScalePriceToE6(std::int64_t price, std::int32_t exponent) {
  const std::int64_t adj = static_cast<std::int64_t>(exponent) + 6;
  i128 value             = price;

  if (adj > 0) {
    // 10^39 already exceeds any 128-bit product we could narrow to 64 bits.
    if (price != 0 && adj > 19) {
      Fail(util::QuoteFailure::kInvalidScaledPrice, "price exponent " + std::to_string(exponent) + " out of range");
    }
    for (std::int64_t i = 0; i < adj && value != 0; ++i) value *= 10;
  } else if (adj < 0) {
    // |price| < 10^19, so dividing by 10^19 or more always yields zero.
    if (-adj >= 19) {
      value = 0;
    } else {
      i128 factor = 1;
      for (std::int64_t i = 0; i < -adj; ++i) factor *= 10;
      value /= factor;
    }
  }

  if (value < 0) {
    Fail(util::QuoteFailure::kInvalidScaledPrice, "scaled price is negative");
  }
  return NarrowOrFail(static_cast<u128>(value), "scaled price");
}

std::optional<std::uint64_t> ConfidenceBps(std::int64_t price, std::uint64_t confidence) {
  if (price == 0) return std::nullopt;
  const u128 abs_price = price < 0 ? static_cast<u128>(-static_cast<i128>(price)) : static_cast<u128>(price);
  const u128 bps       = static_cast<u128>(confidence) * kBpsDenominator / abs_price;
  return bps > kU64Max ? std::numeric_limits<std::uint64_t>::max() : static_cast<std::uint64_t>(bps);
}

std::uint64_t DeriveExchangeRate(std::uint64_t reward_reserve, std::uint64_t base_reserve) {
  if (base_reserve == 0) {
    Fail(util::QuoteFailure::kEmptyReserve, "base asset reserve is empty");
  }
  const u128 rate = static_cast<u128>(reward_reserve) * kLamportScale / base_reserve;
  if (rate == 0) {
    Fail(util::QuoteFailure::kZeroDerivedRate, "derived exchange rate is zero");
  }
  return NarrowOrFail(rate, "exchange rate");
}

void ValidateFeed(const model::PriceFeed& feed, std::int64_t now, std::uint64_t max_stale_secs,
                  std::uint16_t max_confidence_bps) {
  // A feed without a publish time cannot be aged.
  if (feed.publish_time > 0 && max_stale_secs > 0) {
    const i128 age = static_cast<i128>(now) - feed.publish_time;
    if (age > static_cast<i128>(max_stale_secs)) {
      Fail(util::QuoteFailure::kStalePrice, "price published " + std::to_string(static_cast<std::int64_t>(age))
                                                + "s ago exceeds " + std::to_string(max_stale_secs) + "s");
    }
  }

  if (max_confidence_bps > 0) {
    const auto bps = ConfidenceBps(feed.price, feed.confidence);
    if (!bps) {
      Fail(util::QuoteFailure::kConfidenceTooWide, "confidence undefined for zero price");
    }
    if (*bps > max_confidence_bps) {
      Fail(util::QuoteFailure::kConfidenceTooWide, "confidence " + std::to_string(*bps) + " bps exceeds "
                                                       + std::to_string(max_confidence_bps) + " bps");
    }
  }
}

PriceOracleEngine::PriceOracleEngine(std::shared_ptr<rpc::AccountReader> reader,
                                     chain::AddressDeriver deriver,
                                     OracleOptions options)
    : reader_(std::move(reader)), deriver_(std::move(deriver)), options_(std::move(options)) {
}

Quote PriceOracleEngine::GetQuote(const model::VaultConfig& vault, std::int64_t now) const {
  observability::SpanScope span("oracle.quote");
  const auto intended = vault.use_mock_oracle ? QuoteSource::kMockOracle
                        : vault.verify_prices ? QuoteSource::kVerifiedFeed
                        : vault.forca_usd_e6 > 0 ? QuoteSource::kStoredPrice
                                                 : QuoteSource::kFallbackFeed;
  span.SetAttribute("quote.source", ToString(intended));

  try {
    auto quote = vault.use_mock_oracle ? QuoteFromMocks(now) : QuoteFromReserves(vault, now);
    observability::Metrics::Instance().RecordQuote(ToString(quote.source), "ok");
    return quote;
  } catch (const util::QuoteError& e) {
    observability::Metrics::Instance().RecordQuote(ToString(intended), util::ToString(e.failure()));
    span.RecordException(e.what());
    RVAULT_LOG_WARN("quote unavailable", {observability::StringField("source", ToString(intended)),
                                          observability::StringField("failure", util::ToString(e.failure())),
                                          observability::StringField("detail", e.what())});
    throw;
  }
}

Quote PriceOracleEngine::QuoteFromMocks(std::int64_t now) const {
  const auto oracle = rpc::ReadDecoded(*reader_, deriver_.MockOracleSol(), options_.commitment, "mock_oracle",
                                       codec::DecodeMockOracle);
  const auto pool   = rpc::ReadDecoded(*reader_, deriver_.MockPoolForca(), options_.commitment, "mock_pool",
                                       codec::DecodeMockPool);
  if (!oracle || !pool) {
    Fail(util::QuoteFailure::kMockAccountsUnavailable,
         std::string("mock ") + (!oracle ? "oracle" : "pool") + " account not found");
  }

  Quote quote;
  quote.sol_usd_e6       = oracle->sol_usd_e6;
  quote.forca_per_sol_e6 = pool->forca_per_sol_e6;
  quote.forca_usd_e6     = ImpliedRewardPrice(quote.sol_usd_e6, quote.forca_per_sol_e6);
  quote.source           = QuoteSource::kMockOracle;
  quote.computed_at      = now;
  return quote;
}

Quote PriceOracleEngine::QuoteFromReserves(const model::VaultConfig& vault, std::int64_t now) const {
  const auto base_address   = options_.pool_base_reserve.value_or(vault.pool_sol_reserve);
  const auto reward_address = options_.pool_reward_reserve.value_or(vault.pool_forca_reserve);

  const auto base_reserve   = ReadReserve(base_address, "base");
  const auto reward_reserve = ReadReserve(reward_address, "reward");
  const auto rate           = DeriveExchangeRate(reward_reserve, base_reserve);

  Quote quote;
  quote.forca_per_sol_e6 = rate;
  quote.computed_at      = now;

  if (vault.verify_prices) {
    quote.sol_usd_e6 = ReadFeedPriceE6(vault.price_feed, vault, now);
    quote.source     = QuoteSource::kVerifiedFeed;
  } else if (vault.forca_usd_e6 > 0) {
    const u128 sol_usd = static_cast<u128>(vault.forca_usd_e6) * rate / kMicroScale;
    quote.sol_usd_e6   = NarrowOrFail(sol_usd, "stored-price quote");
    quote.source       = QuoteSource::kStoredPrice;
  } else {
    quote.sol_usd_e6 = ReadFeedPriceE6(options_.fallback_price_feed.value_or(vault.price_feed), vault, now);
    quote.source     = QuoteSource::kFallbackFeed;
  }

  quote.forca_usd_e6 = ImpliedRewardPrice(quote.sol_usd_e6, rate);
  return quote;
}

std::uint64_t PriceOracleEngine::ReadReserve(const chain::Address& address, std::string_view which) const {
  if (address.IsZero()) {
    Fail(util::QuoteFailure::kEmptyReserve, std::string(which) + " reserve account not configured");
  }
  const auto account = rpc::ReadDecoded(*reader_, address, options_.commitment, "token_account",
                                        codec::DecodeTokenAccount);
  if (!account) {
    Fail(util::QuoteFailure::kEmptyReserve, std::string(which) + " reserve account " + address.ToBase58() + " not found");
  }
  return account->amount;
}

std::uint64_t PriceOracleEngine::ReadFeedPriceE6(const chain::Address& feed_address,
                                                 const model::VaultConfig& vault,
                                                 std::int64_t now) const {
  if (feed_address.IsZero()) {
    Fail(util::QuoteFailure::kFeedUnavailable, "price feed not configured");
  }

  std::optional<model::PriceFeed> feed;
  try {
    feed = rpc::ReadDecoded(*reader_, feed_address, options_.commitment, "price_feed", codec::DecodePriceFeed);
  } catch (const util::DecodeError& e) {
    Fail(util::QuoteFailure::kFeedUnavailable, "unable to parse price feed " + feed_address.ToBase58() + ": " + e.what());
  }
  if (!feed) {
    Fail(util::QuoteFailure::kFeedUnavailable, "price feed account " + feed_address.ToBase58() + " not found");
  }

  const auto max_stale = vault.max_stale_secs > 0 ? vault.max_stale_secs : options_.max_stale_secs;
  ValidateFeed(*feed, now, max_stale, vault.max_confidence_bps);

  const auto scaled = ScalePriceToE6(feed->price, feed->exponent);
  if (scaled == 0) {
    Fail(util::QuoteFailure::kInvalidScaledPrice, "scaled price is zero");
  }
  return scaled;
}

} // namespace rvault::oracle
