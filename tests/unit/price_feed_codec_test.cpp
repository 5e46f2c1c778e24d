#include "internal/codec/price_feed_codec.hpp"

#include <cassert>
#include <iostream>

#include "account_builders.hpp"
#include "internal/util/errors.hpp"

namespace {

using rvault::util::DecodeError;
using rvault::util::DecodeFailure;

template <typename Fn>
DecodeFailure ExpectDecodeFailure(Fn&& fn) {
  try {
    fn();
  } catch (const DecodeError& e) {
    return e.failure();
  }
  assert(false && "decode should have failed");
  return DecodeFailure::kTooShort;
}

void TestGenericFeedFullVerification() {
  const auto bytes = rvault::testing::EncodeGenericFeed(1, 14'512'345'678, 7'000'000, -8, 1'700'000'000);
  const auto feed  = rvault::codec::DecodeGenericPriceFeed(bytes);
  assert(feed.price == 14'512'345'678);
  assert(feed.confidence == 7'000'000);
  assert(feed.exponent == -8);
  assert(feed.publish_time == 1'700'000'000);
}

void TestGenericFeedPartialVerificationSkipsSignatureCount() {
  const auto bytes = rvault::testing::EncodeGenericFeed(0, 500'000'000, 1, -8, 99);
  const auto feed  = rvault::codec::DecodeGenericPriceFeed(bytes);
  assert(feed.price == 500'000'000);
  assert(feed.publish_time == 99);
}

void TestGenericFeedRejectsUnknownTagAndShortBuffers() {
  auto bytes = rvault::testing::EncodeGenericFeed(1, 1, 1, -8, 1);
  bytes[40]  = 7;
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeGenericPriceFeed(bytes); })
         == DecodeFailure::kUnsupportedTag);

  const rvault::chain::Bytes short_bytes(100, 1);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeGenericPriceFeed(short_bytes); })
         == DecodeFailure::kTooShort);
}

void TestLegacyFeed() {
  const auto bytes = rvault::testing::EncodeLegacyFeed(14'000'000'000, 5'000'000, -8, 1, 1'700'000'500);
  assert(bytes.size() == 240);

  const auto feed = rvault::codec::DecodeLegacyPriceFeed(bytes);
  assert(feed.price == 14'000'000'000);
  assert(feed.confidence == 5'000'000);
  assert(feed.exponent == -8);
  assert(feed.publish_time == 1'700'000'500);
}

void TestLegacyFeedFailures() {
  const auto bad_magic = rvault::testing::EncodeLegacyFeed(1, 1, -8, 1, 1, 0xdeadbeef);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeLegacyPriceFeed(bad_magic); })
         == DecodeFailure::kBadMagicOrVersion);

  const auto halted = rvault::testing::EncodeLegacyFeed(14'000'000'000, 1, -8, 0, 1);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeLegacyPriceFeed(halted); })
         == DecodeFailure::kZeroOrInvalidPrice);

  const auto zero_price = rvault::testing::EncodeLegacyFeed(0, 1, -8, 1, 1);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeLegacyPriceFeed(zero_price); })
         == DecodeFailure::kZeroOrInvalidPrice);

  const rvault::chain::Bytes short_bytes(239, 0);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodeLegacyPriceFeed(short_bytes); })
         == DecodeFailure::kTooShort);
}

void TestDecodePriceFeedTriesGenericThenLegacy() {
  const auto generic = rvault::testing::EncodeGenericFeed(1, 123, 4, -2, 5);
  assert(rvault::codec::DecodePriceFeed(generic).price == 123);

  const auto legacy = rvault::testing::EncodeLegacyFeed(456, 1, -2, 1, 5);
  assert(rvault::codec::DecodePriceFeed(legacy).price == 456);

  const rvault::chain::Bytes junk(64, 9);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodePriceFeed(junk); }) == DecodeFailure::kTooShort);
}

void TestDecodePriceFeedReportsTheMatchingLayoutFailure() {
  // A generic update with an unknown tag is not a legacy account either.
  auto unknown_tag = rvault::testing::EncodeGenericFeed(1, 1, 1, -8, 1);
  unknown_tag[40]  = 2;
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodePriceFeed(unknown_tag); })
         == DecodeFailure::kUnsupportedTag);

  // Legacy magic present: the legacy failure wins.
  const auto halted = rvault::testing::EncodeLegacyFeed(14'000'000'000, 1, -8, 0, 1);
  assert(ExpectDecodeFailure([&] { (void)rvault::codec::DecodePriceFeed(halted); })
         == DecodeFailure::kZeroOrInvalidPrice);
}

} // namespace

int main() {
  TestGenericFeedFullVerification();
  TestGenericFeedPartialVerificationSkipsSignatureCount();
  TestGenericFeedRejectsUnknownTagAndShortBuffers();
  TestLegacyFeed();
  TestLegacyFeedFailures();
  TestDecodePriceFeedTriesGenericThenLegacy();
  TestDecodePriceFeedReportsTheMatchingLayoutFailure();

  std::cout << "rvault_unit_price_feed_codec: pass\n";
  return 0;
}
