#include "internal/codec/price_feed_codec.hpp"

#include <string>

#include "internal/codec/byte_reader.hpp"
#include "internal/codec/layouts.hpp"

namespace rvault::codec {

model::PriceFeed DecodeGenericPriceFeed(std::span<const std::uint8_t> data) {
  if (data.size() < layout::kGenericFeedMinSize) {
    throw util::DecodeError(util::DecodeFailure::kTooShort,
                            "price update too short: " + std::to_string(data.size()));
  }

  ByteReader r(data, layout::kGenericFeedHeader);
  const auto tag = r.ReadU8();
  if (tag == layout::kGenericTagPartial) {
    r.Skip(1);
  } else if (tag != layout::kGenericTagFull) {
    throw util::DecodeError(util::DecodeFailure::kUnsupportedTag,
                            "unsupported verification tag " + std::to_string(tag));
  }

  r.Skip(32); // feed id

  model::PriceFeed feed;
  feed.price        = r.ReadI64();
  feed.confidence   = r.ReadU64();
  feed.exponent     = r.ReadI32();
  feed.publish_time = r.ReadI64();
  return feed;
}

model::PriceFeed DecodeLegacyPriceFeed(std::span<const std::uint8_t> data) {
  if (data.size() < layout::kLegacyMinSize) {
    throw util::DecodeError(util::DecodeFailure::kTooShort,
                            "legacy price account too short: " + std::to_string(data.size()));
  }

  ByteReader r(data);
  const auto magic   = r.ReadU32();
  const auto version = r.ReadU32();
  const auto type    = r.ReadU32();
  if (magic != layout::kLegacyMagic || (version != 2 && version != 3) || type != layout::kLegacyAccountPrice) {
    throw util::DecodeError(util::DecodeFailure::kBadMagicOrVersion,
                            "not a legacy price account (magic/version/type mismatch)");
  }

  r.Seek(layout::kLegacyExponentOffset);
  model::PriceFeed feed;
  feed.exponent = r.ReadI32();

  r.Seek(layout::kLegacyAggOffset);
  feed.price      = r.ReadI64();
  feed.confidence = r.ReadU64();
  const auto status = r.ReadU32();
  r.Skip(4);
  feed.publish_time = r.ReadI64();

  if (status == 0 || feed.price == 0) {
    throw util::DecodeError(util::DecodeFailure::kZeroOrInvalidPrice,
                            "legacy price not trading (status=" + std::to_string(status) + ")");
  }
  return feed;
}

model::PriceFeed DecodePriceFeed(std::span<const std::uint8_t> data) {
  try {
    return DecodeGenericPriceFeed(data);
  } catch (const util::DecodeError& generic_error) {
    try {
      return DecodeLegacyPriceFeed(data);
    } catch (const util::DecodeError&) {
      // Report the legacy failure only for accounts that carry its magic.
      if (data.size() >= 4 && ByteReader(data).ReadU32() == layout::kLegacyMagic) throw;
      throw generic_error;
    }
  }
}

} // namespace rvault::codec
