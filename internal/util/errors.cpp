#include "internal/util/errors.hpp"

namespace rvault::util {

std::string_view ToString(DecodeFailure failure) {
  switch (failure) {
    case DecodeFailure::kTooShort:
      return "TooShort";
    case DecodeFailure::kUnsupportedTag:
      return "UnsupportedTag";
    case DecodeFailure::kBadMagicOrVersion:
      return "BadMagicOrVersion";
    case DecodeFailure::kZeroOrInvalidPrice:
      return "ZeroOrInvalidPrice";
  }
  return "Unknown";
}

std::string_view ToString(QuoteFailure failure) {
  switch (failure) {
    case QuoteFailure::kMockAccountsUnavailable:
      return "MockAccountsUnavailable";
    case QuoteFailure::kEmptyReserve:
      return "EmptyReserve";
    case QuoteFailure::kZeroDerivedRate:
      return "ZeroDerivedRate";
    case QuoteFailure::kStalePrice:
      return "StalePrice";
    case QuoteFailure::kConfidenceTooWide:
      return "ConfidenceTooWide";
    case QuoteFailure::kInvalidScaledPrice:
      return "InvalidScaledPrice";
    case QuoteFailure::kFeedUnavailable:
      return "FeedUnavailable";
  }
  return "Unknown";
}

} // namespace rvault::util
