#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rvault::util {

/*
  Central error types.

  These get translated later to gRPC status codes, or attached to a
  single snapshot slot by the assembler.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed owner program id or seed material. Never retryable.
class AddressDerivationError : public std::runtime_error {
 public:
  explicit AddressDerivationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class DecodeFailure {
  kTooShort,
  kUnsupportedTag,
  kBadMagicOrVersion,
  kZeroOrInvalidPrice,
};

class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeFailure failure, const std::string& msg) : std::runtime_error(msg), failure_(failure) {
  }

  DecodeFailure failure() const {
    return failure_;
  }

 private:
  DecodeFailure failure_;
};

enum class QuoteFailure {
  kMockAccountsUnavailable,
  kEmptyReserve,
  kZeroDerivedRate,
  kStalePrice,
  kConfidenceTooWide,
  kInvalidScaledPrice,
  kFeedUnavailable,
};

class QuoteError : public std::runtime_error {
 public:
  QuoteError(QuoteFailure failure, const std::string& msg) : std::runtime_error(msg), failure_(failure) {
  }

  QuoteFailure failure() const {
    return failure_;
  }

 private:
  QuoteFailure failure_;
};

// Opaque transport failure from the account read primitive.
class ReadError : public std::runtime_error {
 public:
  explicit ReadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

std::string_view ToString(DecodeFailure failure);
std::string_view ToString(QuoteFailure failure);

} // namespace rvault::util
