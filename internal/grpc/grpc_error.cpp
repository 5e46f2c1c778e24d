#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rvault::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace rvault::util;

  if (const auto* quote = dynamic_cast<const QuoteError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION,
            "price unavailable (" + std::string(ToString(quote->failure())) + "): " + e.what()};
  }
  if (const auto* decode = dynamic_cast<const DecodeError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, std::string(ToString(decode->failure())) + ": " + e.what()};
  }
  if (dynamic_cast<const AddressDerivationError*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ReadError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace rvault::grpc
