#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace rvault::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Quote failures carry their failure kind in the message so callers can tell
  an unavailable price apart from a bad request.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace rvault::grpc
