#include "time.hpp"

namespace rvault::util {

std::int64_t ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::int64_t UnixNowSeconds() {
  return ToUnixSeconds(std::chrono::system_clock::now());
}

} // namespace rvault::util
