#pragma once

#include <chrono>
#include <cstdint>

namespace rvault::util {

// Ledger timestamps are signed unix seconds; every "now" in the reader
// comes from here unless a test injects its own clock.
std::int64_t UnixNowSeconds();

std::int64_t ToUnixSeconds(std::chrono::system_clock::time_point tp);

} // namespace rvault::util
