#pragma once
#include <chrono>
#include <cstdint>

namespace gitwatch::timeutil {

// Seconds since the Unix epoch, as written into records.
auto unix_seconds(std::chrono::system_clock::time_point tp) -> std::int64_t;

inline auto now_seconds() -> std::int64_t {
  return unix_seconds(std::chrono::system_clock::now());
}

} // namespace gitwatch::timeutil
