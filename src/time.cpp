#include "gitwatch/time.hpp"

namespace gitwatch::timeutil {

std::int64_t unix_seconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace gitwatch::timeutil
