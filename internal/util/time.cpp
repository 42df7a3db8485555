#include "time.hpp"

namespace msgstore::util {

TimePoint Now() {
  return Clock::now();
}

int64_t NowNanos() {
  return ToUnixNanos(Clock::now());
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace msgstore::util
