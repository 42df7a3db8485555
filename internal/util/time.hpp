#pragma once

#include <chrono>
#include <cstdint>

namespace msgstore::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Wall clock in nanoseconds since the Unix epoch. Message timestamps use this.
int64_t NowNanos();

int64_t ToUnixNanos(TimePoint tp);

} // namespace msgstore::util
