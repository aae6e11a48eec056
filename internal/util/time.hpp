#pragma once

#include <chrono>
#include <cstdint>

namespace recsync::util {

/*
  Wall clock helpers. All record code reads the clock through here.

  Record timestamps are nanoseconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(uint64_t nanos);
uint64_t  ToUnixMillis(TimePoint tp);

uint64_t NowNanos();

} // namespace recsync::util
