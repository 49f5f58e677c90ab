#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace relay::util {

/*
  Time utilities. Single place that reads the wall clock.

  Components that compare against wall time take a NowFn so tests can
  drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixSeconds(TimePoint tp);
// Only for seconds representable by Clock (roughly +/-292 years around 1970).
TimePoint FromUnixSeconds(int64_t seconds);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace relay::util
