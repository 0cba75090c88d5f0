#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace vaultsync::util {

/*
  Time utilities. Single place to control the clock source.

  Engine components take a ClockFn so tests can drive timeouts and backoff
  without sleeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

} // namespace vaultsync::util
