#pragma once

#include <chrono>
#include <cstdint>

namespace trailmap::util {

/*
  Time utilities, single place to control clock source later.
  Persisted timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

} // namespace trailmap::util
