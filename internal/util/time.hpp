#pragma once

#include <chrono>
#include <cstdint>

namespace storygraph::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMillis();

} // namespace storygraph::util
