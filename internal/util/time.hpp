#pragma once

#include <chrono>
#include <cstdint>

namespace trustnet::util {

/*
  Time utilities.

  Record timestamps are Unix epoch seconds. Elapsed wall time for solver
  runs is measured on the steady clock.
*/

using SteadyClock = std::chrono::steady_clock;

inline constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t WholeDays(std::int64_t seconds);

double SecondsSince(SteadyClock::time_point start);

} // namespace trustnet::util
