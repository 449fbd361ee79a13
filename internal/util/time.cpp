#include "time.hpp"

namespace trustnet::util {

std::int64_t WholeDays(std::int64_t seconds) {
  if (seconds <= 0) return 0;
  return seconds / kSecondsPerDay;
}

double SecondsSince(SteadyClock::time_point start) {
  return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

} // namespace trustnet::util
