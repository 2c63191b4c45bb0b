#include "lexrisk/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace lexrisk::core {

std::string SystemClock::now_iso8601() const {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::int64_t SystemClock::monotonic_micros() const {
  const auto since_start = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(since_start).count();
}

}  // namespace lexrisk::core
