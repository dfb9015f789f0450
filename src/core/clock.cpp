#include "osim/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace osim::core {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
  const auto time_t_value = std::chrono::system_clock::to_time_t(seconds);

  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

std::string SystemClock::now_iso8601() {
  return format_iso8601(std::chrono::system_clock::now());
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

}  // namespace osim::core
