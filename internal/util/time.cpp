#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlmigrate::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatUnixMillis(uint64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  const auto        millis  = static_cast<int>(unix_ms % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

} // namespace sqlmigrate::util
