#include "zkr/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace zkr {

// -----------------------------------------------------------------------------
// format_rfc3339_ms(): split into whole seconds + millis, render in UTC
// -----------------------------------------------------------------------------
std::string format_rfc3339_ms(std::int64_t epoch_ms) {
  if (epoch_ms < 0) {
    epoch_ms = 0;
  }

  const std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  const int millis = static_cast<int>(epoch_ms % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer),
                "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec, millis);
  return buffer;
}

}  // namespace zkr
