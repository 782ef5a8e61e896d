#ifndef LOADWATCH_CORE_TIME_UTILS_HPP_
#define LOADWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace loadwatch::core {

// Canonical UTC timestamp used by logs, events and persisted records:
// "2024-05-01T12:00:00.250Z". Pre-epoch instants floor to the previous second.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const std::int64_t total_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  std::int64_t seconds = total_ms / 1000;
  std::int64_t millis = total_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  const auto epoch_seconds = static_cast<std::time_t>(seconds);
  std::tm utc{};
  if (gmtime_r(&epoch_seconds, &utc) == nullptr) {
    return "";
  }

  char buffer[32];
  const int written = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                                    utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                                    utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
    return "";
  }
  return std::string(buffer, static_cast<std::size_t>(written));
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point FromEpochMilliseconds(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(epoch_ms));
}

// Seconds with millisecond resolution, e.g. "2.350". Used for log fields.
inline std::string FormatSeconds(std::chrono::duration<double> value) {
  char buffer[48];
  const int written = std::snprintf(buffer, sizeof(buffer), "%.3f", value.count());
  return written > 0 ? std::string(buffer) : std::string("0.000");
}

} // namespace loadwatch::core

#endif // LOADWATCH_CORE_TIME_UTILS_HPP_
