#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace Trace::Common {

// Nanoseconds from CLOCK_MONOTONIC, used for durations
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Nanoseconds from CLOCK_REALTIME for wall clock stamps
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Fast date/time formatting without allocation
class FastDateTime {
public:
  // ISO-8601 UTC with microseconds: 2024-01-31T12:00:00.123456+00:00
  static bool formatIso8601Utc(uint64_t wall_nanos, char* buffer, size_t size) noexcept {
    time_t seconds = static_cast<time_t>(wall_nanos / 1'000'000'000);
    uint32_t micros = static_cast<uint32_t>((wall_nanos % 1'000'000'000) / 1'000);

    struct tm tm_time;
    if (!gmtime_r(&seconds, &tm_time)) {
      return false;
    }

    int written = snprintf(buffer, size, "%04d-%02d-%02dT%02d:%02d:%02d.%06u+00:00",
                           tm_time.tm_year + 1900,
                           tm_time.tm_mon + 1,
                           tm_time.tm_mday,
                           tm_time.tm_hour,
                           tm_time.tm_min,
                           tm_time.tm_sec,
                           micros);
    return written > 0 && static_cast<size_t>(written) < size;
  }

  // Local time stamp for file names: YYYYMMDD_HHMMSS
  static bool formatFileStamp(char* buffer, size_t size) noexcept {
    time_t now = time(nullptr);
    struct tm tm_time;
    if (!localtime_r(&now, &tm_time)) {
      return false;
    }
    return strftime(buffer, size, "%Y%m%d_%H%M%S", &tm_time) > 0;
  }
};

// Current wall clock as ISO-8601 UTC
inline bool getIso8601Now(char* buffer, size_t size) noexcept {
  return FastDateTime::formatIso8601Utc(getWallClockNanos(), buffer, size);
}

} // namespace Trace::Common
