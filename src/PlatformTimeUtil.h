#pragma once

#include <chrono>

namespace DroidFrame {

// Input event times arrive as uptime nanoseconds (SYSTEM_TIME_MONOTONIC).
// Returns a timestamp that never goes backwards relative to `previous`.
inline std::chrono::nanoseconds monotonicEventTime(std::chrono::nanoseconds eventTime,
                                                   std::chrono::nanoseconds previous) {
  if (eventTime.count() <= 0) {
    return previous;
  }
  if (eventTime < previous) {
    return previous;
  }
  return eventTime;
}

inline std::chrono::steady_clock::time_point steadyTimeFromUptime(
    std::chrono::nanoseconds eventTime,
    std::chrono::nanoseconds uptimeNow,
    std::chrono::steady_clock::time_point now) {
  if (eventTime.count() < 0 || uptimeNow.count() < 0) {
    return now;
  }
  auto delta = uptimeNow - eventTime;
  if (delta.count() < 0) {
    delta = std::chrono::nanoseconds{0};
  }
  return now - std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta);
}

} // namespace DroidFrame
