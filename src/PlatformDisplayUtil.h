#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>

#include "DroidFrame/Types.h"

namespace DroidFrame {

inline float sanitizedPixelsPerPoint(float value, float fallback) {
  if (value > 0.0f && std::isfinite(value)) {
    return value;
  }
  if (fallback > 0.0f && std::isfinite(fallback)) {
    return fallback;
  }
  return 1.0f;
}

// Screen density (dots per inch) to toolkit pixels per point.
inline std::optional<float> pixelsPerPointFromDensity(int32_t densityDpi, float baseDpi) {
  if (densityDpi <= 0) {
    return std::nullopt;
  }
  if (!(baseDpi > 0.0f) || !std::isfinite(baseDpi)) {
    return std::nullopt;
  }
  return static_cast<float>(densityDpi) / baseDpi;
}

inline LogicalSize logicalSizeFromPixels(PixelSize size, float pixelsPerPoint) {
  float scale = sanitizedPixelsPerPoint(pixelsPerPoint, 1.0f);
  return LogicalSize{static_cast<float>(size.width) / scale, static_cast<float>(size.height) / scale};
}

inline std::optional<std::chrono::nanoseconds> intervalFromRefreshRate(double refreshRate) {
  if (!(refreshRate > 0.0) || !std::isfinite(refreshRate)) {
    return std::nullopt;
  }
  double seconds = 1.0 / refreshRate;
  if (!(seconds > 0.0) || !std::isfinite(seconds)) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}

} // namespace DroidFrame
