#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

#include "DroidFrame/Input.h"

namespace DroidFrame {

// AMETA_* bits from android/input.h.
constexpr uint32_t kMetaShiftOn = 0x01u;
constexpr uint32_t kMetaAltOn = 0x02u;
constexpr uint32_t kMetaCtrlOn = 0x1000u;
constexpr uint32_t kMetaMetaOn = 0x10000u;

inline Modifiers modifiersFromMetaState(uint32_t metaState) {
  Modifiers modifiers{};
  modifiers.shift = (metaState & kMetaShiftOn) != 0u;
  modifiers.alt = (metaState & kMetaAltOn) != 0u;
  modifiers.ctrl = (metaState & kMetaCtrlOn) != 0u;
  modifiers.meta = (metaState & kMetaMetaOn) != 0u;
  return modifiers;
}

inline std::optional<float> normalizedPressure(float value) {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return std::clamp(value, 0.0f, 1.0f);
}

inline float normalizedScrollDelta(float value) {
  if (!std::isfinite(value)) {
    return 0.0f;
  }
  return value;
}

inline Point logicalPoint(float x, float y, float pixelsPerPoint) {
  if (!std::isfinite(x)) {
    x = 0.0f;
  }
  if (!std::isfinite(y)) {
    y = 0.0f;
  }
  return Point{x / pixelsPerPoint, y / pixelsPerPoint};
}

inline bool isPrintable(char32_t codepoint) {
  if (codepoint < 0x20 || codepoint == 0x7F) {
    return false;
  }
  if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
    return false;
  }
  return codepoint <= 0x10FFFF;
}

inline void appendUtf8(std::string& out, char32_t codepoint) {
  uint32_t cp = static_cast<uint32_t>(codepoint);
  if (cp < 0x80u) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

} // namespace DroidFrame
