#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string_view>
#include <vector>

namespace DroidFrame {

using Utf8TextView = std::string_view;

enum class BackendErrorCode {
  InvalidTransition,
  SurfaceInvalidated,
  ToolkitUpdateFailed,
  SerializationFailed,
  InvalidConfig,
  PlatformFailure,
  Unsupported,
  ShuttingDown,
};

enum class ErrorDomain {
  Lifecycle,
  Surface,
  Toolkit,
  Persistence,
  Backend,
};

struct BackendError {
  BackendErrorCode code = BackendErrorCode::PlatformFailure;
};

template <typename T>
using BackendResult = std::expected<T, BackendError>;
using BackendStatus = BackendResult<void>;

constexpr ErrorDomain errorDomain(BackendErrorCode code) {
  switch (code) {
    case BackendErrorCode::InvalidTransition:
      return ErrorDomain::Lifecycle;
    case BackendErrorCode::SurfaceInvalidated:
      return ErrorDomain::Surface;
    case BackendErrorCode::ToolkitUpdateFailed:
      return ErrorDomain::Toolkit;
    case BackendErrorCode::SerializationFailed:
      return ErrorDomain::Persistence;
    case BackendErrorCode::InvalidConfig:
    case BackendErrorCode::PlatformFailure:
    case BackendErrorCode::Unsupported:
    case BackendErrorCode::ShuttingDown:
      return ErrorDomain::Backend;
  }
  return ErrorDomain::Backend;
}

constexpr std::string_view errorLabel(BackendErrorCode code) {
  switch (code) {
    case BackendErrorCode::InvalidTransition:
      return "invalid transition";
    case BackendErrorCode::SurfaceInvalidated:
      return "surface invalidated";
    case BackendErrorCode::ToolkitUpdateFailed:
      return "toolkit update failed";
    case BackendErrorCode::SerializationFailed:
      return "serialization failed";
    case BackendErrorCode::InvalidConfig:
      return "invalid config";
    case BackendErrorCode::PlatformFailure:
      return "platform failure";
    case BackendErrorCode::Unsupported:
      return "unsupported";
    case BackendErrorCode::ShuttingDown:
      return "shutting down";
  }
  return "unknown";
}

struct PixelSize {
  uint32_t width = 0u;
  uint32_t height = 0u;
};

constexpr bool operator==(PixelSize a, PixelSize b) {
  return a.width == b.width && a.height == b.height;
}

struct LogicalSize {
  float width = 0.0f;
  float height = 0.0f;
};

struct PixelInsets {
  int32_t left = 0;
  int32_t top = 0;
  int32_t right = 0;
  int32_t bottom = 0;
};

enum class Theme {
  Unknown,
  Light,
  Dark,
};

struct DisplayMetrics {
  PixelSize size{};
  float pixelsPerPoint = 1.0f;
  Theme theme = Theme::Unknown;
  PixelInsets contentInsets{};
};

struct FrameTiming {
  std::chrono::steady_clock::time_point time;
  std::chrono::nanoseconds delta{0};
  uint64_t frameIndex = 0u;
};

// Opaque application state. Never interpreted by the backend.
struct PersistedState {
  std::vector<uint8_t> bytes;
};

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

using LogCallback = std::function<void(LogLevel, Utf8TextView)>;

} // namespace DroidFrame
