#pragma once

#include <cmath>

#include "DroidFrame/Config.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

inline BackendStatus validateBackendConfig(const BackendConfig& config) {
  if (!(config.baseDpi > 0.0f) || !std::isfinite(config.baseDpi)) {
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }
  if (config.frameInterval && config.frameInterval->count() <= 0) {
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }
  if (config.maxIdleInterval && config.maxIdleInterval->count() <= 0) {
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }
  if (config.frameInterval && config.maxIdleInterval &&
      *config.maxIdleInterval < *config.frameInterval) {
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }
  return {};
}

} // namespace DroidFrame
