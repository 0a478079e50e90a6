#pragma once

#include <chrono>
#include <optional>

#include "DroidFrame/Config.h"

namespace DroidFrame {

inline BackendConfig resolveBackendConfig(const BackendConfig& config,
                                          std::optional<std::chrono::nanoseconds> displayInterval) {
  BackendConfig resolved = config;
  if (resolved.maxQueuedEvents == 0u) {
    resolved.maxQueuedEvents = kDefaultMaxQueuedEvents;
  }
  if (resolved.instanceKey.empty()) {
    resolved.instanceKey = kDefaultInstanceKey;
  }
  if (resolved.capToDisplayRate) {
    if (!resolved.frameInterval || resolved.frameInterval->count() <= 0) {
      if (displayInterval && displayInterval->count() > 0) {
        resolved.frameInterval = displayInterval;
      }
    }
  }
  return resolved;
}

inline BackendConfig resolveBackendConfig(const BackendConfig& config) {
  return resolveBackendConfig(config, std::nullopt);
}

} // namespace DroidFrame
