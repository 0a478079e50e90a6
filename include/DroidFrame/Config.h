#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace DroidFrame {

// Android's reference density is 160 dpi; a lower base scales the UI up a
// little for legibility on phones.
constexpr float kDefaultBaseDpi = 120.0f;
constexpr size_t kDefaultMaxQueuedEvents = 4096u;
constexpr const char* kDefaultInstanceKey = "main";

struct BackendConfig {
  float baseDpi = kDefaultBaseDpi;
  bool coalescePointerMoves = false;
  // Minimum spacing between continuous repaints. Unset means uncapped.
  std::optional<std::chrono::nanoseconds> frameInterval;
  // Cap continuous repaints to the display refresh when no interval is set.
  bool capToDisplayRate = false;
  // Produce a frame at least this often while resumed, even without input.
  std::optional<std::chrono::nanoseconds> maxIdleInterval;
  size_t maxQueuedEvents = kDefaultMaxQueuedEvents;
  std::string instanceKey = kDefaultInstanceKey;
};

} // namespace DroidFrame
