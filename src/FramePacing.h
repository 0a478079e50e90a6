#pragma once

#include <chrono>
#include <optional>

#include "DroidFrame/FrameLoop.h"
#include "DroidFrame/Toolkit.h"

namespace DroidFrame {

inline RepaintRequest repaintRequestFromHint(const RepaintHint& hint) {
  switch (hint.mode) {
    case RepaintMode::OnInput:
      return RepaintRequest{};
    case RepaintMode::AtDeadline:
      return RepaintRequest{RepaintKind::At, hint.deadline};
    case RepaintMode::Continuous:
      return RepaintRequest{RepaintKind::Continuous, {}};
  }
  return RepaintRequest{};
}

inline int repaintUrgency(RepaintKind kind) {
  switch (kind) {
    case RepaintKind::None:
      return 0;
    case RepaintKind::At:
      return 1;
    case RepaintKind::Continuous:
      return 2;
    case RepaintKind::Now:
      return 3;
  }
  return 0;
}

// The more urgent request wins; two deadlines keep the earlier one.
inline RepaintRequest mergeRepaintRequest(const RepaintRequest& current, const RepaintRequest& incoming) {
  if (current.kind == RepaintKind::At && incoming.kind == RepaintKind::At) {
    return incoming.deadline < current.deadline ? incoming : current;
  }
  return repaintUrgency(incoming.kind) > repaintUrgency(current.kind) ? incoming : current;
}

inline bool shouldPresentCapped(std::optional<std::chrono::nanoseconds> interval,
                                std::optional<std::chrono::steady_clock::time_point> last,
                                std::chrono::steady_clock::time_point now) {
  if (!interval || interval->count() <= 0) {
    return true;
  }
  if (!last) {
    return true;
  }
  return now - *last >= *interval;
}

// Only continuous repaint is throttled by the frame interval.
inline bool repaintDue(const RepaintRequest& request,
                       std::optional<std::chrono::nanoseconds> interval,
                       std::optional<std::chrono::steady_clock::time_point> last,
                       std::chrono::steady_clock::time_point now) {
  switch (request.kind) {
    case RepaintKind::None:
      return false;
    case RepaintKind::Now:
      return true;
    case RepaintKind::At:
      return now >= request.deadline;
    case RepaintKind::Continuous:
      return shouldPresentCapped(interval, last, now);
  }
  return false;
}

inline bool idleRefreshDue(std::optional<std::chrono::nanoseconds> maxIdle,
                           std::optional<std::chrono::steady_clock::time_point> last,
                           std::chrono::steady_clock::time_point now) {
  if (!maxIdle || maxIdle->count() <= 0 || !last) {
    return false;
  }
  return now - *last >= *maxIdle;
}

// Earliest time a frame becomes due without new input, or nullopt.
inline std::optional<std::chrono::steady_clock::time_point> nextWakeTime(
    const RepaintRequest& request,
    std::optional<std::chrono::nanoseconds> interval,
    std::optional<std::chrono::steady_clock::time_point> last,
    std::optional<std::chrono::nanoseconds> maxIdle,
    std::chrono::steady_clock::time_point now) {
  std::optional<std::chrono::steady_clock::time_point> next;
  auto consider = [&next](std::chrono::steady_clock::time_point candidate) {
    if (!next || candidate < *next) {
      next = candidate;
    }
  };
  switch (request.kind) {
    case RepaintKind::None:
      break;
    case RepaintKind::Now:
      consider(now);
      break;
    case RepaintKind::At:
      consider(request.deadline);
      break;
    case RepaintKind::Continuous:
      if (interval && interval->count() > 0 && last) {
        consider(*last + std::chrono::duration_cast<std::chrono::steady_clock::duration>(*interval));
      } else {
        consider(now);
      }
      break;
  }
  if (maxIdle && maxIdle->count() > 0 && last) {
    consider(*last + std::chrono::duration_cast<std::chrono::steady_clock::duration>(*maxIdle));
  }
  return next;
}

} // namespace DroidFrame
