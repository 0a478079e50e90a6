#include "DroidFrame/Lifecycle.h"

#include <string>
#include <utility>

namespace DroidFrame {

std::string_view lifecycleStateLabel(LifecycleState state) {
  switch (state) {
    case LifecycleState::Created:
      return "created";
    case LifecycleState::Started:
      return "started";
    case LifecycleState::Resumed:
      return "resumed";
    case LifecycleState::Paused:
      return "paused";
    case LifecycleState::Stopped:
      return "stopped";
    case LifecycleState::Destroyed:
      return "destroyed";
  }
  return "unknown";
}

std::string_view lifecycleTransitionLabel(LifecycleTransition transition) {
  switch (transition) {
    case LifecycleTransition::Create:
      return "create";
    case LifecycleTransition::Start:
      return "start";
    case LifecycleTransition::Resume:
      return "resume";
    case LifecycleTransition::Pause:
      return "pause";
    case LifecycleTransition::Stop:
      return "stop";
    case LifecycleTransition::Destroy:
      return "destroy";
  }
  return "unknown";
}

std::optional<LifecycleState> nextLifecycleState(std::optional<LifecycleState> current,
                                                 LifecycleTransition transition) {
  if (!current) {
    if (transition == LifecycleTransition::Create) {
      return LifecycleState::Created;
    }
    return std::nullopt;
  }
  switch (*current) {
    case LifecycleState::Created:
      if (transition == LifecycleTransition::Start) {
        return LifecycleState::Started;
      }
      // Activity finished from inside onCreate.
      if (transition == LifecycleTransition::Destroy) {
        return LifecycleState::Destroyed;
      }
      break;
    case LifecycleState::Started:
      if (transition == LifecycleTransition::Resume) {
        return LifecycleState::Resumed;
      }
      if (transition == LifecycleTransition::Stop) {
        return LifecycleState::Stopped;
      }
      break;
    case LifecycleState::Resumed:
      if (transition == LifecycleTransition::Pause) {
        return LifecycleState::Paused;
      }
      break;
    case LifecycleState::Paused:
      if (transition == LifecycleTransition::Resume) {
        return LifecycleState::Resumed;
      }
      if (transition == LifecycleTransition::Stop) {
        return LifecycleState::Stopped;
      }
      break;
    case LifecycleState::Stopped:
      if (transition == LifecycleTransition::Start) {
        return LifecycleState::Started;
      }
      if (transition == LifecycleTransition::Destroy) {
        return LifecycleState::Destroyed;
      }
      break;
    case LifecycleState::Destroyed:
      break;
  }
  return std::nullopt;
}

bool lifecycleAllowsSurface(std::optional<LifecycleState> state) {
  if (!state) {
    return false;
  }
  return *state == LifecycleState::Started || *state == LifecycleState::Resumed ||
         *state == LifecycleState::Paused;
}

LifecycleStateMachine::LifecycleStateMachine(const Logger& logger) : logger_(logger) {}

BackendStatus LifecycleStateMachine::apply(LifecycleTransition transition) {
  LifecycleChange change{};
  change.transition = transition;
  std::vector<LifecycleListener> listeners;
  std::optional<LifecycleState> rejectedIn;
  bool rejected = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = nextLifecycleState(state_, transition);
    if (!next) {
      rejected = true;
      rejectedIn = state_;
    } else {
      change.previous = state_;
      change.current = *next;
      state_ = *next;
      listeners = listeners_;
    }
  }

  if (rejected) {
    std::string message = "lifecycle: rejected ";
    message += lifecycleTransitionLabel(transition);
    message += " in state ";
    message += rejectedIn ? lifecycleStateLabel(*rejectedIn) : std::string_view("none");
    logger_.warning(message);
    return std::unexpected(BackendError{BackendErrorCode::InvalidTransition});
  }

  std::string message = "lifecycle: ";
  message += lifecycleStateLabel(change.current);
  logger_.debug(message);

  for (const auto& listener : listeners) {
    listener(change);
  }
  return {};
}

std::optional<LifecycleState> LifecycleStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool LifecycleStateMachine::isTerminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == LifecycleState::Destroyed;
}

void LifecycleStateMachine::addListener(LifecycleListener listener) {
  if (!listener) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

} // namespace DroidFrame
