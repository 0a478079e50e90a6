#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "DroidFrame/Log.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

enum class LifecycleState {
  Created,
  Started,
  Resumed,
  Paused,
  Stopped,
  Destroyed,
};

enum class LifecycleTransition {
  Create,
  Start,
  Resume,
  Pause,
  Stop,
  Destroy,
};

struct LifecycleChange {
  std::optional<LifecycleState> previous;
  LifecycleState current = LifecycleState::Created;
  LifecycleTransition transition = LifecycleTransition::Create;
};

using LifecycleListener = std::function<void(const LifecycleChange&)>;

std::string_view lifecycleStateLabel(LifecycleState state);
std::string_view lifecycleTransitionLabel(LifecycleTransition transition);

// Returns the state reached by applying `transition` to `current`, or nullopt
// when the platform contract does not allow it. `current` is empty before
// the first Create.
std::optional<LifecycleState> nextLifecycleState(std::optional<LifecycleState> current,
                                                 LifecycleTransition transition);

inline bool isValidTransition(std::optional<LifecycleState> from, LifecycleTransition transition) {
  return nextLifecycleState(from, transition).has_value();
}

// States in which a surface may be attached to a graphics context.
bool lifecycleAllowsSurface(std::optional<LifecycleState> state);

class LifecycleStateMachine {
public:
  explicit LifecycleStateMachine(const Logger& logger);

  // Applies a platform transition. Rejected transitions leave the state
  // untouched. Listeners run synchronously, after the state is updated.
  BackendStatus apply(LifecycleTransition transition);

  std::optional<LifecycleState> state() const;
  bool isTerminal() const;

  void addListener(LifecycleListener listener);

private:
  const Logger& logger_;
  mutable std::mutex mutex_;
  std::optional<LifecycleState> state_;
  std::vector<LifecycleListener> listeners_;
};

} // namespace DroidFrame
