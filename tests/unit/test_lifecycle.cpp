#include "DroidFrame/Lifecycle.h"

#include "tests/unit/test_fakes.h"
#include "tests/unit/test_helpers.h"

#include <array>
#include <vector>

using namespace DroidFrame;
using namespace DroidFrame::Test;

namespace {

constexpr std::array<LifecycleTransition, 6> kAllTransitions{
    LifecycleTransition::Create,
    LifecycleTransition::Start,
    LifecycleTransition::Resume,
    LifecycleTransition::Pause,
    LifecycleTransition::Stop,
    LifecycleTransition::Destroy,
};

// Shortest path from "none" to each state.
std::vector<LifecycleTransition> pathTo(LifecycleState state) {
  using T = LifecycleTransition;
  switch (state) {
    case LifecycleState::Created:
      return {T::Create};
    case LifecycleState::Started:
      return {T::Create, T::Start};
    case LifecycleState::Resumed:
      return {T::Create, T::Start, T::Resume};
    case LifecycleState::Paused:
      return {T::Create, T::Start, T::Resume, T::Pause};
    case LifecycleState::Stopped:
      return {T::Create, T::Start, T::Resume, T::Pause, T::Stop};
    case LifecycleState::Destroyed:
      return {T::Create, T::Start, T::Resume, T::Pause, T::Stop, T::Destroy};
  }
  return {};
}

} // namespace

TEST_SUITE_BEGIN("droidframe.lifecycle");

DF_TEST("droidframe.lifecycle", "valid sequences never fail") {
  using T = LifecycleTransition;
  const std::vector<std::vector<T>> sequences{
      {T::Create, T::Start, T::Resume, T::Pause, T::Stop, T::Destroy},
      {T::Create, T::Start, T::Resume, T::Pause, T::Resume, T::Pause, T::Stop, T::Start, T::Resume,
       T::Pause, T::Stop, T::Destroy},
      {T::Create, T::Destroy},
      {T::Create, T::Start, T::Stop, T::Destroy},
      {T::Create, T::Start, T::Resume, T::Pause, T::Stop, T::Start, T::Stop, T::Destroy},
  };
  for (const auto& sequence : sequences) {
    Logger logger;
    LifecycleStateMachine machine(logger);
    for (auto transition : sequence) {
      DF_CHECK(machine.apply(transition).has_value());
    }
    DF_CHECK(machine.state() == LifecycleState::Destroyed);
    DF_CHECK(machine.isTerminal());
  }
}

DF_TEST("droidframe.lifecycle", "invalid transitions keep state") {
  Logger logger;
  LifecycleStateMachine machine(logger);

  auto early = machine.apply(LifecycleTransition::Start);
  DF_REQUIRE(!early.has_value());
  DF_CHECK(early.error().code == BackendErrorCode::InvalidTransition);
  DF_CHECK(!machine.state().has_value());

  DF_REQUIRE(machine.apply(LifecycleTransition::Create).has_value());
  DF_REQUIRE(machine.apply(LifecycleTransition::Start).has_value());
  DF_REQUIRE(machine.apply(LifecycleTransition::Resume).has_value());

  auto again = machine.apply(LifecycleTransition::Resume);
  DF_REQUIRE(!again.has_value());
  DF_CHECK(again.error().code == BackendErrorCode::InvalidTransition);
  DF_CHECK(machine.state() == LifecycleState::Resumed);

  DF_CHECK(!machine.apply(LifecycleTransition::Create).has_value());
  DF_CHECK(!machine.apply(LifecycleTransition::Destroy).has_value());
  DF_CHECK(machine.state() == LifecycleState::Resumed);
}

DF_TEST("droidframe.lifecycle", "nothing applies after destroy") {
  Logger logger;
  LifecycleStateMachine machine(logger);
  DF_REQUIRE(machine.apply(LifecycleTransition::Create).has_value());
  DF_REQUIRE(machine.apply(LifecycleTransition::Destroy).has_value());
  for (auto transition : kAllTransitions) {
    auto status = machine.apply(transition);
    DF_CHECK(!status.has_value());
    DF_CHECK(machine.state() == LifecycleState::Destroyed);
  }
}

DF_TEST("droidframe.lifecycle", "machine agrees with transition table from every state") {
  constexpr std::array<LifecycleState, 6> states{
      LifecycleState::Created, LifecycleState::Started, LifecycleState::Resumed,
      LifecycleState::Paused,  LifecycleState::Stopped, LifecycleState::Destroyed,
  };
  for (auto state : states) {
    for (auto transition : kAllTransitions) {
      Logger logger;
      LifecycleStateMachine machine(logger);
      for (auto step : pathTo(state)) {
        DF_REQUIRE(machine.apply(step).has_value());
      }
      auto expected = nextLifecycleState(state, transition);
      auto status = machine.apply(transition);
      DF_CHECK(status.has_value() == expected.has_value());
      DF_CHECK(isValidTransition(state, transition) == expected.has_value());
      if (expected) {
        DF_CHECK(machine.state() == *expected);
      } else {
        DF_CHECK(machine.state() == state);
      }
    }
  }
}

DF_TEST("droidframe.lifecycle", "platform shortcuts are accepted") {
  DF_CHECK(nextLifecycleState(LifecycleState::Created, LifecycleTransition::Destroy) ==
           LifecycleState::Destroyed);
  DF_CHECK(nextLifecycleState(LifecycleState::Started, LifecycleTransition::Stop) ==
           LifecycleState::Stopped);
  DF_CHECK(!nextLifecycleState(LifecycleState::Resumed, LifecycleTransition::Stop).has_value());
  DF_CHECK(!nextLifecycleState(std::nullopt, LifecycleTransition::Start).has_value());
  DF_CHECK(nextLifecycleState(std::nullopt, LifecycleTransition::Create) == LifecycleState::Created);
}

DF_TEST("droidframe.lifecycle", "listeners run in order with previous and next") {
  Logger logger;
  LifecycleStateMachine machine(logger);
  std::vector<std::string> calls;
  std::vector<LifecycleChange> changes;
  machine.addListener([&](const LifecycleChange& change) {
    calls.push_back("first");
    changes.push_back(change);
  });
  machine.addListener([&](const LifecycleChange&) { calls.push_back("second"); });

  DF_REQUIRE(machine.apply(LifecycleTransition::Create).has_value());
  DF_REQUIRE(machine.apply(LifecycleTransition::Start).has_value());
  DF_CHECK(!machine.apply(LifecycleTransition::Pause).has_value());

  DF_REQUIRE(calls.size() == 4u);
  DF_CHECK(calls[0] == "first");
  DF_CHECK(calls[1] == "second");
  DF_REQUIRE(changes.size() == 2u);
  DF_CHECK(!changes[0].previous.has_value());
  DF_CHECK(changes[0].current == LifecycleState::Created);
  DF_CHECK(changes[1].previous == LifecycleState::Created);
  DF_CHECK(changes[1].current == LifecycleState::Started);
  DF_CHECK(changes[1].transition == LifecycleTransition::Start);
}

DF_TEST("droidframe.lifecycle", "listener sees updated state") {
  Logger logger;
  LifecycleStateMachine machine(logger);
  std::optional<LifecycleState> seen;
  machine.addListener([&](const LifecycleChange&) { seen = machine.state(); });
  DF_REQUIRE(machine.apply(LifecycleTransition::Create).has_value());
  DF_CHECK(seen == LifecycleState::Created);
}

DF_TEST("droidframe.lifecycle", "rejections are logged") {
  Logger logger;
  LogCapture capture;
  logger.setCallback(capture.callback());
  LifecycleStateMachine machine(logger);
  DF_CHECK(!machine.apply(LifecycleTransition::Resume).has_value());
  DF_CHECK(capture.count(LogLevel::Warning) == 1u);
  DF_CHECK(capture.contains("rejected resume in state none"));
}

DF_TEST("droidframe.lifecycle", "surface allowed states") {
  DF_CHECK(!lifecycleAllowsSurface(std::nullopt));
  DF_CHECK(!lifecycleAllowsSurface(LifecycleState::Created));
  DF_CHECK(lifecycleAllowsSurface(LifecycleState::Started));
  DF_CHECK(lifecycleAllowsSurface(LifecycleState::Resumed));
  DF_CHECK(lifecycleAllowsSurface(LifecycleState::Paused));
  DF_CHECK(!lifecycleAllowsSurface(LifecycleState::Stopped));
  DF_CHECK(!lifecycleAllowsSurface(LifecycleState::Destroyed));
}

DF_TEST("droidframe.lifecycle", "labels") {
  DF_CHECK(lifecycleStateLabel(LifecycleState::Paused) == "paused");
  DF_CHECK(lifecycleTransitionLabel(LifecycleTransition::Destroy) == "destroy");
}

TEST_SUITE_END();
