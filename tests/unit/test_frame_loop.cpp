#include "DroidFrame/FrameLoop.h"

#include "tests/unit/test_fakes.h"
#include "tests/unit/test_helpers.h"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace DroidFrame;
using namespace DroidFrame::Test;

namespace {

using std::chrono::milliseconds;

FrameOutput continuousOutput() {
  FrameOutput output{};
  output.repaint.mode = RepaintMode::Continuous;
  return output;
}

} // namespace

TEST_SUITE_BEGIN("droidframe.frameloop");

DF_TEST("droidframe.frameloop", "state follows lifecycle and surface") {
  BackendHarness h;
  auto& loop = h.backend->frameLoop();
  DF_CHECK(loop.state() == FrameLoopState::Suspended);

  DF_REQUIRE(h.backend->onCreate().has_value());
  DF_REQUIRE(h.backend->onStart().has_value());
  DF_CHECK(loop.state() == FrameLoopState::Suspended);
  DF_REQUIRE(h.backend->onResume().has_value());
  DF_CHECK(loop.state() == FrameLoopState::WaitingForSurface);

  DF_REQUIRE(h.backend->onSurfaceAvailable(fakeSurface(1u)).has_value());
  pump(*h.backend);
  DF_CHECK(loop.state() == FrameLoopState::Idle);

  DF_REQUIRE(h.backend->onPause().has_value());
  DF_CHECK(loop.state() == FrameLoopState::Suspended);
  DF_CHECK(frameLoopStateLabel(loop.state()) == "suspended");
}

DF_TEST("droidframe.frameloop", "idle loop renders nothing") {
  BackendHarness h;
  bringUp(*h.backend);
  DF_CHECK(pump(*h.backend, 5) == 1);
  DF_CHECK(h.backend->frameLoop().frameCount() == 1u);
  DF_CHECK(h.backend->frameLoop().repaintRequest().kind == RepaintKind::None);
}

DF_TEST("droidframe.frameloop", "continuous repaint without cap") {
  BackendHarness h;
  h.toolkit.output = continuousOutput();
  bringUp(*h.backend);
  DF_CHECK(pump(*h.backend, 4) == 4);
  DF_CHECK(h.graphics.presents() == 4);
}

DF_TEST("droidframe.frameloop", "continuous repaint is capped by the frame interval") {
  BackendConfig config{};
  config.frameInterval = std::chrono::hours(1);
  BackendHarness h(config);
  h.toolkit.output = continuousOutput();
  bringUp(*h.backend);
  DF_CHECK(pump(*h.backend, 4) == 1);
  auto wait = h.backend->frameLoop().timeUntilNextFrame();
  DF_REQUIRE(wait.has_value());
  DF_CHECK(*wait > std::chrono::nanoseconds{0});
}

DF_TEST("droidframe.frameloop", "explicit repaint bypasses the cap") {
  BackendConfig config{};
  config.frameInterval = std::chrono::hours(1);
  BackendHarness h(config);
  h.toolkit.output = continuousOutput();
  bringUp(*h.backend);
  pump(*h.backend);
  h.backend->frameLoop().requestRepaint();
  DF_CHECK(pump(*h.backend) == 1);
}

DF_TEST("droidframe.frameloop", "deadline hint wakes the loop") {
  BackendHarness h;
  FrameOutput output{};
  output.repaint.mode = RepaintMode::AtDeadline;
  output.repaint.deadline = std::chrono::steady_clock::now() + milliseconds(20);
  h.toolkit.scripted.push_back(output);
  bringUp(*h.backend);

  DF_CHECK(pump(*h.backend) == 1);
  DF_CHECK(pump(*h.backend) == 0);
  DF_CHECK(h.backend->frameLoop().runOnce(milliseconds(2000)));
  DF_CHECK(h.toolkit.frameCount() == 2u);
}

DF_TEST("droidframe.frameloop", "delayed repaint request") {
  BackendHarness h;
  bringUp(*h.backend);
  pump(*h.backend);

  h.backend->frameLoop().requestRepaint(milliseconds(30));
  DF_CHECK(h.backend->frameLoop().repaintRequest().kind == RepaintKind::At);
  auto wait = h.backend->frameLoop().timeUntilNextFrame();
  DF_REQUIRE(wait.has_value());
  DF_CHECK(*wait <= milliseconds(30));
  DF_CHECK(h.backend->frameLoop().runOnce(milliseconds(2000)));
}

DF_TEST("droidframe.frameloop", "idle refresh without input") {
  BackendConfig config{};
  config.maxIdleInterval = milliseconds(5);
  BackendHarness h(config);
  bringUp(*h.backend);
  pump(*h.backend);
  std::this_thread::sleep_for(milliseconds(10));
  DF_CHECK(pump(*h.backend) == 1);
}

DF_TEST("droidframe.frameloop", "time until next frame") {
  BackendHarness h;
  auto& loop = h.backend->frameLoop();
  DF_CHECK(!loop.timeUntilNextFrame().has_value());

  bringUp(*h.backend);
  auto pending = loop.timeUntilNextFrame();
  DF_REQUIRE(pending.has_value());
  DF_CHECK(pending->count() == 0);

  pump(*h.backend);
  DF_CHECK(!loop.timeUntilNextFrame().has_value());

  h.backend->onMotionEvent(touchEvent(MotionAction::Down, 0u, 1.0f, 1.0f));
  auto input = loop.timeUntilNextFrame();
  DF_REQUIRE(input.has_value());
  DF_CHECK(input->count() == 0);
}

DF_TEST("droidframe.frameloop", "frames carry increasing index and timing") {
  BackendHarness h;
  h.toolkit.output = continuousOutput();
  bringUp(*h.backend);
  pump(*h.backend, 3);
  auto frames = h.toolkit.frames();
  DF_REQUIRE(frames.size() == 3u);
  DF_CHECK(frames[0].frameIndex == 0u);
  DF_CHECK(frames[1].frameIndex == 1u);
  DF_CHECK(frames[2].frameIndex == 2u);
  DF_CHECK(h.graphics.lastPresentedFrame() == 2u);
}

DF_TEST("droidframe.frameloop", "pointer moves coalesce when enabled") {
  BackendConfig config{};
  config.coalescePointerMoves = true;
  BackendHarness h(config);
  bringUp(*h.backend);
  pump(*h.backend);

  h.backend->onMotionEvent(touchEvent(MotionAction::Move, 0u, 1.0f, 0.0f));
  h.backend->onMotionEvent(touchEvent(MotionAction::Move, 0u, 2.0f, 0.0f));
  h.backend->onMotionEvent(touchEvent(MotionAction::Move, 0u, 3.0f, 0.0f));
  DF_CHECK(pump(*h.backend) == 1);

  auto events = h.toolkit.lastFrame().events;
  auto touches = payloadsOf<TouchInput>(events);
  DF_REQUIRE(touches.size() == 1u);
  DF_CHECK(touches[0].position.x == doctest::Approx(3.0f));
  DF_CHECK(payloadsOf<PointerMovedInput>(events).size() == 1u);
}

DF_TEST("droidframe.frameloop", "pointer moves are kept by default") {
  BackendHarness h;
  bringUp(*h.backend);
  pump(*h.backend);
  h.backend->onMotionEvent(touchEvent(MotionAction::Move, 0u, 1.0f, 0.0f));
  h.backend->onMotionEvent(touchEvent(MotionAction::Move, 0u, 2.0f, 0.0f));
  pump(*h.backend);
  DF_CHECK(payloadsOf<TouchInput>(h.toolkit.lastFrame().events).size() == 2u);
}

DF_TEST("droidframe.frameloop", "wake hook fires on requests") {
  BackendHarness h;
  std::atomic<int> wakes{0};
  h.backend->frameLoop().setWakeHook([&]() { ++wakes; });
  h.backend->frameLoop().requestRepaint();
  h.backend->frameLoop().wake();
  DF_REQUIRE(h.backend->onLowMemory().has_value());
  DF_CHECK(wakes.load() >= 3);
}

DF_TEST("droidframe.frameloop", "render thread tasks run inline without a thread") {
  BackendHarness h;
  std::thread::id ranOn{};
  auto status = h.backend->frameLoop().runOnRenderThread([&]() { ranOn = std::this_thread::get_id(); });
  DF_CHECK(status.has_value());
  DF_CHECK(ranOn == std::this_thread::get_id());
}

DF_TEST("droidframe.frameloop", "render thread task exceptions reach the caller") {
  BackendHarness h;
  DF_CHECK_THROWS_AS(h.backend->frameLoop().runOnRenderThread([]() { throw std::runtime_error("task"); }),
                     std::runtime_error);
}

DF_TEST("droidframe.frameloop", "tasks are refused after shutdown") {
  BackendHarness h;
  h.backend->frameLoop().shutdown();
  h.backend->frameLoop().shutdown();
  bool ran = false;
  auto status = h.backend->frameLoop().runOnRenderThread([&]() { ran = true; });
  DF_REQUIRE(!status.has_value());
  DF_CHECK(status.error().code == BackendErrorCode::ShuttingDown);
  DF_CHECK(!ran);
  DF_CHECK(!h.backend->frameLoop().timeUntilNextFrame().has_value());
}

DF_TEST("droidframe.frameloop", "render thread draws and stops on destroy") {
  BackendHarness h;
  bringUp(*h.backend);
  DF_REQUIRE(h.backend->startRenderThread().has_value());
  DF_CHECK(waitFor([&]() { return h.toolkit.frameCount() >= 1u; }));

  auto again = h.backend->startRenderThread();
  DF_REQUIRE(!again.has_value());
  DF_CHECK(again.error().code == BackendErrorCode::PlatformFailure);

  // Input from this thread wakes the render thread.
  h.backend->onMotionEvent(touchEvent(MotionAction::Down, 0u, 4.0f, 4.0f));
  DF_CHECK(waitFor([&]() { return h.toolkit.frameCount() >= 2u; }));
  DF_CHECK(h.toolkit.updateThread() != std::this_thread::get_id());

  auto saved = h.backend->onPause();
  DF_REQUIRE(saved.has_value());
  DF_CHECK(h.toolkit.saveCount() == 1);
  DF_CHECK(h.toolkit.saveThread() == h.toolkit.updateThread());

  DF_REQUIRE(h.backend->onStop().has_value());
  DF_REQUIRE(h.backend->onDestroy().has_value());
  DF_CHECK(h.backend->frameLoop().isShutDown());
  DF_CHECK(!h.graphics.live());
  DF_CHECK(h.graphics.violations() == 0);
}

DF_TEST("droidframe.frameloop", "surface loss while rendering continuously") {
  BackendConfig config{};
  config.frameInterval = milliseconds(1);
  BackendHarness h(config);
  h.toolkit.output = continuousOutput();
  bringUp(*h.backend);
  DF_REQUIRE(h.backend->startRenderThread().has_value());
  DF_CHECK(waitFor([&]() { return h.graphics.presents() >= 3; }));

  DF_REQUIRE(h.backend->onSurfaceDestroyed().has_value());
  h.graphics.poison(1u);
  int presented = h.graphics.presents();
  std::this_thread::sleep_for(milliseconds(20));
  DF_CHECK(h.graphics.presents() == presented);
  DF_CHECK(h.graphics.violations() == 0);

  DF_REQUIRE(h.backend->onSurfaceAvailable(fakeSurface(2u)).has_value());
  DF_CHECK(waitFor([&]() { return h.graphics.presents() > presented; }));

  DF_REQUIRE(h.backend->onPause().has_value());
  DF_REQUIRE(h.backend->onStop().has_value());
  DF_REQUIRE(h.backend->onDestroy().has_value());
  DF_CHECK(h.graphics.violations() == 0);
}

DF_TEST("droidframe.frameloop", "destructor stops a running render thread") {
  BackendHarness h;
  bringUp(*h.backend);
  DF_REQUIRE(h.backend->startRenderThread().has_value());
  DF_CHECK(waitFor([&]() { return h.toolkit.frameCount() >= 1u; }));
  h.backend.reset();
  DF_CHECK(!h.graphics.live());
}

TEST_SUITE_END();
