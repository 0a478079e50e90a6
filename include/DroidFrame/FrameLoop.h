#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include "DroidFrame/Config.h"
#include "DroidFrame/EventQueue.h"
#include "DroidFrame/InputTranslator.h"
#include "DroidFrame/Lifecycle.h"
#include "DroidFrame/Log.h"
#include "DroidFrame/Surface.h"
#include "DroidFrame/Toolkit.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

enum class FrameLoopState {
  Idle,
  WaitingForSurface,
  Rendering,
  Suspended,
};

std::string_view frameLoopStateLabel(FrameLoopState state);

enum class RepaintKind {
  None,
  Now,
  At,
  Continuous,
};

struct RepaintRequest {
  RepaintKind kind = RepaintKind::None;
  std::chrono::steady_clock::time_point deadline{};
};

// Drives the toolkit from the render thread: collects translated input, runs
// one update per frame and presents through the surface manager.
class FrameLoopCoordinator {
public:
  using Clock = std::chrono::steady_clock;

  FrameLoopCoordinator(Toolkit& toolkit,
                       SurfaceManager& surfaces,
                       EventQueue& events,
                       InputTranslator& translator,
                       const BackendConfig& config,
                       const Logger& logger);
  ~FrameLoopCoordinator();

  FrameLoopCoordinator(const FrameLoopCoordinator&) = delete;
  FrameLoopCoordinator& operator=(const FrameLoopCoordinator&) = delete;

  // May be null; toolkit platform output is then dropped.
  void setPlatformServices(PlatformServices* services);
  // Called after every wake request, outside the loop lock. Lets a platform
  // event loop (ALooper) return from its poll.
  void setWakeHook(std::function<void()> hook);

  void onLifecycleChanged(const LifecycleChange& change);

  // One loop iteration on the calling thread. Waits at most `maxWait` for
  // work; nullopt waits until something happens. True when a frame ran.
  bool runOnce(std::optional<std::chrono::nanoseconds> maxWait);
  // Render thread body. Returns after shutdown().
  void run();
  // Stops the loop and waits for run() to return. Terminal.
  void shutdown();

  // Thread-safe.
  void wake();
  void requestRepaint(std::chrono::nanoseconds delay = std::chrono::nanoseconds{0});

  // Runs `task` on the render thread and blocks until it finished. Runs
  // inline when called from the render thread or when no render thread is
  // running. Exceptions thrown by the task are rethrown here.
  BackendStatus runOnRenderThread(std::function<void()> task);
  // As runOnRenderThread, serialized against toolkit updates.
  BackendStatus runToolkitTask(std::function<void(Toolkit&)> task);

  // Render thread. Zero when a frame is due now, nullopt when the loop
  // should sleep until woken.
  std::optional<std::chrono::nanoseconds> timeUntilNextFrame() const;

  FrameLoopState state() const;
  uint64_t frameCount() const;
  bool isShutDown() const;
  RepaintRequest repaintRequest() const;

private:
  void runPendingTasks();
  void processEvents();
  void notifyLowMemory();
  bool frameDue(Clock::time_point now);
  void waitForWork(std::optional<std::chrono::nanoseconds> maxWait);
  bool renderFrame();
  void relayOutput(const FrameOutput& output);
  void applyMetrics(const DisplayMetrics& metrics);
  void appendEvent(InputPayload payload);
  void notifyWake();

  Toolkit& toolkit_;
  SurfaceManager& surfaces_;
  EventQueue& events_;
  InputTranslator& translator_;
  BackendConfig config_;
  const Logger& logger_;

  // Render thread only.
  std::vector<InputEvent> pending_;
  DisplayMetrics metrics_{};
  bool focused_ = false;
  bool keyboardVisible_ = false;
  bool continuousHint_ = false;

  std::mutex toolkitMutex_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable stoppedCv_;
  FrameLoopState state_ = FrameLoopState::Suspended;
  bool suspended_ = true;
  bool shutdown_ = false;
  bool wakeRequested_ = false;
  // Set on Paused/Stopped; the render thread clears composition and accent state.
  bool inputResetPending_ = false;
  bool renderThreadActive_ = false;
  std::thread::id renderThreadId_{};
  std::deque<std::packaged_task<void()>> tasks_;
  RepaintRequest repaint_{};
  std::optional<Clock::time_point> lastFrame_;
  uint64_t frameCount_ = 0u;
  PlatformServices* services_ = nullptr;
  std::function<void()> wakeHook_;
};

} // namespace DroidFrame
