#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "DroidFrame/Config.h"
#include "DroidFrame/EventQueue.h"
#include "DroidFrame/FrameLoop.h"
#include "DroidFrame/Input.h"
#include "DroidFrame/InputTranslator.h"
#include "DroidFrame/Lifecycle.h"
#include "DroidFrame/Log.h"
#include "DroidFrame/Persistence.h"
#include "DroidFrame/Surface.h"
#include "DroidFrame/Toolkit.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

// One activity instance. Owns the lifecycle machine, surface manager, input
// path, persistence bridge and frame loop, and exposes the platform callbacks.
// No exception thrown by a collaborator escapes a callback; it is logged and
// reported as PlatformFailure.
class Backend {
public:
  // Validates and resolves `config`. The toolkit, graphics backend, store and
  // services must outlive the backend. `displayInterval` feeds
  // BackendConfig::capToDisplayRate.
  static BackendResult<std::unique_ptr<Backend>> create(
      const BackendConfig& config,
      Toolkit& toolkit,
      GraphicsBackend& graphics,
      StateStore& store,
      PlatformServices* services = nullptr,
      std::optional<std::chrono::nanoseconds> displayInterval = std::nullopt);

  // Joins the render thread. Must not run on that thread.
  ~Backend();

  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;

  void setLogCallback(LogCallback callback);

  // Lifecycle callbacks. Transitions apply before the call returns.
  BackendStatus onCreate();
  BackendStatus onStart();
  BackendStatus onResume();
  // Returns the state saved on entering Paused.
  BackendResult<PersistedState> onPause();
  BackendStatus onStop();
  // Stops the frame loop and releases graphics before returning.
  BackendStatus onDestroy();

  BackendStatus onSurfaceAvailable(const SurfaceHandle& handle);
  BackendStatus onSurfaceChanged(const SurfaceHandle& handle, PixelSize size, float pixelsPerPoint);
  BackendStatus onSurfaceDestroyed();

  // Input is queued for the render thread. The returned status tells the
  // platform whether the event will be consumed.
  BackendResult<InputStatus> onMotionEvent(RawMotionEvent event);
  BackendResult<InputStatus> onKeyEvent(RawKeyEvent event);
  BackendStatus onTextEvent(RawTextEvent event);
  BackendStatus onCompositionEvent(RawCompositionEvent event);
  BackendStatus onFocusChanged(bool focused);
  BackendStatus onConfigurationChanged(float pixelsPerPoint, Theme theme, PixelInsets contentInsets);
  BackendStatus onLowMemory();

  // Spawns a dedicated render thread running the frame loop. Joined by
  // onDestroy, or by the destructor when onDestroy ran on the render thread.
  // Without it the owner pumps frameLoop().runOnce().
  BackendStatus startRenderThread();

  FrameLoopCoordinator& frameLoop();
  SurfaceManager& surfaces();
  std::optional<LifecycleState> lifecycleState() const;
  const BackendConfig& config() const;
  const Logger& logger() const;

private:
  Backend(const BackendConfig& config,
          Toolkit& toolkit,
          GraphicsBackend& graphics,
          StateStore& store,
          PlatformServices* services);

  BackendStatus applyTransition(LifecycleTransition transition);
  void onLifecycleChanged(const LifecycleChange& change);
  void restorePriorState();
  void saveState();
  BackendStatus publishMetrics();
  void stopRenderThread();

  BackendConfig config_;
  Logger logger_;
  LifecycleStateMachine lifecycle_;
  EventQueue events_;
  InputTranslator translator_;
  SurfaceManager surfaces_;
  StatePersistenceBridge persistence_;
  FrameLoopCoordinator coordinator_;

  std::mutex metricsMutex_;
  DisplayMetrics metrics_{};

  std::mutex saveMutex_;
  PersistedState lastSave_{};

  std::mutex threadMutex_;
  std::thread renderThread_;
};

} // namespace DroidFrame
