#include "DroidFrame/Backend.h"

#include <exception>
#include <string>
#include <utility>

#include "ConfigDefaults.h"
#include "DroidFrame/ConfigValidation.h"
#include "PlatformDisplayUtil.h"

namespace DroidFrame {
namespace {

// Runs a platform callback body. Exceptions from collaborators become
// PlatformFailure.
template <typename Fn>
auto guarded(const Logger& logger, std::string_view entry, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    std::string message = "backend: ";
    message += entry;
    message += " failed: ";
    message += ex.what();
    logger.error(message);
  } catch (...) {
    std::string message = "backend: ";
    message += entry;
    message += " failed with a non-standard exception";
    logger.error(message);
  }
  return std::unexpected(BackendError{BackendErrorCode::PlatformFailure});
}

} // namespace

BackendResult<std::unique_ptr<Backend>> Backend::create(const BackendConfig& config,
                                                        Toolkit& toolkit,
                                                        GraphicsBackend& graphics,
                                                        StateStore& store,
                                                        PlatformServices* services,
                                                        std::optional<std::chrono::nanoseconds> displayInterval) {
  auto valid = validateBackendConfig(config);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  BackendConfig resolved = resolveBackendConfig(config, displayInterval);
  return std::unique_ptr<Backend>(new Backend(resolved, toolkit, graphics, store, services));
}

Backend::Backend(const BackendConfig& config,
                 Toolkit& toolkit,
                 GraphicsBackend& graphics,
                 StateStore& store,
                 PlatformServices* services)
    : config_(config),
      lifecycle_(logger_),
      events_(config_.maxQueuedEvents, logger_),
      translator_(logger_),
      surfaces_(graphics, logger_),
      persistence_(store, config_.instanceKey, logger_),
      coordinator_(toolkit, surfaces_, events_, translator_, config_, logger_) {
  coordinator_.setPlatformServices(services);
  lifecycle_.addListener([this](const LifecycleChange& change) { onLifecycleChanged(change); });
  events_.setNotifier([this]() { coordinator_.wake(); });
  surfaces_.setResizeListener([this](PixelSize size, float pixelsPerPoint) {
    {
      std::lock_guard<std::mutex> lock(metricsMutex_);
      metrics_.size = size;
      metrics_.pixelsPerPoint = pixelsPerPoint;
    }
    if (!publishMetrics()) {
      logger_.debug("backend: resize after shutdown ignored");
      return;
    }
    coordinator_.requestRepaint();
  });
  surfaces_.setAttachListener([this](bool attached) {
    if (attached) {
      coordinator_.requestRepaint();
    } else {
      coordinator_.wake();
    }
  });
}

Backend::~Backend() {
  coordinator_.shutdown();
  stopRenderThread();
  surfaces_.releaseAll();
  events_.close();
}

void Backend::setLogCallback(LogCallback callback) {
  logger_.setCallback(std::move(callback));
}

BackendStatus Backend::onCreate() {
  return guarded(logger_, "create", [this]() { return applyTransition(LifecycleTransition::Create); });
}

BackendStatus Backend::onStart() {
  return guarded(logger_, "start", [this]() { return applyTransition(LifecycleTransition::Start); });
}

BackendStatus Backend::onResume() {
  return guarded(logger_, "resume", [this]() { return applyTransition(LifecycleTransition::Resume); });
}

BackendResult<PersistedState> Backend::onPause() {
  return guarded(logger_, "pause", [this]() -> BackendResult<PersistedState> {
    auto status = applyTransition(LifecycleTransition::Pause);
    if (!status) {
      return std::unexpected(status.error());
    }
    std::lock_guard<std::mutex> lock(saveMutex_);
    return lastSave_;
  });
}

BackendStatus Backend::onStop() {
  return guarded(logger_, "stop", [this]() { return applyTransition(LifecycleTransition::Stop); });
}

BackendStatus Backend::onDestroy() {
  return guarded(logger_, "destroy", [this]() { return applyTransition(LifecycleTransition::Destroy); });
}

BackendStatus Backend::onSurfaceAvailable(const SurfaceHandle& handle) {
  return guarded(logger_, "surface available", [this, &handle]() -> BackendStatus {
    surfaces_.onSurfaceAvailable(handle);
    return {};
  });
}

BackendStatus Backend::onSurfaceChanged(const SurfaceHandle& handle, PixelSize size, float pixelsPerPoint) {
  return guarded(logger_, "surface changed", [&]() -> BackendStatus {
    surfaces_.onSurfaceChanged(handle, size, pixelsPerPoint);
    return {};
  });
}

BackendStatus Backend::onSurfaceDestroyed() {
  return guarded(logger_, "surface destroyed", [this]() -> BackendStatus {
    surfaces_.onSurfaceDestroyed();
    return {};
  });
}

BackendResult<InputStatus> Backend::onMotionEvent(RawMotionEvent event) {
  return guarded(logger_, "motion event", [&]() -> BackendResult<InputStatus> {
    if (event.pointers.empty() && event.action != MotionAction::Outside) {
      return InputStatus::Unhandled;
    }
    if (!events_.push(std::move(event))) {
      return InputStatus::Unhandled;
    }
    return InputStatus::Handled;
  });
}

BackendResult<InputStatus> Backend::onKeyEvent(RawKeyEvent event) {
  return guarded(logger_, "key event", [&]() -> BackendResult<InputStatus> {
    // Unhandled keys (Back, volume) go back to the platform.
    if (classifyKeyEvent(event) == InputStatus::Unhandled) {
      return InputStatus::Unhandled;
    }
    if (!events_.push(std::move(event))) {
      return InputStatus::Unhandled;
    }
    return InputStatus::Handled;
  });
}

BackendStatus Backend::onTextEvent(RawTextEvent event) {
  return guarded(logger_, "text event", [&]() -> BackendStatus {
    if (!events_.push(std::move(event))) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    return {};
  });
}

BackendStatus Backend::onCompositionEvent(RawCompositionEvent event) {
  return guarded(logger_, "composition event", [&]() -> BackendStatus {
    if (!events_.push(std::move(event))) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    return {};
  });
}

BackendStatus Backend::onFocusChanged(bool focused) {
  return guarded(logger_, "focus", [&]() -> BackendStatus {
    if (!events_.push(FocusChanged{focused})) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    return {};
  });
}

BackendStatus Backend::onConfigurationChanged(float pixelsPerPoint, Theme theme, PixelInsets contentInsets) {
  return guarded(logger_, "configuration", [&]() -> BackendStatus {
    if (events_.isClosed()) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    {
      std::lock_guard<std::mutex> lock(metricsMutex_);
      metrics_.pixelsPerPoint = sanitizedPixelsPerPoint(pixelsPerPoint, metrics_.pixelsPerPoint);
      metrics_.theme = theme;
      metrics_.contentInsets = contentInsets;
    }
    auto published = publishMetrics();
    if (!published) {
      return published;
    }
    coordinator_.requestRepaint();
    return {};
  });
}

BackendStatus Backend::onLowMemory() {
  return guarded(logger_, "low memory", [this]() -> BackendStatus {
    if (!events_.push(LowMemoryNotice{})) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    return {};
  });
}

BackendStatus Backend::startRenderThread() {
  return guarded(logger_, "start render thread", [this]() -> BackendStatus {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (coordinator_.isShutDown()) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    if (renderThread_.joinable()) {
      logger_.warning("backend: render thread already running");
      return std::unexpected(BackendError{BackendErrorCode::PlatformFailure});
    }
    renderThread_ = std::thread([this]() { coordinator_.run(); });
    return {};
  });
}

FrameLoopCoordinator& Backend::frameLoop() {
  return coordinator_;
}

SurfaceManager& Backend::surfaces() {
  return surfaces_;
}

std::optional<LifecycleState> Backend::lifecycleState() const {
  return lifecycle_.state();
}

const BackendConfig& Backend::config() const {
  return config_;
}

const Logger& Backend::logger() const {
  return logger_;
}

BackendStatus Backend::applyTransition(LifecycleTransition transition) {
  return lifecycle_.apply(transition);
}

void Backend::onLifecycleChanged(const LifecycleChange& change) {
  if (change.current == LifecycleState::Destroyed) {
    coordinator_.onLifecycleChanged(change);
    stopRenderThread();
    surfaces_.onLifecycleChanged(change);
    surfaces_.releaseAll();
    events_.close();
    logger_.info("backend: destroyed");
    return;
  }

  // The surface mirror updates first so the loop sees consistent readiness.
  surfaces_.onLifecycleChanged(change);
  coordinator_.onLifecycleChanged(change);

  if (change.current == LifecycleState::Created) {
    restorePriorState();
  } else if (change.current == LifecycleState::Paused) {
    saveState();
  }
}

void Backend::restorePriorState() {
  auto prior = persistence_.loadPrior();
  auto status = coordinator_.runToolkitTask(
      [this, &prior](Toolkit& toolkit) { persistence_.onRestore(toolkit, std::move(prior)); });
  if (!status) {
    std::string message = "backend: restore skipped (";
    message += errorLabel(status.error().code);
    message += ")";
    logger_.warning(message);
  }
}

void Backend::saveState() {
  PersistedState saved{};
  auto status = coordinator_.runToolkitTask(
      [this, &saved](Toolkit& toolkit) { saved = persistence_.onSave(toolkit); });
  if (!status) {
    std::string message = "backend: save skipped (";
    message += errorLabel(status.error().code);
    message += ")";
    logger_.warning(message);
  }
  std::lock_guard<std::mutex> lock(saveMutex_);
  lastSave_ = std::move(saved);
}

BackendStatus Backend::publishMetrics() {
  DisplayMetrics metrics{};
  {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    metrics = metrics_;
  }
  if (!events_.push(DisplayMetricsChanged{metrics})) {
    return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
  }
  return {};
}

void Backend::stopRenderThread() {
  std::lock_guard<std::mutex> lock(threadMutex_);
  if (!renderThread_.joinable()) {
    return;
  }
  if (renderThread_.get_id() == std::this_thread::get_id()) {
    // Destroy issued from the render thread itself. It exits on its own and
    // ~Backend joins it from the owning thread.
    return;
  }
  renderThread_.join();
}

} // namespace DroidFrame
