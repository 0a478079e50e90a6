#include "DroidFrame/Surface.h"

#include <string>
#include <utility>

#include "PlatformDisplayUtil.h"

namespace DroidFrame {

SurfaceManager::SurfaceManager(GraphicsBackend& graphics, const Logger& logger)
    : graphics_(graphics), logger_(logger) {}

SurfaceManager::~SurfaceManager() {
  releaseAll();
}

void SurfaceManager::onSurfaceAvailable(const SurfaceHandle& handle) {
  bool attached = false;
  bool detached = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
      logger_.debug("surface: available after teardown ignored");
      return;
    }
    if (!handle.isValid()) {
      logger_.warning("surface: available with null handle ignored");
      return;
    }
    if (platformSurface_ && *platformSurface_ != handle) {
      detached = detachLocked();
    }
    platformSurface_ = handle;
    if (lifecycleAllowsSurface(lifecycle_)) {
      attached = attachLocked();
    } else {
      logger_.debug("surface: held as pending until started");
    }
  }
  if (detached && !attached) {
    notifyAttach(false);
  }
  if (attached) {
    notifyAttach(true);
  }
}

void SurfaceManager::onSurfaceChanged(const SurfaceHandle& handle, PixelSize size, float pixelsPerPoint) {
  bool attached = false;
  bool detached = false;
  float scale = 1.0f;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
      logger_.debug("surface: change after teardown ignored");
      return;
    }
    if (!handle.isValid()) {
      logger_.warning("surface: change with null handle ignored");
      return;
    }
    size_ = size;
    pixelsPerPoint_ = sanitizedPixelsPerPoint(pixelsPerPoint, pixelsPerPoint_);
    scale = pixelsPerPoint_;
    if (!platformSurface_ || *platformSurface_ != handle) {
      // The platform swapped the surface without a separate available signal.
      detached = detachLocked();
      platformSurface_ = handle;
      if (lifecycleAllowsSurface(lifecycle_)) {
        attached = attachLocked();
      }
    } else if (contextLive_) {
      auto status = graphics_.resizeContext(size);
      if (!status) {
        std::string message = "surface: resize failed (";
        message += errorLabel(status.error().code);
        message += ")";
        logger_.warning(message);
      }
    } else if (lifecycleAllowsSurface(lifecycle_)) {
      // Pending surface whose earlier attach failed.
      attached = attachLocked();
    }
  }
  if (detached && !attached) {
    notifyAttach(false);
  }
  if (attached) {
    notifyAttach(true);
  }

  SurfaceResizeListener listener;
  {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener = resizeListener_;
  }
  if (listener) {
    listener(size, scale);
  }
}

void SurfaceManager::onSurfaceDestroyed() {
  bool detached = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    detached = detachLocked();
    platformSurface_.reset();
  }
  logger_.debug("surface: destroyed");
  if (detached) {
    notifyAttach(false);
  }
}

void SurfaceManager::onLifecycleChanged(const LifecycleChange& change) {
  bool attached = false;
  bool detached = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycle_ = change.current;
    if (released_) {
      return;
    }
    if (change.current == LifecycleState::Destroyed) {
      detached = detachLocked();
      platformSurface_.reset();
      released_ = true;
    } else if (lifecycleAllowsSurface(change.current)) {
      if (platformSurface_ && !contextLive_) {
        attached = attachLocked();
      }
    } else {
      // Stopped keeps the platform surface as pending for the next start.
      detached = detachLocked();
    }
  }
  if (detached) {
    notifyAttach(false);
  }
  if (attached) {
    notifyAttach(true);
  }
}

bool SurfaceManager::isReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isReadyLocked();
}

BackendStatus SurfaceManager::present(const DrawOutput& output) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isReadyLocked()) {
    return std::unexpected(BackendError{BackendErrorCode::SurfaceInvalidated});
  }
  return graphics_.present(output);
}

std::optional<SurfaceHandle> SurfaceManager::attachedSurface() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!contextLive_) {
    return std::nullopt;
  }
  return platformSurface_;
}

bool SurfaceManager::hasPendingSurface() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return platformSurface_.has_value() && !contextLive_;
}

PixelSize SurfaceManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_;
}

float SurfaceManager::pixelsPerPoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pixelsPerPoint_;
}

void SurfaceManager::setResizeListener(SurfaceResizeListener listener) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  resizeListener_ = std::move(listener);
}

void SurfaceManager::setAttachListener(SurfaceAttachListener listener) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  attachListener_ = std::move(listener);
}

void SurfaceManager::releaseAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  detachLocked();
  platformSurface_.reset();
  released_ = true;
}

bool SurfaceManager::attachLocked() {
  if (contextLive_ || !platformSurface_) {
    return false;
  }
  auto status = graphics_.createContext(*platformSurface_, size_);
  if (!status) {
    std::string message = "surface: graphics context creation failed (";
    message += errorLabel(status.error().code);
    message += ")";
    logger_.error(message);
    return false;
  }
  contextLive_ = true;
  logger_.debug("surface: attached");
  return true;
}

bool SurfaceManager::detachLocked() {
  if (!contextLive_) {
    return false;
  }
  contextLive_ = false;
  graphics_.destroyContext();
  logger_.debug("surface: detached");
  return true;
}

bool SurfaceManager::isReadyLocked() const {
  return !released_ && lifecycle_ == LifecycleState::Resumed && platformSurface_.has_value() &&
         contextLive_;
}

void SurfaceManager::notifyAttach(bool attached) {
  SurfaceAttachListener listener;
  {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener = attachListener_;
  }
  if (listener) {
    listener(attached);
  }
}

} // namespace DroidFrame
