#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "DroidFrame/Lifecycle.h"
#include "DroidFrame/Log.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

// Platform drawable (ANativeWindow* on Android). The backend never releases
// `native`; the platform owns it.
struct SurfaceHandle {
  void* native = nullptr;
  uint64_t generation = 0u;

  constexpr bool isValid() const { return native != nullptr; }
};

constexpr bool operator==(SurfaceHandle a, SurfaceHandle b) {
  return a.native == b.native && a.generation == b.generation;
}
constexpr bool operator!=(SurfaceHandle a, SurfaceHandle b) { return !(a == b); }

// Toolkit draw output for one frame. The payload is produced by the toolkit
// and consumed by its renderer; the backend only routes it.
struct DrawOutput {
  uint64_t frameIndex = 0u;
  float pixelsPerPoint = 1.0f;
  std::shared_ptr<const void> payload;
};

// Graphics context built on a platform surface (EGL, Vulkan, ...).
class GraphicsBackend {
public:
  virtual ~GraphicsBackend() = default;

  virtual BackendStatus createContext(const SurfaceHandle& surface, PixelSize size) = 0;
  virtual BackendStatus resizeContext(PixelSize size) = 0;
  virtual BackendStatus present(const DrawOutput& output) = 0;
  // Must release everything bound to the surface before returning.
  virtual void destroyContext() = 0;
};

using SurfaceResizeListener = std::function<void(PixelSize size, float pixelsPerPoint)>;
using SurfaceAttachListener = std::function<void(bool attached)>;

class SurfaceManager {
public:
  SurfaceManager(GraphicsBackend& graphics, const Logger& logger);
  ~SurfaceManager();

  SurfaceManager(const SurfaceManager&) = delete;
  SurfaceManager& operator=(const SurfaceManager&) = delete;

  void onSurfaceAvailable(const SurfaceHandle& handle);
  void onSurfaceChanged(const SurfaceHandle& handle, PixelSize size, float pixelsPerPoint);
  // Synchronous: the graphics context is gone when this returns.
  void onSurfaceDestroyed();

  void onLifecycleChanged(const LifecycleChange& change);

  // Lifecycle resumed, surface attached and graphics context live.
  bool isReady() const;
  // Re-checks readiness under the surface lock; SurfaceInvalidated when the
  // surface went away since the frame started.
  BackendStatus present(const DrawOutput& output);

  std::optional<SurfaceHandle> attachedSurface() const;
  bool hasPendingSurface() const;
  PixelSize size() const;
  float pixelsPerPoint() const;

  void setResizeListener(SurfaceResizeListener listener);
  void setAttachListener(SurfaceAttachListener listener);

  // Terminal teardown on Destroyed. Later callbacks are ignored.
  void releaseAll();

private:
  bool attachLocked();
  bool detachLocked();
  bool isReadyLocked() const;
  void notifyAttach(bool attached);

  GraphicsBackend& graphics_;
  const Logger& logger_;

  mutable std::mutex mutex_;
  std::optional<LifecycleState> lifecycle_;
  std::optional<SurfaceHandle> platformSurface_;
  bool contextLive_ = false;
  bool released_ = false;
  PixelSize size_{};
  float pixelsPerPoint_ = 1.0f;

  std::mutex listenerMutex_;
  SurfaceResizeListener resizeListener_;
  SurfaceAttachListener attachListener_;
};

} // namespace DroidFrame
