#pragma once

#if defined(__ANDROID__)

#include <functional>
#include <memory>

#include "DroidFrame/Backend.h"

struct android_app;

namespace DroidFrame {

// What the application supplies for one activity instance.
struct AndroidAppParts {
  std::unique_ptr<Toolkit> toolkit;
  std::unique_ptr<GraphicsBackend> graphics;
  BackendConfig config{};
};

using AndroidAppFactory = std::function<AndroidAppParts(android_app* app)>;

// Drives the activity from android_main until it is destroyed. The calling
// thread is both the callback thread and the render thread.
BackendStatus runAndroidApp(android_app* app, AndroidAppFactory factory);

} // namespace DroidFrame

#endif
