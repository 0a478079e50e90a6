#if defined(__ANDROID__)

#include "DroidFrame/Android.h"

#include <android/configuration.h>
#include <android/input.h>
#include <android/log.h>
#include <android/looper.h>
#include <android/native_activity.h>
#include <android/native_window.h>
#include <android/window.h>
#include <android_native_app_glue.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "../Keycodes.h"
#include "../PlatformDisplayUtil.h"

namespace DroidFrame {
namespace {

constexpr const char* kLogTag = "DroidFrame";

int androidLogPriority(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return ANDROID_LOG_DEBUG;
    case LogLevel::Info:
      return ANDROID_LOG_INFO;
    case LogLevel::Warning:
      return ANDROID_LOG_WARN;
    case LogLevel::Error:
      return ANDROID_LOG_ERROR;
  }
  return ANDROID_LOG_INFO;
}

void logToAndroid(LogLevel level, Utf8TextView message) {
  __android_log_print(androidLogPriority(level), kLogTag, "%.*s", static_cast<int>(message.size()),
                      message.data());
}

// Backed by android_app::savedState. The platform hands the bytes back to
// the next instance of the activity after process death.
class SavedStateStore final : public StateStore {
public:
  explicit SavedStateStore(const android_app* app) {
    if (app->savedState && app->savedStateSize > 0u) {
      PersistedState state{};
      const auto* bytes = static_cast<const uint8_t*>(app->savedState);
      state.bytes.assign(bytes, bytes + app->savedStateSize);
      saved_ = std::move(state);
    }
  }

  BackendStatus store(std::string_view, const PersistedState& state) override {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_ = state;
    return {};
  }

  std::optional<PersistedState> load(std::string_view) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_;
  }

  void erase(std::string_view) override {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_.reset();
  }

  // APP_CMD_SAVE_STATE: the glue frees the previous buffer before the command.
  void writeTo(android_app* app) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!saved_ || saved_->bytes.empty()) {
      return;
    }
    void* buffer = std::malloc(saved_->bytes.size());
    if (!buffer) {
      return;
    }
    std::memcpy(buffer, saved_->bytes.data(), saved_->bytes.size());
    app->savedState = buffer;
    app->savedStateSize = saved_->bytes.size();
  }

private:
  std::mutex mutex_;
  std::optional<PersistedState> saved_;
};

class NativeActivityServices final : public PlatformServices {
public:
  explicit NativeActivityServices(ANativeActivity* activity) : activity_(activity) {}

  void setSoftKeyboardVisible(bool visible) override {
    if (visible) {
      ANativeActivity_showSoftInput(activity_, ANATIVEACTIVITY_SHOW_SOFT_INPUT_IMPLICIT);
    } else {
      ANativeActivity_hideSoftInput(activity_, ANATIVEACTIVITY_HIDE_SOFT_INPUT_NOT_ALWAYS);
    }
  }

  // NativeActivity has no input connection to update.
  void setTextInputState(const TextInputState&) override {}

  BackendStatus copyText(Utf8TextView) override {
    return std::unexpected(BackendError{BackendErrorCode::Unsupported});
  }

  BackendResult<std::string> clipboardText() override {
    return std::unexpected(BackendError{BackendErrorCode::Unsupported});
  }

  BackendStatus openUrl(Utf8TextView) override {
    return std::unexpected(BackendError{BackendErrorCode::Unsupported});
  }

  void setFullscreen(bool fullscreen) override {
    if (fullscreen) {
      ANativeActivity_setWindowFlags(activity_, AWINDOW_FLAG_FULLSCREEN, 0);
    } else {
      ANativeActivity_setWindowFlags(activity_, 0, AWINDOW_FLAG_FULLSCREEN);
    }
  }

  void requestFinish() override {
    ANativeActivity_finish(activity_);
  }

private:
  ANativeActivity* activity_ = nullptr;
};

struct AndroidRunner {
  explicit AndroidRunner(android_app* androidApp)
      : app(androidApp), store(androidApp), services(androidApp->activity) {}

  android_app* app = nullptr;
  AndroidAppParts parts;
  SavedStateStore store;
  NativeActivityServices services;
  std::unique_ptr<Backend> backend;
  uint64_t surfaceGeneration = 0u;
  float pixelsPerPoint = 1.0f;
  Theme theme = Theme::Unknown;
  PixelInsets insets{};
};

void report(const AndroidRunner& runner, const BackendStatus& status, Utf8TextView what) {
  if (status) {
    return;
  }
  std::string message = "android: ";
  message += what;
  message += " failed (";
  message += errorLabel(status.error().code);
  message += ")";
  runner.backend->logger().warning(message);
}

Theme themeFromConfiguration(AConfiguration* config) {
  switch (AConfiguration_getUiModeNight(config)) {
    case ACONFIGURATION_UI_MODE_NIGHT_YES:
      return Theme::Dark;
    case ACONFIGURATION_UI_MODE_NIGHT_NO:
      return Theme::Light;
    default:
      return Theme::Unknown;
  }
}

void refreshConfiguration(AndroidRunner& runner) {
  AConfiguration* config = runner.app->config;
  if (!config) {
    return;
  }
  auto scale = pixelsPerPointFromDensity(AConfiguration_getDensity(config), runner.backend->config().baseDpi);
  if (scale) {
    runner.pixelsPerPoint = *scale;
  }
  runner.theme = themeFromConfiguration(config);
  report(runner,
         runner.backend->onConfigurationChanged(runner.pixelsPerPoint, runner.theme, runner.insets),
         "configuration");
}

PixelSize windowSize(ANativeWindow* window) {
  int32_t width = ANativeWindow_getWidth(window);
  int32_t height = ANativeWindow_getHeight(window);
  return PixelSize{static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)};
}

void refreshInsets(AndroidRunner& runner) {
  if (!runner.app->window) {
    return;
  }
  PixelSize size = windowSize(runner.app->window);
  const ARect& rect = runner.app->contentRect;
  runner.insets.left = rect.left;
  runner.insets.top = rect.top;
  runner.insets.right = static_cast<int32_t>(size.width) - rect.right;
  runner.insets.bottom = static_cast<int32_t>(size.height) - rect.bottom;
  report(runner,
         runner.backend->onConfigurationChanged(runner.pixelsPerPoint, runner.theme, runner.insets),
         "content rect");
}

SurfaceHandle currentSurface(const AndroidRunner& runner) {
  return SurfaceHandle{runner.app->window, runner.surfaceGeneration};
}

void handleCommand(android_app* app, int32_t command) {
  auto* runner = static_cast<AndroidRunner*>(app->userData);
  if (!runner || !runner->backend) {
    return;
  }
  Backend& backend = *runner->backend;
  switch (command) {
    case APP_CMD_START:
      report(*runner, backend.onStart(), "start");
      break;
    case APP_CMD_RESUME:
      report(*runner, backend.onResume(), "resume");
      break;
    case APP_CMD_PAUSE: {
      auto saved = backend.onPause();
      if (!saved) {
        report(*runner, std::unexpected(saved.error()), "pause");
      }
      break;
    }
    case APP_CMD_STOP:
      report(*runner, backend.onStop(), "stop");
      break;
    case APP_CMD_DESTROY:
      report(*runner, backend.onDestroy(), "destroy");
      break;
    case APP_CMD_SAVE_STATE:
      runner->store.writeTo(app);
      break;
    case APP_CMD_INIT_WINDOW:
      if (app->window) {
        ++runner->surfaceGeneration;
        report(*runner, backend.onSurfaceAvailable(currentSurface(*runner)), "surface available");
        report(*runner,
               backend.onSurfaceChanged(currentSurface(*runner), windowSize(app->window), runner->pixelsPerPoint),
               "surface changed");
      }
      break;
    case APP_CMD_WINDOW_RESIZED:
      if (app->window) {
        report(*runner,
               backend.onSurfaceChanged(currentSurface(*runner), windowSize(app->window), runner->pixelsPerPoint),
               "surface changed");
      }
      break;
    case APP_CMD_TERM_WINDOW:
      report(*runner, backend.onSurfaceDestroyed(), "surface destroyed");
      break;
    case APP_CMD_GAINED_FOCUS:
      report(*runner, backend.onFocusChanged(true), "focus");
      break;
    case APP_CMD_LOST_FOCUS:
      report(*runner, backend.onFocusChanged(false), "focus");
      break;
    case APP_CMD_CONFIG_CHANGED:
      refreshConfiguration(*runner);
      break;
    case APP_CMD_CONTENT_RECT_CHANGED:
      refreshInsets(*runner);
      break;
    case APP_CMD_LOW_MEMORY:
      report(*runner, backend.onLowMemory(), "low memory");
      break;
    default:
      break;
  }
}

std::optional<MotionAction> motionActionFromAndroid(int32_t action) {
  switch (action & AMOTION_EVENT_ACTION_MASK) {
    case AMOTION_EVENT_ACTION_DOWN:
      return MotionAction::Down;
    case AMOTION_EVENT_ACTION_POINTER_DOWN:
      return MotionAction::PointerDown;
    case AMOTION_EVENT_ACTION_MOVE:
      return MotionAction::Move;
    case AMOTION_EVENT_ACTION_UP:
      return MotionAction::Up;
    case AMOTION_EVENT_ACTION_POINTER_UP:
      return MotionAction::PointerUp;
    case AMOTION_EVENT_ACTION_CANCEL:
      return MotionAction::Cancel;
    case AMOTION_EVENT_ACTION_OUTSIDE:
      return MotionAction::Outside;
    case AMOTION_EVENT_ACTION_HOVER_MOVE:
      return MotionAction::HoverMove;
    case AMOTION_EVENT_ACTION_SCROLL:
      return MotionAction::Scroll;
    default:
      return std::nullopt;
  }
}

ToolType toolTypeFromAndroid(int32_t toolType) {
  switch (toolType) {
    case AMOTION_EVENT_TOOL_TYPE_FINGER:
      return ToolType::Finger;
    case AMOTION_EVENT_TOOL_TYPE_STYLUS:
      return ToolType::Stylus;
    case AMOTION_EVENT_TOOL_TYPE_MOUSE:
      return ToolType::Mouse;
    case AMOTION_EVENT_TOOL_TYPE_ERASER:
      return ToolType::Eraser;
    default:
      return ToolType::Unknown;
  }
}

int32_t handleMotion(AndroidRunner& runner, const AInputEvent* event) {
  int32_t rawAction = AMotionEvent_getAction(event);
  auto action = motionActionFromAndroid(rawAction);
  if (!action) {
    return 0;
  }
  RawMotionEvent motion{};
  motion.deviceId = static_cast<uint32_t>(AInputEvent_getDeviceId(event));
  motion.action = *action;
  motion.actionIndex = static_cast<uint32_t>((rawAction & AMOTION_EVENT_ACTION_POINTER_INDEX_MASK) >>
                                           AMOTION_EVENT_ACTION_POINTER_INDEX_SHIFT);
  motion.metaState = static_cast<uint32_t>(AMotionEvent_getMetaState(event));
  motion.eventTime = std::chrono::nanoseconds{AMotionEvent_getEventTime(event)};
  size_t count = AMotionEvent_getPointerCount(event);
  motion.pointers.reserve(count);
  for (size_t i = 0u; i < count; ++i) {
    RawPointer pointer{};
    pointer.pointerId = static_cast<uint32_t>(AMotionEvent_getPointerId(event, i));
    pointer.x = AMotionEvent_getX(event, i);
    pointer.y = AMotionEvent_getY(event, i);
    pointer.pressure = AMotionEvent_getPressure(event, i);
    pointer.toolType = toolTypeFromAndroid(AMotionEvent_getToolType(event, i));
    pointer.scrollX = AMotionEvent_getAxisValue(event, AMOTION_EVENT_AXIS_HSCROLL, i);
    pointer.scrollY = AMotionEvent_getAxisValue(event, AMOTION_EVENT_AXIS_VSCROLL, i);
    motion.pointers.push_back(pointer);
  }
  auto status = runner.backend->onMotionEvent(std::move(motion));
  return status && *status == InputStatus::Handled ? 1 : 0;
}

int32_t handleKey(AndroidRunner& runner, const AInputEvent* event) {
  RawKeyEvent key{};
  key.deviceId = static_cast<uint32_t>(AInputEvent_getDeviceId(event));
  key.keyCode = AKeyEvent_getKeyCode(event);
  switch (AKeyEvent_getAction(event)) {
    case AKEY_EVENT_ACTION_DOWN:
      key.action = KeyAction::Down;
      break;
    case AKEY_EVENT_ACTION_UP:
      key.action = KeyAction::Up;
      break;
    default:
      key.action = KeyAction::Multiple;
      break;
  }
  key.repeatCount = static_cast<uint32_t>(AKeyEvent_getRepeatCount(event));
  key.metaState = static_cast<uint32_t>(AKeyEvent_getMetaState(event));
  key.eventTime = std::chrono::nanoseconds{AKeyEvent_getEventTime(event)};
  // The NDK does not expose KeyCharacterMap; derive text from the key code.
  key.unicode = fallbackUnicodeForKeyCode(key.keyCode, key.metaState);
  auto status = runner.backend->onKeyEvent(std::move(key));
  return status && *status == InputStatus::Handled ? 1 : 0;
}

int32_t handleInput(android_app* app, AInputEvent* event) {
  auto* runner = static_cast<AndroidRunner*>(app->userData);
  if (!runner || !runner->backend) {
    return 0;
  }
  switch (AInputEvent_getType(event)) {
    case AINPUT_EVENT_TYPE_MOTION:
      return handleMotion(*runner, event);
    case AINPUT_EVENT_TYPE_KEY:
      return handleKey(*runner, event);
    default:
      return 0;
  }
}

int pollTimeoutMillis(std::optional<std::chrono::nanoseconds> wait) {
  if (!wait) {
    return -1;
  }
  auto millis = std::chrono::ceil<std::chrono::milliseconds>(*wait);
  return static_cast<int>(millis.count());
}

} // namespace

BackendStatus runAndroidApp(android_app* app, AndroidAppFactory factory) {
  if (!app || !factory) {
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }

  AndroidRunner runner(app);
  runner.parts = factory(app);
  if (!runner.parts.toolkit || !runner.parts.graphics) {
    logToAndroid(LogLevel::Error, "android: factory returned no toolkit or graphics backend");
    return std::unexpected(BackendError{BackendErrorCode::InvalidConfig});
  }

  auto created = Backend::create(runner.parts.config,
                                 *runner.parts.toolkit,
                                 *runner.parts.graphics,
                                 runner.store,
                                 &runner.services);
  if (!created) {
    std::string message = "android: backend creation failed (";
    message += errorLabel(created.error().code);
    message += ")";
    logToAndroid(LogLevel::Error, message);
    return std::unexpected(created.error());
  }
  runner.backend = std::move(*created);
  runner.backend->setLogCallback(logToAndroid);
  ALooper* looper = app->looper;
  runner.backend->frameLoop().setWakeHook([looper]() { ALooper_wake(looper); });

  app->userData = &runner;
  app->onAppCmd = handleCommand;
  app->onInputEvent = handleInput;

  refreshConfiguration(runner);
  report(runner, runner.backend->onCreate(), "create");

  while (!app->destroyRequested) {
    int timeout = pollTimeoutMillis(runner.backend->frameLoop().timeUntilNextFrame());
    int events = 0;
    android_poll_source* source = nullptr;
    int ident = ALooper_pollOnce(timeout, nullptr, &events, reinterpret_cast<void**>(&source));
    if (ident >= 0 && source) {
      source->process(app, source);
    }
    if (app->destroyRequested) {
      break;
    }
    runner.backend->frameLoop().runOnce(std::chrono::nanoseconds{0});
  }

  // Process death without APP_CMD_DESTROY still tears the instance down.
  if (runner.backend->lifecycleState() != LifecycleState::Destroyed) {
    runner.backend->frameLoop().shutdown();
  }
  app->onAppCmd = nullptr;
  app->onInputEvent = nullptr;
  app->userData = nullptr;
  runner.backend.reset();
  return {};
}

} // namespace DroidFrame

#endif
