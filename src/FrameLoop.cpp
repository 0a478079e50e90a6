#include "DroidFrame/FrameLoop.h"

#include <exception>
#include <span>
#include <string>
#include <utility>

#include "FramePacing.h"
#include "PlatformDisplayUtil.h"

namespace DroidFrame {
namespace {

std::string describeError(Utf8TextView prefix, BackendError error) {
  std::string message(prefix);
  message += errorLabel(error.code);
  return message;
}

} // namespace

std::string_view frameLoopStateLabel(FrameLoopState state) {
  switch (state) {
    case FrameLoopState::Idle:
      return "idle";
    case FrameLoopState::WaitingForSurface:
      return "waiting for surface";
    case FrameLoopState::Rendering:
      return "rendering";
    case FrameLoopState::Suspended:
      return "suspended";
  }
  return "unknown";
}

FrameLoopCoordinator::FrameLoopCoordinator(Toolkit& toolkit,
                                           SurfaceManager& surfaces,
                                           EventQueue& events,
                                           InputTranslator& translator,
                                           const BackendConfig& config,
                                           const Logger& logger)
    : toolkit_(toolkit),
      surfaces_(surfaces),
      events_(events),
      translator_(translator),
      config_(config),
      logger_(logger) {}

FrameLoopCoordinator::~FrameLoopCoordinator() {
  shutdown();
}

void FrameLoopCoordinator::setPlatformServices(PlatformServices* services) {
  std::lock_guard<std::mutex> lock(mutex_);
  services_ = services;
}

void FrameLoopCoordinator::setWakeHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  wakeHook_ = std::move(hook);
}

void FrameLoopCoordinator::onLifecycleChanged(const LifecycleChange& change) {
  if (change.current == LifecycleState::Destroyed) {
    shutdown();
    return;
  }
  bool ready = surfaces_.isReady();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (change.current == LifecycleState::Resumed) {
      suspended_ = false;
      state_ = ready ? FrameLoopState::Idle : FrameLoopState::WaitingForSurface;
      repaint_ = mergeRepaintRequest(repaint_, RepaintRequest{RepaintKind::Now, {}});
      wakeRequested_ = true;
    } else {
      suspended_ = true;
      state_ = FrameLoopState::Suspended;
      if (change.current == LifecycleState::Paused || change.current == LifecycleState::Stopped) {
        inputResetPending_ = true;
      }
    }
  }
  cv_.notify_all();
  notifyWake();
}

bool FrameLoopCoordinator::runOnce(std::optional<std::chrono::nanoseconds> maxWait) {
  runPendingTasks();
  if (isShutDown()) {
    return false;
  }
  processEvents();
  if (frameDue(Clock::now())) {
    return renderFrame();
  }

  waitForWork(maxWait);

  runPendingTasks();
  if (isShutDown()) {
    return false;
  }
  processEvents();
  if (frameDue(Clock::now())) {
    return renderFrame();
  }
  return false;
}

void FrameLoopCoordinator::run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (renderThreadActive_) {
      logger_.warning("frame loop: run() called while a render thread is active");
      return;
    }
    if (shutdown_) {
      return;
    }
    renderThreadActive_ = true;
    renderThreadId_ = std::this_thread::get_id();
  }
  logger_.debug("frame loop: render thread started");

  while (!isShutDown()) {
    runOnce(std::nullopt);
  }

  std::deque<std::packaged_task<void()>> leftover;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    renderThreadActive_ = false;
    renderThreadId_ = std::thread::id{};
    leftover.swap(tasks_);
  }
  // Callers are still blocked on these.
  for (auto& task : leftover) {
    task();
  }
  stoppedCv_.notify_all();
  logger_.debug("frame loop: render thread stopped");
}

void FrameLoopCoordinator::shutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!shutdown_) {
    shutdown_ = true;
    state_ = FrameLoopState::Suspended;
    lock.unlock();
    cv_.notify_all();
    notifyWake();
    logger_.debug("frame loop: shutdown requested");
    lock.lock();
  }
  if (renderThreadActive_ && renderThreadId_ != std::this_thread::get_id()) {
    stoppedCv_.wait(lock, [this] { return !renderThreadActive_; });
  }
}

void FrameLoopCoordinator::wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wakeRequested_ = true;
  }
  cv_.notify_all();
  notifyWake();
}

void FrameLoopCoordinator::requestRepaint(std::chrono::nanoseconds delay) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    RepaintRequest request{RepaintKind::Now, {}};
    if (delay.count() > 0) {
      request = RepaintRequest{RepaintKind::At,
                               Clock::now() + std::chrono::duration_cast<Clock::duration>(delay)};
    }
    repaint_ = mergeRepaintRequest(repaint_, request);
    wakeRequested_ = true;
  }
  cv_.notify_all();
  notifyWake();
}

BackendStatus FrameLoopCoordinator::runOnRenderThread(std::function<void()> task) {
  std::packaged_task<void()> packaged(std::move(task));
  auto done = packaged.get_future();
  bool queued = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return std::unexpected(BackendError{BackendErrorCode::ShuttingDown});
    }
    if (renderThreadActive_ && renderThreadId_ != std::this_thread::get_id()) {
      tasks_.push_back(std::move(packaged));
      wakeRequested_ = true;
      queued = true;
    }
  }
  if (queued) {
    cv_.notify_all();
    notifyWake();
  } else {
    packaged();
  }
  done.get();
  return {};
}

BackendStatus FrameLoopCoordinator::runToolkitTask(std::function<void(Toolkit&)> task) {
  return runOnRenderThread([this, &task]() {
    std::lock_guard<std::mutex> lock(toolkitMutex_);
    task(toolkit_);
  });
}

std::optional<std::chrono::nanoseconds> FrameLoopCoordinator::timeUntilNextFrame() const {
  bool ready = surfaces_.isReady();
  bool queuedEvents = !events_.empty();
  auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    return std::nullopt;
  }
  if (!tasks_.empty()) {
    return std::chrono::nanoseconds{0};
  }
  if (suspended_) {
    return std::nullopt;
  }
  if (queuedEvents) {
    return std::chrono::nanoseconds{0};
  }
  if (!ready) {
    return std::nullopt;
  }
  if (!pending_.empty()) {
    return std::chrono::nanoseconds{0};
  }
  auto next = nextWakeTime(repaint_, config_.frameInterval, lastFrame_, config_.maxIdleInterval, now);
  if (!next) {
    return std::nullopt;
  }
  if (*next <= now) {
    return std::chrono::nanoseconds{0};
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(*next - now);
}

FrameLoopState FrameLoopCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

uint64_t FrameLoopCoordinator::frameCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frameCount_;
}

bool FrameLoopCoordinator::isShutDown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutdown_;
}

RepaintRequest FrameLoopCoordinator::repaintRequest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return repaint_;
}

void FrameLoopCoordinator::runPendingTasks() {
  std::deque<std::packaged_task<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.swap(tasks_);
  }
  for (auto& task : tasks) {
    task();
  }
}

void FrameLoopCoordinator::processEvents() {
  bool resetInput = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wakeRequested_ = false;
    resetInput = inputResetPending_;
    inputResetPending_ = false;
  }
  auto drained = events_.drain();
  for (auto& event : drained) {
    if (auto* motion = std::get_if<RawMotionEvent>(&event)) {
      translator_.translate(*motion, pending_);
    } else if (auto* key = std::get_if<RawKeyEvent>(&event)) {
      translator_.translate(*key, pending_);
    } else if (auto* text = std::get_if<RawTextEvent>(&event)) {
      translator_.translate(*text, pending_);
    } else if (auto* composition = std::get_if<RawCompositionEvent>(&event)) {
      translator_.translate(*composition, pending_);
    } else if (auto* metrics = std::get_if<DisplayMetricsChanged>(&event)) {
      applyMetrics(metrics->metrics);
    } else if (auto* focus = std::get_if<FocusChanged>(&event)) {
      focused_ = focus->focused;
      if (!focus->focused) {
        translator_.reset(pending_);
      }
      appendEvent(FocusInput{focus->focused});
    } else if (std::holds_alternative<LowMemoryNotice>(event)) {
      logger_.info("frame loop: low memory");
      notifyLowMemory();
    }
  }
  // Events queued before the pause are translated first.
  if (resetInput) {
    translator_.reset(pending_);
  }
}

void FrameLoopCoordinator::notifyLowMemory() {
  std::lock_guard<std::mutex> lock(toolkitMutex_);
  try {
    toolkit_.onLowMemory();
  } catch (const std::exception& ex) {
    std::string message = "frame loop: low memory handler threw: ";
    message += ex.what();
    logger_.error(message);
  } catch (...) {
    logger_.error("frame loop: low memory handler threw an unknown exception");
  }
}

bool FrameLoopCoordinator::frameDue(Clock::time_point now) {
  bool ready = surfaces_.isReady();
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    return false;
  }
  if (suspended_) {
    state_ = FrameLoopState::Suspended;
    return false;
  }
  if (!ready) {
    state_ = FrameLoopState::WaitingForSurface;
    return false;
  }
  state_ = FrameLoopState::Idle;
  if (!pending_.empty()) {
    return true;
  }
  return repaintDue(repaint_, config_.frameInterval, lastFrame_, now) ||
         idleRefreshDue(config_.maxIdleInterval, lastFrame_, now);
}

void FrameLoopCoordinator::waitForWork(std::optional<std::chrono::nanoseconds> maxWait) {
  bool ready = surfaces_.isReady();
  auto now = Clock::now();
  std::unique_lock<std::mutex> lock(mutex_);
  auto hasWork = [this]() {
    return shutdown_ || !tasks_.empty() || (!suspended_ && wakeRequested_);
  };
  if (hasWork()) {
    return;
  }

  std::optional<Clock::time_point> until;
  if (maxWait) {
    until = now + std::chrono::duration_cast<Clock::duration>(*maxWait);
  }
  if (!suspended_ && ready) {
    auto next = nextWakeTime(repaint_, config_.frameInterval, lastFrame_, config_.maxIdleInterval, now);
    if (next && (!until || *next < *until)) {
      until = next;
    }
  }

  if (until) {
    cv_.wait_until(lock, *until, hasWork);
  } else {
    cv_.wait(lock, hasWork);
  }
}

bool FrameLoopCoordinator::renderFrame() {
  auto now = Clock::now();
  FrameTiming timing{};
  RepaintRequest previous{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = FrameLoopState::Rendering;
    timing.time = now;
    timing.delta = lastFrame_ ? std::chrono::duration_cast<std::chrono::nanoseconds>(now - *lastFrame_)
                              : std::chrono::nanoseconds{0};
    timing.frameIndex = frameCount_;
    // Requests made while the toolkit runs apply to the next frame.
    previous = repaint_;
    repaint_ = RepaintRequest{};
  }

  std::vector<InputEvent> input;
  input.swap(pending_);
  if (config_.coalescePointerMoves) {
    coalescePointerMoves(input);
  }

  float pixelsPerPoint = sanitizedPixelsPerPoint(metrics_.pixelsPerPoint, 1.0f);
  FrameInput frame{};
  frame.events = std::span<const InputEvent>(input.data(), input.size());
  frame.screenSize = logicalSizeFromPixels(metrics_.size, pixelsPerPoint);
  frame.pixelsPerPoint = pixelsPerPoint;
  frame.focused = focused_;
  frame.theme = metrics_.theme;
  frame.contentInsets = metrics_.contentInsets;
  frame.timing = timing;

  BackendResult<FrameOutput> result = std::unexpected(BackendError{BackendErrorCode::ToolkitUpdateFailed});
  {
    std::lock_guard<std::mutex> lock(toolkitMutex_);
    try {
      result = toolkit_.update(frame);
    } catch (const std::exception& ex) {
      std::string message = "frame loop: toolkit update threw: ";
      message += ex.what();
      logger_.error(message);
      result = std::unexpected(BackendError{BackendErrorCode::ToolkitUpdateFailed});
    } catch (...) {
      logger_.error("frame loop: toolkit update threw an unknown exception");
      result = std::unexpected(BackendError{BackendErrorCode::ToolkitUpdateFailed});
    }
  }

  if (!result) {
    logger_.error(describeError("frame loop: frame skipped, ", result.error()));
    std::lock_guard<std::mutex> lock(mutex_);
    // A skipped frame keeps the standing schedule. A one-shot request was
    // consumed by the attempt.
    if (previous.kind != RepaintKind::Now) {
      repaint_ = mergeRepaintRequest(repaint_, previous);
    }
    if (continuousHint_) {
      repaint_ = mergeRepaintRequest(repaint_, RepaintRequest{RepaintKind::Continuous, {}});
    }
    state_ = FrameLoopState::Idle;
    return false;
  }

  FrameOutput& output = *result;
  relayOutput(output);

  RepaintRequest next = repaintRequestFromHint(output.repaint);
  continuousHint_ = next.kind == RepaintKind::Continuous;
  if (output.discard) {
    next = mergeRepaintRequest(next, RepaintRequest{RepaintKind::Now, {}});
  } else {
    output.draw.frameIndex = timing.frameIndex;
    output.draw.pixelsPerPoint = pixelsPerPoint;
    auto presented = surfaces_.present(output.draw);
    if (!presented) {
      if (presented.error().code == BackendErrorCode::SurfaceInvalidated) {
        logger_.debug("frame loop: surface went away, frame dropped");
      } else {
        logger_.warning(describeError("frame loop: present failed, ", presented.error()));
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    repaint_ = mergeRepaintRequest(repaint_, next);
    lastFrame_ = now;
    ++frameCount_;
    state_ = FrameLoopState::Idle;
  }
  return true;
}

void FrameLoopCoordinator::relayOutput(const FrameOutput& output) {
  PlatformServices* services = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    services = services_;
  }
  if (!services) {
    return;
  }

  try {
    if (output.wantsKeyboard != keyboardVisible_) {
      services->setSoftKeyboardVisible(output.wantsKeyboard);
      keyboardVisible_ = output.wantsKeyboard;
    }
    if (output.textInputState) {
      services->setTextInputState(*output.textInputState);
    }
    for (const auto& command : output.commands) {
      if (auto* copy = std::get_if<CopyTextCommand>(&command)) {
        auto status = services->copyText(copy->text);
        if (!status) {
          logger_.warning(describeError("frame loop: copy failed, ", status.error()));
        }
      } else if (auto* url = std::get_if<OpenUrlCommand>(&command)) {
        auto status = services->openUrl(url->url);
        if (!status) {
          logger_.warning(describeError("frame loop: open url failed, ", status.error()));
        }
      } else if (std::holds_alternative<RequestPasteCommand>(command)) {
        auto text = services->clipboardText();
        if (!text) {
          logger_.warning(describeError("frame loop: paste failed, ", text.error()));
        } else if (!text->empty()) {
          appendEvent(PasteInput{std::move(*text)});
          std::lock_guard<std::mutex> lock(mutex_);
          repaint_ = mergeRepaintRequest(repaint_, RepaintRequest{RepaintKind::Now, {}});
        }
      } else if (std::holds_alternative<RequestCloseCommand>(command)) {
        logger_.info("frame loop: toolkit requested close");
        services->requestFinish();
      } else if (auto* fullscreen = std::get_if<SetFullscreenCommand>(&command)) {
        services->setFullscreen(fullscreen->fullscreen);
      }
    }
  } catch (const std::exception& ex) {
    std::string message = "frame loop: platform services threw: ";
    message += ex.what();
    logger_.error(message);
  }
}

void FrameLoopCoordinator::applyMetrics(const DisplayMetrics& metrics) {
  float pixelsPerPoint = sanitizedPixelsPerPoint(metrics.pixelsPerPoint, metrics_.pixelsPerPoint);
  bool resized = !(metrics.size == metrics_.size) || pixelsPerPoint != metrics_.pixelsPerPoint;
  metrics_ = metrics;
  metrics_.pixelsPerPoint = pixelsPerPoint;
  translator_.setPixelsPerPoint(pixelsPerPoint);
  if (resized) {
    appendEvent(ResizeInput{logicalSizeFromPixels(metrics_.size, pixelsPerPoint), pixelsPerPoint});
  }
}

void FrameLoopCoordinator::appendEvent(InputPayload payload) {
  InputEvent event{};
  event.timestamp = translator_.lastTimestamp();
  event.payload = std::move(payload);
  pending_.push_back(std::move(event));
}

void FrameLoopCoordinator::notifyWake() {
  std::function<void()> hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = wakeHook_;
  }
  if (hook) {
    hook();
  }
}

} // namespace DroidFrame
