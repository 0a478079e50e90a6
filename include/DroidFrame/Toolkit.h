#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "DroidFrame/Input.h"
#include "DroidFrame/Surface.h"
#include "DroidFrame/Types.h"

namespace DroidFrame {

struct FrameInput {
  std::span<const InputEvent> events;
  LogicalSize screenSize{};
  float pixelsPerPoint = 1.0f;
  bool focused = false;
  Theme theme = Theme::Unknown;
  PixelInsets contentInsets{};
  FrameTiming timing{};
};

enum class RepaintMode {
  OnInput,
  AtDeadline,
  Continuous,
};

struct RepaintHint {
  RepaintMode mode = RepaintMode::OnInput;
  std::chrono::steady_clock::time_point deadline{};
};

struct TextInputState {
  std::string text;
  TextRange selection{};
  std::optional<TextRange> compositionRegion;
};

struct CopyTextCommand {
  std::string text;
};

struct OpenUrlCommand {
  std::string url;
};

struct RequestPasteCommand {};

struct RequestCloseCommand {};

struct SetFullscreenCommand {
  bool fullscreen = false;
};

using PlatformCommand = std::variant<CopyTextCommand,
                                     OpenUrlCommand,
                                     RequestPasteCommand,
                                     RequestCloseCommand,
                                     SetFullscreenCommand>;

struct FrameOutput {
  DrawOutput draw{};
  RepaintHint repaint{};
  // Skip presentation and run another pass right away.
  bool discard = false;
  bool wantsKeyboard = false;
  std::optional<TextInputState> textInputState;
  std::vector<PlatformCommand> commands;
};

// The immediate mode GUI toolkit. Only ever called from the render thread,
// one call at a time.
class Toolkit {
public:
  virtual ~Toolkit() = default;

  virtual BackendResult<FrameOutput> update(const FrameInput& input) = 0;
  virtual BackendResult<PersistedState> saveState() = 0;
  virtual void restoreState(std::span<const uint8_t> bytes) = 0;
  virtual void onLowMemory() {}
};

// Platform facilities the toolkit output can ask for.
class PlatformServices {
public:
  virtual ~PlatformServices() = default;

  virtual void setSoftKeyboardVisible(bool visible) = 0;
  virtual void setTextInputState(const TextInputState& state) = 0;
  virtual BackendStatus copyText(Utf8TextView text) = 0;
  virtual BackendResult<std::string> clipboardText() = 0;
  virtual BackendStatus openUrl(Utf8TextView url) = 0;
  virtual void setFullscreen(bool fullscreen) = 0;
  virtual void requestFinish() = 0;
};

} // namespace DroidFrame
