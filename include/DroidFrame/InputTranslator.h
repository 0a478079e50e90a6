#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "DroidFrame/Input.h"
#include "DroidFrame/Log.h"

namespace DroidFrame {

enum class InputStatus {
  Handled,
  Unhandled,
};

enum class CompositionState {
  Idle,
  Composing,
  Committed,
  Canceled,
};

// IME composition transitions. Committed and Canceled are transient and
// behave like Idle for the next action.
CompositionState advanceComposition(CompositionState current, CompositionAction action);

// Whether translating this key will produce toolkit input. Lets the platform
// glue answer the input queue before translation happens on the render thread.
InputStatus classifyKeyEvent(const RawKeyEvent& event);

// Converts raw platform input into toolkit events. Render thread only.
class InputTranslator {
public:
  explicit InputTranslator(const Logger& logger);

  // Pixels per point used for every event translated after this call.
  void setPixelsPerPoint(float pixelsPerPoint);
  float pixelsPerPoint() const;

  InputStatus translate(const RawMotionEvent& event, std::vector<InputEvent>& out);
  InputStatus translate(const RawKeyEvent& event, std::vector<InputEvent>& out);
  InputStatus translate(const RawTextEvent& event, std::vector<InputEvent>& out);
  InputStatus translate(const RawCompositionEvent& event, std::vector<InputEvent>& out);

  CompositionState compositionState() const;
  std::optional<char32_t> pendingAccent() const;
  // Timestamp of the newest translated event.
  std::chrono::nanoseconds lastTimestamp() const;

  // Drops a pending accent and ends an open composition, emitting a cancel.
  void reset(std::vector<InputEvent>& out);

private:
  std::chrono::nanoseconds stamp(std::chrono::nanoseconds eventTime);
  void emit(std::vector<InputEvent>& out,
            std::chrono::nanoseconds timestamp,
            Modifiers modifiers,
            InputPayload payload);
  InputStatus translateTouch(const RawMotionEvent& event,
                             TouchPhase phase,
                             bool actionPointerOnly,
                             std::chrono::nanoseconds timestamp,
                             Modifiers modifiers,
                             std::vector<InputEvent>& out);

  const Logger& logger_;
  float pixelsPerPoint_ = 1.0f;
  std::chrono::nanoseconds lastTimestamp_{0};
  CompositionState composition_ = CompositionState::Idle;
  std::optional<char32_t> pendingAccent_;
};

// Merges runs of consecutive moves of the same pointer, keeping the last.
void coalescePointerMoves(std::vector<InputEvent>& events);

} // namespace DroidFrame
