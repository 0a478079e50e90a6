#include "DroidFrame/InputTranslator.h"

#include <algorithm>
#include <string>
#include <utility>

#include "Keycodes.h"
#include "PlatformDisplayUtil.h"
#include "PlatformInputUtil.h"
#include "PlatformTimeUtil.h"

namespace DroidFrame {
namespace {

bool isMoveEvent(const InputEvent& event) {
  if (const auto* touch = std::get_if<TouchInput>(&event.payload)) {
    return touch->phase == TouchPhase::Move;
  }
  return std::holds_alternative<PointerMovedInput>(event.payload);
}

// Identity of a move for coalescing: kind, device and pointer.
struct MoveKey {
  bool touch = false;
  uint32_t deviceId = 0u;
  uint32_t pointerId = 0u;

  bool operator==(const MoveKey&) const = default;
};

MoveKey moveKey(const InputEvent& event) {
  if (const auto* touch = std::get_if<TouchInput>(&event.payload)) {
    return MoveKey{true, touch->deviceId, touch->pointerId};
  }
  return MoveKey{};
}

} // namespace

CompositionState advanceComposition(CompositionState current, CompositionAction action) {
  bool composing = current == CompositionState::Composing;
  switch (action) {
    case CompositionAction::Update:
      return CompositionState::Composing;
    case CompositionAction::Commit:
      return CompositionState::Committed;
    case CompositionAction::Cancel:
      return composing ? CompositionState::Canceled : CompositionState::Idle;
  }
  return CompositionState::Idle;
}

InputStatus classifyKeyEvent(const RawKeyEvent& event) {
  if (event.combiningAccent) {
    return InputStatus::Handled;
  }
  if (clipboardActionFromAndroidKeyCode(event.keyCode)) {
    return InputStatus::Handled;
  }
  if (keyFromAndroidKeyCode(event.keyCode)) {
    return InputStatus::Handled;
  }
  if (isPrintable(event.unicode)) {
    return InputStatus::Handled;
  }
  return InputStatus::Unhandled;
}

InputTranslator::InputTranslator(const Logger& logger) : logger_(logger) {}

void InputTranslator::setPixelsPerPoint(float pixelsPerPoint) {
  pixelsPerPoint_ = sanitizedPixelsPerPoint(pixelsPerPoint, pixelsPerPoint_);
}

float InputTranslator::pixelsPerPoint() const {
  return pixelsPerPoint_;
}

InputStatus InputTranslator::translate(const RawMotionEvent& event, std::vector<InputEvent>& out) {
  auto timestamp = stamp(event.eventTime);
  auto modifiers = modifiersFromMetaState(event.metaState);

  if (event.pointers.empty() && event.action != MotionAction::Outside) {
    logger_.warning("input: motion event without pointers");
    return InputStatus::Unhandled;
  }

  bool single = event.pointers.size() == 1u;
  switch (event.action) {
    case MotionAction::Down:
    case MotionAction::PointerDown: {
      translateTouch(event, TouchPhase::Start, true, timestamp, modifiers, out);
      if (single) {
        const auto& pointer = event.pointers.front();
        PointerButtonInput button{};
        button.position = logicalPoint(pointer.x, pointer.y, pixelsPerPoint_);
        button.pressed = true;
        emit(out, timestamp, modifiers, button);
      }
      return InputStatus::Handled;
    }
    case MotionAction::Move: {
      translateTouch(event, TouchPhase::Move, false, timestamp, modifiers, out);
      if (single) {
        const auto& pointer = event.pointers.front();
        emit(out, timestamp, modifiers,
             PointerMovedInput{logicalPoint(pointer.x, pointer.y, pixelsPerPoint_)});
      }
      return InputStatus::Handled;
    }
    case MotionAction::Up:
    case MotionAction::PointerUp: {
      translateTouch(event, TouchPhase::End, true, timestamp, modifiers, out);
      if (single) {
        const auto& pointer = event.pointers.front();
        PointerButtonInput button{};
        button.position = logicalPoint(pointer.x, pointer.y, pixelsPerPoint_);
        button.pressed = false;
        emit(out, timestamp, modifiers, button);
        emit(out, timestamp, modifiers, PointerGoneInput{});
      }
      return InputStatus::Handled;
    }
    case MotionAction::Cancel:
      return translateTouch(event, TouchPhase::Cancel, false, timestamp, modifiers, out);
    case MotionAction::Outside:
      emit(out, timestamp, modifiers, PointerGoneInput{});
      return InputStatus::Handled;
    case MotionAction::HoverMove:
      for (const auto& pointer : event.pointers) {
        if (pointer.toolType == ToolType::Mouse || pointer.toolType == ToolType::Stylus) {
          emit(out, timestamp, modifiers,
               PointerMovedInput{logicalPoint(pointer.x, pointer.y, pixelsPerPoint_)});
        }
      }
      return InputStatus::Handled;
    case MotionAction::Scroll:
      for (const auto& pointer : event.pointers) {
        MouseWheelInput wheel{};
        wheel.deltaX = normalizedScrollDelta(pointer.scrollX) / pixelsPerPoint_;
        wheel.deltaY = normalizedScrollDelta(pointer.scrollY) / pixelsPerPoint_;
        emit(out, timestamp, modifiers, wheel);
      }
      return InputStatus::Handled;
  }
  logger_.warning("input: unknown motion action");
  return InputStatus::Unhandled;
}

InputStatus InputTranslator::translate(const RawKeyEvent& event, std::vector<InputEvent>& out) {
  auto timestamp = stamp(event.eventTime);
  auto modifiers = modifiersFromMetaState(event.metaState);
  bool down = event.action != KeyAction::Up;
  bool repeat = event.repeatCount > 0u || event.action == KeyAction::Multiple;

  if (event.combiningAccent) {
    if (down) {
      pendingAccent_ = event.unicode;
    }
    return InputStatus::Handled;
  }

  if (auto clipboard = clipboardActionFromAndroidKeyCode(event.keyCode)) {
    if (down) {
      emit(out, timestamp, modifiers, ClipboardInput{*clipboard});
    }
    return InputStatus::Handled;
  }

  InputStatus status = InputStatus::Unhandled;
  if (auto key = keyFromAndroidKeyCode(event.keyCode)) {
    KeyInput input{};
    input.key = *key;
    input.pressed = down;
    input.repeat = repeat;
    emit(out, timestamp, modifiers, input);
    status = InputStatus::Handled;
  }

  if (!isPrintable(event.unicode)) {
    if (status == InputStatus::Unhandled) {
      std::string message = "input: unknown key code ";
      message += std::to_string(event.keyCode);
      logger_.warning(message);
    }
    return status;
  }
  if (!down) {
    return InputStatus::Handled;
  }
  if (modifiers.ctrl || modifiers.meta) {
    // Shortcut chords carry no text.
    pendingAccent_.reset();
    return InputStatus::Handled;
  }

  char32_t character = event.unicode;
  if (pendingAccent_) {
    char32_t accent = *pendingAccent_;
    pendingAccent_.reset();
    auto combined = combineDeadKey(accent, character);
    if (!combined) {
      std::string message = "input: no composed form for dead key U+";
      message += std::to_string(static_cast<uint32_t>(accent));
      logger_.warning(message);
      return status;
    }
    character = *combined;
  }

  TextInput text{};
  appendUtf8(text.text, character);
  emit(out, timestamp, modifiers, std::move(text));
  return InputStatus::Handled;
}

InputStatus InputTranslator::translate(const RawTextEvent& event, std::vector<InputEvent>& out) {
  auto timestamp = stamp(event.eventTime);
  if (event.text.empty()) {
    return InputStatus::Handled;
  }
  emit(out, timestamp, Modifiers{}, TextInput{event.text});
  return InputStatus::Handled;
}

InputStatus InputTranslator::translate(const RawCompositionEvent& event, std::vector<InputEvent>& out) {
  auto timestamp = stamp(event.eventTime);
  CompositionState next = advanceComposition(composition_, event.action);
  switch (next) {
    case CompositionState::Composing: {
      CompositionUpdateInput update{};
      update.preedit = event.text;
      update.selection = event.selection;
      emit(out, timestamp, Modifiers{}, std::move(update));
      composition_ = CompositionState::Composing;
      break;
    }
    case CompositionState::Committed:
      emit(out, timestamp, Modifiers{}, CompositionCommitInput{event.text});
      composition_ = CompositionState::Idle;
      break;
    case CompositionState::Canceled:
      emit(out, timestamp, Modifiers{}, CompositionCancelInput{});
      composition_ = CompositionState::Idle;
      break;
    case CompositionState::Idle:
      logger_.debug("input: composition cancel without active composition");
      composition_ = CompositionState::Idle;
      break;
  }
  return InputStatus::Handled;
}

CompositionState InputTranslator::compositionState() const {
  return composition_;
}

std::optional<char32_t> InputTranslator::pendingAccent() const {
  return pendingAccent_;
}

std::chrono::nanoseconds InputTranslator::lastTimestamp() const {
  return lastTimestamp_;
}

void InputTranslator::reset(std::vector<InputEvent>& out) {
  if (composition_ == CompositionState::Composing) {
    emit(out, lastTimestamp_, Modifiers{}, CompositionCancelInput{});
  }
  composition_ = CompositionState::Idle;
  pendingAccent_.reset();
}

std::chrono::nanoseconds InputTranslator::stamp(std::chrono::nanoseconds eventTime) {
  lastTimestamp_ = monotonicEventTime(eventTime, lastTimestamp_);
  return lastTimestamp_;
}

void InputTranslator::emit(std::vector<InputEvent>& out,
                           std::chrono::nanoseconds timestamp,
                           Modifiers modifiers,
                           InputPayload payload) {
  InputEvent event{};
  event.timestamp = timestamp;
  event.modifiers = modifiers;
  event.payload = std::move(payload);
  out.push_back(std::move(event));
}

InputStatus InputTranslator::translateTouch(const RawMotionEvent& event,
                                            TouchPhase phase,
                                            bool actionPointerOnly,
                                            std::chrono::nanoseconds timestamp,
                                            Modifiers modifiers,
                                            std::vector<InputEvent>& out) {
  size_t first = 0u;
  size_t last = event.pointers.size();
  if (actionPointerOnly && event.actionIndex < event.pointers.size()) {
    first = event.actionIndex;
    last = first + 1u;
  }
  for (size_t i = first; i < last; ++i) {
    const auto& pointer = event.pointers[i];
    TouchInput touch{};
    touch.deviceId = event.deviceId;
    touch.pointerId = pointer.pointerId;
    touch.phase = phase;
    touch.position = logicalPoint(pointer.x, pointer.y, pixelsPerPoint_);
    touch.force = normalizedPressure(pointer.pressure);
    emit(out, timestamp, modifiers, touch);
  }
  return InputStatus::Handled;
}

void coalescePointerMoves(std::vector<InputEvent>& events) {
  std::vector<InputEvent> result;
  result.reserve(events.size());
  size_t i = 0u;
  while (i < events.size()) {
    if (!isMoveEvent(events[i])) {
      result.push_back(std::move(events[i]));
      ++i;
      continue;
    }
    size_t end = i;
    while (end < events.size() && isMoveEvent(events[end])) {
      ++end;
    }
    // Keep the last move per pointer within the run, in arrival order.
    std::vector<MoveKey> seen;
    std::vector<size_t> kept;
    for (size_t j = end; j > i; --j) {
      MoveKey key = moveKey(events[j - 1u]);
      if (std::find(seen.begin(), seen.end(), key) == seen.end()) {
        seen.push_back(key);
        kept.push_back(j - 1u);
      }
    }
    std::reverse(kept.begin(), kept.end());
    for (size_t index : kept) {
      result.push_back(std::move(events[index]));
    }
    i = end;
  }
  events = std::move(result);
}

} // namespace DroidFrame
