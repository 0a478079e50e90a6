#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "DroidFrame/Types.h"

namespace DroidFrame {

// Raw platform input, as delivered by the activity glue in physical pixels.

enum class MotionAction {
  Down,
  PointerDown,
  Move,
  Up,
  PointerUp,
  Cancel,
  Outside,
  HoverMove,
  Scroll,
};

enum class ToolType {
  Unknown,
  Finger,
  Stylus,
  Mouse,
  Eraser,
};

struct RawPointer {
  uint32_t pointerId = 0u;
  float x = 0.0f;
  float y = 0.0f;
  float pressure = 1.0f;
  ToolType toolType = ToolType::Finger;
  float scrollX = 0.0f;
  float scrollY = 0.0f;
};

struct RawMotionEvent {
  uint32_t deviceId = 0u;
  MotionAction action = MotionAction::Move;
  uint32_t actionIndex = 0u;
  uint32_t metaState = 0u;
  std::chrono::nanoseconds eventTime{0};
  std::vector<RawPointer> pointers;
};

enum class KeyAction {
  Down,
  Up,
  Multiple,
};

struct RawKeyEvent {
  uint32_t deviceId = 0u;
  int32_t keyCode = 0;
  KeyAction action = KeyAction::Down;
  uint32_t repeatCount = 0u;
  uint32_t metaState = 0u;
  // Character produced by the key under the current meta state, 0 when none.
  char32_t unicode = 0;
  // Set when `unicode` is a dead key accent waiting for the next character.
  bool combiningAccent = false;
  std::chrono::nanoseconds eventTime{0};
};

struct RawTextEvent {
  std::string text;
  std::chrono::nanoseconds eventTime{0};
};

struct TextRange {
  uint32_t start = 0u;
  uint32_t end = 0u;
};

constexpr bool operator==(TextRange a, TextRange b) {
  return a.start == b.start && a.end == b.end;
}

enum class CompositionAction {
  Update,
  Commit,
  Cancel,
};

struct RawCompositionEvent {
  CompositionAction action = CompositionAction::Update;
  std::string text;
  std::optional<TextRange> selection;
  std::chrono::nanoseconds eventTime{0};
};

struct DisplayMetricsChanged {
  DisplayMetrics metrics{};
};

struct FocusChanged {
  bool focused = false;
};

struct LowMemoryNotice {};

using PlatformEvent = std::variant<RawMotionEvent,
                                   RawKeyEvent,
                                   RawTextEvent,
                                   RawCompositionEvent,
                                   DisplayMetricsChanged,
                                   FocusChanged,
                                   LowMemoryNotice>;

// Toolkit input vocabulary, in logical points.

struct Modifiers {
  bool shift = false;
  bool alt = false;
  bool ctrl = false;
  bool meta = false;
};

constexpr bool operator==(Modifiers a, Modifiers b) {
  return a.shift == b.shift && a.alt == b.alt && a.ctrl == b.ctrl && a.meta == b.meta;
}

struct Point {
  float x = 0.0f;
  float y = 0.0f;
};

enum class TouchPhase {
  Start,
  Move,
  End,
  Cancel,
};

struct TouchInput {
  uint32_t deviceId = 0u;
  uint32_t pointerId = 0u;
  TouchPhase phase = TouchPhase::Move;
  Point position{};
  std::optional<float> force;
};

enum class PointerButton {
  Primary,
  Secondary,
  Middle,
};

struct PointerButtonInput {
  Point position{};
  PointerButton button = PointerButton::Primary;
  bool pressed = false;
};

struct PointerMovedInput {
  Point position{};
};

struct PointerGoneInput {};

struct MouseWheelInput {
  float deltaX = 0.0f;
  float deltaY = 0.0f;
};

enum class Key {
  A, B, C, D, E, F, G, H, I, J, K, L, M,
  N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
  Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  Escape,
  Tab,
  Space,
  Enter,
  Backspace,
  Delete,
  Insert,
  Home,
  End,
  PageUp,
  PageDown,
  ArrowLeft,
  ArrowRight,
  ArrowUp,
  ArrowDown,
  Minus,
  Equals,
  Comma,
  Period,
  Slash,
};

struct KeyInput {
  Key key = Key::A;
  bool pressed = false;
  bool repeat = false;
};

struct TextInput {
  std::string text;
};

struct CompositionUpdateInput {
  std::string preedit;
  std::optional<TextRange> selection;
};

struct CompositionCommitInput {
  std::string text;
};

struct CompositionCancelInput {};

enum class ClipboardAction {
  Copy,
  Cut,
  Paste,
};

struct ClipboardInput {
  ClipboardAction action = ClipboardAction::Copy;
};

struct PasteInput {
  std::string text;
};

struct FocusInput {
  bool focused = false;
};

struct ResizeInput {
  LogicalSize size{};
  float pixelsPerPoint = 1.0f;
};

using InputPayload = std::variant<TouchInput,
                                  PointerButtonInput,
                                  PointerMovedInput,
                                  PointerGoneInput,
                                  MouseWheelInput,
                                  KeyInput,
                                  TextInput,
                                  CompositionUpdateInput,
                                  CompositionCommitInput,
                                  CompositionCancelInput,
                                  ClipboardInput,
                                  PasteInput,
                                  FocusInput,
                                  ResizeInput>;

struct InputEvent {
  std::chrono::nanoseconds timestamp{0};
  Modifiers modifiers{};
  InputPayload payload;
};

} // namespace DroidFrame
