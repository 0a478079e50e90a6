#pragma once

#include <cstdint>
#include <optional>

#include "DroidFrame/Input.h"

namespace DroidFrame {

// AKEYCODE_* values from android/keycodes.h.
namespace AndroidKey {
constexpr int32_t Back = 4;
constexpr int32_t Num0 = 7;
constexpr int32_t Num9 = 16;
constexpr int32_t DpadUp = 19;
constexpr int32_t DpadDown = 20;
constexpr int32_t DpadLeft = 21;
constexpr int32_t DpadRight = 22;
constexpr int32_t A = 29;
constexpr int32_t Z = 54;
constexpr int32_t Comma = 55;
constexpr int32_t Period = 56;
constexpr int32_t Tab = 61;
constexpr int32_t Space = 62;
constexpr int32_t Enter = 66;
constexpr int32_t Del = 67;
constexpr int32_t Minus = 69;
constexpr int32_t Equals = 70;
constexpr int32_t Slash = 76;
constexpr int32_t PageUp = 92;
constexpr int32_t PageDown = 93;
constexpr int32_t Escape = 111;
constexpr int32_t ForwardDel = 112;
constexpr int32_t MoveHome = 122;
constexpr int32_t MoveEnd = 123;
constexpr int32_t Insert = 124;
constexpr int32_t F1 = 131;
constexpr int32_t F12 = 142;
constexpr int32_t Numpad0 = 144;
constexpr int32_t Numpad9 = 153;
constexpr int32_t NumpadSubtract = 156;
constexpr int32_t NumpadEnter = 160;
constexpr int32_t NumpadEquals = 161;
constexpr int32_t Cut = 277;
constexpr int32_t Copy = 278;
constexpr int32_t Paste = 279;
} // namespace AndroidKey

std::optional<Key> keyFromAndroidKeyCode(int32_t keyCode);
std::optional<ClipboardAction> clipboardActionFromAndroidKeyCode(int32_t keyCode);

// Precomposed character for a dead key accent followed by `base`.
std::optional<char32_t> combineDeadKey(char32_t accent, char32_t base);

// Character for keys whose glyph does not depend on the keyboard layout,
// used when the platform gives no key character map.
char32_t fallbackUnicodeForKeyCode(int32_t keyCode, uint32_t metaState);

} // namespace DroidFrame
