#include "Keycodes.h"

#include <array>

#include "PlatformInputUtil.h"

namespace DroidFrame {
namespace {

struct KeyMapping {
  int32_t keyCode = 0;
  Key key = Key::A;
};

constexpr std::array<KeyMapping, 23> kSingleKeys{{
    {AndroidKey::DpadUp, Key::ArrowUp},
    {AndroidKey::DpadDown, Key::ArrowDown},
    {AndroidKey::DpadLeft, Key::ArrowLeft},
    {AndroidKey::DpadRight, Key::ArrowRight},
    {AndroidKey::Comma, Key::Comma},
    {AndroidKey::Period, Key::Period},
    {AndroidKey::Tab, Key::Tab},
    {AndroidKey::Space, Key::Space},
    {AndroidKey::Enter, Key::Enter},
    {AndroidKey::Del, Key::Backspace},
    {AndroidKey::Minus, Key::Minus},
    {AndroidKey::Equals, Key::Equals},
    {AndroidKey::Slash, Key::Slash},
    {AndroidKey::PageUp, Key::PageUp},
    {AndroidKey::PageDown, Key::PageDown},
    {AndroidKey::Escape, Key::Escape},
    {AndroidKey::ForwardDel, Key::Delete},
    {AndroidKey::MoveHome, Key::Home},
    {AndroidKey::MoveEnd, Key::End},
    {AndroidKey::Insert, Key::Insert},
    {AndroidKey::NumpadSubtract, Key::Minus},
    {AndroidKey::NumpadEnter, Key::Enter},
    {AndroidKey::NumpadEquals, Key::Equals},
}};

struct DeadKeyEntry {
  char32_t accent = 0;
  char32_t base = 0;
  char32_t composed = 0;
};

constexpr char32_t kGrave = 0x0300;
constexpr char32_t kAcute = 0x0301;
constexpr char32_t kCircumflex = 0x0302;
constexpr char32_t kTilde = 0x0303;
constexpr char32_t kDiaeresis = 0x0308;

constexpr std::array<DeadKeyEntry, 59> kDeadKeys{{
    {kGrave, U' ', U'`'},
    {kGrave, U'a', 0x00E0}, {kGrave, U'e', 0x00E8}, {kGrave, U'i', 0x00EC},
    {kGrave, U'o', 0x00F2}, {kGrave, U'u', 0x00F9},
    {kGrave, U'A', 0x00C0}, {kGrave, U'E', 0x00C8}, {kGrave, U'I', 0x00CC},
    {kGrave, U'O', 0x00D2}, {kGrave, U'U', 0x00D9},
    {kAcute, U' ', 0x00B4},
    {kAcute, U'a', 0x00E1}, {kAcute, U'e', 0x00E9}, {kAcute, U'i', 0x00ED},
    {kAcute, U'o', 0x00F3}, {kAcute, U'u', 0x00FA}, {kAcute, U'y', 0x00FD},
    {kAcute, U'A', 0x00C1}, {kAcute, U'E', 0x00C9}, {kAcute, U'I', 0x00CD},
    {kAcute, U'O', 0x00D3}, {kAcute, U'U', 0x00DA}, {kAcute, U'Y', 0x00DD},
    {kCircumflex, U' ', U'^'},
    {kCircumflex, U'a', 0x00E2}, {kCircumflex, U'e', 0x00EA}, {kCircumflex, U'i', 0x00EE},
    {kCircumflex, U'o', 0x00F4}, {kCircumflex, U'u', 0x00FB},
    {kCircumflex, U'A', 0x00C2}, {kCircumflex, U'E', 0x00CA}, {kCircumflex, U'I', 0x00CE},
    {kCircumflex, U'O', 0x00D4}, {kCircumflex, U'U', 0x00DB},
    {kTilde, U' ', U'~'},
    {kTilde, U'a', 0x00E3}, {kTilde, U'n', 0x00F1}, {kTilde, U'o', 0x00F5},
    {kTilde, U'A', 0x00C3}, {kTilde, U'N', 0x00D1}, {kTilde, U'O', 0x00D5},
    {kDiaeresis, U' ', 0x00A8},
    {kDiaeresis, U'a', 0x00E4}, {kDiaeresis, U'e', 0x00EB}, {kDiaeresis, U'i', 0x00EF},
    {kDiaeresis, U'o', 0x00F6}, {kDiaeresis, U'u', 0x00FC}, {kDiaeresis, U'y', 0x00FF},
    {kDiaeresis, U'A', 0x00C4}, {kDiaeresis, U'E', 0x00CB}, {kDiaeresis, U'I', 0x00CF},
    {kDiaeresis, U'O', 0x00D6}, {kDiaeresis, U'U', 0x00DC},
    {kGrave, kGrave, U'`'},
    {kAcute, kAcute, 0x00B4},
    {kCircumflex, kCircumflex, U'^'},
    {kTilde, kTilde, U'~'},
    {kDiaeresis, kDiaeresis, 0x00A8},
}};

} // namespace

std::optional<Key> keyFromAndroidKeyCode(int32_t keyCode) {
  if (keyCode >= AndroidKey::A && keyCode <= AndroidKey::Z) {
    return static_cast<Key>(static_cast<int32_t>(Key::A) + (keyCode - AndroidKey::A));
  }
  if (keyCode >= AndroidKey::Num0 && keyCode <= AndroidKey::Num9) {
    return static_cast<Key>(static_cast<int32_t>(Key::Num0) + (keyCode - AndroidKey::Num0));
  }
  if (keyCode >= AndroidKey::Numpad0 && keyCode <= AndroidKey::Numpad9) {
    return static_cast<Key>(static_cast<int32_t>(Key::Num0) + (keyCode - AndroidKey::Numpad0));
  }
  if (keyCode >= AndroidKey::F1 && keyCode <= AndroidKey::F12) {
    return static_cast<Key>(static_cast<int32_t>(Key::F1) + (keyCode - AndroidKey::F1));
  }
  for (const auto& mapping : kSingleKeys) {
    if (mapping.keyCode == keyCode) {
      return mapping.key;
    }
  }
  return std::nullopt;
}

std::optional<ClipboardAction> clipboardActionFromAndroidKeyCode(int32_t keyCode) {
  switch (keyCode) {
    case AndroidKey::Copy:
      return ClipboardAction::Copy;
    case AndroidKey::Cut:
      return ClipboardAction::Cut;
    case AndroidKey::Paste:
      return ClipboardAction::Paste;
    default:
      return std::nullopt;
  }
}

std::optional<char32_t> combineDeadKey(char32_t accent, char32_t base) {
  for (const auto& entry : kDeadKeys) {
    if (entry.accent == accent && entry.base == base) {
      return entry.composed;
    }
  }
  return std::nullopt;
}

char32_t fallbackUnicodeForKeyCode(int32_t keyCode, uint32_t metaState) {
  bool shift = (metaState & kMetaShiftOn) != 0u;
  if (keyCode >= AndroidKey::A && keyCode <= AndroidKey::Z) {
    char32_t base = shift ? U'A' : U'a';
    return base + static_cast<char32_t>(keyCode - AndroidKey::A);
  }
  if (!shift && keyCode >= AndroidKey::Num0 && keyCode <= AndroidKey::Num9) {
    return U'0' + static_cast<char32_t>(keyCode - AndroidKey::Num0);
  }
  if (keyCode >= AndroidKey::Numpad0 && keyCode <= AndroidKey::Numpad9) {
    return U'0' + static_cast<char32_t>(keyCode - AndroidKey::Numpad0);
  }
  switch (keyCode) {
    case AndroidKey::Space:
      return U' ';
    case AndroidKey::Comma:
      return shift ? U'<' : U',';
    case AndroidKey::Period:
      return shift ? U'>' : U'.';
    case AndroidKey::Minus:
    case AndroidKey::NumpadSubtract:
      return U'-';
    case AndroidKey::Equals:
      return shift ? U'+' : U'=';
    case AndroidKey::Slash:
      return shift ? U'?' : U'/';
    default:
      return 0;
  }
}

} // namespace DroidFrame
