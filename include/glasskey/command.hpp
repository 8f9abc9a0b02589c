/**
 * @file command.hpp
 * @brief Команды движка для инжектора событий ОС
 */

#pragma once

#include "glasskey/key_action.hpp"
#include "glasskey/types.hpp"

#include <cstdint>
#include <string_view>

namespace glasskey {

/// Маска модификаторов, зажимаемых вокруг клавиши
enum ModifierBits : std::uint8_t {
  kModShift = 1 << 0,
  kModCtrl = 1 << 1,
  kModAlt = 1 << 2,
  kModMeta = 1 << 3,
};

using ModifierMask = std::uint8_t;

[[nodiscard]] constexpr ModifierMask modifier_bit(ScanCode code) noexcept {
  switch (code) {
  case KEY_LEFTSHIFT:
  case KEY_RIGHTSHIFT:
    return kModShift;
  case KEY_LEFTCTRL:
  case KEY_RIGHTCTRL:
    return kModCtrl;
  case KEY_LEFTALT:
  case KEY_RIGHTALT:
    return kModAlt;
  case KEY_LEFTMETA:
  case KEY_RIGHTMETA:
    return kModMeta;
  default:
    return 0;
  }
}

enum class CommandKind : std::uint8_t {
  KeyTap,
  KeyDown,
  KeyUp,
  ModifierDown,
  ModifierUp,
  MouseClick,
  PointerMove,
  Haptic,
  SystemKey
};

[[nodiscard]] constexpr std::string_view
command_kind_name(CommandKind kind) noexcept {
  switch (kind) {
  case CommandKind::KeyTap:
    return "key-tap";
  case CommandKind::KeyDown:
    return "key-down";
  case CommandKind::KeyUp:
    return "key-up";
  case CommandKind::ModifierDown:
    return "modifier-down";
  case CommandKind::ModifierUp:
    return "modifier-up";
  case CommandKind::MouseClick:
    return "mouse-click";
  case CommandKind::PointerMove:
    return "pointer-move";
  case CommandKind::Haptic:
    return "haptic";
  case CommandKind::SystemKey:
    return "system-key";
  }
  return "unknown";
}

struct Command {
  CommandKind kind = CommandKind::KeyTap;
  ScanCode code = 0;
  ModifierMask modifiers = 0;
  MouseButton button = MouseButton::Left;
  int count = 1;
  int dx = 0;
  int dy = 0;
  /// Сила хаптика 0..1
  double strength = 0.0;
  Side side = Side::Left;
  double timestamp = 0.0;

  bool operator==(const Command &) const = default;
};

/// Приёмник команд движка
class CommandSink {
public:
  virtual ~CommandSink() = default;
  virtual void submit(const Command &command) = 0;
};

} // namespace glasskey
