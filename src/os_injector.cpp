/**
 * @file os_injector.cpp
 * @brief Исполнение команд через инжектор
 */

#include "glasskey/os_injector.hpp"

namespace glasskey {

void deliver(OsInjector &injector, const Command &c) {
  switch (c.kind) {
  case CommandKind::KeyTap:
  case CommandKind::SystemKey:
    injector.key_event(c.code, c.modifiers, true);
    injector.key_event(c.code, c.modifiers, false);
    return;
  case CommandKind::KeyDown:
  case CommandKind::ModifierDown:
    injector.key_event(c.code, c.modifiers, true);
    return;
  case CommandKind::KeyUp:
  case CommandKind::ModifierUp:
    injector.key_event(c.code, c.modifiers, false);
    return;
  case CommandKind::MouseClick:
    injector.click(c.button, c.count);
    return;
  case CommandKind::PointerMove:
    injector.pointer_move(c.dx, c.dy);
    return;
  case CommandKind::Haptic:
    injector.haptic_pulse(c.strength, c.side);
    return;
  }
}

} // namespace glasskey
