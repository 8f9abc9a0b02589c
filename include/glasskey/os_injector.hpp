/**
 * @file os_injector.hpp
 * @brief Интерфейс инжектора событий ОС
 *
 * Ядро только вызывает эти методы; конкретный механизм (uinput, stdout)
 * реализуется отдельно.
 */

#pragma once

#include "glasskey/command.hpp"

namespace glasskey {

class OsInjector {
public:
  virtual ~OsInjector() = default;

  /// Клавиша; modifiers зажимаются до нажатия и отпускаются после отпускания
  virtual void key_event(ScanCode code, ModifierMask modifiers, bool down) = 0;
  virtual void pointer_move(int dx, int dy) = 0;
  virtual void click(MouseButton button, int count) = 0;
  virtual void haptic_pulse(double strength, Side device) = 0;
};

/// Исполняет одну команду через инжектор
void deliver(OsInjector &injector, const Command &command);

} // namespace glasskey
