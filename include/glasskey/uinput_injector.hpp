/**
 * @file uinput_injector.hpp
 * @brief Генератор событий ввода через uinput
 */

#pragma once

#include "glasskey/os_injector.hpp"

#include <linux/input.h>

#include <atomic>
#include <cstddef>
#include <span>

namespace glasskey {

/// Куда писать события
enum class InjectorTarget {
  Uinput, // Собственное виртуальное устройство /dev/uinput
  Stdout  // Сырые input_event в stdout (для пайпа в `uinput -d`)
};

/**
 * @brief Виртуальная клавиатура + мышь
 *
 * Все записи идут одним системным вызовом на пачку (событие + SYN).
 * Неполная запись в устройство фатальна: половина нажатия оставила бы
 * клавишу залипшей в системе.
 */
class UinputInjector final : public OsInjector {
public:
  explicit UinputInjector(InjectorTarget target) noexcept;
  ~UinputInjector() override;

  UinputInjector(const UinputInjector &) = delete;
  UinputInjector &operator=(const UinputInjector &) = delete;

  /**
   * @brief Открывает /dev/uinput и создаёт устройство (для Stdout - no-op)
   * @return true если устройство готово
   */
  [[nodiscard]] bool open();

  void close() noexcept;

  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

  void key_event(ScanCode code, ModifierMask modifiers, bool down) override;
  void pointer_move(int dx, int dy) override;
  void click(MouseButton button, int count) override;
  void haptic_pulse(double strength, Side device) override;

  /// Отпускает все модификаторы (при сбросе и выходе)
  void release_all_modifiers();

private:
  void emit_events(std::span<const input_event> events) const;
  void send(std::uint16_t type, std::uint16_t code, std::int32_t value) const;
  void press_modifiers(ModifierMask mask, bool down);
  void send_button(MouseButton button, bool down) const;

  static void write_all_or_die(int fd, const void *data, std::size_t bytes);

  InjectorTarget target_;
  int fd_ = -1;
  ModifierMask held_modifiers_ = 0;
  std::atomic<bool> haptic_warned_{false};
};

} // namespace glasskey
