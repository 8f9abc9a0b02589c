/**
 * @file test_support.hpp
 * @brief CHECK и построители кадров для тестов
 */

#pragma once

#include "glasskey/command.hpp"
#include "glasskey/engine.hpp"
#include "glasskey/types.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

namespace glasskey::test {

[[noreturn]] inline void test_fail(const char *expr, const char *file,
                                   int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

/// Запоминает все команды движка
class RecordingSink final : public CommandSink {
public:
  void submit(const Command &command) override { commands.push_back(command); }

  [[nodiscard]] std::size_t count(CommandKind kind) const {
    return static_cast<std::size_t>(
        std::count_if(commands.begin(), commands.end(),
                      [&](const Command &c) { return c.kind == kind; }));
  }

  [[nodiscard]] std::size_t count(CommandKind kind, ScanCode code) const {
    return static_cast<std::size_t>(std::count_if(
        commands.begin(), commands.end(),
        [&](const Command &c) { return c.kind == kind && c.code == code; }));
  }

  [[nodiscard]] std::size_t clicks(MouseButton button) const {
    return static_cast<std::size_t>(std::count_if(
        commands.begin(), commands.end(), [&](const Command &c) {
          return c.kind == CommandKind::MouseClick && c.button == button;
        }));
  }

  std::vector<Command> commands;
};

inline Contact touch(std::uint32_t id, double x, double y,
                     float pressure = 0.0f,
                     ContactState state = ContactState::Touching) {
  Contact c;
  c.id = id;
  c.x = x;
  c.y = y;
  c.pressure = pressure;
  c.state = state;
  return c;
}

inline Contact touch(std::uint32_t id, Point p, float pressure = 0.0f) {
  return touch(id, p.x, p.y, pressure);
}

inline RawTouchFrame frame(Side side, double t,
                           std::vector<Contact> contacts = {}) {
  RawTouchFrame f;
  f.side = side;
  f.timestamp = t;
  f.contacts = std::move(contacts);
  return f;
}

/// Привязка по ключу позиции ("right:0:0", "custom:<id>")
inline const KeyBinding *find_binding(const TouchEngine &engine, Side side,
                                      std::string_view key) {
  for (const KeyBinding &b : engine.bindings(side)) {
    if (b.storage_key == key) {
      return &b;
    }
  }
  return nullptr;
}

/// Раскладка без клавиш: вся поверхность свободна для жестов и указателя
inline EngineConfig blank_config() {
  EngineConfig config;
  config.layout_preset = "blank";
  return config;
}

} // namespace glasskey::test

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::glasskey::test::test_fail(#expr, __FILE__, __LINE__);                  \
    }                                                                          \
  } while (0)
