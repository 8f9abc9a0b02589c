/**
 * @file types.hpp
 * @brief Базовые типы и структуры данных glasskey
 *
 * Кадры касаний, состояния контактов, стороны тачпадов и коды результатов.
 * Все координаты контактов нормализованы в [0, 1], начало отсчёта в левом
 * верхнем углу поверхности.
 */

#pragma once

#include <linux/input.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace glasskey {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/glasskey/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/glasskey/config.yaml";

/// Путь к пользовательской раскладке клавиш (относительно $HOME)
inline constexpr std::string_view kUserKeymapRelPath =
    ".config/glasskey/keymap.conf";

/// Максимальный номер слоя (слой 0 всегда базовый)
inline constexpr int kMaxLayer = 7;
inline constexpr std::size_t kLayerCount = kMaxLayer + 1;

/// Физический размер тачпада по умолчанию (мм)
inline constexpr double kDefaultPadWidthMm = 160.0;
inline constexpr double kDefaultPadHeightMm = 114.9;

// ===========================================================================
// Стороны и контакты
// ===========================================================================

/// Скан-код клавиши (обёртка над linux/input.h константами)
using ScanCode = std::uint16_t;

/// Логическая роль поверхности
enum class Side : std::uint8_t { Left = 0, Right = 1 };

inline constexpr std::size_t kSideCount = 2;
inline constexpr std::array<Side, kSideCount> kSides{Side::Left, Side::Right};

[[nodiscard]] constexpr std::size_t side_index(Side side) noexcept {
  return static_cast<std::size_t>(side);
}

[[nodiscard]] constexpr Side other_side(Side side) noexcept {
  return side == Side::Left ? Side::Right : Side::Left;
}

[[nodiscard]] constexpr std::string_view side_name(Side side) noexcept {
  return side == Side::Left ? "left" : "right";
}

/// Жизненный цикл контакта (порядок значений фиксирован форматом захвата)
enum class ContactState : std::uint8_t {
  NotTouching = 0,
  Starting = 1,
  Hovering = 2,
  Making = 3,
  Touching = 4,
  Breaking = 5,
  Lingering = 6,
  Leaving = 7
};

/// Контакт лежит на поверхности (участвует в распознавании)
[[nodiscard]] constexpr bool is_tip_state(ContactState s) noexcept {
  return s == ContactState::Starting || s == ContactState::Making ||
         s == ContactState::Touching || s == ContactState::Lingering;
}

/// Переходное состояние: читателю стоит дождаться более стабильного кадра
[[nodiscard]] constexpr bool is_transitional_state(ContactState s) noexcept {
  return s == ContactState::Starting || s == ContactState::Breaking ||
         s == ContactState::Leaving;
}

struct Point {
  double x = 0.0;
  double y = 0.0;

  constexpr bool operator==(const Point &) const noexcept = default;
};

/// Один контакт в кадре
struct Contact {
  std::uint32_t id = 0;
  double x = 0.0;
  double y = 0.0;
  float major_axis = 0.0f;
  float minor_axis = 0.0f;
  float pressure = 0.0f;
  float angle = 0.0f;
  float density = 0.0f;
  ContactState state = ContactState::NotTouching;

  [[nodiscard]] constexpr Point position() const noexcept { return {x, y}; }

  bool operator==(const Contact &) const noexcept = default;
};

/// Сырой кадр от одной поверхности
struct RawTouchFrame {
  Side side = Side::Left;
  /// Монотонное время кадра в секундах
  double timestamp = 0.0;
  std::vector<Contact> contacts;

  bool operator==(const RawTouchFrame &) const = default;
};

/// Приводит координату к [0, 1]
[[nodiscard]] constexpr double clamp_unit(double v) noexcept {
  return std::clamp(v, 0.0, 1.0);
}

/// Монотонное время в секундах (та же шкала, что и у кадров evdev)
[[nodiscard]] inline double monotonic_seconds() noexcept {
  using namespace std::chrono;
  return duration<double>(steady_clock::now().time_since_epoch()).count();
}

/// Нормализует координаты контактов кадра
inline void clamp_contacts(RawTouchFrame &frame) noexcept {
  for (auto &c : frame.contacts) {
    c.x = clamp_unit(c.x);
    c.y = clamp_unit(c.y);
  }
}

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Результат операций захвата и воспроизведения
enum class CaptureResult {
  Ok,
  IoError,
  InvalidFormat,
  UnsupportedVersion,
  CaptureActive,
  CaptureNotActive,
  ReplayActive,
  ReplayNotLoaded
};

[[nodiscard]] constexpr std::string_view
capture_result_name(CaptureResult r) noexcept {
  switch (r) {
  case CaptureResult::Ok:
    return "ok";
  case CaptureResult::IoError:
    return "i/o error";
  case CaptureResult::InvalidFormat:
    return "invalid capture format";
  case CaptureResult::UnsupportedVersion:
    return "unsupported capture version";
  case CaptureResult::CaptureActive:
    return "capture already active";
  case CaptureResult::CaptureNotActive:
    return "capture not active";
  case CaptureResult::ReplayActive:
    return "replay session active";
  case CaptureResult::ReplayNotLoaded:
    return "no replay session loaded";
  }
  return "unknown";
}

} // namespace glasskey
