/**
 * @file key_action.hpp
 * @brief Действия клавиш и жестов
 *
 * KeyAction - неизменяемое значение с человекочитаемой подписью.
 * Сравнивается структурно: это позволяет отличить "всё ещё дефолтный"
 * маппинг от пользовательского и не сохранять лишнее.
 */

#pragma once

#include "glasskey/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace glasskey {

// ===========================================================================
// Виды действий
// ===========================================================================

enum class ActionKind : std::uint8_t {
  None,
  Key,            // Обычная клавиша (тап)
  Continuous,     // Клавиша удерживается, пока палец на поверхности
  Modifier,       // Модификатор (в т.ч. Chordal Shift)
  KeyChord,       // Модификатор + клавиша (Ctrl+C, "!")
  MouseButton,    // Клик мыши
  MomentaryLayer, // MO(n): слой активен, пока контакт держится
  LayerSet,       // TO(n): постоянное переключение слоя
  LayerToggle,    // TG(n): переключение туда и обратно
  TypingToggle,   // Вкл/выкл режим печати
  VoiceToggle,    // Старт/стоп голосового ввода
  SystemControl   // Громкость, яркость, медиа
};

enum class MouseButton : std::uint8_t { Left, Right, Middle };

[[nodiscard]] constexpr std::string_view
action_kind_name(ActionKind kind) noexcept {
  switch (kind) {
  case ActionKind::None:
    return "none";
  case ActionKind::Key:
    return "key";
  case ActionKind::Continuous:
    return "continuous";
  case ActionKind::Modifier:
    return "modifier";
  case ActionKind::KeyChord:
    return "chord";
  case ActionKind::MouseButton:
    return "mouse";
  case ActionKind::MomentaryLayer:
    return "momentary-layer";
  case ActionKind::LayerSet:
    return "layer-set";
  case ActionKind::LayerToggle:
    return "layer-toggle";
  case ActionKind::TypingToggle:
    return "typing-toggle";
  case ActionKind::VoiceToggle:
    return "voice";
  case ActionKind::SystemControl:
    return "system";
  }
  return "unknown";
}

struct KeyAction {
  ActionKind kind = ActionKind::None;
  std::string label = "None";
  /// Основной скан-код (Key, Continuous, Modifier, KeyChord, SystemControl)
  ScanCode code = 0;
  /// Модификатор аккорда (KeyChord)
  ScanCode modifier = 0;
  /// Целевой слой (MomentaryLayer, LayerSet, LayerToggle)
  int layer = 0;
  MouseButton button = MouseButton::Left;

  bool operator==(const KeyAction &) const = default;
};

/// Маппинг позиции: основное действие и необязательное действие удержания
struct KeyMapping {
  KeyAction primary;
  std::optional<KeyAction> hold;

  bool operator==(const KeyMapping &) const = default;
};

// ===========================================================================
// Разбор подписей
// ===========================================================================

/**
 * @brief Преобразует подпись в действие
 *
 * Неизвестная подпись даёт Key с кодом 0 (ничего не отправляет).
 *
 * @param label Подпись ("A", "Ctrl+C", "MO(1)", "Left Click", ...)
 * @return Разрешённое действие
 */
[[nodiscard]] KeyAction resolve_action_label(std::string_view label);

/// Подпись "None" или пустая строка
[[nodiscard]] bool is_none_label(std::string_view label) noexcept;

[[nodiscard]] KeyAction none_action();

/// Подпись аккордового Shift ("Chordal Shift" и синонимы)
[[nodiscard]] bool is_chordal_shift_label(std::string_view label) noexcept;

/// Действия, к которым разрешено "примагничивание" (snap)
[[nodiscard]] constexpr bool is_snappable(ActionKind kind) noexcept {
  return kind == ActionKind::Key || kind == ActionKind::Continuous ||
         kind == ActionKind::Modifier || kind == ActionKind::KeyChord;
}

/// Касание такой клавиши однозначно означает печать, а не мышь
[[nodiscard]] constexpr bool is_keyboard_anchor(ActionKind kind) noexcept {
  return kind == ActionKind::Modifier || kind == ActionKind::Continuous ||
         kind == ActionKind::MomentaryLayer || kind == ActionKind::KeyChord;
}

/// Действия, после которых продлевается окно печати (typing grace)
[[nodiscard]] constexpr bool extends_typing_grace(ActionKind kind) noexcept {
  return kind == ActionKind::Key || kind == ActionKind::Continuous ||
         kind == ActionKind::Modifier || kind == ActionKind::MouseButton ||
         kind == ActionKind::KeyChord;
}

} // namespace glasskey
