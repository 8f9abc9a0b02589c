/**
 * @file key_action.cpp
 * @brief Разбор подписей клавиш в действия
 */

#include "glasskey/key_action.hpp"
#include "glasskey/scancode_map.hpp"

#include <algorithm>
#include <charconv>

namespace glasskey {

namespace {

KeyAction make(ActionKind kind, std::string_view label, ScanCode code = 0) {
  KeyAction a;
  a.kind = kind;
  a.label = std::string{label};
  a.code = code;
  return a;
}

KeyAction make_chord(std::string_view label, ScanCode modifier,
                     ScanCode code) {
  KeyAction a = make(ActionKind::KeyChord, label, code);
  a.modifier = modifier;
  return a;
}

KeyAction make_mouse(std::string_view label, MouseButton button) {
  KeyAction a = make(ActionKind::MouseButton, label);
  a.button = button;
  return a;
}

/// Разбирает "MO(3)" -> 3 (номер слоя приводится к 0..kMaxLayer)
std::optional<int> parse_layer_call(std::string_view label,
                                    std::string_view prefix) {
  if (!label.starts_with(prefix) || !label.ends_with(")")) {
    return std::nullopt;
  }
  std::string_view inner =
      label.substr(prefix.size(), label.size() - prefix.size() - 1);
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(inner.data(), inner.data() + inner.size(), value);
  if (ec != std::errc{} || ptr != inner.data() + inner.size()) {
    return std::nullopt;
  }
  return std::clamp(value, 0, kMaxLayer);
}

std::optional<KeyAction> resolve_mouse(std::string_view label) {
  if (label == "LClick" || label == "MouseLeft" || label == "Left Click") {
    return make_mouse(label, MouseButton::Left);
  }
  if (label == "RClick" || label == "MouseRight" || label == "Right Click") {
    return make_mouse(label, MouseButton::Right);
  }
  if (label == "MClick" || label == "MouseMiddle" ||
      label == "Middle Click") {
    return make_mouse(label, MouseButton::Middle);
  }
  return std::nullopt;
}

std::optional<KeyAction> resolve_layer(std::string_view label) {
  if (auto n = parse_layer_call(label, "MO(")) {
    KeyAction a = make(ActionKind::MomentaryLayer, label);
    a.layer = *n;
    return a;
  }
  if (auto n = parse_layer_call(label, "TO(")) {
    KeyAction a = make(ActionKind::LayerSet, label);
    a.layer = *n;
    return a;
  }
  if (auto n = parse_layer_call(label, "TG(")) {
    KeyAction a = make(ActionKind::LayerToggle, label);
    a.layer = *n;
    return a;
  }
  return std::nullopt;
}

/// "Ctrl+C", "Win+D", "Alt+Tab", "Shift+Tab"
std::optional<KeyAction> resolve_modifier_chord(std::string_view label) {
  const auto plus = label.find('+');
  if (plus == std::string_view::npos || plus == 0 ||
      plus + 1 >= label.size()) {
    return std::nullopt;
  }
  auto modifier = find_label(kModifierLabels, label.substr(0, plus));
  auto key = key_label_to_code(label.substr(plus + 1));
  if (!modifier || !key) {
    return std::nullopt;
  }
  return make_chord(label, *modifier, *key);
}

} // namespace

bool is_none_label(std::string_view label) noexcept {
  return label.empty() || label == "None";
}

KeyAction none_action() { return KeyAction{}; }

bool is_chordal_shift_label(std::string_view label) noexcept {
  return label == "Chordal Shift" || label == "Chord Shift" ||
         label == "ChordShift";
}

KeyAction resolve_action_label(std::string_view label) {
  if (is_none_label(label)) {
    return none_action();
  }

  if (auto mouse = resolve_mouse(label)) {
    return *mouse;
  }
  if (auto layer = resolve_layer(label)) {
    return *layer;
  }

  if (label == "TT" || label == "TYPE" || label == "TypingToggle" ||
      label == "Typing Toggle") {
    return make(ActionKind::TypingToggle, label);
  }
  if (label == "Voice" || label == "Dictation") {
    return make(ActionKind::VoiceToggle, label, KEY_VOICECOMMAND);
  }
  if (is_chordal_shift_label(label)) {
    return make(ActionKind::Modifier, label, KEY_LEFTSHIFT);
  }
  if (label == "EMOJI") {
    return make_chord(label, KEY_LEFTMETA, KEY_DOT);
  }

  if (auto chord = resolve_modifier_chord(label)) {
    return *chord;
  }
  if (auto shifted = find_label(kShiftedSymbols, label)) {
    return make_chord(label, KEY_LEFTSHIFT, *shifted);
  }
  if (auto modifier = find_label(kModifierLabels, label)) {
    return make(ActionKind::Modifier, label, *modifier);
  }
  if (auto system = find_label(kSystemLabels, label)) {
    return make(ActionKind::SystemControl, label, *system);
  }
  if (label == "EmDash") {
    return make(ActionKind::Key, label, KEY_MINUS);
  }

  auto code = key_label_to_code(label);
  const bool continuous =
      std::find(kContinuousLabels.begin(), kContinuousLabels.end(), label) !=
      kContinuousLabels.end();
  if (code && continuous) {
    return make(ActionKind::Continuous, label, *code);
  }
  return make(ActionKind::Key, label, code.value_or(0));
}

} // namespace glasskey
