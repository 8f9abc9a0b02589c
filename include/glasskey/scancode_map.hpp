/**
 * @file scancode_map.hpp
 * @brief Таблицы соответствия подписей клавиш и скан-кодов linux/input.h
 *
 * Constexpr таблицы: подписи из раскладки ("A", "Ret", "F5", ";") в KEY_*,
 * а также символы, которые набираются через Shift ("!" -> Shift+1).
 */

#pragma once

#include <linux/input.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace glasskey {

// ===========================================================================
// Подписи клавиш
// ===========================================================================

struct KeyNameMapping {
  std::string_view name;
  std::uint16_t code;
};

inline constexpr std::array kKeyLabels = std::to_array<KeyNameMapping>({
    {"A", KEY_A}, {"B", KEY_B}, {"C", KEY_C}, {"D", KEY_D}, {"E", KEY_E},
    {"F", KEY_F}, {"G", KEY_G}, {"H", KEY_H}, {"I", KEY_I}, {"J", KEY_J},
    {"K", KEY_K}, {"L", KEY_L}, {"M", KEY_M}, {"N", KEY_N}, {"O", KEY_O},
    {"P", KEY_P}, {"Q", KEY_Q}, {"R", KEY_R}, {"S", KEY_S}, {"T", KEY_T},
    {"U", KEY_U}, {"V", KEY_V}, {"W", KEY_W}, {"X", KEY_X}, {"Y", KEY_Y},
    {"Z", KEY_Z},
    {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4}, {"5", KEY_5},
    {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9}, {"0", KEY_0},
    {";", KEY_SEMICOLON}, {"=", KEY_EQUAL}, {",", KEY_COMMA},
    {"-", KEY_MINUS}, {".", KEY_DOT}, {"/", KEY_SLASH}, {"`", KEY_GRAVE},
    {"[", KEY_LEFTBRACE}, {"\\", KEY_BACKSLASH}, {"]", KEY_RIGHTBRACE},
    {"'", KEY_APOSTROPHE},
    {"Space", KEY_SPACE},
    {"Back", KEY_BACKSPACE}, {"Backspace", KEY_BACKSPACE},
    {"Ret", KEY_ENTER}, {"Enter", KEY_ENTER},
    {"Tab", KEY_TAB},
    {"Esc", KEY_ESC}, {"Escape", KEY_ESC},
    {"Delete", KEY_DELETE}, {"Del", KEY_DELETE},
    {"Insert", KEY_INSERT}, {"Ins", KEY_INSERT},
    {"Home", KEY_HOME}, {"End", KEY_END},
    {"PageUp", KEY_PAGEUP}, {"PgUp", KEY_PAGEUP},
    {"PageDown", KEY_PAGEDOWN}, {"PgDn", KEY_PAGEDOWN},
    {"Left", KEY_LEFT}, {"Right", KEY_RIGHT}, {"Up", KEY_UP},
    {"Down", KEY_DOWN},
    {"CapsLock", KEY_CAPSLOCK},
    {"F1", KEY_F1}, {"F2", KEY_F2}, {"F3", KEY_F3}, {"F4", KEY_F4},
    {"F5", KEY_F5}, {"F6", KEY_F6}, {"F7", KEY_F7}, {"F8", KEY_F8},
    {"F9", KEY_F9}, {"F10", KEY_F10}, {"F11", KEY_F11}, {"F12", KEY_F12},
    {"F13", KEY_F13}, {"F14", KEY_F14}, {"F15", KEY_F15}, {"F16", KEY_F16},
    {"F17", KEY_F17}, {"F18", KEY_F18}, {"F19", KEY_F19}, {"F20", KEY_F20},
    {"F21", KEY_F21}, {"F22", KEY_F22}, {"F23", KEY_F23}, {"F24", KEY_F24},
});

/// Модификаторы
inline constexpr std::array kModifierLabels = std::to_array<KeyNameMapping>({
    {"Shift", KEY_LEFTSHIFT}, {"LShift", KEY_LEFTSHIFT},
    {"RShift", KEY_RIGHTSHIFT},
    {"Ctrl", KEY_LEFTCTRL}, {"LCtrl", KEY_LEFTCTRL},
    {"RCtrl", KEY_RIGHTCTRL},
    {"Alt", KEY_LEFTALT}, {"LAlt", KEY_LEFTALT}, {"RAlt", KEY_RIGHTALT},
    {"Win", KEY_LEFTMETA}, {"LWin", KEY_LEFTMETA}, {"RWin", KEY_RIGHTMETA},
    {"Meta", KEY_LEFTMETA},
});

/// Клавиши системного управления (громкость, яркость, медиа)
inline constexpr std::array kSystemLabels = std::to_array<KeyNameMapping>({
    {"VolUp", KEY_VOLUMEUP}, {"VolDown", KEY_VOLUMEDOWN},
    {"Mute", KEY_MUTE}, {"BrightUp", KEY_BRIGHTNESSUP},
    {"BrightDown", KEY_BRIGHTNESSDOWN}, {"PlayPause", KEY_PLAYPAUSE},
    {"NextTrack", KEY_NEXTSONG}, {"PrevTrack", KEY_PREVIOUSSONG},
});

/// Символы, набираемые через Shift
inline constexpr std::array kShiftedSymbols = std::to_array<KeyNameMapping>({
    {"!", KEY_1}, {"@", KEY_2}, {"#", KEY_3}, {"$", KEY_4}, {"%", KEY_5},
    {"^", KEY_6}, {"&", KEY_7}, {"*", KEY_8}, {"(", KEY_9}, {")", KEY_0},
    {"~", KEY_GRAVE}, {"_", KEY_MINUS}, {"+", KEY_EQUAL},
    {"{", KEY_LEFTBRACE}, {"}", KEY_RIGHTBRACE}, {"|", KEY_BACKSLASH},
    {":", KEY_SEMICOLON}, {"\"", KEY_APOSTROPHE}, {"<", KEY_COMMA},
    {">", KEY_DOT}, {"?", KEY_SLASH},
});

/// Клавиши, которые держатся нажатыми, пока палец на поверхности
inline constexpr std::array kContinuousLabels = std::to_array<std::string_view>(
    {"Space", "Back", "Backspace", "Left", "Right", "Up", "Down"});

template <std::size_t N>
[[nodiscard]] constexpr std::optional<std::uint16_t>
find_label(const std::array<KeyNameMapping, N> &table,
           std::string_view name) noexcept {
  for (const auto &mapping : table) {
    if (mapping.name == name) {
      return mapping.code;
    }
  }
  return std::nullopt;
}

/// Поиск кода клавиши по подписи (однобуквенные подписи без учёта регистра)
[[nodiscard]] constexpr std::optional<std::uint16_t>
key_label_to_code(std::string_view name) noexcept {
  if (name.size() == 1 && name[0] >= 'a' && name[0] <= 'z') {
    const char upper[1] = {static_cast<char>(name[0] - 'a' + 'A')};
    return find_label(kKeyLabels, std::string_view{upper, 1});
  }
  return find_label(kKeyLabels, name);
}

[[nodiscard]] constexpr bool is_modifier(std::uint16_t code) noexcept {
  return code == KEY_LEFTSHIFT || code == KEY_RIGHTSHIFT ||
         code == KEY_LEFTCTRL || code == KEY_RIGHTCTRL ||
         code == KEY_LEFTALT || code == KEY_RIGHTALT ||
         code == KEY_LEFTMETA || code == KEY_RIGHTMETA;
}

} // namespace glasskey
