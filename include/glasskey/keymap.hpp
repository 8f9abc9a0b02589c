/**
 * @file keymap.hpp
 * @brief Хранилище маппингов клавиш и пользовательских кнопок
 *
 * Данные хранятся по пресету раскладки, внутри - по слою (0..kMaxLayer).
 * Адресация только каноническим ключом позиции ("left:1:3").
 */

#pragma once

#include "glasskey/geometry.hpp"
#include "glasskey/key_action.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace glasskey {

inline constexpr std::string_view kDefaultLayoutName = "6x3";

/// Минимальный размер пользовательской кнопки (доля поверхности)
inline constexpr double kMinCustomButtonSize = 0.05;

/// Свободно размещённая кнопка (не привязана к сетке)
struct CustomButton {
  std::string id;
  Side side = Side::Right;
  NormalizedRect rect;
  KeyMapping mapping;

  bool operator==(const CustomButton &) const = default;
};

using LayerMappings = std::map<std::string, KeyMapping, std::less<>>;

/// Данные одного пресета раскладки
struct LayoutKeymap {
  std::array<LayerMappings, kLayerCount> mappings;
  std::array<std::vector<CustomButton>, kLayerCount> buttons;

  bool operator==(const LayoutKeymap &) const = default;
};

class KeymapStore {
public:
  KeymapStore();

  /// Хранилище с заводскими маппингами и кнопками
  [[nodiscard]] static KeymapStore create_default();

  void set_active_layout(std::string_view name);
  [[nodiscard]] const std::string &active_layout() const noexcept {
    return active_layout_;
  }

  /**
   * @brief Маппинг позиции с откатом на подпись пресета
   *
   * @param layer Слой (приводится к 0..kMaxLayer)
   * @param key Канонический ключ позиции
   * @param default_label Подпись из пресета для этой позиции
   */
  [[nodiscard]] KeyMapping resolve_mapping(int layer, std::string_view key,
                                           std::string_view default_label) const;

  /// Кнопки слоя для одной поверхности
  [[nodiscard]] std::vector<CustomButton> resolve_custom_buttons(int layer,
                                                                 Side side) const;

  void set_mapping(int layer, std::string key, KeyMapping mapping);
  bool remove_mapping(int layer, std::string_view key);

  void add_custom_button(int layer, CustomButton button);
  bool remove_custom_button(int layer, std::string_view id);

  [[nodiscard]] const LayerMappings &layer_mappings(int layer) const;
  [[nodiscard]] const std::map<std::string, LayoutKeymap, std::less<>> &
  layouts() const noexcept {
    return layouts_;
  }
  LayoutKeymap &layout_data(std::string_view name);

  /// Нормализация после загрузки: пустые подписи, размеры кнопок
  void normalize();

  bool operator==(const KeymapStore &) const = default;

private:
  [[nodiscard]] const LayoutKeymap *active_data() const;

  std::map<std::string, LayoutKeymap, std::less<>> layouts_;
  std::string active_layout_{kDefaultLayoutName};
};

/// Приводит прямоугольник кнопки к допустимым размерам внутри [0, 1]
[[nodiscard]] NormalizedRect clamp_custom_button_rect(const NormalizedRect &rect);

// ===========================================================================
// Файл раскладки
// ===========================================================================

struct KeymapLoadOutcome {
  KeymapStore store;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/// Загрузка без скрытых фолбэков
[[nodiscard]] KeymapLoadOutcome load_keymap_checked(std::filesystem::path path);

/// Best-effort: при отсутствии или порче файла возвращает заводские данные
[[nodiscard]] KeymapStore load_keymap(const std::filesystem::path &path);

/// Сериализация в строковый формат (маппинги, равные подписи пресета, опускаются)
[[nodiscard]] std::string serialize_keymap(const KeymapStore &store);

[[nodiscard]] ConfigResult save_keymap(const KeymapStore &store,
                                       const std::filesystem::path &path);

} // namespace glasskey
