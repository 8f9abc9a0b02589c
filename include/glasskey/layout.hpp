/**
 * @file layout.hpp
 * @brief Пресеты раскладок и построение сетки клавиш
 *
 * Раскладка - неизменяемая сетка нормализованных прямоугольников для одной
 * поверхности. Перестраивается целиком при смене пресета, колонок или
 * размеров тачпада.
 */

#pragma once

#include "glasskey/geometry.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace glasskey {

/// Размер клавиши по умолчанию (мм)
inline constexpr double kKeyWidthMm = 18.0;
inline constexpr double kKeyHeightMm = 17.0;

using LabelGrid = std::vector<std::vector<std::string>>;

struct LayoutPreset {
  std::string name;
  std::string display_name;
  int columns = 0;
  int rows = 0;
  /// Левый верхний угол первой клавиши каждой колонки (мм)
  std::vector<Point> column_anchors_mm;
  /// Подписи правой половины; левая получается зеркалированием строк
  LabelGrid right_labels;
  /// Левая поверхность без клавиш (мобильные раскладки)
  bool blank_left_side = false;
  double fixed_key_scale = 1.0;
  bool allows_column_settings = true;
  /// Сдвиг строки вправо в долях ширины клавиши
  std::vector<double> row_stagger;

  [[nodiscard]] LabelGrid left_labels() const;
};

/// Настройки одной колонки
struct ColumnSettings {
  double scale = 1.0;
  double offset_x_percent = 0.0;
  double offset_y_percent = 0.0;
  double row_spacing_percent = 0.0;
  double rotation_deg = 0.0;

  bool operator==(const ColumnSettings &) const = default;
};

/// Построенная раскладка одной поверхности
struct KeyLayout {
  std::vector<std::vector<NormalizedRect>> rects;
  LabelGrid labels;

  [[nodiscard]] bool empty() const noexcept { return rects.empty(); }
};

/// Все известные пресеты (первый - "blank")
[[nodiscard]] const std::vector<LayoutPreset> &all_presets();

/// Поиск пресета по имени без учёта регистра; по умолчанию "6x3"
[[nodiscard]] const LayoutPreset &resolve_preset(std::string_view name);

/// Колонки по умолчанию (для фиксированных пресетов - их масштаб)
[[nodiscard]] std::vector<ColumnSettings>
default_column_settings(const LayoutPreset &preset);

/**
 * @brief Строит сетку клавиш
 *
 * @param preset Пресет раскладки
 * @param pad_width_mm Ширина тачпада
 * @param pad_height_mm Высота тачпада
 * @param columns Настройки колонок (при несовпадении размера - дефолтные)
 * @param mirrored true для левой поверхности
 * @param key_spacing_percent Дополнительный зазор между клавишами, % размера
 */
[[nodiscard]] KeyLayout build_layout(const LayoutPreset &preset,
                                     double pad_width_mm, double pad_height_mm,
                                     std::span<const ColumnSettings> columns,
                                     bool mirrored,
                                     double key_spacing_percent = 0.0);

/// Канонический ключ хранения позиции: "left:1:3"
[[nodiscard]] std::string storage_key(Side side, int row, int col);

} // namespace glasskey
