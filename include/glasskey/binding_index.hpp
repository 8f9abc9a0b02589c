/**
 * @file binding_index.hpp
 * @brief Индекс привязок клавиш одной поверхности для быстрого хит-теста
 *
 * Привязки строятся из раскладки, активного слоя и хранилища маппингов при
 * каждой смене конфигурации. Поиск идёт через сетку корзин 10x12.
 */

#pragma once

#include "glasskey/geometry.hpp"
#include "glasskey/key_action.hpp"
#include "glasskey/keymap.hpp"
#include "glasskey/layout.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace glasskey {

/// Производная привязка (не сохраняется)
struct KeyBinding {
  NormalizedRect rect;
  std::string label;
  KeyAction action;
  std::optional<KeyAction> hold;
  Side side = Side::Right;
  /// Позиция в сетке; -1 для пользовательских кнопок
  int row = -1;
  int col = -1;
  std::string storage_key;
};

class BindingIndex {
public:
  static constexpr int kBucketRows = 10;
  static constexpr int kBucketColumns = 12;

  BindingIndex() = default;

  /**
   * @brief Строит индекс: сначала сетка (построчно), затем кнопки слоя
   *
   * @param side Поверхность
   * @param layout Сетка клавиш этой поверхности
   * @param keymap Хранилище маппингов
   * @param layer Активный слой
   * @param snap_fraction Радиус примагничивания в долях размера клавиши
   */
  [[nodiscard]] static BindingIndex build(Side side, const KeyLayout &layout,
                                          const KeymapStore &keymap, int layer,
                                          double snap_fraction);

  /**
   * @brief Привязка, содержащая точку
   *
   * Среди перекрывающихся выигрывает та, у которой точка дальше от края;
   * при равной глубине - меньшая по площади.
   */
  [[nodiscard]] const KeyBinding *hit_test(Point p) const;

  /**
   * @brief Примагничивание точки вне клавиш к ближайшей клавише
   *
   * Кандидат должен лежать не дальше snap_fraction * min(w, h) от своего
   * прямоугольника. Если второй по близости центр почти так же близок
   * (в пределах ambiguity_ratio), побеждает меньшее расстояние до края.
   */
  [[nodiscard]] const KeyBinding *try_snap(Point p,
                                           double ambiguity_ratio) const;

  [[nodiscard]] std::span<const KeyBinding> bindings() const noexcept {
    return bindings_;
  }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }
  [[nodiscard]] std::size_t snap_candidates() const noexcept {
    return snap_.size();
  }

private:
  struct SnapEntry {
    std::size_t binding = 0;
    Point center;
    double reach = 0.0;
  };

  [[nodiscard]] static int bucket_index(double value, int count) noexcept;

  std::vector<KeyBinding> bindings_;
  std::vector<SnapEntry> snap_;
  std::vector<std::vector<std::size_t>> buckets_;
};

} // namespace glasskey
