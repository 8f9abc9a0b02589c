/**
 * @file geometry.hpp
 * @brief Геометрия хит-теста: нормализованные прямоугольники с поворотом
 *
 * Прямоугольник задаётся в нормализованных координатах поверхности.
 * При построении предвычисляются центр, полуразмеры, sin/cos поворота и
 * охватывающий axis-aligned бокс, поэтому проверки попадания дешёвые.
 */

#pragma once

#include "glasskey/types.hpp"

namespace glasskey {

/// Axis-aligned бокс
struct Bounds {
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;

  [[nodiscard]] constexpr bool contains(Point p) const noexcept {
    return p.x >= min_x && p.x <= max_x && p.y >= min_y && p.y <= max_y;
  }
};

/// Приводит угол (в градусах) к диапазону (-180, 180]
[[nodiscard]] double normalize_rotation(double degrees) noexcept;

class NormalizedRect {
public:
  NormalizedRect() noexcept;
  NormalizedRect(double x, double y, double width, double height,
                 double rotation_deg = 0.0) noexcept;

  [[nodiscard]] double x() const noexcept { return x_; }
  [[nodiscard]] double y() const noexcept { return y_; }
  [[nodiscard]] double width() const noexcept { return width_; }
  [[nodiscard]] double height() const noexcept { return height_; }
  [[nodiscard]] double rotation_deg() const noexcept { return rotation_; }
  [[nodiscard]] Point center() const noexcept { return {cx_, cy_}; }
  [[nodiscard]] const Bounds &bounds() const noexcept { return bounds_; }
  [[nodiscard]] double area() const noexcept { return width_ * height_; }
  [[nodiscard]] bool is_rotated() const noexcept { return rotation_ != 0.0; }

  /// Попадание точки: быстрый отсев по боксу, затем локальные координаты
  [[nodiscard]] bool contains(Point p) const noexcept;

  /**
   * @brief Расстояние от точки до ближайшей стороны (в локальных координатах)
   *
   * @return min(halfWidth - |localX|, halfHeight - |localY|); положительно
   *         внутри, отрицательно снаружи
   */
  [[nodiscard]] double distance_to_edge(Point p) const noexcept;

  /// Квадрат расстояния от внешней точки до прямоугольника (0 внутри)
  [[nodiscard]] double distance_sq_outside(Point p) const noexcept;

  /// Зеркальное отражение по горизонтали (x -> 1 - x - w)
  [[nodiscard]] NormalizedRect mirrored() const noexcept;

  bool operator==(const NormalizedRect &other) const noexcept {
    return x_ == other.x_ && y_ == other.y_ && width_ == other.width_ &&
           height_ == other.height_ && rotation_ == other.rotation_;
  }

private:
  [[nodiscard]] Point to_local(Point p) const noexcept;

  double x_ = 0.0;
  double y_ = 0.0;
  double width_ = 0.0;
  double height_ = 0.0;
  double rotation_ = 0.0;

  double cx_ = 0.0;
  double cy_ = 0.0;
  double half_w_ = 0.0;
  double half_h_ = 0.0;
  double sin_ = 0.0;
  double cos_ = 1.0;
  Bounds bounds_;
};

} // namespace glasskey
