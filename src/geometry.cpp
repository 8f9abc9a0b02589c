/**
 * @file geometry.cpp
 * @brief Реализация геометрии хит-теста
 */

#include "glasskey/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace glasskey {

double normalize_rotation(double degrees) noexcept {
  if (!std::isfinite(degrees)) {
    return 0.0;
  }
  double r = std::fmod(degrees, 360.0);
  if (r <= -180.0) {
    r += 360.0;
  } else if (r > 180.0) {
    r -= 360.0;
  }
  return r;
}

NormalizedRect::NormalizedRect() noexcept
    : NormalizedRect(0.0, 0.0, 0.0, 0.0, 0.0) {}

NormalizedRect::NormalizedRect(double x, double y, double width,
                               double height, double rotation_deg) noexcept
    : x_{x}, y_{y}, width_{std::max(0.0, width)},
      height_{std::max(0.0, height)},
      rotation_{normalize_rotation(rotation_deg)} {
  half_w_ = width_ * 0.5;
  half_h_ = height_ * 0.5;
  cx_ = x_ + half_w_;
  cy_ = y_ + half_h_;

  if (rotation_ == 0.0) {
    bounds_ = Bounds{x_, y_, x_ + width_, y_ + height_};
    return;
  }

  const double rad = rotation_ * std::numbers::pi / 180.0;
  sin_ = std::sin(rad);
  cos_ = std::cos(rad);

  // Углы повёрнутого прямоугольника
  const double ex = std::abs(half_w_ * cos_) + std::abs(half_h_ * sin_);
  const double ey = std::abs(half_w_ * sin_) + std::abs(half_h_ * cos_);
  bounds_ = Bounds{cx_ - ex, cy_ - ey, cx_ + ex, cy_ + ey};
}

Point NormalizedRect::to_local(Point p) const noexcept {
  const double dx = p.x - cx_;
  const double dy = p.y - cy_;
  if (rotation_ == 0.0) {
    return {dx, dy};
  }
  // Обратный поворот
  return {dx * cos_ + dy * sin_, -dx * sin_ + dy * cos_};
}

bool NormalizedRect::contains(Point p) const noexcept {
  if (!bounds_.contains(p)) {
    return false;
  }
  if (rotation_ == 0.0) {
    return true;
  }
  const Point local = to_local(p);
  return std::abs(local.x) <= half_w_ && std::abs(local.y) <= half_h_;
}

double NormalizedRect::distance_to_edge(Point p) const noexcept {
  const Point local = to_local(p);
  return std::min(half_w_ - std::abs(local.x), half_h_ - std::abs(local.y));
}

double NormalizedRect::distance_sq_outside(Point p) const noexcept {
  const Point local = to_local(p);
  const double dx = std::max(std::abs(local.x) - half_w_, 0.0);
  const double dy = std::max(std::abs(local.y) - half_h_, 0.0);
  return dx * dx + dy * dy;
}

NormalizedRect NormalizedRect::mirrored() const noexcept {
  return NormalizedRect{1.0 - x_ - width_, y_, width_, height_, -rotation_};
}

} // namespace glasskey
