/**
 * @file binding_index.cpp
 * @brief Построение индекса привязок, хит-тест и примагничивание
 */

#include "glasskey/binding_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace glasskey {

int BindingIndex::bucket_index(double value, int count) noexcept {
  const double v = std::clamp(value, 0.0, 0.999999);
  return std::clamp(static_cast<int>(v * count), 0, count - 1);
}

BindingIndex BindingIndex::build(Side side, const KeyLayout &layout,
                                 const KeymapStore &keymap, int layer,
                                 double snap_fraction) {
  BindingIndex index;
  snap_fraction = std::clamp(snap_fraction, 0.0, 2.0);

  auto add = [&](KeyBinding binding) {
    if (is_snappable(binding.action.kind) && snap_fraction > 0.0) {
      const NormalizedRect &r = binding.rect;
      index.snap_.push_back(
          SnapEntry{index.bindings_.size(), r.center(),
                    std::min(r.width(), r.height()) * snap_fraction});
    }
    index.bindings_.push_back(std::move(binding));
  };

  for (std::size_t row = 0; row < layout.rects.size(); ++row) {
    const auto &rects = layout.rects[row];
    for (std::size_t col = 0; col < rects.size(); ++col) {
      std::string label;
      if (row < layout.labels.size() && col < layout.labels[row].size()) {
        label = layout.labels[row][col];
      }
      if (label.empty()) {
        continue;
      }
      KeyBinding b;
      b.side = side;
      b.row = static_cast<int>(row);
      b.col = static_cast<int>(col);
      b.storage_key = storage_key(side, b.row, b.col);
      KeyMapping mapping = keymap.resolve_mapping(layer, b.storage_key, label);
      b.rect = rects[col];
      b.label = mapping.primary.label;
      b.action = std::move(mapping.primary);
      b.hold = std::move(mapping.hold);
      add(std::move(b));
    }
  }

  for (auto &button : keymap.resolve_custom_buttons(layer, side)) {
    KeyBinding b;
    b.side = side;
    b.storage_key = "custom:" + button.id;
    b.rect = button.rect;
    b.label = button.mapping.primary.label;
    b.action = std::move(button.mapping.primary);
    b.hold = std::move(button.mapping.hold);
    add(std::move(b));
  }

  index.buckets_.resize(static_cast<std::size_t>(kBucketRows * kBucketColumns));
  for (std::size_t i = 0; i < index.bindings_.size(); ++i) {
    const Bounds &bb = index.bindings_[i].rect.bounds();
    const int min_row = bucket_index(bb.min_y, kBucketRows);
    const int max_row = bucket_index(bb.max_y, kBucketRows);
    const int min_col = bucket_index(bb.min_x, kBucketColumns);
    const int max_col = bucket_index(bb.max_x, kBucketColumns);
    for (int r = min_row; r <= max_row; ++r) {
      for (int c = min_col; c <= max_col; ++c) {
        index.buckets_[static_cast<std::size_t>(r * kBucketColumns + c)]
            .push_back(i);
      }
    }
  }
  return index;
}

const KeyBinding *BindingIndex::hit_test(Point p) const {
  if (bindings_.empty()) {
    return nullptr;
  }
  const int r = bucket_index(p.y, kBucketRows);
  const int c = bucket_index(p.x, kBucketColumns);

  // Перекрытие: точка глубже внутри, при равенстве - меньшая площадь
  const KeyBinding *best = nullptr;
  double best_depth = -std::numeric_limits<double>::max();
  double best_area = std::numeric_limits<double>::max();
  for (std::size_t i :
       buckets_[static_cast<std::size_t>(r * kBucketColumns + c)]) {
    const NormalizedRect &rect = bindings_[i].rect;
    if (!rect.contains(p)) {
      continue;
    }
    const double depth = rect.distance_to_edge(p);
    const double area = rect.width() * rect.height();
    if (depth > best_depth + 1e-9 ||
        (std::abs(depth - best_depth) <= 1e-9 && area < best_area)) {
      best = &bindings_[i];
      best_depth = depth;
      best_area = area;
    }
  }
  return best;
}

const KeyBinding *BindingIndex::try_snap(Point p,
                                         double ambiguity_ratio) const {
  const SnapEntry *best = nullptr;
  const SnapEntry *second = nullptr;
  double best_d = std::numeric_limits<double>::max();
  double second_d = std::numeric_limits<double>::max();

  for (const auto &e : snap_) {
    const double dx = p.x - e.center.x;
    const double dy = p.y - e.center.y;
    const double d = dx * dx + dy * dy;
    if (d < best_d) {
      second = best;
      second_d = best_d;
      best = &e;
      best_d = d;
    } else if (d < second_d) {
      second = &e;
      second_d = d;
    }
  }

  auto within_reach = [&](const SnapEntry &e) {
    return bindings_[e.binding].rect.distance_sq_outside(p) <=
           e.reach * e.reach;
  };

  if (!best || !within_reach(*best)) {
    return nullptr;
  }

  const SnapEntry *selected = best;
  const double ratio = std::max(1.0, ambiguity_ratio);
  if (second && within_reach(*second) && second_d <= best_d * ratio * ratio) {
    const double edge_best =
        bindings_[best->binding].rect.distance_sq_outside(p);
    const double edge_second =
        bindings_[second->binding].rect.distance_sq_outside(p);
    if (edge_second < edge_best) {
      selected = second;
    }
  }
  return &bindings_[selected->binding];
}

} // namespace glasskey
