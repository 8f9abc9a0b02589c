/**
 * @file engine_intent.cpp
 * @brief Классификация намерения (печать / мышь / жест) и движение указателя
 */

#include "glasskey/engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace glasskey {

namespace {

constexpr double ms(double value) noexcept { return value / 1000.0; }

} // namespace

void TouchEngine::track_intent_touches(Side side, std::span<const Contact> tips,
                                       double now) {
  SideState &st = sides_[side_index(side)];
  const BindingIndex &index = indices_[side_index(side)];

  std::map<std::uint32_t, IntentTouch> next;
  for (const Contact &c : tips) {
    const Point p = c.position();
    auto it = st.touches.find(c.id);
    if (it == st.touches.end()) {
      IntentTouch t;
      t.start = p;
      t.last = p;
      t.start_time = now;
      t.last_time = now;
      if (const KeyBinding *hit = index.hit_test(p)) {
        t.on_key = true;
        t.anchor = is_keyboard_anchor(hit->action.kind);
      }
      next.emplace(c.id, t);
      continue;
    }

    IntentTouch t = it->second;
    const double dt = now - t.last_time;
    const double step = mm_distance(t.last, p);
    t.velocity_mm_s = dt > 1e-6 ? step / dt : 0.0;
    t.max_distance_mm = std::max(t.max_distance_mm, mm_distance(t.start, p));
    t.last = p;
    t.last_time = now;
    next.emplace(c.id, t);
  }
  st.touches = std::move(next);
}

Point TouchEngine::centroid(Side side) const {
  const SideState &st = sides_[side_index(side)];
  Point c;
  if (st.touches.empty()) {
    return c;
  }
  for (const auto &[id, t] : st.touches) {
    c.x += t.last.x;
    c.y += t.last.y;
  }
  c.x /= static_cast<double>(st.touches.size());
  c.y /= static_cast<double>(st.touches.size());
  return c;
}

void TouchEngine::set_intent(Side side, IntentMode mode, double now,
                             std::string_view reason) {
  SideState &st = sides_[side_index(side)];
  if (st.mode == mode) {
    return;
  }

  IntentTransition record{now, side, st.mode, mode, reason};
  if (ring_.size() < kTransitionRingSize) {
    ring_.push_back(record);
  } else {
    ring_[ring_head_] = record;
    ring_head_ = (ring_head_ + 1) % kTransitionRingSize;
  }

  st.mode = mode;
  st.mode_since = now;
  if (mode == IntentMode::KeyCandidate) {
    st.centroid_start = centroid(side);
  }
  if (mode == IntentMode::KeyCandidate || mode == IntentMode::MouseCandidate) {
    // Без новых кадров (палец неподвижен) решение примет таймер
    ++st.key_buffer_generation;
    schedule(TimerToken{now + ms(config_.key_buffer_ms),
                        TimerToken::Kind::KeyBuffer, side, 0,
                        st.key_buffer_generation});
  }
}

void TouchEngine::update_intent(Side side, int count, double now) {
  SideState &st = sides_[side_index(side)];

  if (count == 0) {
    st.until_all_up = false;
    if (keyboard_mode_) {
      set_intent(side, IntentMode::TypingCommitted, now, "keyboard_only");
    } else if (grace_active(now)) {
      set_intent(side, IntentMode::TypingCommitted, now, "grace");
    } else {
      set_intent(side, IntentMode::Idle, now, "all_up");
    }
    return;
  }
  if (keyboard_mode_) {
    set_intent(side, IntentMode::TypingCommitted, now, "keyboard_only");
    return;
  }

  int on_key = 0;
  int off_key = 0;
  bool anchor = false;
  double max_distance = 0.0;
  double max_velocity = 0.0;
  double first_start = std::numeric_limits<double>::max();
  double last_start = std::numeric_limits<double>::lowest();
  for (const auto &[id, t] : st.touches) {
    if (t.on_key) {
      ++on_key;
    } else {
      ++off_key;
    }
    anchor = anchor || t.anchor;
    max_distance = std::max(max_distance, t.max_distance_mm);
    max_velocity = std::max(max_velocity, t.velocity_mm_s);
    first_start = std::min(first_start, t.start_time);
    last_start = std::max(last_start, t.start_time);
  }
  const double start_span = st.touches.empty() ? 0.0 : last_start - first_start;
  const double key_buffer = ms(config_.key_buffer_ms);
  const int prev = st.prev_contacts;
  const bool typing = grace_active(now) || st.mode == IntentMode::TypingCommitted;

  // Несколько пальцев почти одновременно - кандидат в жест
  if (!anchor && !typing && start_span <= key_buffer &&
      ((count >= 3 && prev != 2) || (count >= 2 && prev <= 1))) {
    set_intent(side, IntentMode::GestureCandidate, now, "multi_finger");
    return;
  }
  if (st.mode == IntentMode::GestureCandidate && count >= 2) {
    return;
  }

  const double move = config_.intent_move_mm;
  bool mouse_signal =
      max_distance > move || max_distance > config_.drag_cancel_mm ||
      (max_velocity > config_.intent_velocity_mm_s &&
       max_distance > 0.25 * move) ||
      (count > prev && prev >= 1 && off_key > 0);
  if (st.mode == IntentMode::KeyCandidate &&
      mm_distance(centroid(side), st.centroid_start) > move) {
    mouse_signal = true;
  }
  if (anchor && count <= 1) {
    mouse_signal = false;
  }

  if (grace_active(now)) {
    set_intent(side, IntentMode::TypingCommitted, now, "grace");
    return;
  }

  switch (st.mode) {
  case IntentMode::Idle:
  case IntentMode::GestureCandidate:
    if (on_key > 0 && !mouse_signal) {
      set_intent(side, IntentMode::KeyCandidate, now, "on_key");
    } else {
      set_intent(side, IntentMode::MouseCandidate, now,
                 mouse_signal ? "motion" : "off_key");
    }
    return;
  case IntentMode::KeyCandidate:
    if (mouse_signal) {
      set_intent(side, IntentMode::MouseCandidate, now, "motion");
    } else if (now - st.mode_since + 1e-9 >= key_buffer) {
      set_intent(side, IntentMode::TypingCommitted, now, "key_buffer");
    }
    return;
  case IntentMode::TypingCommitted:
    if (!st.until_all_up && mouse_signal) {
      set_intent(side, IntentMode::MouseActive, now, "motion");
    }
    return;
  case IntentMode::MouseCandidate:
    if (mouse_signal || now - st.mode_since + 1e-9 >= key_buffer) {
      set_intent(side, IntentMode::MouseActive, now,
                 mouse_signal ? "motion" : "key_buffer");
    }
    return;
  case IntentMode::MouseActive:
    return;
  }
}

void TouchEngine::emit_pointer_motion(Side side, std::span<const Contact> tips,
                                      double now) {
  SideState &st = sides_[side_index(side)];
  if (st.mode != IntentMode::MouseActive || tips.size() != 1) {
    st.pointer_valid = false;
    return;
  }

  const Contact &c = tips.front();
  const Point p = c.position();
  if (!st.pointer_valid || st.pointer_id != c.id) {
    st.pointer_valid = true;
    st.pointer_id = c.id;
    st.pointer_last = p;
    st.pointer_residue_x = 0.0;
    st.pointer_residue_y = 0.0;
    return;
  }

  const double fx = (p.x - st.pointer_last.x) * config_.pad_width_mm *
                        config_.pointer_speed +
                    st.pointer_residue_x;
  const double fy = (p.y - st.pointer_last.y) * config_.pad_height_mm *
                        config_.pointer_speed +
                    st.pointer_residue_y;
  const int dx = static_cast<int>(std::trunc(fx));
  const int dy = static_cast<int>(std::trunc(fy));
  st.pointer_residue_x = fx - dx;
  st.pointer_residue_y = fy - dy;
  st.pointer_last = p;

  if (dx == 0 && dy == 0) {
    return;
  }
  Command command;
  command.kind = CommandKind::PointerMove;
  command.dx = dx;
  command.dy = dy;
  command.side = side;
  command.timestamp = now;
  emit(command);
}

} // namespace glasskey
