/**
 * @file engine_gestures.cpp
 * @brief Жесты: тап-клики, свайп пятью пальцами, аккордовый Shift, удержания
 */

#include "glasskey/engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace glasskey {

namespace {

constexpr double ms(double value) noexcept { return value / 1000.0; }

constexpr std::uint64_t kCornerHoldKey = 0;
constexpr std::uint64_t kFourFingerHoldKey = 1;

} // namespace

// ===========================================================================
// Аккордовый Shift
// ===========================================================================

bool TouchEngine::chordal_shift_gesture() const {
  return config_.chordal_shift_enabled &&
         is_chordal_shift_label(config_.gestures.four_finger_hold);
}

void TouchEngine::update_chord_shift(Side side, int count, double now) {
  SideState &current = sides_[side_index(side)];
  current.raw_contacts = count;
  current.raw_time = now;

  const bool enabled = chordal_shift_gesture();
  for (Side source : kSides) {
    const SideState &src = sides_[side_index(source)];
    SideState &target = sides_[side_index(other_side(source))];
    if (!enabled) {
      target.chord_latch = false;
      continue;
    }
    // Источник, молчащий дольше таймаута, считается отпущенным
    const int contacts =
        now - src.raw_time > kChordSourceStaleTimeout ? 0 : src.raw_contacts;
    if (src.swipe.armed || contacts >= kSwipeArmContacts || contacts == 0) {
      target.chord_latch = false;
    } else if (contacts >= kChordShiftContactThreshold) {
      target.chord_latch = true;
    }
  }

  const bool desired = sides_[0].chord_latch || sides_[1].chord_latch;
  if (desired == shift_down_) {
    return;
  }

  Command command;
  command.code = KEY_LEFTSHIFT;
  command.side = side;
  command.timestamp = now;
  if (desired) {
    command.kind = CommandKind::ModifierDown;
    shift_down_ = emit(command);
  } else {
    command.kind = CommandKind::ModifierUp;
    emit(command);
    shift_down_ = false;
  }
}

bool TouchEngine::is_chord_source(Side side) const noexcept {
  const SideState &st = sides_[side_index(side)];
  if (st.swipe.armed || st.raw_contacts >= kSwipeArmContacts) {
    return false;
  }
  return sides_[side_index(other_side(side))].chord_latch;
}

// ===========================================================================
// Тап двумя / тремя пальцами
// ===========================================================================

void TouchEngine::update_tap_gesture(Side side, int count, double now) {
  SideState &st = sides_[side_index(side)];
  TapGestureState &tap = st.tap;
  const int prev = st.prev_contacts;

  if (!tap.active) {
    if (!config_.tap_click_enabled || keyboard_mode_ || grace_active(now)) {
      return;
    }
    if (prev > 1 || count < 2 || count > 3) {
      return;
    }
    if ((count == 2 && !config_.two_finger_tap_enabled) ||
        (count == 3 && !config_.three_finger_tap_enabled)) {
      return;
    }
    double first = std::numeric_limits<double>::max();
    double last = std::numeric_limits<double>::lowest();
    for (const auto &[id, t] : st.touches) {
      if (t.on_key || t.anchor) {
        return;
      }
      first = std::min(first, t.start_time);
      last = std::max(last, t.start_time);
    }
    if (last - first > ms(config_.tap_stagger_ms) + 1e-9) {
      return;
    }
    tap.active = true;
    tap.invalid = false;
    tap.max_contacts = count;
    tap.start_time = first;
    return;
  }

  if (count > tap.max_contacts) {
    if (count == 3 && config_.three_finger_tap_enabled &&
        now - tap.start_time <= ms(config_.tap_stagger_ms) + 1e-9) {
      tap.max_contacts = 3;
    } else {
      tap.invalid = true;
    }
  }
  for (const auto &[id, t] : st.touches) {
    if (t.max_distance_mm > config_.tap_move_mm) {
      tap.invalid = true;
    }
  }
  if (now - tap.start_time > ms(config_.tap_cadence_ms)) {
    tap.invalid = true;
  }

  if (count > 0) {
    return;
  }

  const bool fire = !tap.invalid && !grace_active(now);
  const int fingers = tap.max_contacts;
  tap = TapGestureState{};
  if (!fire) {
    return;
  }
  ++metrics_.gesture_fires;
  run_gesture_action(fingers == 2 ? config_.gestures.two_finger_tap
                                  : config_.gestures.three_finger_tap,
                     side, now);
}

// ===========================================================================
// Свайп пятью пальцами
// ===========================================================================

void TouchEngine::update_five_finger_swipe(Side side, int count, double now) {
  SideState &st = sides_[side_index(side)];
  SwipeState &swipe = st.swipe;

  if (!swipe.armed) {
    if (count >= kSwipeArmContacts) {
      swipe.armed = true;
      swipe.triggered = false;
      consume_side_touches(side, now);
      st.tap.invalid = true;
    }
    return;
  }
  if (count <= kSwipeReleaseContacts) {
    swipe = SwipeState{};
    return;
  }
  if (count < kSwipeSustainContacts || swipe.triggered) {
    return;
  }

  // Среднее смещение пальцев от точек касания не зависит от их числа
  double dx = 0.0;
  double dy = 0.0;
  for (const auto &[id, t] : st.touches) {
    dx += (t.last.x - t.start.x) * config_.pad_width_mm;
    dy += (t.last.y - t.start.y) * config_.pad_height_mm;
  }
  dx /= static_cast<double>(st.touches.size());
  dy /= static_cast<double>(st.touches.size());
  if (std::max(std::abs(dx), std::abs(dy)) < kFiveFingerSwipeThresholdMm) {
    return;
  }

  swipe.triggered = true;
  if (std::abs(dx) < std::abs(dy)) {
    return;
  }
  ++metrics_.gesture_fires;
  run_gesture_action(dx < 0.0 ? config_.gestures.five_finger_swipe_left
                              : config_.gestures.five_finger_swipe_right,
                     side, now);
}

// ===========================================================================
// Удержания: углы и четыре пальца
// ===========================================================================

void TouchEngine::update_corner_hold(Side side, std::span<const Contact> tips,
                                     double now) {
  SideState &st = sides_[side_index(side)];
  HoldGestureState &hold = st.corner;

  bool matched = false;
  bool outer = false;
  if (tips.size() == 2) {
    const Contact &a = tips[0];
    const Contact &b = tips[1];
    const bool vertical = (a.y <= kCornerZone && b.y >= 1.0 - kCornerZone) ||
                          (b.y <= kCornerZone && a.y >= 1.0 - kCornerZone);
    auto near_left = [](const Contact &c) { return c.x <= kCornerZone; };
    auto near_right = [](const Contact &c) { return c.x >= 1.0 - kCornerZone; };
    const bool left_edge = near_left(a) && near_left(b);
    const bool right_edge = near_right(a) && near_right(b);
    if (vertical && (left_edge || right_edge)) {
      matched = true;
      // Внешний край: левый у левой поверхности, правый у правой
      outer = (side == Side::Left) == left_edge;
    }
  }

  const std::string &label = outer ? config_.gestures.outer_corners_hold
                                   : config_.gestures.inner_corners_hold;
  if (!matched || is_none_label(label)) {
    hold = HoldGestureState{};
    return;
  }

  st.tap.invalid = true;
  if ((hold.pending || hold.fired) && st.corner_outer == outer) {
    return;
  }
  hold.pending = true;
  hold.fired = false;
  hold.start_time = now;
  hold.generation = ++generation_counter_;
  st.corner_outer = outer;
  schedule(TimerToken{now + ms(config_.hold_duration_ms),
                      TimerToken::Kind::GestureHold, side, kCornerHoldKey,
                      hold.generation});
}

void TouchEngine::update_four_finger_hold(Side side, int count, double now) {
  SideState &st = sides_[side_index(side)];
  HoldGestureState &hold = st.four_hold;

  if (is_chordal_shift_label(config_.gestures.four_finger_hold) ||
      is_none_label(config_.gestures.four_finger_hold) ||
      count != kChordShiftContactThreshold || st.swipe.armed) {
    hold = HoldGestureState{};
    return;
  }

  bool moved = false;
  for (const auto &[id, t] : st.touches) {
    moved = moved || t.max_distance_mm > config_.drag_cancel_mm;
  }
  if (moved) {
    // Сдвинутые пальцы: удержание не сработает до следующего касания
    hold.pending = false;
    hold.fired = true;
    return;
  }
  if (hold.pending || hold.fired) {
    return;
  }
  hold.pending = true;
  hold.start_time = now;
  hold.generation = ++generation_counter_;
  st.tap.invalid = true;
  schedule(TimerToken{now + ms(config_.hold_duration_ms),
                      TimerToken::Kind::GestureHold, side, kFourFingerHoldKey,
                      hold.generation});
}

void TouchEngine::run_gesture_action(std::string_view label, Side side,
                                     double now) {
  const KeyAction action = resolve_action_label(label);
  if (action.kind == ActionKind::None) {
    return;
  }
  dispatch_tap(action, side, now);
}

} // namespace glasskey
