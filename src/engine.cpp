/**
 * @file engine.cpp
 * @brief Жизненный цикл касаний клавиш, таймеры и состояние движка
 */

#include "glasskey/engine.hpp"

#include <algorithm>
#include <cmath>

namespace glasskey {

namespace {

constexpr double ms(double value) noexcept { return value / 1000.0; }

constexpr bool is_press_kind(ActionKind kind) noexcept {
  return kind == ActionKind::Modifier || kind == ActionKind::Continuous;
}

constexpr bool is_typing_command(CommandKind kind) noexcept {
  return kind == CommandKind::KeyTap || kind == CommandKind::KeyDown ||
         kind == CommandKind::ModifierDown;
}

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void fnv_mix(std::uint64_t &hash, std::uint64_t value) noexcept {
  for (int i = 0; i < 8; ++i) {
    hash ^= (value >> (i * 8)) & 0xFF;
    hash *= kFnvPrime;
  }
}

} // namespace

TouchEngine::TouchEngine(EngineConfig config, KeymapStore keymap,
                         CommandSink &sink)
    : config_(normalize_engine_config(std::move(config))),
      keymap_(std::move(keymap)), sink_(sink) {
  keyboard_mode_ = config_.keyboard_mode;
  ring_.reserve(kTransitionRingSize);
  rebuild_bindings();
}

// ===========================================================================
// Конфигурация
// ===========================================================================

void TouchEngine::rebuild_bindings() {
  const LayoutPreset &preset = resolve_preset(config_.layout_preset);
  keymap_.set_active_layout(preset.name);

  std::vector<ColumnSettings> columns = config_.columns;
  if (columns.empty()) {
    columns = default_column_settings(preset);
  }
  const double snap_fraction = config_.snap_radius_percent / 100.0;

  for (Side side : kSides) {
    const std::size_t i = side_index(side);
    layouts_[i] = build_layout(preset, config_.pad_width_mm,
                               config_.pad_height_mm, columns,
                               side == Side::Left, config_.key_spacing_percent);
    indices_[i] = BindingIndex::build(side, layouts_[i], keymap_,
                                      active_layer_, snap_fraction);
  }
}

void TouchEngine::set_config(EngineConfig config) {
  config_ = normalize_engine_config(std::move(config));
  set_keyboard_mode(config_.keyboard_mode);
  rebuild_bindings();
}

void TouchEngine::set_keymap(KeymapStore keymap) {
  keymap_ = std::move(keymap);
  rebuild_bindings();
}

void TouchEngine::set_persistent_layer(int layer, double now) {
  now_ = now;
  persistent_layer_ = std::clamp(layer, 0, kMaxLayer);
  update_active_layer();
}

void TouchEngine::set_typing_enabled(bool enabled, double now) {
  if (typing_enabled_ == enabled) {
    return;
  }
  typing_enabled_ = enabled;
  if (enabled) {
    return;
  }
  // Всё удерживаемое отпускаем, текущие касания больше ничего не отправят
  release_all_held(now);
  grace_deadline_ = -1.0;
  ++grace_generation_;
  for (Side side : kSides) {
    sides_[side_index(side)].until_all_up = false;
    set_intent(side, IntentMode::Idle, now, "typing_disabled");
  }
}

void TouchEngine::set_keyboard_mode(bool enabled) {
  keyboard_mode_ = enabled;
  if (enabled) {
    for (Side side : kSides) {
      sides_[side_index(side)].pointer_valid = false;
      set_intent(side, IntentMode::TypingCommitted, now_, "keyboard_only");
    }
  }
}

// ===========================================================================
// Кадры
// ===========================================================================

void TouchEngine::process_frame(const RawTouchFrame &frame, bool is_replay) {
  const double now = frame.timestamp;
  fire_due_timers(now);
  now_ = now;
  replay_ = is_replay;
  ++metrics_.frames;

  const Side side = frame.side;
  SideState &st = sides_[side_index(side)];

  std::vector<Contact> tips;
  tips.reserve(frame.contacts.size());
  for (Contact c : frame.contacts) {
    if (!is_tip_state(c.state)) {
      continue;
    }
    c.x = clamp_unit(c.x);
    c.y = clamp_unit(c.y);
    tips.push_back(c);
  }
  const int count = static_cast<int>(tips.size());

  update_chord_shift(side, count, now);
  const bool chord_source = is_chord_source(side);
  if (chord_source) {
    consume_side_touches(side, now);
  }

  track_intent_touches(side, tips, now);

  if (!chord_source) {
    for (const Contact &c : tips) {
      handle_contact(side, c, now);
    }
  }

  // Отпущенные касания
  std::vector<std::uint64_t> released;
  for (const auto &[key, touch] : touches_) {
    if (touch.side != side) {
      continue;
    }
    const bool present =
        std::any_of(tips.begin(), tips.end(),
                    [&](const Contact &c) { return c.id == touch.id; });
    if (!present) {
      released.push_back(key);
    }
  }
  for (std::uint64_t key : released) {
    auto node = touches_.extract(key);
    if (!node.empty()) {
      handle_release(node.mapped(), now);
    }
  }

  update_tap_gesture(side, count, now);
  update_five_finger_swipe(side, count, now);
  update_corner_hold(side, tips, now);
  update_four_finger_hold(side, count, now);
  update_intent(side, count, now);
  emit_pointer_motion(side, tips, now);

  st.prev_contacts = count;
}

void TouchEngine::handle_contact(Side side, const Contact &contact,
                                 double now) {
  const std::uint64_t key = touch_key(side, contact.id);
  const Point p = contact.position();

  if (auto it = touches_.find(key); it != touches_.end()) {
    TouchState &touch = it->second;
    touch.last = p;
    touch.max_distance_mm =
        std::max(touch.max_distance_mm, mm_distance(touch.start, p));
    if (touch.down_sent && touch.max_distance_mm > config_.drag_cancel_mm) {
      end_press(touch, now);
      ++metrics_.drag_cancels;
    }
    try_force_click(touch, contact.pressure, now);
    if (auto again = touches_.find(key); again != touches_.end()) {
      check_hold(again->second, now);
    }
    return;
  }

  const BindingIndex &index = indices_[side_index(side)];
  const KeyBinding *hit = index.hit_test(p);

  TouchState touch;
  touch.side = side;
  touch.id = contact.id;
  touch.generation = ++generation_counter_;
  touch.start_time = now;
  touch.start = p;
  touch.last = p;

  if (hit == nullptr) {
    // Вне клавиш: отслеживаем только если возможен snap при отпускании
    const IntentMode mode = sides_[side_index(side)].mode;
    const bool typing = mode == IntentMode::KeyCandidate ||
                        mode == IntentMode::TypingCommitted ||
                        grace_active(now);
    if (config_.snap_radius_percent <= 0.0 || index.snap_candidates() == 0 ||
        !typing) {
      return;
    }
    touch.off_key = true;
    touches_.emplace(key, std::move(touch));
    return;
  }

  touch.binding = *hit;

  if (hit->action.kind == ActionKind::MomentaryLayer) {
    touch.momentary = true;
    touch.momentary_layer = std::clamp(hit->action.layer, 0, kMaxLayer);
    touch.emitted = true;
    momentary_.emplace_back(key, touch.momentary_layer);
    touches_.emplace(key, std::move(touch));
    update_active_layer();
    return;
  }

  auto [it, inserted] = touches_.emplace(key, std::move(touch));
  TouchState &stored = it->second;
  if (stored.binding->hold) {
    schedule(TimerToken{now + ms(config_.hold_duration_ms),
                        TimerToken::Kind::Hold, side, key, stored.generation});
  } else if (is_press_kind(stored.binding->action.kind)) {
    const KeyAction action = stored.binding->action;
    begin_press(action, stored, now);
  }
  try_force_click(stored, contact.pressure, now);
}

void TouchEngine::handle_release(TouchState &touch, double now) {
  const Side side = touch.side;

  if (touch.momentary) {
    const std::uint64_t key = touch_key(side, touch.id);
    std::erase_if(momentary_, [&](const auto &m) { return m.first == key; });
    update_active_layer();
    return;
  }

  const bool had_down = touch.down_sent;
  end_press(touch, now);

  if (touch.max_distance_mm > config_.drag_cancel_mm) {
    if (!had_down && !touch.emitted) {
      ++metrics_.drag_cancels;
    }
    return;
  }
  if (had_down || touch.emitted || touch.hold_triggered) {
    return;
  }
  if (sides_[side_index(side)].tap.active) {
    return;
  }

  const BindingIndex &index = indices_[side_index(side)];

  auto snap = [&] {
    ++metrics_.snap_attempts;
    if (const KeyBinding *b =
            index.try_snap(touch.last, config_.snap_ambiguity_ratio)) {
      ++metrics_.snap_accepted;
      const KeyAction action = b->action;
      dispatch_tap(action, side, now);
    } else {
      ++metrics_.snap_rejected;
    }
  };

  if (touch.off_key) {
    snap();
    return;
  }
  if (!touch.binding) {
    return;
  }
  if (touch.binding->rect.contains(touch.last)) {
    dispatch_tap(touch.binding->action, side, now);
    return;
  }

  const KeyBinding *hit = index.hit_test(touch.last);
  if (hit != nullptr && hit->storage_key != touch.binding->storage_key) {
    ++metrics_.cross_key_drops;
    return;
  }
  if (hit != nullptr) {
    const KeyAction action = hit->action;
    dispatch_tap(action, side, now);
    return;
  }
  if (config_.snap_radius_percent > 0.0) {
    snap();
  }
}

void TouchEngine::check_hold(TouchState &touch, double now) {
  if (touch.hold_triggered || touch.emitted || touch.down_sent ||
      touch.off_key || !touch.binding || !touch.binding->hold) {
    return;
  }
  if (touch.max_distance_mm > config_.drag_cancel_mm) {
    return;
  }
  if (now - touch.start_time + 1e-9 < ms(config_.hold_duration_ms)) {
    return;
  }

  touch.hold_triggered = true;
  touch.emitted = true;
  ++metrics_.hold_fires;

  const KeyAction action = *touch.binding->hold;
  if (is_press_kind(action.kind)) {
    begin_press(action, touch, now);
  } else {
    dispatch_tap(action, touch.side, now);
  }
}

void TouchEngine::try_force_click(TouchState &touch, float pressure,
                                  double now) {
  if (config_.force_click_min <= 0.0 || touch.off_key || touch.momentary ||
      !touch.binding || touch.hold_triggered || touch.emitted ||
      touch.down_sent) {
    return;
  }
  if (pressure < config_.force_click_min) {
    return;
  }

  touch.hold_triggered = true;
  touch.emitted = true;
  ++metrics_.force_clicks;

  const double ratio =
      std::clamp(static_cast<double>(pressure) / config_.force_click_cap, 0.0,
                 1.0);
  const double scale =
      config_.haptic_strength > 0.0 ? config_.haptic_strength : 1.0;
  pulse_haptic(touch.side, ratio * scale, now);

  const KeyAction action =
      touch.binding->hold ? *touch.binding->hold : touch.binding->action;
  if (is_press_kind(action.kind)) {
    begin_press(action, touch, now);
  } else {
    dispatch_tap(action, touch.side, now);
  }
}

// ===========================================================================
// Действия
// ===========================================================================

bool TouchEngine::begin_press(const KeyAction &action, TouchState &touch,
                              double now) {
  if (!is_press_kind(action.kind) || action.code == 0) {
    return false;
  }
  apply_action_state(action, touch.side, now);

  Command command;
  command.kind = action.kind == ActionKind::Modifier ? CommandKind::ModifierDown
                                                     : CommandKind::KeyDown;
  command.code = action.code;
  command.side = touch.side;
  command.timestamp = now;
  if (!emit(command)) {
    return false;
  }

  touch.down_sent = true;
  touch.down_action = action;
  touch.emitted = true;
  pulse_haptic(touch.side, config_.haptic_strength, now);
  return true;
}

void TouchEngine::end_press(TouchState &touch, double now) {
  if (!touch.down_sent) {
    return;
  }
  touch.down_sent = false;

  Command command;
  command.kind = touch.down_action.kind == ActionKind::Modifier
                     ? CommandKind::ModifierUp
                     : CommandKind::KeyUp;
  command.code = touch.down_action.code;
  command.side = touch.side;
  command.timestamp = now;
  emit(command);
}

void TouchEngine::dispatch_tap(const KeyAction &action, Side side,
                               double now) {
  apply_action_state(action, side, now);

  Command command;
  command.side = side;
  command.timestamp = now;

  switch (action.kind) {
  case ActionKind::None:
  case ActionKind::MomentaryLayer:
  case ActionKind::LayerSet:
  case ActionKind::LayerToggle:
  case ActionKind::TypingToggle:
    return;
  case ActionKind::Key:
  case ActionKind::Continuous:
    if (action.code == 0) {
      return;
    }
    command.kind = CommandKind::KeyTap;
    command.code = action.code;
    break;
  case ActionKind::Modifier: {
    if (action.code == 0) {
      return;
    }
    command.kind = CommandKind::ModifierDown;
    command.code = action.code;
    if (!emit(command)) {
      return;
    }
    command.kind = CommandKind::ModifierUp;
    emit(command);
    pulse_haptic(side, config_.haptic_strength, now);
    return;
  }
  case ActionKind::KeyChord:
    command.kind = CommandKind::KeyTap;
    command.code = action.code;
    command.modifiers = modifier_bit(action.modifier);
    break;
  case ActionKind::MouseButton:
    command.kind = CommandKind::MouseClick;
    command.button = action.button;
    break;
  case ActionKind::SystemControl:
    command.kind = CommandKind::SystemKey;
    command.code = action.code;
    break;
  case ActionKind::VoiceToggle:
    if (replay_) {
      ++metrics_.replay_suppressed;
      return;
    }
    command.kind = CommandKind::SystemKey;
    command.code = action.code;
    break;
  }

  if (emit(command) && command.kind == CommandKind::KeyTap) {
    pulse_haptic(side, config_.haptic_strength, now);
  }
}

void TouchEngine::apply_action_state(const KeyAction &action, Side side,
                                     double now) {
  switch (action.kind) {
  case ActionKind::TypingToggle:
    set_typing_enabled(!typing_enabled_, now);
    return;
  case ActionKind::LayerSet:
    persistent_layer_ = std::clamp(action.layer, 0, kMaxLayer);
    update_active_layer();
    return;
  case ActionKind::LayerToggle: {
    const int target = std::clamp(action.layer, 0, kMaxLayer);
    persistent_layer_ = persistent_layer_ == target ? 0 : target;
    update_active_layer();
    return;
  }
  default:
    break;
  }
  if (typing_enabled_ && extends_typing_grace(action.kind)) {
    extend_typing_grace(side, now);
  }
}

void TouchEngine::extend_typing_grace(Side side, double now) {
  grace_deadline_ = now + ms(config_.typing_grace_ms);
  ++grace_generation_;
  schedule(TimerToken{grace_deadline_, TimerToken::Kind::TypingGrace, side, 0,
                      grace_generation_});
  if (keyboard_mode_) {
    return;
  }
  SideState &st = sides_[side_index(side)];
  if (st.prev_contacts > 0 || !st.touches.empty()) {
    st.until_all_up = true;
  }
  set_intent(side, IntentMode::TypingCommitted, now, "typing_grace");
}

bool TouchEngine::grace_active(double now) const noexcept {
  return typing_enabled_ && grace_deadline_ >= 0.0 && now < grace_deadline_;
}

void TouchEngine::update_active_layer() {
  const int layer =
      momentary_.empty() ? persistent_layer_ : momentary_.front().second;
  if (layer != active_layer_) {
    active_layer_ = layer;
    rebuild_bindings();
  }
}

void TouchEngine::consume_side_touches(Side side, double now) {
  for (auto &[key, touch] : touches_) {
    if (touch.side != side) {
      continue;
    }
    end_press(touch, now);
    touch.emitted = true;
    touch.hold_triggered = true;
    touch.momentary = false;
  }
  const std::size_t before = momentary_.size();
  std::erase_if(momentary_, [&](const auto &m) {
    return (m.first >> 32) == side_index(side);
  });
  if (momentary_.size() != before) {
    update_active_layer();
  }
}

void TouchEngine::release_all_held(double now) {
  for (auto &[key, touch] : touches_) {
    end_press(touch, now);
    touch.emitted = true;
    touch.hold_triggered = true;
    touch.momentary = false;
  }
  momentary_.clear();
  if (shift_down_) {
    Command up;
    up.kind = CommandKind::ModifierUp;
    up.code = KEY_LEFTSHIFT;
    up.timestamp = now;
    emit(up);
    shift_down_ = false;
  }
  update_active_layer();
}

void TouchEngine::pulse_haptic(Side side, double strength, double now) {
  if (strength <= 0.0) {
    return;
  }
  SideState &st = sides_[side_index(side)];
  if (st.last_haptic >= 0.0 && now - st.last_haptic < kHapticMinInterval) {
    return;
  }
  st.last_haptic = now;

  Command command;
  command.kind = CommandKind::Haptic;
  command.strength = std::clamp(strength, 0.0, 1.0);
  command.side = side;
  command.timestamp = now;
  emit(command);
}

bool TouchEngine::emit(Command command) {
  if (!typing_enabled_ && is_typing_command(command.kind)) {
    ++metrics_.typing_suppressed;
    return false;
  }
  ++metrics_.commands;
  if (!muted_) {
    sink_.submit(command);
  }
  return true;
}

double TouchEngine::mm_distance(Point a, Point b) const noexcept {
  const double dx = (a.x - b.x) * config_.pad_width_mm;
  const double dy = (a.y - b.y) * config_.pad_height_mm;
  return std::sqrt(dx * dx + dy * dy);
}

// ===========================================================================
// Таймеры
// ===========================================================================

void TouchEngine::schedule(TimerToken token) { timers_.push_back(token); }

std::optional<double> TouchEngine::next_deadline() const {
  if (timers_.empty()) {
    return std::nullopt;
  }
  auto it = std::min_element(
      timers_.begin(), timers_.end(),
      [](const auto &a, const auto &b) { return a.deadline < b.deadline; });
  return it->deadline;
}

void TouchEngine::fire_due_timers(double now) {
  while (!timers_.empty()) {
    auto it = std::min_element(
        timers_.begin(), timers_.end(),
        [](const auto &a, const auto &b) { return a.deadline < b.deadline; });
    if (it->deadline > now) {
      return;
    }
    const TimerToken token = *it;
    timers_.erase(it);
    now_ = std::max(now_, token.deadline);
    on_timer(token);
  }
}

void TouchEngine::on_timer(const TimerToken &token) {
  ++metrics_.timers_fired;
  const double at = token.deadline;
  SideState &st = sides_[side_index(token.side)];

  switch (token.kind) {
  case TimerToken::Kind::Hold: {
    auto it = touches_.find(token.touch_key);
    if (it == touches_.end() || it->second.generation != token.generation) {
      ++metrics_.stale_timers;
      return;
    }
    check_hold(it->second, at);
    return;
  }
  case TimerToken::Kind::TypingGrace:
    if (token.generation != grace_generation_) {
      ++metrics_.stale_timers;
      return;
    }
    for (Side side : kSides) {
      update_intent(side, sides_[side_index(side)].prev_contacts, at);
    }
    return;
  case TimerToken::Kind::KeyBuffer:
    if (token.generation != st.key_buffer_generation) {
      ++metrics_.stale_timers;
      return;
    }
    update_intent(token.side, st.prev_contacts, at);
    return;
  case TimerToken::Kind::GestureHold: {
    const bool corner = token.touch_key == 0;
    HoldGestureState &hold = corner ? st.corner : st.four_hold;
    if (!hold.pending || hold.fired || hold.generation != token.generation) {
      ++metrics_.stale_timers;
      return;
    }
    hold.fired = true;
    ++metrics_.gesture_fires;
    const GestureBindings &g = config_.gestures;
    const std::string label =
        corner ? (st.corner_outer ? g.outer_corners_hold : g.inner_corners_hold)
               : g.four_finger_hold;
    consume_side_touches(token.side, at);
    run_gesture_action(label, token.side, at);
    return;
  }
  }
}

// ===========================================================================
// Сброс и наблюдение
// ===========================================================================

void TouchEngine::reset_state(double now) {
  for (auto &[key, touch] : touches_) {
    end_press(touch, now);
  }
  touches_.clear();
  momentary_.clear();
  if (shift_down_) {
    Command up;
    up.kind = CommandKind::ModifierUp;
    up.code = KEY_LEFTSHIFT;
    up.timestamp = now;
    emit(up);
    shift_down_ = false;
  }
  for (auto &st : sides_) {
    st = SideState{};
  }
  timers_.clear();
  grace_deadline_ = -1.0;
  ++grace_generation_;
  now_ = now;
  if (keyboard_mode_) {
    for (auto &st : sides_) {
      st.mode = IntentMode::TypingCommitted;
    }
  }
  update_active_layer();
}

void TouchEngine::reset_all(double now) {
  reset_state(now);
  persistent_layer_ = 0;
  typing_enabled_ = true;
  keyboard_mode_ = config_.keyboard_mode;
  for (auto &st : sides_) {
    st.mode = keyboard_mode_ ? IntentMode::TypingCommitted : IntentMode::Idle;
  }
  generation_counter_ = 0;
  grace_generation_ = 0;
  metrics_ = EngineMetrics{};
  ring_.clear();
  ring_head_ = 0;
  active_layer_ = 0;
  rebuild_bindings();
}

std::vector<IntentTransition> TouchEngine::transitions() const {
  if (ring_.size() < kTransitionRingSize) {
    return ring_;
  }
  std::vector<IntentTransition> out;
  out.reserve(ring_.size());
  for (std::size_t i = 0; i < ring_.size(); ++i) {
    out.push_back(ring_[(ring_head_ + i) % ring_.size()]);
  }
  return out;
}

std::uint64_t TouchEngine::fingerprint() const {
  std::uint64_t hash = kFnvOffset;
  for (const auto &st : sides_) {
    fnv_mix(hash, static_cast<std::uint64_t>(st.mode));
    fnv_mix(hash, static_cast<std::uint64_t>(st.prev_contacts));
    fnv_mix(hash, st.chord_latch ? 1 : 0);
    fnv_mix(hash, st.swipe.armed ? 1 : 0);
  }
  fnv_mix(hash, static_cast<std::uint64_t>(active_layer_));
  fnv_mix(hash, static_cast<std::uint64_t>(persistent_layer_));
  fnv_mix(hash, typing_enabled_ ? 1 : 0);
  fnv_mix(hash, keyboard_mode_ ? 1 : 0);
  fnv_mix(hash, shift_down_ ? 1 : 0);
  for (const auto &[key, touch] : touches_) {
    fnv_mix(hash, key);
    const std::uint64_t flags = (touch.off_key ? 1u : 0u) |
                                (touch.momentary ? 2u : 0u) |
                                (touch.hold_triggered ? 4u : 0u) |
                                (touch.emitted ? 8u : 0u) |
                                (touch.down_sent ? 16u : 0u);
    fnv_mix(hash, flags);
  }
  return hash;
}

EngineStatus TouchEngine::status() const {
  EngineStatus s;
  for (Side side : kSides) {
    const SideState &st = sides_[side_index(side)];
    s.contacts[side_index(side)] = st.prev_contacts;
    s.intent[side_index(side)] = st.mode;
    s.chord_shift[side_index(side)] = st.chord_latch;
  }
  s.active_layer = active_layer_;
  s.persistent_layer = persistent_layer_;
  s.typing_enabled = typing_enabled_;
  s.keyboard_mode = keyboard_mode_;
  s.shift_down = shift_down_;
  s.layout = keymap_.active_layout();
  s.fingerprint = fingerprint();
  s.metrics = metrics_;
  return s;
}

} // namespace glasskey
