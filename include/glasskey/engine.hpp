/**
 * @file engine.hpp
 * @brief Движок распознавания: касания -> клавиши, клики, жесты, указатель
 *
 * TouchEngine - однопоточная машина состояний. Все входы (кадры, таймеры,
 * смена конфигурации) должны приходить из одного потока; многопоточная
 * обвязка живёт в InputRuntime.
 *
 * Время движка - шкала меток кадров (секунды). Таймеры удержания и окна
 * печати срабатывают либо перед кадром, чья метка превысила дедлайн, либо
 * явно через fire_due_timers(). Эффект таймера всегда датируется его
 * дедлайном, поэтому воспроизведение захвата детерминировано.
 */

#pragma once

#include "glasskey/binding_index.hpp"
#include "glasskey/command.hpp"
#include "glasskey/config.hpp"
#include "glasskey/keymap.hpp"
#include "glasskey/layout.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace glasskey {

// ===========================================================================
// Константы распознавания
// ===========================================================================

inline constexpr double kFiveFingerSwipeThresholdMm = 8.0;
inline constexpr int kSwipeArmContacts = 5;
inline constexpr int kSwipeSustainContacts = 4;
inline constexpr int kSwipeReleaseContacts = 2;
inline constexpr int kChordShiftContactThreshold = 4;
inline constexpr double kChordSourceStaleTimeout = 0.200;
inline constexpr double kHapticMinInterval = 0.020;
/// Зона угла: доля поверхности от края
inline constexpr double kCornerZone = 0.16;
inline constexpr std::size_t kTransitionRingSize = 256;

// ===========================================================================
// Типы состояния
// ===========================================================================

enum class IntentMode : std::uint8_t {
  Idle,
  KeyCandidate,
  TypingCommitted,
  MouseCandidate,
  MouseActive,
  GestureCandidate
};

[[nodiscard]] constexpr std::string_view
intent_mode_name(IntentMode mode) noexcept {
  switch (mode) {
  case IntentMode::Idle:
    return "idle";
  case IntentMode::KeyCandidate:
    return "key-candidate";
  case IntentMode::TypingCommitted:
    return "typing";
  case IntentMode::MouseCandidate:
    return "mouse-candidate";
  case IntentMode::MouseActive:
    return "mouse";
  case IntentMode::GestureCandidate:
    return "gesture";
  }
  return "unknown";
}

/// Запись кольцевого журнала переходов намерения
struct IntentTransition {
  double timestamp = 0.0;
  Side side = Side::Left;
  IntentMode from = IntentMode::Idle;
  IntentMode to = IntentMode::Idle;
  std::string_view reason;
};

/// Счётчики движка (только растут до reset_metrics)
struct EngineMetrics {
  std::uint64_t frames = 0;
  std::uint64_t commands = 0;
  std::uint64_t typing_suppressed = 0;
  std::uint64_t replay_suppressed = 0;
  std::uint64_t snap_attempts = 0;
  std::uint64_t snap_accepted = 0;
  std::uint64_t snap_rejected = 0;
  std::uint64_t drag_cancels = 0;
  std::uint64_t cross_key_drops = 0;
  std::uint64_t force_clicks = 0;
  std::uint64_t hold_fires = 0;
  std::uint64_t gesture_fires = 0;
  std::uint64_t timers_fired = 0;
  std::uint64_t stale_timers = 0;
};

/// Снимок состояния для опроса извне
struct EngineStatus {
  std::array<int, kSideCount> contacts{};
  std::array<IntentMode, kSideCount> intent{};
  std::array<bool, kSideCount> chord_shift{};
  int active_layer = 0;
  int persistent_layer = 0;
  bool typing_enabled = true;
  bool keyboard_mode = false;
  bool shift_down = false;
  std::string layout;
  std::uint64_t fingerprint = 0;
  EngineMetrics metrics;
};

/// Токен отложенного действия. Устаревший токен (другое поколение) инертен.
struct TimerToken {
  enum class Kind : std::uint8_t { Hold, TypingGrace, KeyBuffer, GestureHold };

  double deadline = 0.0;
  Kind kind = Kind::Hold;
  Side side = Side::Left;
  std::uint64_t touch_key = 0;
  std::uint64_t generation = 0;
};

// ===========================================================================
// TouchEngine
// ===========================================================================

class TouchEngine {
public:
  TouchEngine(EngineConfig config, KeymapStore keymap, CommandSink &sink);

  TouchEngine(const TouchEngine &) = delete;
  TouchEngine &operator=(const TouchEngine &) = delete;

  /**
   * @brief Обрабатывает кадр одной поверхности
   *
   * Сначала срабатывают таймеры с дедлайном до метки кадра.
   *
   * @param frame Кадр (координаты приводятся к [0, 1])
   * @param is_replay Кадр из воспроизведения (голосовой ввод подавляется)
   */
  void process_frame(const RawTouchFrame &frame, bool is_replay = false);

  /// Срабатывают все таймеры с дедлайном <= now
  void fire_due_timers(double now);

  /// Ближайший живой дедлайн
  [[nodiscard]] std::optional<double> next_deadline() const;

  // --- конфигурация ---
  void set_config(EngineConfig config);
  void set_keymap(KeymapStore keymap);
  [[nodiscard]] const EngineConfig &config() const noexcept { return config_; }
  [[nodiscard]] const KeymapStore &keymap() const noexcept { return keymap_; }

  void set_persistent_layer(int layer, double now);
  void set_typing_enabled(bool enabled, double now);
  void set_keyboard_mode(bool enabled);

  /// Отпускает удерживаемое, сбрасывает касания, жесты и таймеры
  void reset_state(double now);
  /// reset_state() плюс слой 0, печать включена, счётчики и журнал пусты
  void reset_all(double now);

  /// При true команды не отправляются (перемотка воспроизведения)
  void set_output_muted(bool muted) noexcept { muted_ = muted; }

  // --- наблюдение ---
  [[nodiscard]] EngineStatus status() const;
  [[nodiscard]] const EngineMetrics &metrics() const noexcept {
    return metrics_;
  }
  [[nodiscard]] std::vector<IntentTransition> transitions() const;
  [[nodiscard]] std::uint64_t fingerprint() const;
  [[nodiscard]] std::span<const KeyBinding> bindings(Side side) const noexcept {
    return indices_[side_index(side)].bindings();
  }
  [[nodiscard]] int active_layer() const noexcept { return active_layer_; }
  [[nodiscard]] bool typing_enabled() const noexcept {
    return typing_enabled_;
  }
  [[nodiscard]] IntentMode intent(Side side) const noexcept {
    return sides_[side_index(side)].mode;
  }

private:
  /// Состояние отслеживаемого касания клавиши
  struct TouchState {
    Side side = Side::Left;
    std::uint32_t id = 0;
    std::uint64_t generation = 0;
    double start_time = 0.0;
    Point start;
    Point last;
    double max_distance_mm = 0.0;
    std::optional<KeyBinding> binding;
    /// Касание вне клавиш, ждущее примагничивания при отпускании
    bool off_key = false;
    bool momentary = false;
    int momentary_layer = 0;
    bool hold_triggered = false;
    bool emitted = false;
    bool down_sent = false;
    KeyAction down_action;
  };

  /// Трекинг пальца для классификации намерения
  struct IntentTouch {
    Point start;
    Point last;
    double start_time = 0.0;
    double last_time = 0.0;
    double max_distance_mm = 0.0;
    double velocity_mm_s = 0.0;
    bool on_key = false;
    bool anchor = false;
  };

  struct SwipeState {
    bool armed = false;
    bool triggered = false;
  };

  struct TapGestureState {
    bool active = false;
    bool invalid = false;
    int max_contacts = 0;
    double start_time = 0.0;
  };

  struct HoldGestureState {
    bool pending = false;
    bool fired = false;
    double start_time = 0.0;
    std::uint64_t generation = 0;
  };

  struct SideState {
    IntentMode mode = IntentMode::Idle;
    double mode_since = 0.0;
    bool until_all_up = false;
    int prev_contacts = 0;
    std::map<std::uint32_t, IntentTouch> touches;
    Point centroid_start;
    SwipeState swipe;
    TapGestureState tap;
    HoldGestureState corner;
    bool corner_outer = true;
    HoldGestureState four_hold;
    std::uint64_t key_buffer_generation = 0;
    /// Сырой счётчик контактов для аккордового Shift
    int raw_contacts = 0;
    double raw_time = 0.0;
    bool chord_latch = false;
    double last_haptic = -1.0;
    Point pointer_last;
    std::uint32_t pointer_id = 0;
    bool pointer_valid = false;
    double pointer_residue_x = 0.0;
    double pointer_residue_y = 0.0;
  };

  // engine.cpp
  void rebuild_bindings();
  void handle_contact(Side side, const Contact &contact, double now);
  void handle_release(TouchState &touch, double now);
  void check_hold(TouchState &touch, double now);
  void try_force_click(TouchState &touch, float pressure, double now);
  bool begin_press(const KeyAction &action, TouchState &touch, double now);
  void end_press(TouchState &touch, double now);
  void dispatch_tap(const KeyAction &action, Side side, double now);
  void apply_action_state(const KeyAction &action, Side side, double now);
  void extend_typing_grace(Side side, double now);
  void update_active_layer();
  void consume_side_touches(Side side, double now);
  void release_all_held(double now);
  void pulse_haptic(Side side, double strength, double now);
  bool emit(Command command);
  void on_timer(const TimerToken &token);
  void schedule(TimerToken token);
  [[nodiscard]] bool grace_active(double now) const noexcept;
  [[nodiscard]] double mm_distance(Point a, Point b) const noexcept;

  // engine_intent.cpp
  void track_intent_touches(Side side, std::span<const Contact> tips,
                            double now);
  void update_intent(Side side, int count, double now);
  void set_intent(Side side, IntentMode mode, double now,
                  std::string_view reason);
  void emit_pointer_motion(Side side, std::span<const Contact> tips,
                           double now);

  // engine_gestures.cpp
  void update_chord_shift(Side side, int count, double now);
  [[nodiscard]] bool is_chord_source(Side side) const noexcept;
  [[nodiscard]] bool chordal_shift_gesture() const;
  void update_tap_gesture(Side side, int count, double now);
  void update_five_finger_swipe(Side side, int count, double now);
  void update_corner_hold(Side side, std::span<const Contact> tips,
                          double now);
  void update_four_finger_hold(Side side, int count, double now);
  void run_gesture_action(std::string_view label, Side side, double now);
  [[nodiscard]] Point centroid(Side side) const;

  [[nodiscard]] static std::uint64_t touch_key(Side side,
                                               std::uint32_t id) noexcept {
    return (static_cast<std::uint64_t>(side_index(side)) << 32) | id;
  }

  EngineConfig config_;
  KeymapStore keymap_;
  CommandSink &sink_;

  std::array<KeyLayout, kSideCount> layouts_;
  std::array<BindingIndex, kSideCount> indices_;
  std::array<SideState, kSideCount> sides_;
  std::map<std::uint64_t, TouchState> touches_;
  /// Удерживаемые MO(n): (ключ касания, слой) в порядке нажатия
  std::vector<std::pair<std::uint64_t, int>> momentary_;

  int persistent_layer_ = 0;
  int active_layer_ = 0;
  bool typing_enabled_ = true;
  bool keyboard_mode_ = false;
  bool shift_down_ = false;
  bool replay_ = false;
  bool muted_ = false;

  double now_ = 0.0;
  double grace_deadline_ = -1.0;
  std::uint64_t grace_generation_ = 0;
  std::uint64_t generation_counter_ = 0;
  std::vector<TimerToken> timers_;

  std::vector<IntentTransition> ring_;
  std::size_t ring_head_ = 0;

  EngineMetrics metrics_;
};

} // namespace glasskey
