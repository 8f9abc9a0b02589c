#include "test_support.hpp"

#include "glasskey/engine.hpp"
#include "glasskey/keymap.hpp"

#include <linux/input.h>

namespace {

using namespace glasskey;
using glasskey::test::blank_config;
using glasskey::test::find_binding;
using glasskey::test::frame;
using glasskey::test::RecordingSink;
using glasskey::test::touch;

Point center_of(const TouchEngine &engine, Side side, std::string_view key) {
  const KeyBinding *b = find_binding(engine, side, key);
  CHECK(b != nullptr);
  return b->rect.center();
}

/// Касание и отпускание в одной точке
void tap_at(TouchEngine &engine, Side side, Point p, double t,
            std::uint32_t id = 1) {
  engine.process_frame(frame(side, t, {touch(id, p)}));
  engine.process_frame(frame(side, t + 0.04));
}

void test_tap_emits_primary() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const Point y = center_of(engine, Side::Right, "right:0:0");
  tap_at(engine, Side::Right, y, 1.0);

  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 1);
  CHECK(sink.count(CommandKind::KeyTap) == 1);

  // Таймер удержания отпущенного касания устарел
  engine.fire_due_timers(2.0);
  CHECK(sink.count(CommandKind::KeyTap) == 1);
  CHECK(engine.metrics().stale_timers >= 1);
}

void test_reused_contact_id_ignores_old_timer() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};
  const Point y = center_of(engine, Side::Right, "right:0:0");

  // Первое касание отпущено до порога удержания (дедлайн 1.12)
  tap_at(engine, Side::Right, y, 1.0);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 1);

  // Драйвер выдал тот же id новому касанию раньше старого дедлайна
  engine.process_frame(frame(Side::Right, 1.06, {touch(1, y)}));
  engine.fire_due_timers(1.125);
  CHECK(sink.count(CommandKind::KeyTap, KEY_MINUS) == 0);
  CHECK(engine.metrics().hold_fires == 0);
  CHECK(engine.metrics().stale_timers >= 1);

  engine.process_frame(frame(Side::Right, 1.15));
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 2);
  CHECK(sink.count(CommandKind::KeyTap) == 2);

  // Третье касание с тем же id удерживается: ровно одно удержание
  engine.process_frame(frame(Side::Right, 2.0, {touch(1, y)}));
  engine.fire_due_timers(2.0 + 0.121);
  engine.process_frame(frame(Side::Right, 2.3));
  engine.fire_due_timers(3.0);
  CHECK(sink.count(CommandKind::KeyTap, KEY_MINUS) == 1);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 2);
}

void test_mouse_button_key_clicks() {
  KeymapStore keymap = KeymapStore::create_default();
  keymap.set_mapping(0, "right:0:4",
                     KeyMapping{resolve_action_label("Right Click"),
                                std::nullopt});
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, keymap, sink};

  tap_at(engine, Side::Right, center_of(engine, Side::Right, "right:0:4"),
         1.0);
  CHECK(sink.clicks(MouseButton::Right) == 1);
  CHECK(sink.count(CommandKind::MouseClick) == 1);
  CHECK(sink.count(CommandKind::KeyTap) == 0);
}

void test_hold_emits_hold_action() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const KeyBinding *b = find_binding(engine, Side::Right, "right:0:0");
  CHECK(b != nullptr && b->hold.has_value());
  const Point p = b->rect.center();
  const ScanCode hold_code = b->hold->code;
  CHECK(hold_code == KEY_MINUS);

  engine.process_frame(frame(Side::Right, 1.0, {touch(1, p)}));
  CHECK(engine.next_deadline().has_value());

  // Палец неподвижен, новых кадров нет: удержание срабатывает по таймеру
  engine.fire_due_timers(1.0 + 0.121);
  CHECK(sink.count(CommandKind::KeyTap, hold_code) == 1);
  CHECK(engine.metrics().hold_fires == 1);

  engine.process_frame(frame(Side::Right, 1.3, {touch(1, p)}));
  engine.process_frame(frame(Side::Right, 1.35));
  CHECK(sink.count(CommandKind::KeyTap, hold_code) == 1);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 0);
}

void test_force_click_triggers_hold() {
  EngineConfig config;
  config.force_click_min = 100.0;
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  const Point p = center_of(engine, Side::Right, "right:0:0");
  engine.process_frame(frame(Side::Right, 1.0, {touch(1, p, 200.0f)}));
  engine.process_frame(frame(Side::Right, 1.04));

  CHECK(engine.metrics().force_clicks == 1);
  CHECK(sink.count(CommandKind::KeyTap, KEY_MINUS) == 1);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 0);
  CHECK(sink.count(CommandKind::Haptic) == 1);

  // Слабое нажатие остаётся обычным тапом
  engine.process_frame(frame(Side::Right, 2.0, {touch(2, p, 50.0f)}));
  engine.process_frame(frame(Side::Right, 2.04));
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 1);
}

void test_force_click_disabled_by_default() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const Point p = center_of(engine, Side::Right, "right:0:0");
  engine.process_frame(frame(Side::Right, 1.0, {touch(1, p, 255.0f)}));
  engine.process_frame(frame(Side::Right, 1.04));

  CHECK(engine.metrics().force_clicks == 0);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 1);
}

void test_drag_cancels_key() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const Point p = center_of(engine, Side::Right, "right:1:1");
  const Point moved{p.x + 6.0 / kDefaultPadWidthMm, p.y};
  engine.process_frame(frame(Side::Right, 1.0, {touch(1, p)}));
  engine.process_frame(frame(Side::Right, 1.02, {touch(1, moved)}));
  engine.process_frame(frame(Side::Right, 1.04, {touch(1, moved)}));
  engine.process_frame(frame(Side::Right, 1.06));

  CHECK(sink.count(CommandKind::KeyTap) == 0);
  CHECK(engine.metrics().drag_cancels >= 1);
}

void test_typing_disabled_suppresses_keys() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};
  const Point y = center_of(engine, Side::Right, "right:0:0");

  engine.set_typing_enabled(false, 0.5);
  CHECK(!engine.typing_enabled());
  tap_at(engine, Side::Right, y, 1.0);
  CHECK(sink.count(CommandKind::KeyTap) == 0);
  CHECK(engine.metrics().typing_suppressed >= 1);

  engine.set_typing_enabled(true, 2.0);
  tap_at(engine, Side::Right, y, 3.0, 2);
  CHECK(sink.count(CommandKind::KeyTap, KEY_Y) == 1);
}

void test_momentary_layer() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const KeyBinding *mo = find_binding(engine, Side::Left, "custom:default-left-1");
  CHECK(mo != nullptr);
  CHECK(mo->action.kind == ActionKind::MomentaryLayer);
  const Point mo_point = mo->rect.center();

  engine.process_frame(frame(Side::Left, 1.0, {touch(1, mo_point)}));
  CHECK(engine.active_layer() == 1);

  const KeyBinding *seven = find_binding(engine, Side::Right, "right:0:1");
  CHECK(seven != nullptr);
  CHECK(seven->action.code == KEY_7);
  const Point p = seven->rect.center();

  tap_at(engine, Side::Right, p, 1.02);
  CHECK(sink.count(CommandKind::KeyTap, KEY_7) == 1);

  engine.process_frame(frame(Side::Left, 1.1));
  CHECK(engine.active_layer() == 0);
  CHECK(engine.status().persistent_layer == 0);
}

void test_layer_toggle_restores_bindings() {
  KeymapStore keymap = KeymapStore::create_default();
  const KeyMapping toggle{resolve_action_label("TG(2)"), std::nullopt};
  keymap.set_mapping(0, "right:0:4", toggle);
  keymap.set_mapping(2, "right:0:4", toggle);
  keymap.set_mapping(2, "right:0:0",
                     KeyMapping{resolve_action_label("Z"), std::nullopt});

  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, keymap, sink};
  const Point tg = center_of(engine, Side::Right, "right:0:4");

  tap_at(engine, Side::Right, tg, 1.0);
  CHECK(engine.active_layer() == 2);
  CHECK(engine.status().persistent_layer == 2);
  CHECK(find_binding(engine, Side::Right, "right:0:0")->action.code == KEY_Z);

  tap_at(engine, Side::Right, tg, 2.0, 2);
  CHECK(engine.active_layer() == 0);
  CHECK(find_binding(engine, Side::Right, "right:0:0")->action.code == KEY_Y);
  CHECK(sink.count(CommandKind::KeyTap) == 0);
}

void test_modifier_key_held_while_touching() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};

  const KeyBinding *shift = find_binding(engine, Side::Left, "left:1:5");
  CHECK(shift != nullptr);
  CHECK(shift->action.kind == ActionKind::Modifier);
  const Point p = shift->rect.center();

  engine.process_frame(frame(Side::Left, 1.0, {touch(1, p)}));
  CHECK(sink.count(CommandKind::ModifierDown, KEY_LEFTSHIFT) == 1);
  engine.process_frame(frame(Side::Left, 1.5, {touch(1, p)}));
  CHECK(sink.count(CommandKind::ModifierUp) == 0);
  engine.process_frame(frame(Side::Left, 1.6));
  CHECK(sink.count(CommandKind::ModifierUp, KEY_LEFTSHIFT) == 1);
}

void test_pointer_and_keyboard_mode() {
  {
    RecordingSink sink;
    TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};
    for (int i = 0; i < 4; ++i) {
      engine.process_frame(frame(Side::Right, 1.0 + 0.02 * i,
                                 {touch(1, 0.5 + 0.05 * i, 0.5)}));
    }
    CHECK(engine.intent(Side::Right) == IntentMode::MouseActive);
    CHECK(sink.count(CommandKind::PointerMove) >= 1);
    for (const Command &c : sink.commands) {
      if (c.kind == CommandKind::PointerMove) {
        CHECK(c.dx > 0);
        CHECK(c.dy == 0);
      }
    }
  }
  {
    EngineConfig config = blank_config();
    config.keyboard_mode = true;
    RecordingSink sink;
    TouchEngine engine{config, KeymapStore::create_default(), sink};
    for (int i = 0; i < 4; ++i) {
      engine.process_frame(frame(Side::Right, 1.0 + 0.02 * i,
                                 {touch(1, 0.5 + 0.05 * i, 0.5)}));
    }
    CHECK(engine.intent(Side::Right) == IntentMode::TypingCommitted);
    CHECK(sink.count(CommandKind::PointerMove) == 0);
  }
}

void test_voice_suppressed_in_replay() {
  KeymapStore keymap = KeymapStore::create_default();
  keymap.set_mapping(0, "right:0:4",
                     KeyMapping{resolve_action_label("Voice"), std::nullopt});
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, keymap, sink};
  const Point p = center_of(engine, Side::Right, "right:0:4");

  engine.process_frame(frame(Side::Right, 1.0, {touch(1, p)}), true);
  engine.process_frame(frame(Side::Right, 1.04), true);
  CHECK(sink.count(CommandKind::SystemKey) == 0);
  CHECK(engine.metrics().replay_suppressed == 1);

  engine.process_frame(frame(Side::Right, 2.0, {touch(2, p)}));
  engine.process_frame(frame(Side::Right, 2.04));
  CHECK(sink.count(CommandKind::SystemKey) == 1);
}

void test_reset_all_restores_initial_state() {
  RecordingSink sink;
  TouchEngine engine{EngineConfig{}, KeymapStore::create_default(), sink};
  const std::uint64_t initial = engine.fingerprint();

  engine.set_persistent_layer(3, 0.5);
  engine.set_typing_enabled(false, 0.5);
  engine.process_frame(frame(Side::Right, 1.0, {touch(1, 0.5, 0.5)}));
  CHECK(engine.fingerprint() != initial);

  engine.reset_all(2.0);
  CHECK(engine.fingerprint() == initial);
  CHECK(engine.active_layer() == 0);
  CHECK(engine.typing_enabled());
  CHECK(engine.metrics().frames == 0);
}

} // namespace

int main() {
  test_tap_emits_primary();
  test_reused_contact_id_ignores_old_timer();
  test_mouse_button_key_clicks();
  test_hold_emits_hold_action();
  test_force_click_triggers_hold();
  test_force_click_disabled_by_default();
  test_drag_cancels_key();
  test_typing_disabled_suppresses_keys();
  test_momentary_layer();
  test_layer_toggle_restores_bindings();
  test_modifier_key_held_while_touching();
  test_pointer_and_keyboard_mode();
  test_voice_suppressed_in_replay();
  test_reset_all_restores_initial_state();

  std::cout << "OK\n";
  return 0;
}
