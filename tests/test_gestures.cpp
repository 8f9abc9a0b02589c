#include "test_support.hpp"

#include "glasskey/engine.hpp"
#include "glasskey/keymap.hpp"

#include <linux/input.h>

namespace {

using namespace glasskey;
using glasskey::test::blank_config;
using glasskey::test::frame;
using glasskey::test::RecordingSink;
using glasskey::test::touch;

std::vector<Contact> row_of(int fingers, double x, double y0 = 0.2,
                            double step = 0.15) {
  std::vector<Contact> out;
  for (int i = 0; i < fingers; ++i) {
    out.push_back(touch(static_cast<std::uint32_t>(i + 1), x, y0 + step * i));
  }
  return out;
}

void test_two_finger_tap_left_click() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(
      frame(Side::Right, 1.0, {touch(1, 0.4, 0.5), touch(2, 0.6, 0.5)}));
  CHECK(engine.intent(Side::Right) == IntentMode::GestureCandidate);
  engine.process_frame(frame(Side::Right, 1.08));

  CHECK(sink.clicks(MouseButton::Left) == 1);
  CHECK(sink.clicks(MouseButton::Right) == 0);
  CHECK(engine.metrics().gesture_fires == 1);
}

void test_three_finger_tap_right_click() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Right, 1.0, row_of(3, 0.5)));
  engine.process_frame(frame(Side::Right, 1.1));

  CHECK(sink.clicks(MouseButton::Right) == 1);
  CHECK(sink.clicks(MouseButton::Left) == 0);
}

void test_staggered_third_finger_upgrades_tap() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  auto three = row_of(3, 0.5);
  auto two = std::vector<Contact>(three.begin(), three.begin() + 2);
  engine.process_frame(frame(Side::Right, 1.0, two));
  engine.process_frame(frame(Side::Right, 1.02, three));
  engine.process_frame(frame(Side::Right, 1.1));

  CHECK(sink.clicks(MouseButton::Right) == 1);
  CHECK(sink.clicks(MouseButton::Left) == 0);
}

void test_moving_fingers_cancel_tap() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(
      frame(Side::Right, 1.0, {touch(1, 0.4, 0.5), touch(2, 0.6, 0.5)}));
  engine.process_frame(
      frame(Side::Right, 1.04, {touch(1, 0.43, 0.5), touch(2, 0.63, 0.5)}));
  engine.process_frame(frame(Side::Right, 1.08));

  CHECK(sink.count(CommandKind::MouseClick) == 0);
}

void test_slow_tap_exceeds_cadence() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  const auto two = std::vector<Contact>{touch(1, 0.4, 0.5), touch(2, 0.6, 0.5)};
  engine.process_frame(frame(Side::Right, 1.0, two));
  engine.process_frame(frame(Side::Right, 1.2, two));
  engine.process_frame(frame(Side::Right, 1.4, two));
  engine.process_frame(frame(Side::Right, 1.45));

  CHECK(sink.count(CommandKind::MouseClick) == 0);
}

void test_tap_click_disabled() {
  EngineConfig config = blank_config();
  config.tap_click_enabled = false;
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  engine.process_frame(
      frame(Side::Right, 1.0, {touch(1, 0.4, 0.5), touch(2, 0.6, 0.5)}));
  engine.process_frame(frame(Side::Right, 1.08));
  CHECK(sink.count(CommandKind::MouseClick) == 0);
}

void test_five_finger_swipe_toggles_typing() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Right, 1.0, row_of(5, 0.6, 0.1)));
  engine.process_frame(frame(Side::Right, 1.05, row_of(5, 0.5, 0.1)));
  CHECK(!engine.typing_enabled());

  // Одно срабатывание на жест
  engine.process_frame(frame(Side::Right, 1.1, row_of(5, 0.4, 0.1)));
  CHECK(!engine.typing_enabled());
  engine.process_frame(frame(Side::Right, 1.15));

  engine.process_frame(frame(Side::Right, 2.0, row_of(5, 0.4, 0.1)));
  engine.process_frame(frame(Side::Right, 2.05, row_of(5, 0.5, 0.1)));
  CHECK(engine.typing_enabled());
  engine.process_frame(frame(Side::Right, 2.1));

  CHECK(engine.metrics().gesture_fires == 2);
  CHECK(sink.count(CommandKind::MouseClick) == 0);
}

void test_vertical_swipe_does_nothing() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Right, 1.0, row_of(5, 0.5, 0.1, 0.1)));
  engine.process_frame(frame(Side::Right, 1.05, row_of(5, 0.5, 0.25, 0.1)));
  engine.process_frame(frame(Side::Right, 1.1));

  CHECK(engine.typing_enabled());
  CHECK(engine.metrics().gesture_fires == 0);
}

void test_chordal_shift_latches_other_side() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Left, 1.0, row_of(4, 0.5)));
  CHECK(sink.count(CommandKind::ModifierDown, KEY_LEFTSHIFT) == 1);
  CHECK(engine.status().shift_down);
  CHECK(engine.status().chord_shift[side_index(Side::Right)]);

  engine.process_frame(frame(Side::Left, 1.05, row_of(4, 0.5)));
  CHECK(sink.count(CommandKind::ModifierDown, KEY_LEFTSHIFT) == 1);

  engine.process_frame(frame(Side::Left, 1.1));
  CHECK(sink.count(CommandKind::ModifierUp, KEY_LEFTSHIFT) == 1);
  CHECK(!engine.status().shift_down);
}

void test_chordal_shift_releases_on_stale_source() {
  RecordingSink sink;
  TouchEngine engine{blank_config(), KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Left, 1.0, row_of(4, 0.5)));
  CHECK(engine.status().shift_down);

  // Левая поверхность замолчала: кадр правой после таймаута снимает Shift
  engine.process_frame(frame(Side::Right, 1.0 + kChordSourceStaleTimeout + 0.05));
  CHECK(!engine.status().shift_down);
  CHECK(sink.count(CommandKind::ModifierUp, KEY_LEFTSHIFT) == 1);
}

void test_chordal_shift_disabled() {
  EngineConfig config = blank_config();
  config.chordal_shift_enabled = false;
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Left, 1.0, row_of(4, 0.5)));
  engine.process_frame(frame(Side::Left, 1.1));
  CHECK(sink.count(CommandKind::ModifierDown) == 0);
}

void test_outer_corner_hold() {
  EngineConfig config = blank_config();
  config.gestures.outer_corners_hold = "Right Click";
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  const std::vector<Contact> corners{touch(1, 0.95, 0.05),
                                     touch(2, 0.95, 0.95)};
  engine.process_frame(frame(Side::Right, 1.0, corners));
  engine.process_frame(frame(Side::Right, 1.2, corners));
  engine.process_frame(frame(Side::Right, 1.4, corners));
  engine.process_frame(frame(Side::Right, 1.45));

  CHECK(sink.clicks(MouseButton::Right) == 1);
  CHECK(sink.clicks(MouseButton::Left) == 0);
}

void test_inner_corner_none_is_ignored() {
  EngineConfig config = blank_config();
  config.gestures.outer_corners_hold = "Right Click";
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  // Левый край правой поверхности - внутренний
  const std::vector<Contact> corners{touch(1, 0.05, 0.05),
                                     touch(2, 0.05, 0.95)};
  engine.process_frame(frame(Side::Right, 1.0, corners));
  engine.process_frame(frame(Side::Right, 1.2, corners));
  engine.process_frame(frame(Side::Right, 1.25));

  CHECK(sink.clicks(MouseButton::Right) == 0);
}

void test_four_finger_hold_generic_action() {
  EngineConfig config = blank_config();
  config.gestures.four_finger_hold = "Middle Click";
  RecordingSink sink;
  TouchEngine engine{config, KeymapStore::create_default(), sink};

  engine.process_frame(frame(Side::Right, 1.0, row_of(4, 0.5)));
  engine.fire_due_timers(1.0 + 0.121);
  CHECK(sink.clicks(MouseButton::Middle) == 1);

  engine.process_frame(frame(Side::Right, 1.3, row_of(4, 0.5)));
  engine.process_frame(frame(Side::Right, 1.35));
  CHECK(sink.clicks(MouseButton::Middle) == 1);
  CHECK(sink.count(CommandKind::ModifierDown) == 0);
}

} // namespace

int main() {
  test_two_finger_tap_left_click();
  test_three_finger_tap_right_click();
  test_staggered_third_finger_upgrades_tap();
  test_moving_fingers_cancel_tap();
  test_slow_tap_exceeds_cadence();
  test_tap_click_disabled();
  test_five_finger_swipe_toggles_typing();
  test_vertical_swipe_does_nothing();
  test_chordal_shift_latches_other_side();
  test_chordal_shift_releases_on_stale_source();
  test_chordal_shift_disabled();
  test_outer_corner_hold();
  test_inner_corner_none_is_ignored();
  test_four_finger_hold_generic_action();

  std::cout << "OK\n";
  return 0;
}
