#include "test_support.hpp"

#include "glasskey/binding_index.hpp"
#include "glasskey/geometry.hpp"
#include "glasskey/key_action.hpp"
#include "glasskey/keymap.hpp"
#include "glasskey/layout.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include <linux/input.h>

namespace {

using namespace glasskey;

bool near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

std::filesystem::path temp_path(std::string_view name) {
  return std::filesystem::temp_directory_path() /
         ("glasskey-test-" + std::to_string(::getpid()) + "-" +
          std::string{name});
}

void test_rotation_normalization() {
  CHECK(near(normalize_rotation(270.0), -90.0));
  CHECK(near(normalize_rotation(-180.0), 180.0));
  CHECK(near(normalize_rotation(540.0), 180.0));
  CHECK(near(normalize_rotation(std::nan("")), 0.0));
}

void test_rect_contains_and_mirror() {
  const NormalizedRect r{0.1, 0.1, 0.2, 0.1};
  CHECK(r.contains({0.2, 0.15}));
  CHECK(!r.contains({0.5, 0.5}));
  CHECK(near(r.center().x, 0.2));

  // Расстояние до ближайшей стороны: положительное внутри, отрицательное снаружи
  CHECK(near(r.distance_to_edge({0.2, 0.15}), 0.05));
  CHECK(near(r.distance_to_edge({0.28, 0.15}), 0.02));
  CHECK(r.distance_to_edge({0.5, 0.5}) < 0.0);

  const NormalizedRect m = r.mirrored();
  CHECK(near(m.x(), 0.7));
  CHECK(m.contains({0.8, 0.15}));

  // Повёрнутый на 90 градусов прямоугольник вытянут по вертикали
  const NormalizedRect rotated{0.4, 0.45, 0.2, 0.1, 90.0};
  CHECK(rotated.contains({0.5, 0.58}));
  CHECK(!rotated.contains({0.58, 0.5}));
  CHECK(near(rotated.distance_sq_outside({0.5, 0.5}), 0.0));
  CHECK(near(rotated.distance_to_edge({0.5, 0.58}), 0.02, 1e-9));
}

void test_action_labels() {
  const KeyAction copy = resolve_action_label("Ctrl+C");
  CHECK(copy.kind == ActionKind::KeyChord);
  CHECK(copy.code == KEY_C);
  CHECK(copy.modifier == KEY_LEFTCTRL);

  const KeyAction bang = resolve_action_label("!");
  CHECK(bang.kind == ActionKind::KeyChord);
  CHECK(bang.code == KEY_1);
  CHECK(bang.modifier == KEY_LEFTSHIFT);

  CHECK(resolve_action_label("MO(3)").kind == ActionKind::MomentaryLayer);
  CHECK(resolve_action_label("MO(3)").layer == 3);
  CHECK(resolve_action_label("TO(9)").layer == kMaxLayer);
  CHECK(resolve_action_label("TG(1)").kind == ActionKind::LayerToggle);
  CHECK(resolve_action_label("Left Click").kind == ActionKind::MouseButton);
  CHECK(resolve_action_label("RClick").button == MouseButton::Right);
  CHECK(resolve_action_label("Typing Toggle").kind == ActionKind::TypingToggle);
  CHECK(resolve_action_label("VolUp").kind == ActionKind::SystemControl);
  CHECK(resolve_action_label("Space").kind == ActionKind::Continuous);
  CHECK(resolve_action_label("Shift").kind == ActionKind::Modifier);
  CHECK(resolve_action_label("q").code == KEY_Q);

  const KeyAction chord = resolve_action_label("Chordal Shift");
  CHECK(chord.kind == ActionKind::Modifier);
  CHECK(chord.code == KEY_LEFTSHIFT);
  CHECK(is_chordal_shift_label("ChordShift"));

  CHECK(resolve_action_label("None").kind == ActionKind::None);
  CHECK(resolve_action_label("").kind == ActionKind::None);
  CHECK(is_none_label(""));
}

void test_presets() {
  CHECK(all_presets().front().name == "blank");
  CHECK(resolve_preset("6X3").name == "6x3");
  CHECK(resolve_preset("unknown").name == "6x3");

  const LayoutPreset &preset = resolve_preset("6x3");
  const auto columns = default_column_settings(preset);
  const KeyLayout right = build_layout(preset, kDefaultPadWidthMm,
                                       kDefaultPadHeightMm, columns, false);
  const KeyLayout left = build_layout(preset, kDefaultPadWidthMm,
                                      kDefaultPadHeightMm, columns, true);

  CHECK(right.rects.size() == 3);
  CHECK(right.rects[0].size() == 6);
  CHECK(right.labels[0][0] == "Y");
  CHECK(left.labels[0][5] == "Y");

  // Левая поверхность зеркальна правой
  const NormalizedRect &a = right.rects[1][2];
  const NormalizedRect &b = left.rects[1][2];
  CHECK(near(b.x(), 1.0 - a.x() - a.width()));
  CHECK(near(a.y(), b.y()));

  // Все клавиши внутри поверхности
  for (const auto &row : right.rects) {
    for (const auto &r : row) {
      CHECK(r.x() >= 0.0 && r.x() + r.width() <= 1.0);
      CHECK(r.y() >= 0.0 && r.y() + r.height() <= 1.0);
    }
  }

  const KeyLayout blank = build_layout(resolve_preset("blank"), 160.0, 114.9,
                                       {}, false);
  CHECK(blank.empty());

  CHECK(storage_key(Side::Left, 1, 3) == "left:1:3");
}

void test_key_spacing_separates_keys() {
  const LayoutPreset &preset = resolve_preset("6x3");
  const auto columns = default_column_settings(preset);
  const KeyLayout tight = build_layout(preset, 160.0, 114.9, columns, false);
  const KeyLayout spaced =
      build_layout(preset, 160.0, 114.9, columns, false, 10.0);
  const double gap_tight = tight.rects[1][0].y() - tight.rects[0][0].y();
  const double gap_spaced = spaced.rects[1][0].y() - spaced.rects[0][0].y();
  CHECK(gap_spaced > gap_tight);
}

void test_keymap_resolution() {
  const KeymapStore store = KeymapStore::create_default();
  const KeyMapping y = store.resolve_mapping(0, "right:0:0", "Y");
  CHECK(y.primary.code == KEY_Y);
  CHECK(y.hold.has_value());
  CHECK(y.hold->code == KEY_MINUS);

  // Нет маппинга: подпись пресета
  const KeyMapping p = store.resolve_mapping(0, "right:0:4", "P");
  CHECK(p.primary.code == KEY_P);
  CHECK(!p.hold.has_value());

  CHECK(store.resolve_custom_buttons(0, Side::Right).size() == 1);
  CHECK(store.resolve_custom_buttons(0, Side::Left).size() == 2);
}

void test_keymap_save_load() {
  KeymapStore store = KeymapStore::create_default();
  store.set_mapping(3, "left:2:2",
                    KeyMapping{resolve_action_label("Ctrl+Z"),
                               resolve_action_label("Ctrl+Y")});
  CustomButton button;
  button.id = "extra";
  button.side = Side::Right;
  button.rect = NormalizedRect{0.8, 0.8, 0.15, 0.15};
  button.mapping = KeyMapping{resolve_action_label("Ret"), std::nullopt};
  store.add_custom_button(3, button);

  const auto path = temp_path("keymap.conf");
  CHECK(save_keymap(store, path) == ConfigResult::Ok);

  const KeymapLoadOutcome loaded = load_keymap_checked(path);
  CHECK(loaded.result == ConfigResult::Ok);

  const KeyMapping undo = loaded.store.resolve_mapping(3, "left:2:2", "C");
  CHECK(undo.primary.kind == ActionKind::KeyChord);
  CHECK(undo.primary.code == KEY_Z);
  CHECK(undo.hold.has_value() && undo.hold->code == KEY_Y);

  const auto buttons = loaded.store.resolve_custom_buttons(3, Side::Right);
  CHECK(buttons.size() == 1);
  CHECK(buttons[0].id == "extra");
  CHECK(near(buttons[0].rect.x(), 0.8, 1e-5));

  // Заводские маппинги пережили сохранение
  const LayoutPreset &preset = resolve_preset("6x3");
  for (const Side side : {Side::Left, Side::Right}) {
    const LabelGrid labels =
        side == Side::Left ? preset.left_labels() : preset.right_labels;
    for (int layer = 0; layer < 2; ++layer) {
      for (int r = 0; r < preset.rows; ++r) {
        for (int c = 0; c < preset.columns; ++c) {
          const std::string key = storage_key(side, r, c);
          const std::string &label =
              labels[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)];
          CHECK(loaded.store.resolve_mapping(layer, key, label) ==
                store.resolve_mapping(layer, key, label));
        }
      }
    }
  }

  std::filesystem::remove(path);
}

void test_corrupt_keymap_falls_back() {
  const auto path = temp_path("corrupt.conf");
  {
    std::ofstream out{path};
    out << "layout: 6x3\nlayer: 0\nthis is not a mapping\n";
  }
  const KeymapLoadOutcome loaded = load_keymap_checked(path);
  CHECK(loaded.result == ConfigResult::ParseError);
  CHECK(!loaded.error.empty());
  CHECK(loaded.store == KeymapStore::create_default());
  CHECK(load_keymap(path) == KeymapStore::create_default());
  std::filesystem::remove(path);

  const KeymapLoadOutcome missing = load_keymap_checked(temp_path("absent"));
  CHECK(missing.result == ConfigResult::FileNotFound);
}

void test_custom_button_clamped() {
  const NormalizedRect r = clamp_custom_button_rect({0.98, -0.2, 0.01, 2.0});
  CHECK(r.width() >= kMinCustomButtonSize);
  CHECK(r.x() + r.width() <= 1.0 + 1e-9);
  CHECK(r.y() >= 0.0);
  CHECK(r.y() + r.height() <= 1.0 + 1e-9);
}

void test_binding_index_hit_and_snap() {
  const LayoutPreset &preset = resolve_preset("6x3");
  const KeyLayout layout =
      build_layout(preset, kDefaultPadWidthMm, kDefaultPadHeightMm,
                   default_column_settings(preset), false);
  const KeymapStore store = KeymapStore::create_default();
  const BindingIndex index =
      BindingIndex::build(Side::Right, layout, store, 0, 0.35);

  const NormalizedRect &y_rect = layout.rects[0][0];
  const KeyBinding *hit = index.hit_test(y_rect.center());
  CHECK(hit != nullptr);
  CHECK(hit->storage_key == "right:0:0");
  CHECK(hit->action.code == KEY_Y);

  // Чуть выше верхнего ряда: мимо клавиш, но в радиусе примагничивания
  const Point above{y_rect.center().x, y_rect.y() - 0.02};
  CHECK(index.hit_test(above) == nullptr);
  const KeyBinding *snapped = index.try_snap(above, 1.15);
  CHECK(snapped != nullptr);
  CHECK(snapped->storage_key == "right:0:0");

  // Далеко от всех клавиш
  CHECK(index.try_snap({0.99, 0.01}, 1.15) == nullptr);

  // Без радиуса примагничивание выключено
  const BindingIndex no_snap =
      BindingIndex::build(Side::Right, layout, store, 0, 0.0);
  CHECK(no_snap.snap_candidates() == 0);
  CHECK(no_snap.try_snap(above, 1.15) == nullptr);

  // Пользовательская кнопка пробела
  const KeyBinding *space = index.hit_test({0.1, 0.9});
  CHECK(space != nullptr);
  CHECK(space->storage_key == "custom:default-right-0");
}

void test_overlapping_custom_button_hit() {
  KeyLayout layout;
  layout.rects = {{NormalizedRect{0.2, 0.2, 0.4, 0.2}}};
  layout.labels = {{"A"}};

  KeymapStore store = KeymapStore::create_default();
  auto add_button = [&](std::string id, NormalizedRect rect) {
    CustomButton button;
    button.id = std::move(id);
    button.side = Side::Right;
    button.rect = rect;
    button.mapping = KeyMapping{resolve_action_label("Ret"), std::nullopt};
    store.add_custom_button(0, button);
  };
  // Квадрат в центре клавиши: та же глубина, меньшая площадь
  add_button("inner", NormalizedRect{0.3, 0.2, 0.2, 0.2});
  // Заходит на правый край клавиши
  add_button("edge", NormalizedRect{0.5, 0.25, 0.3, 0.3});

  const BindingIndex index =
      BindingIndex::build(Side::Right, layout, store, 0, 0.0);

  const KeyBinding *center = index.hit_test({0.4, 0.3});
  CHECK(center != nullptr);
  CHECK(center->storage_key == "custom:inner");

  const KeyBinding *edge = index.hit_test({0.58, 0.35});
  CHECK(edge != nullptr);
  CHECK(edge->storage_key == "custom:edge");

  // Только клавиша сетки
  const KeyBinding *grid = index.hit_test({0.25, 0.3});
  CHECK(grid != nullptr);
  CHECK(grid->storage_key == "right:0:0");
}

} // namespace

int main() {
  test_rotation_normalization();
  test_rect_contains_and_mirror();
  test_action_labels();
  test_presets();
  test_key_spacing_separates_keys();
  test_keymap_resolution();
  test_keymap_save_load();
  test_corrupt_keymap_falls_back();
  test_custom_button_clamped();
  test_binding_index_hit_and_snap();
  test_overlapping_custom_button_hit();

  std::cout << "OK\n";
  return 0;
}
