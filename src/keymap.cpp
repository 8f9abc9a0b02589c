/**
 * @file keymap.cpp
 * @brief Хранилище маппингов: заводские данные, нормализация, файл
 */

#include "glasskey/keymap.hpp"
#include "glasskey/layout.hpp"
#include "glasskey/text_parse.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace glasskey {

namespace {

int clamp_layer(int layer) noexcept { return std::clamp(layer, 0, kMaxLayer); }

KeyMapping make_mapping(std::string_view primary, std::string_view hold = {}) {
  KeyMapping m;
  m.primary = resolve_action_label(primary);
  if (!hold.empty()) {
    m.hold = resolve_action_label(hold);
  }
  return m;
}

struct DefaultSeed {
  int layer;
  std::string_view key;
  std::string_view primary;
  std::string_view hold;
};

// Заводские маппинги пресета 6x3: левая половина получает свои буквы,
// удержание даёт символы и сочетания.
constexpr DefaultSeed kSixByThreeSeeds[] = {
    {0, "left:0:0", "T", "'"},         {0, "left:0:1", "R", "}"},
    {0, "left:0:2", "E", "{"},         {0, "left:0:3", "W", "]"},
    {0, "left:0:4", "Q", "["},         {0, "left:0:5", "Tab", ""},
    {0, "left:1:0", "G", "\""},        {0, "left:1:1", "F", ")"},
    {0, "left:1:2", "D", "("},         {0, "left:1:3", "S", "Ctrl+S"},
    {0, "left:1:4", "A", "Ctrl+A"},    {0, "left:1:5", "Shift", ""},
    {0, "left:2:0", "B", "`"},         {0, "left:2:1", "V", "Ctrl+V"},
    {0, "left:2:2", "C", "Ctrl+C"},    {0, "left:2:3", "X", "Ctrl+X"},
    {0, "left:2:4", "Z", "Ctrl+Z"},    {0, "left:2:5", "Shift", ""},
    {0, "right:0:0", "Y", "-"},        {0, "right:0:1", "U", "&"},
    {0, "right:0:2", "I", "*"},        {0, "right:0:3", "O", "Ctrl+F"},
    {0, "right:1:0", "H", "_"},        {0, "right:1:1", "J", "!"},
    {0, "right:1:2", "K", "#"},        {0, "right:1:3", "L", "~"},
    {0, "right:2:0", "N", "="},        {0, "right:2:1", "M", "@"},
    {0, "right:2:2", ",", "$"},        {0, "right:2:3", ".", "^"},

    {1, "left:0:0", "None", ""},       {1, "left:0:1", "None", ""},
    {1, "left:0:2", "None", ""},       {1, "left:0:3", "Up", ""},
    {1, "left:0:4", "None", ""},       {1, "left:0:5", "None", ""},
    {1, "left:1:0", "None", ""},       {1, "left:1:1", "None", ""},
    {1, "left:1:2", "Right", ""},      {1, "left:1:3", "Down", ""},
    {1, "left:1:4", "Left", ""},       {1, "left:1:5", "None", ""},
    {1, "left:2:0", "None", ""},       {1, "left:2:1", "None", ""},
    {1, "left:2:2", "F", ""},          {1, "left:2:3", "Space", ""},
    {1, "left:2:4", "Ret", ""},        {1, "left:2:5", "None", ""},
    {1, "right:0:0", "+", ""},         {1, "right:0:1", "7", ""},
    {1, "right:0:2", "8", ""},         {1, "right:0:3", "9", ""},
    {1, "right:0:4", "None", ""},      {1, "right:0:5", "Backspace", ""},
    {1, "right:1:0", "EmDash", ""},    {1, "right:1:1", "4", ""},
    {1, "right:1:2", "5", ""},         {1, "right:1:3", "6", ""},
    {1, "right:1:4", "None", ""},      {1, "right:1:5", "None", ""},
    {1, "right:2:0", "=", ""},         {1, "right:2:1", "1", ""},
    {1, "right:2:2", "2", ""},         {1, "right:2:3", "3", ""},
    {1, "right:2:4", ".", ""},         {1, "right:2:5", "None", ""},
};

/// Прямоугольник в миллиметрах -> нормализованный (для левой - зеркально)
NormalizedRect rect_from_mm(double x, double y, double w, double h,
                            bool mirrored) {
  NormalizedRect r{x / kDefaultPadWidthMm, y / kDefaultPadHeightMm,
                   w / kDefaultPadWidthMm, h / kDefaultPadHeightMm};
  return clamp_custom_button_rect(mirrored ? r.mirrored() : r);
}

CustomButton make_button(std::string id, Side side, NormalizedRect rect,
                         std::string_view primary) {
  CustomButton b;
  b.id = std::move(id);
  b.side = side;
  b.rect = rect;
  b.mapping = make_mapping(primary);
  return b;
}

LayoutKeymap make_default_six_by_three() {
  LayoutKeymap data;
  for (const auto &seed : kSixByThreeSeeds) {
    data.mappings[static_cast<std::size_t>(seed.layer)][std::string{seed.key}] =
        make_mapping(seed.primary, seed.hold);
  }

  const NormalizedRect thumb_right = rect_from_mm(0, 75, 40, 40, false);
  const NormalizedRect thumb_left = rect_from_mm(0, 75, 40, 40, true);
  data.buttons[0] = {
      make_button("default-right-0", Side::Right, thumb_right, "Space"),
      make_button("default-left-0", Side::Left, thumb_left, "Back"),
      make_button("default-left-1", Side::Left,
                  rect_from_mm(40, 85, 40, 30, true), "MO(1)"),
  };
  data.buttons[1] = {
      make_button("default-layer1-right-space", Side::Right, thumb_right,
                  "Space"),
      make_button("default-layer1-left-space", Side::Left, thumb_left,
                  "Space"),
      make_button("default-layer1-right-zero", Side::Right,
                  clamp_custom_button_rect({0.30, 0.67, 0.27, 0.20}), "0"),
  };
  return data;
}

/// Подпись пресета по ключу позиции; пустая, если ключ вне сетки
std::string preset_label(const LayoutPreset &preset, std::string_view key) {
  const bool left = key.starts_with("left:");
  const bool right = key.starts_with("right:");
  if (!left && !right) {
    return {};
  }
  std::string_view rest = key.substr(left ? 5 : 6);
  const auto colon = rest.find(':');
  if (colon == std::string_view::npos) {
    return {};
  }
  auto row = parse_int(rest.substr(0, colon));
  auto col = parse_int(rest.substr(colon + 1));
  const LabelGrid labels = left ? preset.left_labels() : preset.right_labels;
  if (!row || !col || *row < 0 || *col < 0 ||
      static_cast<std::size_t>(*row) >= labels.size() ||
      static_cast<std::size_t>(*col) >=
          labels[static_cast<std::size_t>(*row)].size()) {
    return {};
  }
  return labels[static_cast<std::size_t>(*row)][static_cast<std::size_t>(*col)];
}

void normalize_mapping(KeyMapping &m, std::string_view empty_primary) {
  if (trim(m.primary.label).empty()) {
    m.primary = resolve_action_label(empty_primary);
  }
  if (m.hold && (is_none_label(m.hold->label) ||
                 m.hold->kind == ActionKind::None)) {
    m.hold.reset();
  }
}

/// "A || Ctrl+A" -> (primary, hold)
std::pair<std::string_view, std::string_view>
split_actions(std::string_view sv) {
  const auto bar = sv.find("||");
  if (bar == std::string_view::npos) {
    return {trim(sv), {}};
  }
  return {trim(sv.substr(0, bar)), trim(sv.substr(bar + 2))};
}

/// "left:1:3": сторона и неотрицательные строка/колонка
bool valid_storage_key(std::string_view key) {
  std::string_view rest;
  if (key.starts_with("left:")) {
    rest = key.substr(5);
  } else if (key.starts_with("right:")) {
    rest = key.substr(6);
  } else {
    return false;
  }
  const auto colon = rest.find(':');
  if (colon == std::string_view::npos) {
    return false;
  }
  auto row = parse_int(rest.substr(0, colon));
  auto col = parse_int(rest.substr(colon + 1));
  return row && col && *row >= 0 && *col >= 0;
}

} // namespace

// ===========================================================================
// KeymapStore
// ===========================================================================

KeymapStore::KeymapStore() = default;

KeymapStore KeymapStore::create_default() {
  KeymapStore store;
  store.layouts_.emplace(std::string{kDefaultLayoutName},
                         make_default_six_by_three());
  return store;
}

void KeymapStore::set_active_layout(std::string_view name) {
  active_layout_ = resolve_preset(name).name;
}

const LayoutKeymap *KeymapStore::active_data() const {
  auto it = layouts_.find(active_layout_);
  return it == layouts_.end() ? nullptr : &it->second;
}

LayoutKeymap &KeymapStore::layout_data(std::string_view name) {
  std::string key = resolve_preset(name).name;
  return layouts_[key];
}

KeyMapping KeymapStore::resolve_mapping(int layer, std::string_view key,
                                        std::string_view default_label) const {
  if (const LayoutKeymap *data = active_data()) {
    const auto &map = data->mappings[static_cast<std::size_t>(clamp_layer(layer))];
    if (auto it = map.find(key); it != map.end()) {
      return it->second;
    }
  }
  return make_mapping(default_label);
}

std::vector<CustomButton> KeymapStore::resolve_custom_buttons(int layer,
                                                              Side side) const {
  std::vector<CustomButton> out;
  if (const LayoutKeymap *data = active_data()) {
    for (const auto &b :
         data->buttons[static_cast<std::size_t>(clamp_layer(layer))]) {
      if (b.side == side) {
        out.push_back(b);
      }
    }
  }
  return out;
}

void KeymapStore::set_mapping(int layer, std::string key, KeyMapping mapping) {
  layout_data(active_layout_)
      .mappings[static_cast<std::size_t>(clamp_layer(layer))][std::move(key)] =
      std::move(mapping);
}

bool KeymapStore::remove_mapping(int layer, std::string_view key) {
  auto &map = layout_data(active_layout_)
                  .mappings[static_cast<std::size_t>(clamp_layer(layer))];
  auto it = map.find(key);
  if (it == map.end()) {
    return false;
  }
  map.erase(it);
  return true;
}

void KeymapStore::add_custom_button(int layer, CustomButton button) {
  button.rect = clamp_custom_button_rect(button.rect);
  normalize_mapping(button.mapping, "Space");
  auto &buttons = layout_data(active_layout_)
                      .buttons[static_cast<std::size_t>(clamp_layer(layer))];
  auto it = std::find_if(buttons.begin(), buttons.end(),
                         [&](const CustomButton &b) { return b.id == button.id; });
  if (it != buttons.end()) {
    *it = std::move(button);
  } else {
    buttons.push_back(std::move(button));
  }
}

bool KeymapStore::remove_custom_button(int layer, std::string_view id) {
  auto &buttons = layout_data(active_layout_)
                      .buttons[static_cast<std::size_t>(clamp_layer(layer))];
  const auto before = buttons.size();
  std::erase_if(buttons, [&](const CustomButton &b) { return b.id == id; });
  return buttons.size() != before;
}

const LayerMappings &KeymapStore::layer_mappings(int layer) const {
  static const LayerMappings kEmpty;
  const LayoutKeymap *data = active_data();
  if (!data) {
    return kEmpty;
  }
  return data->mappings[static_cast<std::size_t>(clamp_layer(layer))];
}

void KeymapStore::normalize() {
  for (auto &[name, data] : layouts_) {
    for (auto &layer : data.mappings) {
      for (auto &[key, mapping] : layer) {
        normalize_mapping(mapping, "None");
      }
    }
    for (auto &layer : data.buttons) {
      for (auto &b : layer) {
        b.rect = clamp_custom_button_rect(b.rect);
        normalize_mapping(b.mapping, "Space");
      }
    }
  }
  active_layout_ = resolve_preset(active_layout_).name;
}

NormalizedRect clamp_custom_button_rect(const NormalizedRect &rect) {
  const double w = std::clamp(rect.width(), kMinCustomButtonSize, 1.0);
  const double h = std::clamp(rect.height(), kMinCustomButtonSize, 1.0);
  const double x = std::clamp(rect.x(), 0.0, 1.0 - w);
  const double y = std::clamp(rect.y(), 0.0, 1.0 - h);
  return NormalizedRect{x, y, w, h, rect.rotation_deg()};
}

// ===========================================================================
// Файл раскладки
// ===========================================================================

namespace {

/// Разбирает поток; при первой же ошибке возвращает описание строки
std::optional<std::string> parse_keymap_stream(std::istream &in,
                                               KeymapStore &store) {
  std::string line;
  std::string layout{kDefaultLayoutName};
  int layer = 0;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string_view sv = trim(line);
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    auto error = [&](std::string_view what) {
      return std::string{what} + " at line " + std::to_string(line_no);
    };

    if (sv.starts_with("active:")) {
      store.set_active_layout(trim(sv.substr(7)));
      continue;
    }
    if (sv.starts_with("layout:")) {
      layout = resolve_preset(trim(sv.substr(7))).name;
      store.layout_data(layout);
      continue;
    }
    if (sv.starts_with("layer:")) {
      auto n = parse_int(sv.substr(6));
      if (!n) {
        return error("bad layer number");
      }
      layer = clamp_layer(*n);
      continue;
    }

    const auto arrow = sv.find("=>");
    if (arrow == std::string_view::npos) {
      return error("missing '=>'");
    }
    std::string_view lhs = trim(sv.substr(0, arrow));
    auto [primary, hold] = split_actions(sv.substr(arrow + 2));
    LayoutKeymap &data = store.layout_data(layout);

    if (lhs.starts_with("button:")) {
      auto tokens = split_ws(lhs.substr(7));
      if (tokens.size() != 6) {
        return error("button needs id, side and rect");
      }
      if (tokens[1] != "left" && tokens[1] != "right") {
        return error("bad button side");
      }
      auto x = parse_double(tokens[2]);
      auto y = parse_double(tokens[3]);
      auto w = parse_double(tokens[4]);
      auto h = parse_double(tokens[5]);
      if (!x || !y || !w || !h) {
        return error("bad button rect");
      }
      CustomButton b;
      b.id = std::string{tokens[0]};
      b.side = tokens[1] == "left" ? Side::Left : Side::Right;
      b.rect = NormalizedRect{*x, *y, *w, *h};
      b.mapping = make_mapping(primary.empty() ? "Space" : primary, hold);
      data.buttons[static_cast<std::size_t>(layer)].push_back(std::move(b));
      continue;
    }

    if (!valid_storage_key(lhs)) {
      return error("bad position key");
    }
    data.mappings[static_cast<std::size_t>(layer)][std::string{lhs}] =
        make_mapping(primary, hold);
  }

  if (in.bad()) {
    return std::string{"read error"};
  }
  return std::nullopt;
}

void write_actions(std::ostream &out, const KeyMapping &m) {
  out << " => " << m.primary.label;
  if (m.hold) {
    out << " || " << m.hold->label;
  }
  out << "\n";
}

} // namespace

KeymapLoadOutcome load_keymap_checked(std::filesystem::path path) {
  KeymapLoadOutcome out;
  out.used_path = std::move(path);

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Keymap file not found: " + out.used_path.string();
    out.store = KeymapStore::create_default();
    return out;
  }

  KeymapStore parsed;
  if (auto err = parse_keymap_stream(file, parsed)) {
    out.result = ConfigResult::ParseError;
    out.error = "Corrupt keymap " + out.used_path.string() + ": " + *err;
    out.store = KeymapStore::create_default();
    return out;
  }

  parsed.normalize();
  out.store = std::move(parsed);
  return out;
}

KeymapStore load_keymap(const std::filesystem::path &path) {
  KeymapLoadOutcome out = load_keymap_checked(path);
  if (out.result != ConfigResult::Ok) {
    if (out.result != ConfigResult::FileNotFound) {
      std::cerr << "[glasskey] Warning: " << out.error
                << " (using defaults)\n";
    }
    return KeymapStore::create_default();
  }
  std::cerr << "[glasskey] Keymap loaded: " << out.used_path.string() << "\n";
  return out.store;
}

std::string serialize_keymap(const KeymapStore &store) {
  std::ostringstream out;
  out << std::setprecision(6);
  out << "# glasskey keymap\n";
  out << "active: " << store.active_layout() << "\n";

  for (const auto &[name, data] : store.layouts()) {
    const LayoutPreset &preset = resolve_preset(name);
    out << "\nlayout: " << name << "\n";
    for (std::size_t layer = 0; layer < kLayerCount; ++layer) {
      const auto &mappings = data.mappings[layer];
      const auto &buttons = data.buttons[layer];
      if (mappings.empty() && buttons.empty()) {
        continue;
      }
      out << "layer: " << layer << "\n";
      for (const auto &[key, mapping] : mappings) {
        // Совпадает с подписью пресета - разрешится так же и без записи
        if (mapping == make_mapping(preset_label(preset, key))) {
          continue;
        }
        out << key;
        write_actions(out, mapping);
      }
      for (const auto &b : buttons) {
        out << "button: " << b.id << " " << side_name(b.side) << " "
            << b.rect.x() << " " << b.rect.y() << " " << b.rect.width() << " "
            << b.rect.height();
        write_actions(out, b.mapping);
      }
    }
  }
  return out.str();
}

ConfigResult save_keymap(const KeymapStore &store,
                         const std::filesystem::path &path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }

  std::ofstream file{path, std::ios::trunc};
  if (!file.is_open()) {
    std::cerr << "[glasskey] Warning: cannot write keymap " << path.string()
              << "\n";
    return ConfigResult::FileNotFound;
  }
  file << serialize_keymap(store);
  file.flush();
  if (!file) {
    std::cerr << "[glasskey] Warning: keymap write failed " << path.string()
              << "\n";
    return ConfigResult::ParseError;
  }
  return ConfigResult::Ok;
}

} // namespace glasskey
