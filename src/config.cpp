/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "glasskey/config.hpp"
#include "glasskey/text_parse.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace glasskey {

namespace {

/// Получает путь к user config (~/.config/glasskey/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Заголовок секции пишется без отступа: "devices:"
bool is_section_header(std::string_view line) {
  if (line.empty() || line.front() == ' ' || line.front() == '\t') {
    return false;
  }
  const std::string_view sv = trim(line);
  return !sv.empty() && sv.back() == ':' &&
         sv.find(':') == sv.size() - 1;
}

void set_double(std::string_view value, double &out) {
  if (auto v = parse_double(value)) {
    out = *v;
  }
}

void set_bool(std::string_view value, bool &out) {
  if (auto v = parse_bool(value)) {
    out = *v;
  }
}

/// "column: scale offset_x offset_y row_spacing rotation"
std::optional<ColumnSettings> parse_column(std::string_view value) {
  const auto parts = split_ws(value);
  if (parts.empty() || parts.size() > 5) {
    return std::nullopt;
  }
  ColumnSettings col;
  double *fields[] = {&col.scale, &col.offset_x_percent, &col.offset_y_percent,
                      &col.row_spacing_percent, &col.rotation_deg};
  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto v = parse_double(parts[i]);
    if (!v) {
      return std::nullopt;
    }
    *fields[i] = *v;
  }
  return col;
}

void parse_timing(Config &config, std::string_view key, std::string_view value) {
  auto &e = config.engine;
  if (key == "hold_ms") {
    set_double(value, e.hold_duration_ms);
  } else if (key == "typing_grace_ms") {
    set_double(value, e.typing_grace_ms);
  } else if (key == "key_buffer_ms") {
    set_double(value, e.key_buffer_ms);
  } else if (key == "tap_stagger_ms") {
    set_double(value, e.tap_stagger_ms);
  } else if (key == "tap_cadence_ms") {
    set_double(value, e.tap_cadence_ms);
  }
}

void parse_intent(Config &config, std::string_view key, std::string_view value) {
  auto &e = config.engine;
  if (key == "drag_cancel_mm") {
    set_double(value, e.drag_cancel_mm);
  } else if (key == "move_mm") {
    set_double(value, e.intent_move_mm);
  } else if (key == "velocity_mm_s") {
    set_double(value, e.intent_velocity_mm_s);
  } else if (key == "snap_radius_percent") {
    set_double(value, e.snap_radius_percent);
  } else if (key == "snap_ambiguity_ratio") {
    set_double(value, e.snap_ambiguity_ratio);
  } else if (key == "tap_move_mm") {
    set_double(value, e.tap_move_mm);
  } else if (key == "pointer_speed") {
    set_double(value, e.pointer_speed);
  }
}

void parse_force(Config &config, std::string_view key, std::string_view value) {
  auto &e = config.engine;
  if (key == "click_min") {
    set_double(value, e.force_click_min);
  } else if (key == "click_cap") {
    set_double(value, e.force_click_cap);
  } else if (key == "haptic_strength") {
    set_double(value, e.haptic_strength);
  }
}

void parse_keyboard(Config &config, std::string_view key,
                    std::string_view value) {
  auto &e = config.engine;
  if (key == "layout") {
    e.layout_preset = std::string{value};
  } else if (key == "pad_width_mm") {
    set_double(value, e.pad_width_mm);
  } else if (key == "pad_height_mm") {
    set_double(value, e.pad_height_mm);
  } else if (key == "key_spacing_percent") {
    set_double(value, e.key_spacing_percent);
  } else if (key == "keyboard_mode") {
    set_bool(value, e.keyboard_mode);
  } else if (key == "chordal_shift") {
    set_bool(value, e.chordal_shift_enabled);
  } else if (key == "tap_click") {
    set_bool(value, e.tap_click_enabled);
  } else if (key == "two_finger_tap") {
    set_bool(value, e.two_finger_tap_enabled);
  } else if (key == "three_finger_tap") {
    set_bool(value, e.three_finger_tap_enabled);
  } else if (key == "column") {
    if (auto col = parse_column(value)) {
      e.columns.push_back(*col);
    } else {
      std::cerr << "[glasskey] Warning: bad column line: " << value << "\n";
    }
  }
}

void parse_gestures(Config &config, std::string_view key,
                    std::string_view value) {
  auto &g = config.engine.gestures;
  std::string label{value};
  if (key == "two_finger_tap") {
    g.two_finger_tap = label;
  } else if (key == "three_finger_tap") {
    g.three_finger_tap = label;
  } else if (key == "four_finger_hold") {
    g.four_finger_hold = label;
  } else if (key == "five_finger_swipe_left") {
    g.five_finger_swipe_left = label;
  } else if (key == "five_finger_swipe_right") {
    g.five_finger_swipe_right = label;
  } else if (key == "outer_corners_hold") {
    g.outer_corners_hold = label;
  } else if (key == "inner_corners_hold") {
    g.inner_corners_hold = label;
  }
}

void parse_devices(Config &config, std::string_view key,
                   std::string_view value) {
  auto &d = config.devices;
  if (key == "left_id") {
    d.left.id = std::string{value};
  } else if (key == "left_name") {
    d.left.name = std::string{value};
  } else if (key == "left_built_in") {
    set_bool(value, d.left.is_built_in);
  } else if (key == "right_id") {
    d.right.id = std::string{value};
  } else if (key == "right_name") {
    d.right.name = std::string{value};
  } else if (key == "right_built_in") {
    set_bool(value, d.right.is_built_in);
  } else if (key == "grab") {
    set_bool(value, d.grab);
  } else if (key == "fast_resync_s") {
    set_double(value, d.fast_resync_s);
  } else if (key == "slow_resync_s") {
    set_double(value, d.slow_resync_s);
  }
}

void parse_paths(Config &config, std::string_view key, std::string_view value) {
  if (key == "keymap") {
    config.paths.keymap = std::string{value};
  } else if (key == "capture_dir") {
    config.paths.capture_dir = std::string{value};
  }
}

Config parse_config_stream(std::istream &file) {
  Config config;

  std::string line;
  std::string current_section;

  while (std::getline(file, line)) {
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    if (is_section_header(line)) {
      current_section = std::string{sv.substr(0, sv.size() - 1)};
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));

    if (current_section == "timing") {
      parse_timing(config, key, value);
    } else if (current_section == "intent") {
      parse_intent(config, key, value);
    } else if (current_section == "force") {
      parse_force(config, key, value);
    } else if (current_section == "keyboard") {
      parse_keyboard(config, key, value);
    } else if (current_section == "gestures") {
      parse_gestures(config, key, value);
    } else if (current_section == "devices") {
      parse_devices(config, key, value);
    } else if (current_section == "paths") {
      parse_paths(config, key, value);
    }
  }

  return config;
}

bool finite_positive(double v) { return std::isfinite(v) && v > 0.0; }

} // namespace

bool validate_config(const Config &config) {
  const auto &e = config.engine;

  // Геометрия и тайминги
  if (!finite_positive(e.pad_width_mm) || !finite_positive(e.pad_height_mm)) {
    return false;
  }
  if (!std::isfinite(e.hold_duration_ms) || !std::isfinite(e.typing_grace_ms) ||
      !std::isfinite(e.key_buffer_ms) || !std::isfinite(e.tap_cadence_ms) ||
      !std::isfinite(e.tap_stagger_ms)) {
    return false;
  }

  // Пороги движения
  if (!std::isfinite(e.drag_cancel_mm) || !std::isfinite(e.intent_move_mm) ||
      !std::isfinite(e.intent_velocity_mm_s) ||
      !std::isfinite(e.snap_radius_percent) ||
      !std::isfinite(e.snap_ambiguity_ratio) ||
      !std::isfinite(e.pointer_speed)) {
    return false;
  }

  if (!std::isfinite(e.force_click_min) || !std::isfinite(e.force_click_cap) ||
      !std::isfinite(e.haptic_strength)) {
    return false;
  }

  if (!finite_positive(config.devices.fast_resync_s) ||
      !finite_positive(config.devices.slow_resync_s)) {
    return false;
  }

  return true;
}

EngineConfig normalize_engine_config(EngineConfig c) {
  c.pad_width_mm = std::max(c.pad_width_mm, 10.0);
  c.pad_height_mm = std::max(c.pad_height_mm, 10.0);
  c.hold_duration_ms = std::clamp(c.hold_duration_ms, 20.0, 2000.0);
  c.typing_grace_ms = std::clamp(c.typing_grace_ms, 0.0, 2000.0);
  c.key_buffer_ms = std::clamp(c.key_buffer_ms, 0.0, 500.0);
  c.tap_stagger_ms = std::clamp(c.tap_stagger_ms, 0.0, 500.0);
  c.tap_cadence_ms = std::clamp(c.tap_cadence_ms, 50.0, 2000.0);
  c.drag_cancel_mm = std::clamp(c.drag_cancel_mm, 0.5, 50.0);
  c.intent_move_mm = std::clamp(c.intent_move_mm, 0.5, 50.0);
  c.intent_velocity_mm_s = std::clamp(c.intent_velocity_mm_s, 1.0, 1000.0);
  c.snap_radius_percent = std::clamp(c.snap_radius_percent, 0.0, 200.0);
  c.snap_ambiguity_ratio = std::clamp(c.snap_ambiguity_ratio, 1.0, 4.0);
  c.tap_move_mm = std::clamp(c.tap_move_mm, 0.1, 50.0);
  c.pointer_speed = std::clamp(c.pointer_speed, 0.1, 100.0);
  c.force_click_min = std::clamp(c.force_click_min, 0.0, 255.0);
  c.force_click_cap = std::clamp(c.force_click_cap, 1.0, 255.0);
  c.haptic_strength = std::clamp(c.haptic_strength, 0.0, 1.0);
  c.key_spacing_percent = std::clamp(c.key_spacing_percent, 0.0, 50.0);
  for (auto &col : c.columns) {
    col.scale = std::clamp(col.scale, 0.25, 3.0);
    col.offset_x_percent = std::clamp(col.offset_x_percent, -200.0, 200.0);
    col.offset_y_percent = std::clamp(col.offset_y_percent, -200.0, 200.0);
    col.row_spacing_percent = std::clamp(col.row_spacing_percent, -50.0, 200.0);
    col.rotation_deg = normalize_rotation(col.rotation_deg);
  }
  return c;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  out.config = parse_config_stream(file);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort: для дефолтного пути сначала пробуем user-config.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[glasskey] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    if (!out.error.empty()) {
      std::cerr << "[glasskey] Warning: " << out.error << "\n";
    }
    Config fallback;
    fallback.config_path = effective_path;
    return fallback;
  }

  return out.config;
}

std::filesystem::path resolve_keymap_path(const Config &config) {
  if (!config.paths.keymap.empty()) {
    return config.paths.keymap;
  }
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path{home} / std::string{kUserKeymapRelPath};
  }
  return std::filesystem::path{"/etc/glasskey/keymap.conf"};
}

ConfigResult save_device_assignments(const std::filesystem::path &path,
                                     const DevicesConfig &devices) {
  std::vector<std::string> kept;
  {
    std::ifstream in{path};
    std::string line;
    bool in_devices = false;
    while (in && std::getline(in, line)) {
      std::string_view sv = trim(line);
      if (is_section_header(line)) {
        in_devices = (sv == "devices:");
        if (in_devices) {
          continue;
        }
      }
      if (!in_devices) {
        kept.push_back(line);
      }
    }
  }

  std::ostringstream out;
  for (const auto &line : kept) {
    out << line << "\n";
  }
  auto write_role = [&](std::string_view role, const DeviceAssignment &a) {
    out << "  " << role << "_id: " << a.id << "\n";
    out << "  " << role << "_name: " << a.name << "\n";
    out << "  " << role << "_built_in: " << (a.is_built_in ? "true" : "false")
        << "\n";
  };
  out << "devices:\n";
  write_role("left", devices.left);
  write_role("right", devices.right);
  out << "  grab: " << (devices.grab ? "true" : "false") << "\n";
  out << "  fast_resync_s: " << devices.fast_resync_s << "\n";
  out << "  slow_resync_s: " << devices.slow_resync_s << "\n";

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  const std::filesystem::path tmp = path.string() + ".tmp";
  {
    std::ofstream file{tmp, std::ios::trunc};
    if (!file.is_open()) {
      return ConfigResult::FileNotFound;
    }
    file << out.str();
    if (!file) {
      return ConfigResult::ParseError;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::cerr << "[glasskey] Warning: cannot replace " << path << ": "
              << ec.message() << "\n";
    return ConfigResult::FileNotFound;
  }
  return ConfigResult::Ok;
}

} // namespace glasskey
