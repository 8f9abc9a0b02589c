/**
 * @file layout.cpp
 * @brief Пресеты раскладок и построитель сетки
 */

#include "glasskey/layout.hpp"

#include <algorithm>
#include <cctype>

namespace glasskey {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::vector<Point> evenly_spaced(double x0, double step, int count, double y) {
  std::vector<Point> out;
  out.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    out.push_back({x0 + step * i, y});
  }
  return out;
}

std::vector<LayoutPreset> make_presets() {
  std::vector<LayoutPreset> presets;

  presets.push_back(LayoutPreset{"blank", "Blank", 0, 0, {}, {}});

  presets.push_back(LayoutPreset{
      "6x3",
      "6x3",
      6,
      3,
      {{35.0, 20.9},
       {53.0, 19.2},
       {71.0, 17.5},
       {89.0, 19.2},
       {107.0, 22.6},
       {125.0, 22.6}},
      {{"Y", "U", "I", "O", "P", "Back"},
       {"H", "J", "K", "L", ";", "Ret"},
       {"N", "M", ",", ".", "/", "Ret"}}});

  presets.push_back(LayoutPreset{"6x4",
                                 "6x4",
                                 6,
                                 4,
                                 evenly_spaced(32.0, 18.0, 6, 14.0),
                                 {{"6", "7", "8", "9", "0", "Back"},
                                  {"Y", "U", "I", "O", "P", "]"},
                                  {"H", "J", "K", "L", ";", "Ret"},
                                  {"N", "M", ",", ".", "/", "Ret"}}});

  presets.push_back(LayoutPreset{"5x3",
                                 "5x3",
                                 5,
                                 3,
                                 evenly_spaced(36.0, 20.0, 5, 19.0),
                                 {{"Y", "U", "I", "O", "P"},
                                  {"H", "J", "K", "L", ";"},
                                  {"N", "M", ",", ".", "/"}}});

  presets.push_back(LayoutPreset{"5x4",
                                 "5x4",
                                 5,
                                 4,
                                 evenly_spaced(34.0, 20.0, 5, 12.0),
                                 {{"5", "6", "7", "8", "9"},
                                  {"T", "Y", "U", "I", "O"},
                                  {"G", "H", "J", "K", "L"},
                                  {"B", "N", "M", ",", "."}}});

  LayoutPreset planck{
      "planck",
      "Planck",
      12,
      4,
      evenly_spaced(6.0, 12.0, 12, 10.0),
      {{"1", "2", "3", "4", "5", "6", "7", "8", "9", "0", "-", "Back"},
       {"Q", "W", "E", "R", "T", "Y", "U", "I", "O", "P", "[", "]"},
       {"A", "S", "D", "F", "G", "H", "J", "K", "L", ";", "'", "Ret"},
       {"Z", "X", "C", "V", "B", "N", "M", ",", ".", "/", "Shift", "Space"}}};
  planck.blank_left_side = true;
  planck.fixed_key_scale = 0.70;
  presets.push_back(std::move(planck));

  LayoutPreset mobile{
      "mobile",
      "Mobile",
      10,
      4,
      evenly_spaced(8.0, 14.0, 10, 10.0),
      {{"Q", "W", "E", "R", "T", "Y", "U", "I", "O", "P"},
       {"A", "S", "D", "F", "G", "H", "J", "K", "L", "Ret"},
       {"Z", "X", "C", "V", "B", "N", "M", ",", ".", "Back"},
       {"", "", "", "Space", "", "", "", "", "", ""}}};
  mobile.blank_left_side = true;
  mobile.fixed_key_scale = 0.75;
  mobile.allows_column_settings = false;
  mobile.row_stagger = {0.0, 0.25, 0.75, 0.0};
  presets.push_back(std::move(mobile));

  return presets;
}

} // namespace

LabelGrid LayoutPreset::left_labels() const {
  LabelGrid out = right_labels;
  for (auto &row : out) {
    std::reverse(row.begin(), row.end());
  }
  return out;
}

const std::vector<LayoutPreset> &all_presets() {
  static const std::vector<LayoutPreset> presets = make_presets();
  return presets;
}

const LayoutPreset &resolve_preset(std::string_view name) {
  const auto &presets = all_presets();
  for (const auto &p : presets) {
    if (iequals(p.name, name) || iequals(p.display_name, name)) {
      return p;
    }
  }
  if (iequals(name, "mobile-ortho-12x4")) {
    return resolve_preset("planck");
  }
  return presets[1];
}

std::vector<ColumnSettings>
default_column_settings(const LayoutPreset &preset) {
  std::vector<ColumnSettings> out(static_cast<std::size_t>(preset.columns));
  for (auto &c : out) {
    c.scale = preset.fixed_key_scale;
  }
  return out;
}

KeyLayout build_layout(const LayoutPreset &preset, double pad_width_mm,
                       double pad_height_mm,
                       std::span<const ColumnSettings> columns, bool mirrored,
                       double key_spacing_percent) {
  KeyLayout layout;
  const int cols = preset.columns;
  const int rows = preset.rows;
  if (cols <= 0 || rows <= 0 ||
      preset.column_anchors_mm.size() != static_cast<std::size_t>(cols) ||
      pad_width_mm <= 0.0 || pad_height_mm <= 0.0) {
    return layout;
  }
  if (mirrored && preset.blank_left_side) {
    return layout;
  }

  std::vector<ColumnSettings> settings =
      (preset.allows_column_settings &&
       columns.size() == static_cast<std::size_t>(cols))
          ? std::vector<ColumnSettings>(columns.begin(), columns.end())
          : default_column_settings(preset);
  for (auto &c : settings) {
    c.scale = std::clamp(c.scale, 0.25, 3.0);
  }

  // Якоря масштабируются относительно x первой колонки
  const double origin_x = preset.column_anchors_mm.front().x;
  std::vector<Point> anchors;
  anchors.reserve(settings.size());
  for (int c = 0; c < cols; ++c) {
    const Point a = preset.column_anchors_mm[static_cast<std::size_t>(c)];
    anchors.push_back(
        {origin_x + (a.x - origin_x) * settings[static_cast<std::size_t>(c)].scale,
         a.y});
  }

  const double spacing = std::clamp(key_spacing_percent, 0.0, 200.0) / 100.0;
  const double spacing_x = kKeyWidthMm * spacing;
  const double spacing_y = kKeyHeightMm * spacing;

  layout.rects.resize(static_cast<std::size_t>(rows));
  for (int r = 0; r < rows; ++r) {
    auto &row_rects = layout.rects[static_cast<std::size_t>(r)];
    row_rects.reserve(static_cast<std::size_t>(cols));
    const double stagger =
        static_cast<std::size_t>(r) < preset.row_stagger.size()
            ? preset.row_stagger[static_cast<std::size_t>(r)]
            : 0.0;
    for (int c = 0; c < cols; ++c) {
      const ColumnSettings &cs = settings[static_cast<std::size_t>(c)];
      const Point anchor = anchors[static_cast<std::size_t>(c)];
      const double w = kKeyWidthMm * cs.scale;
      const double h = kKeyHeightMm * cs.scale;
      const double row_spacing = h * (cs.row_spacing_percent / 100.0);
      const double x_mm = anchor.x + c * spacing_x + stagger * w;
      const double y_mm = anchor.y + r * (h + row_spacing + spacing_y);

      double x = x_mm / pad_width_mm + cs.offset_x_percent / 100.0;
      const double y = y_mm / pad_height_mm + cs.offset_y_percent / 100.0;
      const double nw = w / pad_width_mm;
      double rotation = cs.rotation_deg;
      if (mirrored) {
        x = 1.0 - x - nw;
        rotation = -rotation;
      }
      row_rects.emplace_back(x, y, nw, h / pad_height_mm, rotation);
    }
  }

  layout.labels = mirrored ? preset.left_labels() : preset.right_labels;
  return layout;
}

std::string storage_key(Side side, int row, int col) {
  std::string key{side_name(side)};
  key += ':';
  key += std::to_string(row);
  key += ':';
  key += std::to_string(col);
  return key;
}

} // namespace glasskey
