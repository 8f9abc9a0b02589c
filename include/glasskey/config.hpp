/**
 * @file config.hpp
 * @brief Конфигурация glasskey
 *
 * Типобезопасная конфигурация с YAML-подобным парсингом.
 * Все значения имеют разумные дефолты; движок дополнительно нормализует
 * параметры перед применением.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "glasskey/layout.hpp"
#include "glasskey/types.hpp"

namespace glasskey {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Действия жестов (подписи в формате раскладки)
struct GestureBindings {
  std::string two_finger_tap = "Left Click";
  std::string three_finger_tap = "Right Click";
  std::string four_finger_hold = "Chordal Shift";
  std::string five_finger_swipe_left = "Typing Toggle";
  std::string five_finger_swipe_right = "Typing Toggle";
  std::string outer_corners_hold = "None";
  std::string inner_corners_hold = "None";

  bool operator==(const GestureBindings &) const = default;
};

/// Настройки движка распознавания
struct EngineConfig {
  // Геометрия
  double pad_width_mm = kDefaultPadWidthMm;
  double pad_height_mm = kDefaultPadHeightMm;
  std::string layout_preset = "6x3";
  double key_spacing_percent = 0.0;
  /// Пусто - колонки пресета по умолчанию
  std::vector<ColumnSettings> columns;

  // Тайминги (мс)
  double hold_duration_ms = 120.0;
  double typing_grace_ms = 120.0;
  double key_buffer_ms = 40.0;
  double tap_stagger_ms = 40.0;
  double tap_cadence_ms = 260.0;

  // Намерение и движение
  double drag_cancel_mm = 3.0;
  double intent_move_mm = 3.0;
  double intent_velocity_mm_s = 50.0;
  double snap_radius_percent = 35.0;
  double snap_ambiguity_ratio = 1.15;
  double tap_move_mm = 2.2;
  /// Отсчётов REL на миллиметр движения пальца
  double pointer_speed = 6.0;

  // Сила нажатия и хаптика
  double force_click_min = 0.0;
  double force_click_cap = 255.0;
  double haptic_strength = 0.0;

  // Режимы
  bool chordal_shift_enabled = true;
  bool keyboard_mode = false;
  bool tap_click_enabled = true;
  bool two_finger_tap_enabled = true;
  bool three_finger_tap_enabled = true;

  GestureBindings gestures;

  bool operator==(const EngineConfig &) const = default;
};

/// Сохранённое назначение устройства на роль
struct DeviceAssignment {
  std::string id;
  std::string name;
  bool is_built_in = false;

  [[nodiscard]] bool empty() const noexcept { return id.empty() && name.empty(); }
  bool operator==(const DeviceAssignment &) const = default;
};

struct DevicesConfig {
  DeviceAssignment left;
  DeviceAssignment right;
  /// Эксклюзивный захват тачпадов (EVIOCGRAB)
  bool grab = true;
  double fast_resync_s = 1.0;
  double slow_resync_s = 10.0;
};

struct PathsConfig {
  /// Пусто - ~/.config/glasskey/keymap.conf
  std::filesystem::path keymap;
  /// Каталог для CAPTURE_START с относительным путём
  std::filesystem::path capture_dir{"/tmp"};
};

/// Полная конфигурация приложения
struct Config {
  EngineConfig engine;
  DevicesConfig devices;
  PathsConfig paths;
  std::filesystem::path config_path{"/etc/glasskey/config.yaml"};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию (best-effort)
 *
 * Для пути по умолчанию сначала пробует ~/.config/glasskey/config.yaml.
 * При ошибках чтения/валидации возвращает дефолты.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

/// Приводит параметры движка к допустимым диапазонам
[[nodiscard]] EngineConfig normalize_engine_config(EngineConfig config);

/// Путь к файлу раскладки с учётом $HOME
[[nodiscard]] std::filesystem::path resolve_keymap_path(const Config &config);

/// Записывает секцию devices: (остальное не трогает)
[[nodiscard]] ConfigResult save_device_assignments(const std::filesystem::path &path,
                                                   const DevicesConfig &devices);

} // namespace glasskey
