/**
 * @file device_session.hpp
 * @brief Выбор левого и правого тачпада, переподключение и чтение кадров
 *
 * Один поток: poll() по открытым устройствам плюс периодическая
 * пересинхронизация (быстро, пока роль без устройства; медленно, когда обе
 * роли на месте).
 */

#pragma once

#include "glasskey/config.hpp"
#include "glasskey/guarded.hpp"
#include "glasskey/touchpad_reader.hpp"

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <thread>
#include <vector>

namespace glasskey {

enum class RoleStatus { Unassigned, Disconnected, Connected };

[[nodiscard]] constexpr std::string_view
role_status_name(RoleStatus status) noexcept {
  switch (status) {
  case RoleStatus::Unassigned:
    return "unassigned";
  case RoleStatus::Disconnected:
    return "disconnected";
  case RoleStatus::Connected:
    return "connected";
  }
  return "unknown";
}

struct RoleState {
  DeviceAssignment assignment;
  std::optional<DeviceInfo> device;
  RoleStatus status = RoleStatus::Unassigned;
};

struct AssignmentResolution {
  std::optional<DeviceInfo> left;
  std::optional<DeviceInfo> right;

  [[nodiscard]] const std::optional<DeviceInfo> &operator[](Side side) const {
    return side == Side::Left ? left : right;
  }
  [[nodiscard]] std::optional<DeviceInfo> &operator[](Side side) {
    return side == Side::Left ? left : right;
  }
};

/**
 * @brief Сопоставляет сохранённые назначения видимым устройствам
 *
 * Порядок: точный id, затем единственное совпадение (name, is_built_in),
 * затем исключение (осталось ровно одно свободное устройство и одна
 * ненайденная роль). Одно устройство никогда не получает обе роли.
 */
[[nodiscard]] AssignmentResolution
resolve_assignment(const DeviceAssignment &left, const DeviceAssignment &right,
                   std::span<const DeviceInfo> visible);

/// Назначение из описания устройства
[[nodiscard]] DeviceAssignment assignment_for(const DeviceInfo &device);

class DeviceSessionService {
public:
  using FrameSink = std::function<void(RawTouchFrame)>;
  using Enumerator = std::function<std::vector<DeviceInfo>()>;
  using AssignmentListener = std::function<void(const DevicesConfig &)>;
  /// Открывает читателя для найденного устройства; nullptr при ошибке
  using Opener = std::function<std::unique_ptr<TouchpadReader>(
      const DeviceInfo &, Side, bool grab)>;

  DeviceSessionService(DevicesConfig config, FrameSink sink,
                       Enumerator enumerate = {}, Opener open = {});
  ~DeviceSessionService();

  DeviceSessionService(const DeviceSessionService &) = delete;
  DeviceSessionService &operator=(const DeviceSessionService &) = delete;

  void start();
  void stop();

  /// Один проход пересинхронизации (в потоке сервиса или до start())
  void resync();

  /// Явное назначение роли; применяется на ближайшей пересинхронизации
  void assign(Side side, DeviceAssignment assignment);

  /// Вызывается при изменении назначений (для сохранения в конфиг)
  void set_assignment_listener(AssignmentListener listener);

  [[nodiscard]] std::array<RoleState, kSideCount> roles() const {
    return roles_.get();
  }
  [[nodiscard]] DevicesConfig devices() const { return config_.get(); }

  /// Интервал до следующей пересинхронизации (с): быстрый, пока назначенная
  /// роль не подключена
  [[nodiscard]] double resync_interval() const;

private:
  void run(std::stop_token st);
  void poll_once(int timeout_ms);

  Guarded<DevicesConfig> config_;
  Guarded<std::array<RoleState, kSideCount>> roles_;
  Guarded<AssignmentListener> listener_;
  FrameSink sink_;
  Enumerator enumerate_;
  Opener open_;

  // Только поток сервиса (или вызывающий до start())
  std::array<std::unique_ptr<TouchpadReader>, kSideCount> readers_;

  std::jthread worker_;
};

} // namespace glasskey
