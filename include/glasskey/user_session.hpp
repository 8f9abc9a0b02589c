/**
 * @file user_session.hpp
 * @brief Пользователь активной сессии при запуске от root
 *
 * Демон стартует от root (нужны /dev/input и /dev/uinput), а конфиг,
 * раскладка и захваты живут в $HOME пользователя, сидящего за seat0.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace glasskey {

struct SessionUser {
  std::string username;
  std::uint32_t uid = 0;
  std::string home_dir;
};

class UserSession {
public:
  /**
   * @brief Находит пользователя активной сессии
   * @return true если пользователь найден и у него есть домашний каталог
   */
  bool initialize();

  [[nodiscard]] bool is_valid() const noexcept { return initialized_; }

  /// Снимок (thread-safe)
  [[nodiscard]] SessionUser user() const;

  /// HOME, USER и LOGNAME процесса указывают на пользователя сессии
  void apply_home() const;

  /// ~/.config/glasskey/config.yaml пользователя сессии
  [[nodiscard]] std::optional<std::filesystem::path> user_config_path() const;

private:
  mutable std::mutex mu_;
  SessionUser user_;
  std::atomic<bool> initialized_{false};
};

/// Имя годится для сессии: не пустое, не root, не UNKNOWN от stat
[[nodiscard]] bool is_session_user_name(std::string_view name) noexcept;

/// Имя пользователя за seat0 (loginctl, затем who, затем владелец tty1)
[[nodiscard]] std::optional<std::string> find_seat_user();

} // namespace glasskey
