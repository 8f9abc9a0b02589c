/**
 * @file user_session.cpp
 * @brief Поиск пользователя сессии и его домашнего каталога
 */

#include "glasskey/user_session.hpp"
#include "glasskey/types.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <pwd.h>

namespace glasskey {

namespace {

/// Первая строка stdout команды, пустая при ошибке
std::string first_line_of(const char *cmd) {
  FILE *pipe = popen(cmd, "r");
  if (!pipe) {
    return {};
  }
  std::array<char, 128> line{};
  std::string out;
  if (std::fgets(line.data(), static_cast<int>(line.size()), pipe)) {
    out = line.data();
  }
  pclose(pipe);

  while (!out.empty() &&
         (out.back() == '\n' || out.back() == '\r' || out.back() == ' ')) {
    out.pop_back();
  }
  return out;
}

} // namespace

bool is_session_user_name(std::string_view name) noexcept {
  return !name.empty() && name != "root" && name != "UNKNOWN";
}

std::optional<std::string> find_seat_user() {
  static constexpr std::array<const char *, 3> kSeatQueries{
      "loginctl list-sessions --no-legend 2>/dev/null | "
      "awk '$4 == \"seat0\" {print $3; exit}'",
      "who 2>/dev/null | awk '$2 ~ /^(:|tty)/ {print $1; exit}'",
      "stat -c '%U' /dev/tty1 2>/dev/null",
  };
  for (const char *cmd : kSeatQueries) {
    std::string name = first_line_of(cmd);
    if (is_session_user_name(name)) {
      return name;
    }
  }
  return std::nullopt;
}

bool UserSession::initialize() {
  if (initialized_) {
    return true;
  }

  auto name = find_seat_user();
  if (!name) {
    std::cerr << "[glasskey] Warning: no active session user found\n";
    return false;
  }

  const struct passwd *pw = getpwnam(name->c_str());
  if (!pw || !pw->pw_dir || pw->pw_dir[0] == '\0') {
    std::cerr << "[glasskey] Warning: no home directory for user " << *name
              << "\n";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    user_ = SessionUser{*name, pw->pw_uid, pw->pw_dir};
  }
  initialized_ = true;
  return true;
}

SessionUser UserSession::user() const {
  std::lock_guard<std::mutex> lock(mu_);
  return user_;
}

void UserSession::apply_home() const {
  if (!initialized_) {
    return;
  }
  const SessionUser u = user();
  setenv("HOME", u.home_dir.c_str(), 1);
  setenv("USER", u.username.c_str(), 1);
  setenv("LOGNAME", u.username.c_str(), 1);
}

std::optional<std::filesystem::path> UserSession::user_config_path() const {
  if (!initialized_) {
    return std::nullopt;
  }
  return std::filesystem::path{user().home_dir} /
         std::string{kUserConfigRelPath};
}

} // namespace glasskey
