/**
 * @file main.cpp
 * @brief Точка входа glasskey
 *
 * Виртуальная клавиатура и указатель на двух тачпадах.
 *
 * Запуск: sudo glasskey [-c config.yaml]
 */

#include "glasskey/config.hpp"
#include "glasskey/daemon.hpp"
#include "glasskey/touchpad_reader.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <signal.h>

namespace {

std::atomic<glasskey::Daemon *> g_daemon{nullptr};

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    if (auto *daemon = g_daemon.load()) {
      daemon->request_stop();
    }
  }
}

void print_version() {
  std::cout << "glasskey 1.0.0 (C++20)\n"
            << "Виртуальная клавиатура на мультитач-тачпадах\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -c, --config PATH  Файл конфигурации\n"
            << "  -k, --keymap PATH  Файл раскладки\n"
            << "      --stdout       Писать input_event в stdout вместо uinput\n"
            << "      --no-grab      Не захватывать тачпады эксклюзивно\n"
            << "      --list-devices Показать найденные тачпады и выйти\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n"
            << "\n"
            << "Конфигурация: /etc/glasskey/config.yaml\n"
            << "Управление: " << glasskey::kIpcSocketPath << "\n";
}

int list_devices() {
  const auto devices = glasskey::enumerate_touchpads();
  if (devices.empty()) {
    std::cout << "Тачпады не найдены\n";
    return 1;
  }
  for (const auto &d : devices) {
    std::cout << d.path.string() << "  id=" << d.id << "  name=\"" << d.name
              << "\"" << (d.is_built_in ? "  built-in" : "") << "\n";
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  glasskey::DaemonOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "--list-devices") {
      return list_devices();
    }
    if (arg == "--stdout") {
      options.target = glasskey::InjectorTarget::Stdout;
      continue;
    }
    if (arg == "--no-grab") {
      options.grab = false;
      continue;
    }
    if (arg == "-c" || arg == "--config" || arg == "-k" || arg == "--keymap") {
      if (i + 1 >= argc) {
        std::cerr << "[glasskey] Missing value for " << arg << "\n";
        return 2;
      }
      const bool is_config = arg == "-c" || arg == "--config";
      (is_config ? options.config_path : options.keymap_path) = argv[++i];
      continue;
    }
    std::cerr << "[glasskey] Unknown option: " << arg << "\n";
    print_usage(argv[0]);
    return 2;
  }

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  glasskey::Config config =
      options.config_path.empty()
          ? glasskey::load_config()
          : glasskey::load_config(options.config_path.string());

  glasskey::Daemon daemon{std::move(config), std::move(options)};
  g_daemon.store(&daemon);
  const int rc = daemon.run();
  g_daemon.store(nullptr);
  return rc;
}
