/**
 * @file daemon.hpp
 * @brief Сборка подсистем и главный цикл сервиса
 *
 * Порядок владения: инжектор -> очередь вывода -> поток движка ->
 * координатор захвата -> устройства -> IPC. Останавливаются в обратном
 * порядке.
 */

#pragma once

#include "glasskey/capture_replay.hpp"
#include "glasskey/config.hpp"
#include "glasskey/device_session.hpp"
#include "glasskey/dispatch_queue.hpp"
#include "glasskey/ipc_server.hpp"
#include "glasskey/runtime.hpp"
#include "glasskey/uinput_injector.hpp"
#include "glasskey/user_session.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace glasskey {

/// Параметры командной строки
struct DaemonOptions {
  /// Явный путь к конфигу (-c); пусто - пользовательский или системный
  std::filesystem::path config_path;
  /// Явный путь к раскладке (-k)
  std::filesystem::path keymap_path;
  InjectorTarget target = InjectorTarget::Uinput;
  bool grab = true;
};

class Daemon {
public:
  Daemon(Config config, DaemonOptions options);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  /**
   * @brief Поднимает все подсистемы
   * @return false если не удалось создать виртуальное устройство
   */
  bool initialize();

  /// Thread-safe, допустимо из обработчика сигнала
  void request_stop() noexcept;

  /**
   * @brief Главный цикл до request_stop()
   * @return Код возврата процесса
   */
  [[nodiscard]] int run();

  /// Перечитывает конфиг и раскладку (вызывается из IPC-потока)
  IpcResult reload_config(const std::string &config_path = {});

private:
  void shutdown();
  void apply_overrides(Config &config) const;
  void persist_assignments(const DevicesConfig &devices);

  // Снапшот, т.к. reload_config() вызывается из IPC-потока
  std::shared_ptr<const Config> config_;
  DaemonOptions options_;

  UserSession user_session_;
  std::unique_ptr<UinputInjector> injector_;
  std::unique_ptr<DispatchQueue> dispatch_;
  std::unique_ptr<InputRuntime> runtime_;
  std::unique_ptr<CaptureReplayCoordinator> replay_;
  std::unique_ptr<DeviceSessionService> devices_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::atomic<bool> stop_requested_{false};
  bool initialized_ = false;
};

} // namespace glasskey
