/**
 * @file ipc_server.hpp
 * @brief IPC сервер для управления glasskey через Unix Domain Socket
 *
 * Одна строка-команда на соединение, ответ "OK ..." или "ERROR ...".
 * Мутации движка уходят в поток движка через InputRuntime.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace glasskey {

class InputRuntime;
class CaptureReplayCoordinator;
class DispatchQueue;

/// Путь к Unix Domain Socket
inline constexpr const char *kIpcSocketPath = "/var/run/glasskey.sock";

/// Команды IPC протокола
enum class IpcCommand {
  Unknown,
  GetStatus,       // GET_STATUS -> состояние движка
  SetTyping,       // SET_TYPING 0|1
  SetKeyboardMode, // SET_KEYBOARD_MODE 0|1
  Reset,           // RESET -> сброс касаний и очереди вывода
  Reload,          // RELOAD [path]
  CaptureStart,    // CAPTURE_START [path]
  CaptureStop,     // CAPTURE_STOP -> число кадров
  ReplayLoad,      // REPLAY_LOAD path
  ReplayPlay,      // REPLAY_PLAY
  ReplaySeek,      // REPLAY_SEEK seconds
  ReplayEnd,       // REPLAY_END
  Metrics,         // METRICS
  Shutdown         // SHUTDOWN -> запрещено
};

/// Результат выполнения команды
struct IpcResult {
  bool success = false;
  std::string message;
};

[[nodiscard]] IpcCommand parse_ipc_command(std::string_view cmd);

/// Ссылки на подсистемы, которыми управляет IPC
struct IpcContext {
  InputRuntime *runtime = nullptr;
  CaptureReplayCoordinator *replay = nullptr;
  DispatchQueue *dispatch = nullptr;

  /// Перезагрузка конфига; аргумент - путь из RELOAD или пустая строка.
  /// Выполняется в IPC-потоке.
  std::function<IpcResult(const std::string &)> reload;

  /// Каталог для CAPTURE_START без аргумента
  std::function<std::filesystem::path()> capture_dir;
};

/**
 * @brief IPC сервер на Unix Domain Socket
 *
 * Работает в отдельном потоке, accept через poll с таймаутом.
 */
class IpcServer {
public:
  explicit IpcServer(IpcContext context);
  ~IpcServer();

  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /**
   * @brief Запускает IPC сервер в отдельном потоке
   * @return true если сокет создан
   */
  bool start();

  /// Останавливает поток и удаляет файл сокета
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /// Парсит и выполняет команду (вызывается и из тестов)
  IpcResult execute_command(std::string_view cmd);

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  void server_loop(std::stop_token st);
  void handle_client(int client_fd);
  [[nodiscard]] int create_socket();

  IpcContext ctx_;

  std::atomic<bool> running_{false};
  std::jthread server_thread_;
  int server_fd_ = -1;

  // Может отличаться от kIpcSocketPath, если основной сокет занят
  std::string socket_path_;
};

} // namespace glasskey
