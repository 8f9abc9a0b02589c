/**
 * @file ipc_server.cpp
 * @brief Реализация IPC сервера на Unix Domain Socket
 */

#include "glasskey/ipc_server.hpp"
#include "glasskey/capture_replay.hpp"
#include "glasskey/dispatch_queue.hpp"
#include "glasskey/runtime.hpp"
#include "glasskey/text_parse.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>

namespace glasskey {

namespace {

/// Аргумент после имени команды
std::string_view command_arg(std::string_view cmd) {
  auto space_pos = cmd.find(' ');
  if (space_pos == std::string_view::npos) {
    return {};
  }
  return trim(cmd.substr(space_pos + 1));
}

std::string format_status(const EngineStatus &s) {
  std::ostringstream out;
  out << "typing=" << (s.typing_enabled ? 1 : 0)
      << " keyboard_mode=" << (s.keyboard_mode ? 1 : 0)
      << " layer=" << s.active_layer << " persistent=" << s.persistent_layer
      << " layout=" << s.layout;
  for (Side side : {Side::Left, Side::Right}) {
    const std::size_t i = side_index(side);
    out << ' ' << side_name(side) << "=" << intent_mode_name(s.intent[i]) << '/'
        << s.contacts[i];
    if (s.chord_shift[i]) {
      out << "/shift";
    }
  }
  return out.str();
}

std::string format_metrics(const EngineMetrics &m, const DispatchMetrics *d) {
  std::ostringstream out;
  out << "frames=" << m.frames << " commands=" << m.commands
      << " typing_suppressed=" << m.typing_suppressed
      << " replay_suppressed=" << m.replay_suppressed
      << " snap=" << m.snap_accepted << '/' << m.snap_attempts
      << " drag_cancels=" << m.drag_cancels
      << " cross_key_drops=" << m.cross_key_drops
      << " force_clicks=" << m.force_clicks << " holds=" << m.hold_fires
      << " gestures=" << m.gesture_fires << " timers=" << m.timers_fired
      << " stale_timers=" << m.stale_timers;
  if (d) {
    out << " queue=" << d->queue_depth << " drops=" << d->drops
        << " delivered=" << d->delivered;
  }
  return out.str();
}

IpcResult capture_error(CaptureResult r, std::string_view detail) {
  std::string msg{capture_result_name(r)};
  if (!detail.empty()) {
    msg += ": ";
    msg += detail;
  }
  return {false, std::move(msg)};
}

std::filesystem::path default_capture_name(const std::filesystem::path &dir) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now);
  return dir / ("glasskey-" + std::to_string(secs.count()) + ".gkcap");
}

} // namespace

IpcCommand parse_ipc_command(std::string_view cmd) {
  cmd = trim(cmd);
  const std::string_view name = cmd.substr(0, cmd.find(' '));

  if (name == "GET_STATUS") {
    return IpcCommand::GetStatus;
  }
  if (name == "SET_TYPING") {
    return IpcCommand::SetTyping;
  }
  if (name == "SET_KEYBOARD_MODE") {
    return IpcCommand::SetKeyboardMode;
  }
  if (name == "RESET") {
    return IpcCommand::Reset;
  }
  if (name == "RELOAD") {
    return IpcCommand::Reload;
  }
  if (name == "CAPTURE_START") {
    return IpcCommand::CaptureStart;
  }
  if (name == "CAPTURE_STOP") {
    return IpcCommand::CaptureStop;
  }
  if (name == "REPLAY_LOAD") {
    return IpcCommand::ReplayLoad;
  }
  if (name == "REPLAY_PLAY") {
    return IpcCommand::ReplayPlay;
  }
  if (name == "REPLAY_SEEK") {
    return IpcCommand::ReplaySeek;
  }
  if (name == "REPLAY_END") {
    return IpcCommand::ReplayEnd;
  }
  if (name == "METRICS") {
    return IpcCommand::Metrics;
  }
  if (name == "SHUTDOWN") {
    return IpcCommand::Shutdown;
  }
  return IpcCommand::Unknown;
}

IpcServer::IpcServer(IpcContext context) : ctx_(std::move(context)) {}

IpcServer::~IpcServer() { stop(); }

bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  server_fd_ = create_socket();
  if (server_fd_ < 0) {
    return false;
  }

  running_.store(true);
  server_thread_ =
      std::jthread([this](std::stop_token st) { server_loop(st); });

  std::cerr << "[glasskey-ipc] Server started on " << socket_path_ << "\n";
  return true;
}

void IpcServer::stop() {
  if (!running_.load()) {
    return;
  }
  running_.store(false);

  if (server_thread_.joinable()) {
    server_thread_.request_stop();
    server_thread_.join();
  }

  if (server_fd_ >= 0) {
    close(server_fd_);
    server_fd_ = -1;
  }

  if (!socket_path_.empty()) {
    unlink(socket_path_.c_str());
    socket_path_.clear();
  }

  std::cerr << "[glasskey-ipc] Server stopped\n";
}

bool IpcServer::is_running() const noexcept { return running_.load(); }

int IpcServer::create_socket() {
  auto is_socket_active = [](const char *socket_path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      // Не можем проверить: путь не трогаем
      return true;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path, sizeof(addr.sun_path) - 1);

    bool active = false;
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
      active = true;
    } else {
      active = !(errno == ECONNREFUSED || errno == ENOENT);
    }
    close(fd);
    return active;
  };

  auto create_bound_socket = [&](const std::string &socket_path,
                                 bool unlink_first, int &out_errno) -> int {
    if (unlink_first) {
      unlink(socket_path.c_str());
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      out_errno = errno;
      std::cerr << "[glasskey-ipc] Failed to create socket: "
                << strerror(errno) << "\n";
      return -1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(),
                 sizeof(addr.sun_path) - 1);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      out_errno = errno;
      std::cerr << "[glasskey-ipc] Failed to bind socket (" << socket_path
                << "): " << strerror(out_errno) << "\n";
      close(fd);
      return -1;
    }

    // Пользовательский клиент пишет в сокет root'а
    if (chmod(socket_path.c_str(), 0666) < 0) {
      std::cerr << "[glasskey-ipc] Warning: failed to chmod socket ("
                << socket_path << "): " << strerror(errno) << "\n";
    }

    if (listen(fd, 5) < 0) {
      out_errno = errno;
      std::cerr << "[glasskey-ipc] Failed to listen (" << socket_path
                << "): " << strerror(out_errno) << "\n";
      close(fd);
      unlink(socket_path.c_str());
      return -1;
    }

    socket_path_ = socket_path;
    out_errno = 0;
    return fd;
  };

  int bind_errno = 0;
  int fd = create_bound_socket(kIpcSocketPath, false, bind_errno);
  if (fd >= 0) {
    return fd;
  }

  if (bind_errno == EADDRINUSE) {
    if (!is_socket_active(kIpcSocketPath)) {
      std::cerr << "[glasskey-ipc] Stale primary socket detected, replacing: "
                << kIpcSocketPath << "\n";
      fd = create_bound_socket(kIpcSocketPath, true, bind_errno);
      if (fd >= 0) {
        return fd;
      }
    }

    const std::string fallback = std::string("/var/run/glasskey-") +
                                 std::to_string(::getpid()) + ".sock";
    std::cerr << "[glasskey-ipc] Primary socket busy, using: " << fallback
              << "\n";
    fd = create_bound_socket(fallback, true, bind_errno);
    if (fd >= 0) {
      return fd;
    }
  }

  return -1;
}

void IpcServer::server_loop(std::stop_token st) {
  while (!st.stop_requested()) {
    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, 500);

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[glasskey-ipc] Poll error: " << strerror(errno) << "\n";
      break;
    }
    if (ret == 0) {
      continue;
    }

    if (pfd.revents & POLLIN) {
      int client_fd = accept(server_fd_, nullptr, nullptr);
      if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
          std::cerr << "[glasskey-ipc] Accept error: " << strerror(errno)
                    << "\n";
        }
        continue;
      }
      handle_client(client_fd);
      close(client_fd);
    }
  }
}

void IpcServer::handle_client(int client_fd) {
  char buffer[512] = {};
  ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer) - 1);
  if (bytes_read <= 0) {
    return;
  }

  std::string_view cmd =
      trim(std::string_view{buffer, static_cast<std::size_t>(bytes_read)});
  std::cerr << "[glasskey-ipc] Received command: " << cmd << "\n";

  IpcResult result = execute_command(cmd);

  std::string response = result.success ? "OK" : "ERROR";
  if (!result.message.empty()) {
    response += " ";
    response += result.message;
  }
  response += "\n";

  if (write(client_fd, response.c_str(), response.size()) < 0) {
    std::cerr << "[glasskey-ipc] Warning: reply failed: " << strerror(errno)
              << "\n";
  }
}

IpcResult IpcServer::execute_command(std::string_view cmd) {
  cmd = trim(cmd);
  const IpcCommand command = parse_ipc_command(cmd);
  const std::string_view arg = command_arg(cmd);

  if (!ctx_.runtime &&
      command != IpcCommand::Unknown && command != IpcCommand::Shutdown &&
      command != IpcCommand::Reload) {
    return {false, "Runtime not available"};
  }

  switch (command) {
  case IpcCommand::GetStatus:
    return {true, format_status(ctx_.runtime->status())};

  case IpcCommand::SetTyping:
  case IpcCommand::SetKeyboardMode: {
    auto value = parse_bool(arg);
    if (!value) {
      return {false, arg.empty() ? "Missing argument" : "Invalid argument"};
    }
    const bool on = *value;
    if (command == IpcCommand::SetTyping) {
      ctx_.runtime->call([on](TouchEngine &engine) {
        engine.set_typing_enabled(on, monotonic_seconds());
      });
      std::cerr << "[glasskey-ipc] Typing " << (on ? "enabled" : "disabled")
                << "\n";
    } else {
      ctx_.runtime->call(
          [on](TouchEngine &engine) { engine.set_keyboard_mode(on); });
      std::cerr << "[glasskey-ipc] Keyboard mode " << (on ? "on" : "off")
                << "\n";
    }
    return {true, on ? "ON" : "OFF"};
  }

  case IpcCommand::Reset:
    ctx_.runtime->call(
        [](TouchEngine &engine) { engine.reset_state(monotonic_seconds()); });
    if (ctx_.dispatch) {
      ctx_.dispatch->clear_queue();
    }
    return {true, "Reset"};

  case IpcCommand::Reload: {
    if (!ctx_.reload) {
      return {false, "Reload not supported"};
    }
    IpcResult res = ctx_.reload(std::string{arg});
    if (res.success) {
      std::cerr << "[glasskey-ipc] Config reloaded successfully\n";
    } else {
      std::cerr << "[glasskey-ipc] Config reload failed";
      if (!res.message.empty()) {
        std::cerr << ": " << res.message;
      }
      std::cerr << "\n";
    }
    if (res.message.empty()) {
      res.message = res.success ? "Config reloaded" : "Reload failed";
    }
    return res;
  }

  case IpcCommand::CaptureStart: {
    if (!ctx_.replay) {
      return {false, "Capture not supported"};
    }
    std::filesystem::path path{std::string{arg}};
    if (path.empty()) {
      const std::filesystem::path dir =
          ctx_.capture_dir ? ctx_.capture_dir() : std::filesystem::path{"/tmp"};
      path = default_capture_name(dir);
    }
    const CaptureResult r = ctx_.replay->start_capture(path);
    if (r != CaptureResult::Ok) {
      return capture_error(r, path.string());
    }
    return {true, path.string()};
  }

  case IpcCommand::CaptureStop: {
    if (!ctx_.replay) {
      return {false, "Capture not supported"};
    }
    auto out = ctx_.replay->stop_capture();
    if (!out.ok()) {
      return capture_error(out.result, out.error);
    }
    return {true, "frames=" + std::to_string(out.value)};
  }

  case IpcCommand::ReplayLoad: {
    if (!ctx_.replay) {
      return {false, "Replay not supported"};
    }
    if (arg.empty()) {
      return {false, "Missing argument"};
    }
    auto out = ctx_.replay->load_replay(std::filesystem::path{std::string{arg}});
    if (!out.ok()) {
      return capture_error(out.result, out.error);
    }
    std::ostringstream msg;
    msg << "frames=" << out.value.frame_count
        << " duration=" << out.value.duration_seconds;
    return {true, msg.str()};
  }

  case IpcCommand::ReplayPlay: {
    if (!ctx_.replay) {
      return {false, "Replay not supported"};
    }
    const CaptureResult r = ctx_.replay->start_play();
    if (r != CaptureResult::Ok) {
      return capture_error(r, {});
    }
    return {true, "Playing"};
  }

  case IpcCommand::ReplaySeek: {
    if (!ctx_.replay) {
      return {false, "Replay not supported"};
    }
    auto seconds = parse_double(arg);
    if (!seconds || !std::isfinite(*seconds)) {
      return {false, arg.empty() ? "Missing argument" : "Invalid argument"};
    }
    auto out = ctx_.replay->seek(*seconds);
    if (!out.ok()) {
      return capture_error(out.result, out.error);
    }
    std::ostringstream msg;
    msg << "frame=" << out.value.frame_index
        << " time=" << out.value.time_seconds;
    return {true, msg.str()};
  }

  case IpcCommand::ReplayEnd: {
    if (!ctx_.replay) {
      return {false, "Replay not supported"};
    }
    const CaptureResult r = ctx_.replay->end_replay();
    if (r != CaptureResult::Ok) {
      return capture_error(r, {});
    }
    return {true, "Replay ended"};
  }

  case IpcCommand::Metrics: {
    const EngineStatus status = ctx_.runtime->status();
    if (ctx_.dispatch) {
      const DispatchMetrics d = ctx_.dispatch->snapshot_metrics();
      return {true, format_metrics(status.metrics, &d)};
    }
    return {true, format_metrics(status.metrics, nullptr)};
  }

  case IpcCommand::Shutdown:
    std::cerr << "[glasskey-ipc] Shutdown requested\n";
    return {false, "Shutdown not allowed via IPC"};

  case IpcCommand::Unknown:
    break;
  }
  return {false, "Unknown command"};
}

} // namespace glasskey
