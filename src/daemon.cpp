/**
 * @file daemon.cpp
 * @brief Реализация главного цикла сервиса
 */

#include "glasskey/daemon.hpp"
#include "glasskey/keymap.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace glasskey {

namespace {

constexpr auto kLoopTick = std::chrono::milliseconds{100};
constexpr auto kSessionRetryInterval = std::chrono::seconds{3};

} // namespace

Daemon::Daemon(Config config, DaemonOptions options)
    : config_{std::make_shared<Config>(std::move(config))},
      options_{std::move(options)} {}

Daemon::~Daemon() { shutdown(); }

void Daemon::apply_overrides(Config &config) const {
  if (!options_.keymap_path.empty()) {
    config.paths.keymap = options_.keymap_path;
  }
  if (!options_.grab) {
    config.devices.grab = false;
  }
  config.engine = normalize_engine_config(std::move(config.engine));
}

bool Daemon::initialize() {
  if (initialized_) {
    return true;
  }

  // $HOME активного пользователя нужен для ~/.config/glasskey
  if (user_session_.initialize()) {
    user_session_.apply_home();
    std::cerr << "[glasskey] Session user: " << user_session_.user().username
              << "\n";
  } else {
    std::cerr << "[glasskey] Warning: no user session, using system paths\n";
  }

  {
    IpcResult res = reload_config(options_.config_path.string());
    if (!res.success) {
      std::cerr << "[glasskey] Warning: initial config load failed: "
                << res.message << "\n";
      auto cfg = std::make_shared<Config>(*std::atomic_load(&config_));
      apply_overrides(*cfg);
      std::shared_ptr<const Config> cfg_const = cfg;
      std::atomic_store(&config_, std::move(cfg_const));
    }
  }

  auto cfg = std::atomic_load(&config_);
  KeymapStore keymap = load_keymap(resolve_keymap_path(*cfg));

  injector_ = std::make_unique<UinputInjector>(options_.target);
  if (!injector_->open()) {
    std::cerr << "[glasskey] Failed to create virtual input device\n";
    return false;
  }

  dispatch_ = std::make_unique<DispatchQueue>();
  dispatch_->start(*injector_);

  runtime_ = std::make_unique<InputRuntime>(cfg->engine, std::move(keymap),
                                            *dispatch_);
  runtime_->start();

  replay_ = std::make_unique<CaptureReplayCoordinator>(*runtime_);

  InputRuntime *runtime = runtime_.get();
  devices_ = std::make_unique<DeviceSessionService>(
      cfg->devices, [runtime](RawTouchFrame frame) {
        runtime->ingest(std::move(frame));
      });
  devices_->set_assignment_listener(
      [this](const DevicesConfig &devices) { persist_assignments(devices); });
  devices_->start();

  IpcContext ctx;
  ctx.runtime = runtime_.get();
  ctx.replay = replay_.get();
  ctx.dispatch = dispatch_.get();
  ctx.reload = [this](const std::string &path) { return reload_config(path); };
  ctx.capture_dir = [this] {
    return std::atomic_load(&config_)->paths.capture_dir;
  };
  ipc_server_ = std::make_unique<IpcServer>(std::move(ctx));
  if (!ipc_server_->start()) {
    std::cerr << "[glasskey] Warning: IPC server failed to start. "
                 "Remote control will be unavailable.\n";
  }

  initialized_ = true;
  return true;
}

void Daemon::request_stop() noexcept {
  stop_requested_.store(true, std::memory_order_relaxed);
}

int Daemon::run() {
  if (!initialize()) {
    std::cerr << "[glasskey] Failed to initialize\n";
    shutdown();
    return 1;
  }

  std::cerr << "[glasskey] Running\n";

  auto last_session_retry = std::chrono::steady_clock::now();
  while (!stop_requested_.load(std::memory_order_relaxed)) {
    std::this_thread::sleep_for(kLoopTick);

    // Ленивая повторная инициализация сессии (пользователь вошёл позже)
    if (!user_session_.is_valid()) {
      auto now = std::chrono::steady_clock::now();
      if (now - last_session_retry >= kSessionRetryInterval) {
        last_session_retry = now;
        if (user_session_.initialize()) {
          user_session_.apply_home();
          std::cerr << "[glasskey] Session found: "
                    << user_session_.user().username << "\n";
          IpcResult res = reload_config();
          if (!res.success) {
            std::cerr << "[glasskey] Warning: " << res.message << "\n";
          }
        }
      }
    }
  }

  std::cerr << "[glasskey] Stopping\n";
  shutdown();
  return 0;
}

void Daemon::shutdown() {
  if (ipc_server_) {
    ipc_server_->stop();
  }
  if (devices_) {
    devices_->stop();
  }
  if (replay_) {
    replay_->cancel_play();
  }
  if (runtime_) {
    runtime_->stop();
  }
  if (dispatch_) {
    dispatch_->stop();
  }
  if (injector_) {
    injector_->release_all_modifiers();
    injector_->close();
  }
}

IpcResult Daemon::reload_config(const std::string &config_path) {
  std::filesystem::path system_path{std::string{kConfigPath}};
  std::filesystem::path load_path = system_path;
  bool tried_user = false;
  bool user_exists = false;

  const bool explicit_path = !config_path.empty();

  if (explicit_path) {
    load_path = std::filesystem::path{config_path};
    std::error_code ec;
    if (!std::filesystem::exists(load_path, ec) || ec) {
      std::string msg = "Config file not found: " + config_path;
      std::cerr << "[glasskey] " << msg << "\n";
      return {false, std::move(msg)};
    }
  } else {
    auto user_path = user_session_.user_config_path();
    tried_user = user_path.has_value();
    if (user_path) {
      std::error_code ec;
      user_exists = std::filesystem::exists(*user_path, ec) && !ec;
      if (user_exists) {
        load_path = *user_path;
      }
    }
  }

  ConfigLoadOutcome loaded = load_config_checked(load_path);
  if (loaded.result != ConfigResult::Ok) {
    std::cerr << "[glasskey] Config reload failed: " << loaded.error << "\n";
    return {false,
            loaded.error.empty() ? "Config reload failed" : loaded.error};
  }

  auto new_cfg = std::make_shared<Config>(std::move(loaded.config));
  apply_overrides(*new_cfg);

  if (runtime_) {
    KeymapStore keymap = load_keymap(resolve_keymap_path(*new_cfg));
    runtime_->call([engine_cfg = new_cfg->engine,
                    keymap = std::move(keymap)](TouchEngine &engine) mutable {
      engine.set_config(std::move(engine_cfg));
      engine.set_keymap(std::move(keymap));
    });
  }
  if (devices_) {
    // Пустое назначение в файле не отменяет уже найденное устройство
    if (!new_cfg->devices.left.empty()) {
      devices_->assign(Side::Left, new_cfg->devices.left);
    }
    if (!new_cfg->devices.right.empty()) {
      devices_->assign(Side::Right, new_cfg->devices.right);
    }
  }

  std::shared_ptr<const Config> cfg_const = new_cfg;
  std::atomic_store(&config_, std::move(cfg_const));

  std::cerr << "[glasskey] Configuration reloaded: " << loaded.used_path
            << "\n";
  std::cerr << "[glasskey] engine: layout=" << new_cfg->engine.layout_preset
            << ", hold_ms=" << new_cfg->engine.hold_duration_ms
            << ", keyboard_mode=" << new_cfg->engine.keyboard_mode
            << ", chordal_shift=" << new_cfg->engine.chordal_shift_enabled
            << '\n';

  std::string message = "Loaded " + loaded.used_path.string();
  if (!explicit_path && tried_user && !user_exists) {
    message += " (user config not found; using system config)";
  }
  return {true, std::move(message)};
}

void Daemon::persist_assignments(const DevicesConfig &devices) {
  auto cfg = std::atomic_load(&config_);
  const ConfigResult r = save_device_assignments(cfg->config_path, devices);
  if (r != ConfigResult::Ok) {
    std::cerr << "[glasskey] Warning: cannot save device assignments to "
              << cfg->config_path << "\n";
    return;
  }
  auto updated = std::make_shared<Config>(*cfg);
  updated->devices.left = devices.left;
  updated->devices.right = devices.right;
  std::shared_ptr<const Config> cfg_const = updated;
  std::atomic_store(&config_, std::move(cfg_const));
  std::cerr << "[glasskey] Device assignments saved\n";
}

} // namespace glasskey
