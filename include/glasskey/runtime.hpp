/**
 * @file runtime.hpp
 * @brief Поток движка: приём кадров, таймеры, захват, публикация статуса
 *
 * Все мутации TouchEngine выполняются в одном потоке. Остальные потоки
 * (читатели evdev, IPC, воспроизведение) только ставят задачи в очередь.
 */

#pragma once

#include "glasskey/capture_file.hpp"
#include "glasskey/concurrent_queue.hpp"
#include "glasskey/engine.hpp"
#include "glasskey/guarded.hpp"
#include "glasskey/touch_snapshot.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>

namespace glasskey {

/// Задача для потока движка
struct EngineTask {
  enum class Kind : std::uint8_t { Frame, Call };

  Kind kind = Kind::Frame;
  RawTouchFrame frame;
  bool is_replay = false;
  std::function<void(TouchEngine &)> call;
};

class InputRuntime {
public:
  /// Максимальная пауза цикла без задач и таймеров
  static constexpr double kIdleTick = 0.050;

  InputRuntime(const EngineConfig &config, KeymapStore keymap,
               CommandSink &sink);
  ~InputRuntime();

  InputRuntime(const InputRuntime &) = delete;
  InputRuntime &operator=(const InputRuntime &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool running() const noexcept { return worker_.joinable(); }

  /// Кадр от живого источника (игнорируется, пока загружено воспроизведение)
  void ingest(RawTouchFrame frame);

  /// Кадр воспроизведения: тот же путь, флаг is_replay
  void ingest_replay(RawTouchFrame frame);

  void post(std::function<void(TouchEngine &)> fn);

  /**
   * @brief Выполняет fn в потоке движка и дожидается результата
   *
   * Без запущенного потока fn выполняется сразу в вызывающем.
   */
  template <class F> auto call(F &&fn) -> std::invoke_result_t<F, TouchEngine &> {
    using R = std::invoke_result_t<F, TouchEngine &>;
    if (!running()) {
      return std::forward<F>(fn)(engine_);
    }
    auto task = std::make_shared<std::packaged_task<R(TouchEngine &)>>(
        std::forward<F>(fn));
    auto future = task->get_future();
    post([task](TouchEngine &engine) { (*task)(engine); });
    return future.get();
  }

  /// Ждёт, пока поток движка обработает всё, что уже в очереди
  void sync();

  [[nodiscard]] EngineStatus status() const { return status_.get(); }
  [[nodiscard]] TouchSnapshotService &snapshots() noexcept {
    return snapshots_;
  }

  // --- захват (запись идёт в потоке движка) ---
  [[nodiscard]] CaptureResult start_capture(const std::filesystem::path &path);
  [[nodiscard]] CaptureOutcome<std::size_t> stop_capture();
  [[nodiscard]] bool capturing() const noexcept {
    return capturing_.load(std::memory_order_acquire);
  }

  /// Живые кадры отбрасываются (сессия воспроизведения)
  void set_live_input_enabled(bool enabled) noexcept {
    live_enabled_.store(enabled, std::memory_order_release);
  }
  [[nodiscard]] bool live_input_enabled() const noexcept {
    return live_enabled_.load(std::memory_order_acquire);
  }

  /// Таймеры по настенным часам (выключаются на время перемотки/проигрывания)
  void set_wall_timers_enabled(bool enabled) noexcept {
    wall_timers_.store(enabled, std::memory_order_release);
  }

private:
  void engine_loop(std::stop_token st);
  void run_task(EngineTask &task);
  void publish_status();
  /// Оценка текущего времени в шкале меток кадров
  [[nodiscard]] double engine_now() const noexcept;

  TouchEngine engine_;
  ConcurrentQueue<EngineTask> queue_;
  TouchSnapshotService snapshots_;
  Guarded<EngineStatus> status_;

  // Только поток движка
  CaptureWriter capture_;
  double last_frame_ts_ = 0.0;
  double last_frame_wall_ = 0.0;

  std::atomic<bool> capturing_{false};
  std::atomic<bool> live_enabled_{true};
  std::atomic<bool> wall_timers_{true};

  std::jthread worker_;
};

} // namespace glasskey
