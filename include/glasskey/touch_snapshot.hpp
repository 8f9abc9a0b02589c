/**
 * @file touch_snapshot.hpp
 * @brief Снимок касаний для медленных потребителей (UI, отладка)
 *
 * Коалесцер собирает кадры обеих поверхностей и выпускает новый снимок не
 * чаще, чем раз в kCoalesceInterval, если обновилась только одна сторона.
 * Движок сам работает с сырым потоком и снимками не пользуется.
 */

#pragma once

#include "glasskey/concurrent_queue.hpp"
#include "glasskey/types.hpp"

#include <array>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <vector>

namespace glasskey {

/// Интервал коалесцирования (секунды)
inline constexpr double kCoalesceInterval = 0.020;

struct TouchSnapshot {
  std::vector<Contact> left;
  std::vector<Contact> right;
  std::uint64_t revision = 0;
  /// Есть контакты в переходном состоянии (starting/breaking/leaving)
  bool transitional = false;
  /// Время выпуска по часам коалесцера
  double timestamp = 0.0;
};

class TouchSnapshotCoalescer {
public:
  /**
   * @brief Вносит кадр одной стороны в буфер
   *
   * Пустой список контактов очищает буфер стороны и тоже считается
   * обновлением.
   *
   * @return true если выпущен новый снимок
   */
  bool update(Side side, std::span<const Contact> contacts, double now);

  /// Выпускает отложенное обновление, если интервал истёк
  bool flush_if_due(double now);

  [[nodiscard]] const TouchSnapshot &snapshot() const noexcept {
    return snapshot_;
  }

  [[nodiscard]] std::optional<TouchSnapshot>
  snapshot_if_updated_since(std::uint64_t revision) const;

private:
  bool should_flush(double now) const noexcept;
  void flush(double now);

  std::array<std::vector<Contact>, kSideCount> pending_;
  std::array<bool, kSideCount> dirty_{false, false};
  double last_flush_ = -1.0;
  TouchSnapshot snapshot_;
};

/**
 * @brief Коалесцер в отдельном потоке
 *
 * Кадры передаются через очередь, чтобы чтение снимка никогда не
 * блокировало обработку кадров. Читатели получают копию.
 *
 * Обновления и отложенные выпуски отмечаются одними часами службы, а не
 * метками кадров: при воспроизведении метки кадров относятся к времени
 * захвата.
 */
class TouchSnapshotService {
public:
  using Clock = std::function<double()>;

  explicit TouchSnapshotService(Clock clock = monotonic_seconds);
  ~TouchSnapshotService();

  TouchSnapshotService(const TouchSnapshotService &) = delete;
  TouchSnapshotService &operator=(const TouchSnapshotService &) = delete;

  void start();
  void stop();

  /// Неблокирующая передача кадра в поток коалесцера
  void submit(const RawTouchFrame &frame);

  [[nodiscard]] TouchSnapshot snapshot() const;
  [[nodiscard]] std::optional<TouchSnapshot>
  snapshot_if_updated_since(std::uint64_t revision) const;

  /// Ждёт снимок новее revision не дольше timeout
  [[nodiscard]] std::optional<TouchSnapshot>
  wait_for_update(std::uint64_t revision, std::chrono::milliseconds timeout) const;

private:
  void worker_loop(std::stop_token st);
  void publish(const TouchSnapshot &snap);

  Clock clock_;
  ConcurrentQueue<RawTouchFrame> frames_;
  TouchSnapshotCoalescer coalescer_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  TouchSnapshot shared_;

  std::jthread worker_;
};

} // namespace glasskey
