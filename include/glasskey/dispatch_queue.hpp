/**
 * @file dispatch_queue.hpp
 * @brief Ограниченный буфер команд между движком и инжектором ОС
 *
 * Кольцо фиксированной ёмкости. enqueue() никогда не блокирует: при
 * переполнении новая команда отбрасывается и счётчик потерь растёт.
 * Единственный потребитель разбирает очередь строго в порядке FIFO.
 */

#pragma once

#include "glasskey/command.hpp"
#include "glasskey/os_injector.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace glasskey {

inline constexpr std::size_t kDefaultDispatchCapacity = 1024;

struct DispatchMetrics {
  std::size_t queue_depth = 0;
  std::uint64_t drops = 0;
  std::uint64_t enqueued = 0;
  std::uint64_t delivered = 0;
};

class DispatchQueue final : public CommandSink {
public:
  explicit DispatchQueue(std::size_t capacity = kDefaultDispatchCapacity);
  ~DispatchQueue() override;

  DispatchQueue(const DispatchQueue &) = delete;
  DispatchQueue &operator=(const DispatchQueue &) = delete;

  /**
   * @brief Неблокирующая постановка команды
   * @return false если очередь полна и команда отброшена
   */
  bool enqueue(const Command &command);

  /// CommandSink: переполнение не ошибка, только метрика
  void submit(const Command &command) override;

  /// Забирает голову очереди без ожидания
  [[nodiscard]] bool try_dequeue(Command &out);

  /// Запускает поток-потребитель, доставляющий команды в injector
  void start(OsInjector &injector);

  /// Останавливает потребителя (ожидает завершения потока)
  void stop();

  [[nodiscard]] DispatchMetrics snapshot_metrics() const;

  /// Отбрасывает все ожидающие команды
  void clear_queue();

  /// Ждёт, пока очередь опустеет и текущая команда будет доставлена
  [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;

  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

private:
  void consumer_loop(std::stop_token st, OsInjector &injector);

  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  mutable std::condition_variable_any idle_cv_;
  std::vector<Command> slots_;
  std::size_t head_ = 0;
  std::size_t count_ = 0;
  bool delivering_ = false;
  std::uint64_t drops_ = 0;
  std::uint64_t enqueued_ = 0;
  std::uint64_t delivered_ = 0;

  std::jthread consumer_;
};

} // namespace glasskey
