/**
 * @file dispatch_queue.cpp
 * @brief Кольцевой буфер команд и поток доставки
 */

#include "glasskey/dispatch_queue.hpp"

#include <algorithm>

namespace glasskey {

DispatchQueue::DispatchQueue(std::size_t capacity)
    : slots_(std::max<std::size_t>(capacity, 1)) {}

DispatchQueue::~DispatchQueue() { stop(); }

bool DispatchQueue::enqueue(const Command &command) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (count_ == slots_.size()) {
      ++drops_;
      return false;
    }
    slots_[(head_ + count_) % slots_.size()] = command;
    ++count_;
    ++enqueued_;
  }
  cv_.notify_one();
  return true;
}

void DispatchQueue::submit(const Command &command) {
  // Потеря учитывается в drops_, продюсер не блокируется и не уведомляется
  (void)enqueue(command);
}

bool DispatchQueue::try_dequeue(Command &out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (count_ == 0) {
    return false;
  }
  out = slots_[head_];
  head_ = (head_ + 1) % slots_.size();
  --count_;
  return true;
}

void DispatchQueue::start(OsInjector &injector) {
  if (consumer_.joinable()) {
    return;
  }
  consumer_ = std::jthread(
      [this, &injector](std::stop_token st) { consumer_loop(st, injector); });
}

void DispatchQueue::stop() {
  if (!consumer_.joinable()) {
    return;
  }
  consumer_.request_stop();
  cv_.notify_all();
  consumer_.join();
}

void DispatchQueue::consumer_loop(std::stop_token st, OsInjector &injector) {
  while (!st.stop_requested()) {
    Command command;
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (!cv_.wait(lock, st, [this] { return count_ > 0; })) {
        break;
      }
      command = slots_[head_];
      head_ = (head_ + 1) % slots_.size();
      --count_;
      delivering_ = true;
    }

    // Вызов ОС без удержания блокировки
    deliver(injector, command);

    {
      std::lock_guard<std::mutex> lock(mu_);
      delivering_ = false;
      ++delivered_;
    }
    idle_cv_.notify_all();
  }
}

DispatchMetrics DispatchQueue::snapshot_metrics() const {
  std::lock_guard<std::mutex> lock(mu_);
  return DispatchMetrics{count_, drops_, enqueued_, delivered_};
}

void DispatchQueue::clear_queue() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    head_ = 0;
    count_ = 0;
  }
  idle_cv_.notify_all();
}

bool DispatchQueue::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return idle_cv_.wait_for(lock, timeout,
                           [this] { return count_ == 0 && !delivering_; });
}

} // namespace glasskey
