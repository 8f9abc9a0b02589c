/**
 * @file touch_snapshot.cpp
 * @brief Коалесцер снимков касаний и его фоновый поток
 */

#include "glasskey/touch_snapshot.hpp"

#include <algorithm>
#include <utility>

namespace glasskey {

namespace {

bool any_transitional(const std::vector<Contact> &contacts) {
  return std::any_of(contacts.begin(), contacts.end(), [](const Contact &c) {
    return is_transitional_state(c.state);
  });
}

} // namespace

// ===========================================================================
// TouchSnapshotCoalescer
// ===========================================================================

bool TouchSnapshotCoalescer::update(Side side, std::span<const Contact> contacts,
                                    double now) {
  auto &buf = pending_[side_index(side)];
  buf.assign(contacts.begin(), contacts.end());
  dirty_[side_index(side)] = true;

  if (should_flush(now)) {
    flush(now);
    return true;
  }
  return false;
}

bool TouchSnapshotCoalescer::flush_if_due(double now) {
  if ((dirty_[0] || dirty_[1]) && should_flush(now)) {
    flush(now);
    return true;
  }
  return false;
}

bool TouchSnapshotCoalescer::should_flush(double now) const noexcept {
  if (dirty_[0] && dirty_[1]) {
    return true;
  }
  // Обновилась одна сторона: ждём не дольше интервала с прошлой выдачи
  return last_flush_ < 0.0 || now - last_flush_ >= kCoalesceInterval;
}

void TouchSnapshotCoalescer::flush(double now) {
  snapshot_.left = pending_[side_index(Side::Left)];
  snapshot_.right = pending_[side_index(Side::Right)];
  snapshot_.transitional =
      any_transitional(snapshot_.left) || any_transitional(snapshot_.right);
  snapshot_.timestamp = now;
  ++snapshot_.revision;
  dirty_ = {false, false};
  last_flush_ = now;
}

std::optional<TouchSnapshot>
TouchSnapshotCoalescer::snapshot_if_updated_since(std::uint64_t revision) const {
  if (snapshot_.revision == revision) {
    return std::nullopt;
  }
  return snapshot_;
}

// ===========================================================================
// TouchSnapshotService
// ===========================================================================

TouchSnapshotService::TouchSnapshotService(Clock clock)
    : clock_(std::move(clock)) {}

TouchSnapshotService::~TouchSnapshotService() { stop(); }

void TouchSnapshotService::start() {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
}

void TouchSnapshotService::stop() {
  if (!worker_.joinable()) {
    return;
  }
  worker_.request_stop();
  frames_.notify_all();
  worker_.join();
}

void TouchSnapshotService::submit(const RawTouchFrame &frame) {
  frames_.push(frame);
}

void TouchSnapshotService::publish(const TouchSnapshot &snap) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    shared_ = snap;
  }
  cv_.notify_all();
}

void TouchSnapshotService::worker_loop(std::stop_token st) {
  const auto tick = std::chrono::milliseconds{20};
  while (!st.stop_requested()) {
    auto frame = frames_.pop_wait_for(st, tick);
    bool flushed = false;
    const double now = clock_();
    if (frame) {
      flushed = coalescer_.update(frame->side, frame->contacts, now);
    } else {
      flushed = coalescer_.flush_if_due(now);
    }
    if (flushed) {
      publish(coalescer_.snapshot());
    }
  }
}

TouchSnapshot TouchSnapshotService::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shared_;
}

std::optional<TouchSnapshot>
TouchSnapshotService::snapshot_if_updated_since(std::uint64_t revision) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (shared_.revision == revision) {
    return std::nullopt;
  }
  return shared_;
}

std::optional<TouchSnapshot>
TouchSnapshotService::wait_for_update(std::uint64_t revision,
                                      std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout,
                    [&] { return shared_.revision != revision; })) {
    return std::nullopt;
  }
  return shared_;
}

} // namespace glasskey
