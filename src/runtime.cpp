/**
 * @file runtime.cpp
 * @brief Реализация потока движка
 */

#include "glasskey/runtime.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace glasskey {

InputRuntime::InputRuntime(const EngineConfig &config, KeymapStore keymap,
                           CommandSink &sink)
    : engine_(config, std::move(keymap), sink) {
  status_.set(engine_.status());
}

InputRuntime::~InputRuntime() { stop(); }

void InputRuntime::start() {
  if (worker_.joinable()) {
    return;
  }
  last_frame_ts_ = monotonic_seconds();
  last_frame_wall_ = last_frame_ts_;
  snapshots_.start();
  worker_ = std::jthread([this](std::stop_token st) { engine_loop(st); });
}

void InputRuntime::stop() {
  if (worker_.joinable()) {
    worker_.request_stop();
    queue_.notify_all();
    worker_.join();
    worker_ = std::jthread{};
  }

  // Оставшиеся вызовы выполняем здесь: их ждут через future
  EngineTask task;
  while (queue_.try_pop(task)) {
    if (task.kind == EngineTask::Kind::Call) {
      run_task(task);
    }
  }

  if (capture_.is_open()) {
    auto closed = capture_.close();
    capturing_.store(false, std::memory_order_release);
    if (!closed.ok()) {
      std::cerr << "[glasskey] Warning: " << closed.error << "\n";
    }
  }
  snapshots_.stop();
}

void InputRuntime::ingest(RawTouchFrame frame) {
  if (!live_input_enabled()) {
    return;
  }
  clamp_contacts(frame);
  quantize_for_capture(frame);
  snapshots_.submit(frame);

  EngineTask task;
  task.kind = EngineTask::Kind::Frame;
  task.frame = std::move(frame);
  queue_.push(std::move(task));
}

void InputRuntime::ingest_replay(RawTouchFrame frame) {
  clamp_contacts(frame);
  snapshots_.submit(frame);

  EngineTask task;
  task.kind = EngineTask::Kind::Frame;
  task.frame = std::move(frame);
  task.is_replay = true;
  queue_.push(std::move(task));
}

void InputRuntime::post(std::function<void(TouchEngine &)> fn) {
  EngineTask task;
  task.kind = EngineTask::Kind::Call;
  task.call = std::move(fn);
  queue_.push(std::move(task));
}

void InputRuntime::sync() {
  call([](TouchEngine &) {});
}

CaptureResult InputRuntime::start_capture(const std::filesystem::path &path) {
  return call([this, path](TouchEngine &) {
    if (capture_.is_open()) {
      return CaptureResult::CaptureActive;
    }
    const CaptureResult r = capture_.open(path);
    if (r == CaptureResult::Ok) {
      capturing_.store(true, std::memory_order_release);
      std::cerr << "[glasskey] Capture started: " << path << "\n";
    }
    return r;
  });
}

CaptureOutcome<std::size_t> InputRuntime::stop_capture() {
  return call([this](TouchEngine &) {
    auto out = capture_.close();
    capturing_.store(false, std::memory_order_release);
    if (out.ok()) {
      std::cerr << "[glasskey] Capture stopped: " << out.value << " frames\n";
    }
    return out;
  });
}

double InputRuntime::engine_now() const noexcept {
  return last_frame_ts_ + (monotonic_seconds() - last_frame_wall_);
}

void InputRuntime::run_task(EngineTask &task) {
  switch (task.kind) {
  case EngineTask::Kind::Frame:
    if (capture_.is_open() && !task.is_replay) {
      if (capture_.write(task.frame) != CaptureResult::Ok) {
        std::cerr << "[glasskey] Warning: capture write failed\n";
      }
    }
    last_frame_ts_ = task.frame.timestamp;
    last_frame_wall_ = monotonic_seconds();
    engine_.process_frame(task.frame, task.is_replay);
    break;
  case EngineTask::Kind::Call:
    if (task.call) {
      task.call(engine_);
    }
    break;
  }
}

void InputRuntime::publish_status() { status_.set(engine_.status()); }

void InputRuntime::engine_loop(std::stop_token st) {
  while (!st.stop_requested()) {
    double wait = kIdleTick;
    const bool wall_timers = wall_timers_.load(std::memory_order_acquire);
    const auto deadline = engine_.next_deadline();
    if (wall_timers && deadline) {
      wait = std::clamp(*deadline - engine_now(), 0.0, kIdleTick);
    }

    auto task = queue_.pop_wait_for(
        st, std::chrono::duration<double>(wait));
    if (task) {
      run_task(*task);
    } else if (wall_timers && deadline) {
      // Неподвижный палец не даёт кадров: удержание решает таймер
      engine_.fire_due_timers(engine_now());
    }
    publish_status();
  }
}

} // namespace glasskey
