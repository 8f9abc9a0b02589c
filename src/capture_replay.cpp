/**
 * @file capture_replay.cpp
 * @brief Реализация координатора захвата и воспроизведения
 */

#include "glasskey/capture_replay.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iostream>

namespace glasskey {

namespace {

/// Сон, прерываемый запросом остановки
bool sleep_for(std::stop_token st, std::chrono::nanoseconds duration) {
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mu);
  cv.wait_for(lock, st, duration, [] { return false; });
  return !st.stop_requested();
}

template <typename T>
CaptureOutcome<T> failure(CaptureResult result, std::string error = {}) {
  CaptureOutcome<T> out;
  out.result = result;
  out.error = error.empty() ? std::string{capture_result_name(result)}
                            : std::move(error);
  return out;
}

} // namespace

CaptureReplayCoordinator::CaptureReplayCoordinator(InputRuntime &runtime)
    : runtime_(runtime) {}

CaptureReplayCoordinator::~CaptureReplayCoordinator() { cancel_play(); }

// ===========================================================================
// Захват
// ===========================================================================

CaptureResult
CaptureReplayCoordinator::start_capture(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(op_mu_);
  if (replay_loaded()) {
    return CaptureResult::ReplayActive;
  }
  return runtime_.start_capture(path);
}

CaptureOutcome<std::size_t> CaptureReplayCoordinator::stop_capture() {
  std::lock_guard<std::mutex> lock(op_mu_);
  return runtime_.stop_capture();
}

// ===========================================================================
// Воспроизведение
// ===========================================================================

bool CaptureReplayCoordinator::replay_loaded() const {
  return session_.get().data != nullptr;
}

ReplayInfo CaptureReplayCoordinator::info() const {
  const Session s = session_.get();
  ReplayInfo info;
  if (s.data) {
    info.frame_count = s.data->frames.size();
    info.duration_seconds = s.data->duration();
  }
  info.position = s.position;
  info.playing = s.playing;
  return info;
}

void CaptureReplayCoordinator::set_position(int index, double time) {
  session_.compute([&](Session &s) {
    s.position.frame_index = index;
    s.position.time_seconds = time;
  });
}

CaptureOutcome<ReplayInfo>
CaptureReplayCoordinator::load_replay(const std::filesystem::path &path) {
  if (runtime_.capturing()) {
    return failure<ReplayInfo>(CaptureResult::CaptureActive);
  }

  auto loaded = read_capture(path);
  if (!loaded.ok()) {
    return failure<ReplayInfo>(loaded.result, loaded.error);
  }

  cancel_play();
  std::lock_guard<std::mutex> lock(op_mu_);
  if (runtime_.capturing()) {
    return failure<ReplayInfo>(CaptureResult::CaptureActive);
  }

  auto data = std::make_shared<const CaptureData>(std::move(loaded.value));
  const double origin = data->start_time();
  session_.set(Session{data, ReplayPosition{}, false});

  runtime_.set_live_input_enabled(false);
  runtime_.set_wall_timers_enabled(false);
  runtime_.call([origin](TouchEngine &engine) { engine.reset_all(origin); });

  CaptureOutcome<ReplayInfo> out;
  out.value = info();
  std::cerr << "[glasskey] Replay loaded: " << path << " ("
            << out.value.frame_count << " frames, "
            << out.value.duration_seconds << " s)\n";
  return out;
}

CaptureOutcome<ReplayPosition> CaptureReplayCoordinator::seek(double seconds) {
  cancel_play();
  std::lock_guard<std::mutex> lock(op_mu_);

  const Session s = session_.get();
  if (!s.data) {
    return failure<ReplayPosition>(CaptureResult::ReplayNotLoaded);
  }

  CaptureOutcome<ReplayPosition> out;
  if (s.data->empty()) {
    runtime_.call([](TouchEngine &engine) { engine.reset_all(0.0); });
    set_position(-1, 0.0);
    out.value = ReplayPosition{};
    return out;
  }

  const double target = std::clamp(seconds, 0.0, s.data->duration());
  const int index = s.data->frame_index_for_time(target);
  const double origin = s.data->start_time();

  runtime_.call([origin](TouchEngine &engine) {
    engine.reset_all(origin);
    engine.set_output_muted(true);
  });
  for (int i = 0; i <= index; ++i) {
    runtime_.ingest_replay(s.data->frames[static_cast<std::size_t>(i)]);
  }
  runtime_.call([](TouchEngine &engine) { engine.set_output_muted(false); });

  set_position(index, target);
  out.value = ReplayPosition{index, target};
  return out;
}

CaptureResult CaptureReplayCoordinator::start_play() {
  cancel_play();
  std::lock_guard<std::mutex> lock(play_mu_);
  if (!replay_loaded()) {
    return CaptureResult::ReplayNotLoaded;
  }

  auto promise =
      std::make_shared<std::promise<CaptureOutcome<ReplayPosition>>>();
  play_result_ = promise->get_future().share();
  session_.compute([](Session &s) { s.playing = true; });
  play_thread_ = std::jthread([this, promise](std::stop_token st) {
    auto result = play_frames(st);
    session_.compute([](Session &s) { s.playing = false; });
    promise->set_value(std::move(result));
  });
  return CaptureResult::Ok;
}

CaptureOutcome<ReplayPosition> CaptureReplayCoordinator::play() {
  const CaptureResult started = start_play();
  if (started != CaptureResult::Ok) {
    return failure<ReplayPosition>(started);
  }
  std::shared_future<CaptureOutcome<ReplayPosition>> result;
  {
    std::lock_guard<std::mutex> lock(play_mu_);
    result = play_result_;
  }
  return result.get();
}

void CaptureReplayCoordinator::cancel_play() {
  std::lock_guard<std::mutex> lock(play_mu_);
  if (play_thread_.joinable()) {
    play_thread_.request_stop();
    play_thread_.join();
    play_thread_ = std::jthread{};
  }
}

CaptureOutcome<ReplayPosition>
CaptureReplayCoordinator::play_frames(std::stop_token st) {
  std::lock_guard<std::mutex> lock(op_mu_);
  const Session s = session_.get();
  if (!s.data) {
    return failure<ReplayPosition>(CaptureResult::ReplayNotLoaded);
  }

  CaptureOutcome<ReplayPosition> out;
  const CaptureData &data = *s.data;
  if (data.empty()) {
    set_position(-1, 0.0);
    out.value = ReplayPosition{};
    return out;
  }

  int index = s.position.frame_index;
  double time = s.position.time_seconds;
  if (index < 0) {
    const double origin = data.start_time();
    runtime_.call([origin](TouchEngine &engine) { engine.reset_all(origin); });
    runtime_.ingest_replay(data.frames.front());
    index = 0;
    time = 0.0;
    set_position(index, time);
  }

  using clock = std::chrono::steady_clock;
  const int count = static_cast<int>(data.frames.size());
  while (index + 1 < count && !st.stop_requested()) {
    const int next = index + 1;
    const double next_time = data.frame_time(static_cast<std::size_t>(next));

    if (next_time > time) {
      const auto wait_start = clock::now();
      const double start_time = time;
      while (time < next_time) {
        const double elapsed =
            std::chrono::duration<double>(clock::now() - wait_start).count();
        time = std::min(next_time, start_time + elapsed);
        set_position(index, time);
        if (time >= next_time) {
          break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(next_time - time));
        if (!sleep_for(st, std::min<std::chrono::nanoseconds>(
                               kReplaySleepChunk,
                               std::max(remaining, std::chrono::nanoseconds{1})))) {
          break;
        }
      }
      if (st.stop_requested()) {
        break;
      }
    }

    runtime_.ingest_replay(data.frames[static_cast<std::size_t>(next)]);
    index = next;
    time = next_time;
    set_position(index, time);
  }

  runtime_.sync();
  out.value = ReplayPosition{index, time};
  return out;
}

CaptureResult CaptureReplayCoordinator::end_replay() {
  cancel_play();
  std::lock_guard<std::mutex> lock(op_mu_);
  if (!replay_loaded()) {
    return CaptureResult::ReplayNotLoaded;
  }
  session_.set(Session{});
  runtime_.call(
      [](TouchEngine &engine) { engine.reset_all(monotonic_seconds()); });
  runtime_.set_wall_timers_enabled(true);
  runtime_.set_live_input_enabled(true);
  std::cerr << "[glasskey] Replay session ended\n";
  return CaptureResult::Ok;
}

} // namespace glasskey
