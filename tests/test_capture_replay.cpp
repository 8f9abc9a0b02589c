#include "test_support.hpp"

#include "glasskey/capture_file.hpp"
#include "glasskey/capture_replay.hpp"
#include "glasskey/runtime.hpp"

#include <cmath>
#include <filesystem>
#include <mutex>
#include <unistd.h>
#include <utility>

namespace {

using namespace glasskey;
using glasskey::test::find_binding;
using glasskey::test::frame;
using glasskey::test::touch;

std::filesystem::path temp_path(std::string_view name) {
  return std::filesystem::temp_directory_path() /
         ("glasskey-test-" + std::to_string(::getpid()) + "-" +
          std::string{name});
}

/// Потокобезопасный приёмник: команды приходят из потока движка
class LockedSink final : public CommandSink {
public:
  void submit(const Command &command) override {
    std::lock_guard<std::mutex> lock(mu_);
    commands_.push_back(command);
  }

  /// Вид и код команд без меток времени
  std::vector<std::pair<CommandKind, ScanCode>> keys() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::pair<CommandKind, ScanCode>> out;
    for (const auto &c : commands_) {
      out.emplace_back(c.kind, c.code);
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return commands_.size();
  }

private:
  mutable std::mutex mu_;
  std::vector<Command> commands_;
};

/// Десять кадров на 500 мс: палец ведётся по пустой нижней полосе
std::vector<RawTouchFrame> sweep_frames(double t0) {
  std::vector<RawTouchFrame> out;
  for (int i = 0; i < 10; ++i) {
    const double t = t0 + 0.5 * i / 9.0;
    out.push_back(frame(Side::Right, t, {touch(1, 0.5 + 0.01 * i, 0.95)}));
  }
  return out;
}

std::uint64_t engine_fingerprint(InputRuntime &runtime) {
  return runtime.call(
      [](TouchEngine &engine) { return engine.fingerprint(); });
}

void test_writer_reader() {
  const auto path = temp_path("frames.gkcap");
  std::vector<RawTouchFrame> frames = sweep_frames(100.0);
  frames[3].contacts.push_back(touch(2, 0.123456789, 0.3, 42.0f));
  frames[5].side = Side::Left;
  frames[7].contacts.clear();

  CaptureWriter writer;
  CHECK(writer.open(path) == CaptureResult::Ok);
  for (const auto &f : frames) {
    CHECK(writer.write(f) == CaptureResult::Ok);
  }
  const auto closed = writer.close();
  CHECK(closed.ok());
  CHECK(closed.value == frames.size());

  const auto loaded = read_capture(path);
  CHECK(loaded.ok());
  CHECK(loaded.value.frames.size() == frames.size());
  for (std::size_t i = 0; i < frames.size(); ++i) {
    RawTouchFrame expected = frames[i];
    quantize_for_capture(expected);
    CHECK(loaded.value.frames[i] == expected);
  }
  CHECK(std::abs(loaded.value.duration() - 0.5) < 1e-9);

  std::filesystem::remove(path);
}

void test_rejects_bad_files() {
  std::string bytes;
  encode_frame(frame(Side::Left, 1.0, {touch(1, 0.5, 0.5)}), bytes);

  const auto no_magic = parse_capture("NOTACAPT\x01\0\0\0\0\0\0\0" + bytes);
  CHECK(no_magic.result == CaptureResult::InvalidFormat);

  std::string header{kCaptureMagic};
  header += std::string{"\x02\0\0\0\0\0\0\0", 8};
  CHECK(parse_capture(header + bytes).result ==
        CaptureResult::UnsupportedVersion);

  std::string good{kCaptureMagic};
  good += std::string{"\x01\0\0\0\0\0\0\0", 8};
  CHECK(parse_capture(good + bytes).ok());
  CHECK(parse_capture(good).ok());

  const auto truncated = parse_capture(good + bytes.substr(0, bytes.size() - 4));
  CHECK(truncated.result == CaptureResult::InvalidFormat);
  CHECK(truncated.value.empty());

  CHECK(parse_capture("GKCAP").result == CaptureResult::InvalidFormat);
  CHECK(read_capture(temp_path("missing.gkcap")).result ==
        CaptureResult::IoError);
}

void test_rejects_bad_timestamps() {
  std::string header{kCaptureMagic};
  header += std::string{"\x01\0\0\0\0\0\0\0", 8};

  auto encode = [&](std::initializer_list<double> times) {
    std::string bytes = header;
    for (double t : times) {
      encode_frame(frame(Side::Right, t, {touch(1, 0.5, 0.5)}), bytes);
    }
    return bytes;
  };

  // Время кадров не убывает; одинаковые метки допустимы
  CHECK(parse_capture(encode({5.0, 5.0, 6.0})).ok());

  const auto backwards = parse_capture(encode({5.0, 2.0}));
  CHECK(backwards.result == CaptureResult::InvalidFormat);
  CHECK(backwards.value.empty());

  CHECK(parse_capture(encode({5.0, 2.0, std::nan("")})).result ==
        CaptureResult::InvalidFormat);
  CHECK(parse_capture(encode({std::nan("")})).result ==
        CaptureResult::InvalidFormat);
  CHECK(parse_capture(encode({1.0, HUGE_VAL})).result ==
        CaptureResult::InvalidFormat);

  // Координаты вне поверхности прижимаются, NaN отвергается
  std::string wide = header;
  encode_frame(frame(Side::Left, 1.0, {touch(1, 1.5, -0.25)}), wide);
  const auto clamped = parse_capture(wide);
  CHECK(clamped.ok());
  CHECK(clamped.value.frames[0].contacts[0].x == 1.0);
  CHECK(clamped.value.frames[0].contacts[0].y == 0.0);

  std::string bad_pos = header;
  encode_frame(frame(Side::Left, 1.0, {touch(1, std::nan(""), 0.5)}), bad_pos);
  CHECK(parse_capture(bad_pos).result == CaptureResult::InvalidFormat);
}

void test_frame_index_for_time() {
  CaptureData data;
  CHECK(data.frame_index_for_time(1.0) == -1);

  data.frames = sweep_frames(10.0);
  CHECK(data.frame_index_for_time(-1.0) == 0);
  CHECK(data.frame_index_for_time(0.0) == 0);
  CHECK(data.frame_index_for_time(0.25) == 4);
  CHECK(data.frame_index_for_time(0.5 / 9.0 * 2.0) == 2);
  CHECK(data.frame_index_for_time(10.0) == 9);
}

void test_capture_then_replay_matches() {
  // Координаты клавиш берём из движка с той же раскладкой
  test::RecordingSink scratch;
  TouchEngine layout_engine{EngineConfig{}, KeymapStore::create_default(),
                            scratch};
  const Point y =
      find_binding(layout_engine, Side::Right, "right:0:0")->rect.center();
  const Point j =
      find_binding(layout_engine, Side::Right, "right:1:1")->rect.center();

  const auto path = temp_path("typing.gkcap");
  LockedSink live_sink;
  {
    InputRuntime runtime{EngineConfig{}, KeymapStore::create_default(),
                         live_sink};
    runtime.start();
    CaptureReplayCoordinator replay{runtime};
    CHECK(replay.start_capture(path) == CaptureResult::Ok);
    CHECK(replay.start_capture(path) == CaptureResult::CaptureActive);

    runtime.ingest(frame(Side::Right, 1.00, {touch(1, y)}));
    runtime.ingest(frame(Side::Right, 1.04));
    runtime.ingest(frame(Side::Right, 1.20, {touch(2, j)}));
    runtime.ingest(frame(Side::Right, 1.24));

    const auto stopped = replay.stop_capture();
    CHECK(stopped.ok());
    CHECK(stopped.value == 4);
    runtime.stop();
  }
  CHECK(live_sink.size() >= 2);

  LockedSink replay_sink;
  InputRuntime runtime{EngineConfig{}, KeymapStore::create_default(),
                       replay_sink};
  runtime.start();
  CaptureReplayCoordinator replay{runtime};
  const auto loaded = replay.load_replay(path);
  CHECK(loaded.ok());
  CHECK(loaded.value.frame_count == 4);
  CHECK(replay.start_capture(path) == CaptureResult::ReplayActive);

  // Живые кадры во время сессии воспроизведения отбрасываются
  runtime.ingest(frame(Side::Right, 1.10, {touch(9, y)}));

  const auto played = replay.play();
  CHECK(played.ok());
  CHECK(played.value.frame_index == 3);
  CHECK(replay_sink.keys() == live_sink.keys());

  CHECK(replay.end_replay() == CaptureResult::Ok);
  CHECK(replay.end_replay() == CaptureResult::ReplayNotLoaded);
  CHECK(runtime.live_input_enabled());
  runtime.stop();
  std::filesystem::remove(path);
}

void test_ten_frame_session() {
  const auto path = temp_path("sweep.gkcap");
  LockedSink sink;
  InputRuntime runtime{EngineConfig{}, KeymapStore::create_default(), sink};
  runtime.start();
  CaptureReplayCoordinator replay{runtime};

  CHECK(replay.seek(0.1).result == CaptureResult::ReplayNotLoaded);
  CHECK(replay.start_play() == CaptureResult::ReplayNotLoaded);

  CHECK(replay.start_capture(path) == CaptureResult::Ok);
  for (const auto &f : sweep_frames(50.0)) {
    runtime.ingest(f);
  }
  const auto stopped = replay.stop_capture();
  CHECK(stopped.ok());
  CHECK(stopped.value == 10);
  CHECK(replay.stop_capture().result == CaptureResult::CaptureNotActive);

  const auto loaded = replay.load_replay(path);
  CHECK(loaded.ok());
  CHECK(loaded.value.frame_count == 10);
  CHECK(std::abs(loaded.value.duration_seconds - 0.5) < 1e-9);

  const auto pos = replay.seek(0.25);
  CHECK(pos.ok());
  CHECK(pos.value.frame_index == 4);
  CHECK(std::abs(pos.value.time_seconds - 0.25) < 1e-9);
  CHECK(replay.info().position.frame_index == 4);

  const auto played = replay.play();
  CHECK(played.ok());
  CHECK(played.value.frame_index == 9);
  CHECK(std::abs(played.value.time_seconds - 0.5) < 1e-6);
  CHECK(!replay.info().playing);

  // Перемотка за конец прижимается к длительности
  const auto clamped = replay.seek(5.0);
  CHECK(clamped.value.frame_index == 9);
  CHECK(std::abs(clamped.value.time_seconds - 0.5) < 1e-9);

  CHECK(replay.end_replay() == CaptureResult::Ok);
  runtime.stop();
  std::filesystem::remove(path);
}

void test_seek_is_path_independent() {
  const auto path = temp_path("seek.gkcap");
  {
    CaptureWriter writer;
    CHECK(writer.open(path) == CaptureResult::Ok);
    const std::vector<RawTouchFrame> frames{
        frame(Side::Right, 5.00, {touch(1, 0.5, 0.5)}),
        frame(Side::Right, 5.05, {touch(1, 0.55, 0.5)}),
        frame(Side::Left, 5.10, {touch(1, 0.3, 0.4), touch(2, 0.6, 0.4)}),
        frame(Side::Right, 5.15, {touch(1, 0.6, 0.52)}),
        frame(Side::Left, 5.20),
        frame(Side::Right, 5.25),
        frame(Side::Left, 5.30, {touch(3, 0.2, 0.8)}),
    };
    for (const auto &f : frames) {
      CHECK(writer.write(f) == CaptureResult::Ok);
    }
    CHECK(writer.close().value == frames.size());
  }

  LockedSink sink;
  InputRuntime runtime{EngineConfig{}, KeymapStore::create_default(), sink};
  runtime.start();
  CaptureReplayCoordinator replay{runtime};
  CHECK(replay.load_replay(path).ok());

  CHECK(replay.seek(0.17).ok());
  const std::uint64_t direct = engine_fingerprint(runtime);

  CHECK(replay.seek(0.29).ok());
  CHECK(replay.seek(0.02).ok());
  CHECK(replay.seek(0.17).ok());
  CHECK(engine_fingerprint(runtime) == direct);

  // Перемотка не отправляет команд в ОС
  CHECK(sink.size() == 0);

  CHECK(replay.end_replay() == CaptureResult::Ok);
  runtime.stop();
  std::filesystem::remove(path);
}

} // namespace

int main() {
  test_writer_reader();
  test_rejects_bad_files();
  test_rejects_bad_timestamps();
  test_frame_index_for_time();
  test_capture_then_replay_matches();
  test_ten_frame_session();
  test_seek_is_path_independent();

  std::cout << "OK\n";
  return 0;
}
