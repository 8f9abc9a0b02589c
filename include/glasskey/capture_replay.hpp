/**
 * @file capture_replay.hpp
 * @brief Координатор захвата и воспроизведения
 *
 * Захват и воспроизведение взаимоисключающие. Пока загружена сессия
 * воспроизведения, живые кадры отбрасываются, а таймеры движка срабатывают
 * только по меткам воспроизводимых кадров.
 */

#pragma once

#include "glasskey/capture_file.hpp"
#include "glasskey/guarded.hpp"
#include "glasskey/runtime.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace glasskey {

/// Период проверки отмены при ожидании следующего кадра
inline constexpr std::chrono::milliseconds kReplaySleepChunk{16};

struct ReplayPosition {
  int frame_index = -1;
  double time_seconds = 0.0;
};

struct ReplayInfo {
  std::size_t frame_count = 0;
  double duration_seconds = 0.0;
  ReplayPosition position;
  bool playing = false;
};

class CaptureReplayCoordinator {
public:
  explicit CaptureReplayCoordinator(InputRuntime &runtime);
  ~CaptureReplayCoordinator();

  CaptureReplayCoordinator(const CaptureReplayCoordinator &) = delete;
  CaptureReplayCoordinator &operator=(const CaptureReplayCoordinator &) = delete;

  // --- захват ---
  [[nodiscard]] CaptureResult start_capture(const std::filesystem::path &path);
  [[nodiscard]] CaptureOutcome<std::size_t> stop_capture();

  // --- воспроизведение ---

  /// Загружает файл целиком; при ошибке движок не трогается
  [[nodiscard]] CaptureOutcome<ReplayInfo>
  load_replay(const std::filesystem::path &path);

  /**
   * @brief Перематывает на последний кадр с временем <= seconds
   *
   * Прерывает текущее проигрывание и дожидается его завершения. Состояние
   * движка сбрасывается и восстанавливается повторной подачей кадров
   * с заглушённым выводом.
   */
  [[nodiscard]] CaptureOutcome<ReplayPosition> seek(double seconds);

  /// Запускает проигрывание в фоне с текущей позиции
  [[nodiscard]] CaptureResult start_play();

  /// Проигрывает до конца (или до отмены) и возвращает конечную позицию
  [[nodiscard]] CaptureOutcome<ReplayPosition> play();

  /// Отменяет проигрывание и ждёт остановки потока
  void cancel_play();

  [[nodiscard]] CaptureResult end_replay();

  [[nodiscard]] ReplayInfo info() const;
  [[nodiscard]] bool replay_loaded() const;

private:
  struct Session {
    std::shared_ptr<const CaptureData> data;
    ReplayPosition position;
    bool playing = false;
  };

  CaptureOutcome<ReplayPosition> play_frames(std::stop_token st);
  void set_position(int index, double time);

  InputRuntime &runtime_;
  Guarded<Session> session_;
  /// Сериализует загрузку, перемотку и завершение
  std::mutex op_mu_;
  /// Защищает поток проигрывания
  std::mutex play_mu_;
  std::jthread play_thread_;
  std::shared_future<CaptureOutcome<ReplayPosition>> play_result_;
};

} // namespace glasskey
