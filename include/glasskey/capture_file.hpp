/**
 * @file capture_file.hpp
 * @brief Бинарный формат захвата сырых кадров (GKCAPV01)
 *
 * Заголовок 16 байт: magic "GKCAPV01", u32 версия, u32 резерв.
 * Запись кадра: f64 метка (с), u8 поверхность, u8 число контактов,
 * u16 резерв, затем контакты по 36 байт. Порядок байт little-endian.
 */

#pragma once

#include "glasskey/types.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace glasskey {

inline constexpr std::string_view kCaptureMagic = "GKCAPV01";
inline constexpr std::uint32_t kCaptureVersion = 1;
inline constexpr std::size_t kCaptureHeaderSize = 16;
inline constexpr std::size_t kCaptureRecordHeaderSize = 12;
inline constexpr std::size_t kCaptureContactSize = 36;

/// Результат операции захвата со значением
template <typename T> struct CaptureOutcome {
  T value{};
  CaptureResult result = CaptureResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == CaptureResult::Ok; }
};

/// Последовательная запись кадров в файл
class CaptureWriter {
public:
  CaptureWriter() = default;
  CaptureWriter(const CaptureWriter &) = delete;
  CaptureWriter &operator=(const CaptureWriter &) = delete;

  /// Создаёт файл и пишет заголовок
  [[nodiscard]] CaptureResult open(const std::filesystem::path &path);

  [[nodiscard]] CaptureResult write(const RawTouchFrame &frame);

  /**
   * @brief Сбрасывает буфер и закрывает файл
   * @return Число записанных кадров или IoError при сбое flush/close
   */
  [[nodiscard]] CaptureOutcome<std::size_t> close();

  [[nodiscard]] bool is_open() const noexcept { return out_.is_open(); }
  [[nodiscard]] std::size_t frame_count() const noexcept { return frames_; }
  [[nodiscard]] const std::filesystem::path &path() const noexcept {
    return path_;
  }

private:
  std::ofstream out_;
  std::filesystem::path path_;
  std::size_t frames_ = 0;
  bool failed_ = false;
};

/// Загруженный захват
struct CaptureData {
  std::vector<RawTouchFrame> frames;

  [[nodiscard]] bool empty() const noexcept { return frames.empty(); }
  [[nodiscard]] double start_time() const noexcept {
    return frames.empty() ? 0.0 : frames.front().timestamp;
  }
  /// Длительность от первой до последней метки
  [[nodiscard]] double duration() const noexcept {
    return frames.empty() ? 0.0
                          : frames.back().timestamp - frames.front().timestamp;
  }
  /// Время кадра относительно начала захвата
  [[nodiscard]] double frame_time(std::size_t index) const noexcept {
    return frames[index].timestamp - start_time();
  }

  /**
   * @brief Последний кадр с временем <= seconds (бинарный поиск)
   *
   * @param seconds Время от начала захвата
   * @return Индекс кадра или -1 для пустого захвата
   */
  [[nodiscard]] int frame_index_for_time(double seconds) const noexcept;
};

/// Приводит координаты к точности f32, как они лягут в файл
void quantize_for_capture(RawTouchFrame &frame) noexcept;

/// Сериализует кадр в конец буфера
void encode_frame(const RawTouchFrame &frame, std::string &out);

/// Разбирает захват из памяти
[[nodiscard]] CaptureOutcome<CaptureData> parse_capture(std::string_view bytes);

/// Читает захват целиком
[[nodiscard]] CaptureOutcome<CaptureData>
read_capture(const std::filesystem::path &path);

} // namespace glasskey
