/**
 * @file touchpad_reader.hpp
 * @brief Чтение multitouch-кадров из evdev (протокол B)
 */

#pragma once

#include "glasskey/types.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace glasskey {

/// Видимое устройство-тачпад
struct DeviceInfo {
  /// uniq, иначе phys, иначе "vendor:product"
  std::string id;
  std::string name;
  std::filesystem::path path;
  bool is_built_in = false;

  bool operator==(const DeviceInfo &) const = default;
};

struct AxisRange {
  int minimum = 0;
  int maximum = 0;

  [[nodiscard]] double normalize(int value) const noexcept {
    const int span = maximum - minimum;
    if (span <= 0) {
      return 0.0;
    }
    return clamp_unit(static_cast<double>(value - minimum) / span);
  }
};

/// Тачпад: MT-координаты и слоты, но не сенсорный экран
[[nodiscard]] std::optional<DeviceInfo>
inspect_touchpad(const std::filesystem::path &path);

/// Все тачпады в каталоге (/dev/input/event*), по возрастанию пути
[[nodiscard]] std::vector<DeviceInfo>
enumerate_touchpads(const std::filesystem::path &dir = "/dev/input");

// ===========================================================================
// Декодер протокола B
// ===========================================================================

class MtDecoder {
public:
  static constexpr std::size_t kMaxSlots = 16;

  void set_ranges(AxisRange x, AxisRange y, AxisRange pressure) noexcept {
    x_ = x;
    y_ = y;
    pressure_ = pressure;
  }

  /**
   * @brief Принимает событие; на SYN_REPORT возвращает кадр
   *
   * Новый tracking id даёт Starting, продолжение - Touching, снятие пальца -
   * один кадр Breaking, после чего контакт пропадает.
   */
  [[nodiscard]] std::optional<RawTouchFrame> feed(const input_event &ev,
                                                  Side side);

  void reset() noexcept;

private:
  struct Slot {
    int tracking_id = -1;
    std::uint32_t last_id = 0;
    int x = 0;
    int y = 0;
    int pressure = 0;
    int major = 0;
    int minor = 0;
    int orientation = 0;
    bool fresh = false;
    bool lifting = false;
  };

  [[nodiscard]] Contact make_contact(const Slot &slot, ContactState state,
                                     std::uint32_t id) const;

  std::array<Slot, kMaxSlots> slots_{};
  std::size_t current_ = 0;
  bool dropped_ = false;
  AxisRange x_;
  AxisRange y_;
  AxisRange pressure_;
};

// ===========================================================================
// Читатель устройства
// ===========================================================================

enum class ReadResult { Ok, Disconnected, Error };

class TouchpadReader {
public:
  using FrameCallback = std::function<void(RawTouchFrame)>;

  TouchpadReader(DeviceInfo info, Side side);
  ~TouchpadReader();

  TouchpadReader(const TouchpadReader &) = delete;
  TouchpadReader &operator=(const TouchpadReader &) = delete;

  /// Открывает устройство (неблокирующий fd, монотонные метки времени)
  [[nodiscard]] bool open(bool grab);

  /// Принимает уже открытый неблокирующий fd с известными диапазонами осей
  void adopt(int fd, AxisRange x, AxisRange y, AxisRange pressure = {});

  void close();

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] const DeviceInfo &info() const noexcept { return info_; }
  [[nodiscard]] Side side() const noexcept { return side_; }

  /// Вычитывает всё доступное; кадры отдаются в callback
  [[nodiscard]] ReadResult read_available(const FrameCallback &callback);

private:
  DeviceInfo info_;
  Side side_;
  int fd_ = -1;
  bool grabbed_ = false;
  MtDecoder decoder_;
};

} // namespace glasskey
