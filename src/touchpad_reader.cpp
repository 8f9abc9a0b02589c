/**
 * @file touchpad_reader.cpp
 * @brief Реализация чтения evdev
 */

#include "glasskey/touchpad_reader.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace glasskey {

namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * 8;

constexpr std::size_t bit_words(std::size_t bits) {
  return (bits + kBitsPerLong - 1) / kBitsPerLong;
}

bool test_bit(const unsigned long *bits, std::size_t bit) {
  return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

std::string ioctl_name(int fd) {
  char buf[256] = {};
  if (ioctl(fd, EVIOCGNAME(sizeof(buf) - 1), buf) < 0) {
    return {};
  }
  return buf;
}

std::string ioctl_phys(int fd) {
  char buf[256] = {};
  if (ioctl(fd, EVIOCGPHYS(sizeof(buf) - 1), buf) < 0) {
    return {};
  }
  return buf;
}

std::string ioctl_uniq(int fd) {
  char buf[256] = {};
  if (ioctl(fd, EVIOCGUNIQ(sizeof(buf) - 1), buf) < 0) {
    return {};
  }
  return buf;
}

std::optional<AxisRange> abs_range(int fd, int axis) {
  input_absinfo info{};
  if (ioctl(fd, EVIOCGABS(axis), &info) < 0) {
    return std::nullopt;
  }
  return AxisRange{info.minimum, info.maximum};
}

bool is_built_in_bus(std::uint16_t bus) {
  return bus == BUS_I2C || bus == BUS_SPI || bus == BUS_HOST ||
         bus == BUS_I8042;
}

/// Описание открытого fd, если это тачпад
std::optional<DeviceInfo> describe(int fd, const std::filesystem::path &path) {
  unsigned long abs_bits[bit_words(ABS_CNT)] = {};
  if (ioctl(fd, EVIOCGBIT(EV_ABS, sizeof(abs_bits)), abs_bits) < 0) {
    return std::nullopt;
  }
  if (!test_bit(abs_bits, ABS_MT_POSITION_X) ||
      !test_bit(abs_bits, ABS_MT_SLOT)) {
    return std::nullopt;
  }

  unsigned long props[bit_words(INPUT_PROP_CNT)] = {};
  if (ioctl(fd, EVIOCGPROP(sizeof(props)), props) >= 0 &&
      test_bit(props, INPUT_PROP_DIRECT)) {
    return std::nullopt;
  }

  input_id id{};
  if (ioctl(fd, EVIOCGID, &id) < 0) {
    return std::nullopt;
  }

  DeviceInfo info;
  info.name = ioctl_name(fd);
  info.path = path;
  info.is_built_in = is_built_in_bus(id.bustype);
  const std::string uniq = ioctl_uniq(fd);
  const std::string phys = ioctl_phys(fd);
  if (!uniq.empty()) {
    info.id = uniq;
  } else if (!phys.empty()) {
    info.id = phys;
  } else {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04x:%04x", id.vendor, id.product);
    info.id = buf;
  }
  return info;
}

} // namespace

std::optional<DeviceInfo> inspect_touchpad(const std::filesystem::path &path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    return std::nullopt;
  }
  auto info = describe(fd, path);
  ::close(fd);
  return info;
}

std::vector<DeviceInfo> enumerate_touchpads(const std::filesystem::path &dir) {
  std::vector<DeviceInfo> out;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (!name.starts_with("event")) {
      continue;
    }
    if (auto info = inspect_touchpad(entry.path())) {
      out.push_back(std::move(*info));
    }
  }
  if (ec) {
    std::cerr << "[glasskey] Warning: cannot scan " << dir << ": "
              << ec.message() << "\n";
  }
  std::sort(out.begin(), out.end(),
            [](const auto &a, const auto &b) { return a.path < b.path; });
  return out;
}

// ===========================================================================
// MtDecoder
// ===========================================================================

void MtDecoder::reset() noexcept {
  slots_ = {};
  current_ = 0;
  dropped_ = false;
}

Contact MtDecoder::make_contact(const Slot &slot, ContactState state,
                                std::uint32_t id) const {
  Contact c;
  c.id = id;
  c.x = x_.normalize(slot.x);
  c.y = y_.normalize(slot.y);
  c.pressure = pressure_.maximum > pressure_.minimum
                   ? static_cast<float>(pressure_.normalize(slot.pressure) *
                                        255.0)
                   : 0.0f;
  c.major_axis = static_cast<float>(slot.major);
  c.minor_axis = static_cast<float>(slot.minor);
  c.angle = static_cast<float>(slot.orientation);
  c.state = state;
  return c;
}

std::optional<RawTouchFrame> MtDecoder::feed(const input_event &ev, Side side) {
  if (ev.type == EV_ABS) {
    if (ev.code == ABS_MT_SLOT) {
      current_ = ev.value >= 0 && static_cast<std::size_t>(ev.value) < kMaxSlots
                     ? static_cast<std::size_t>(ev.value)
                     : kMaxSlots;
      return std::nullopt;
    }
    if (current_ >= kMaxSlots) {
      return std::nullopt;
    }
    Slot &slot = slots_[current_];
    switch (ev.code) {
    case ABS_MT_TRACKING_ID:
      if (ev.value < 0) {
        if (slot.tracking_id >= 0) {
          slot.lifting = true;
          slot.last_id = static_cast<std::uint32_t>(slot.tracking_id);
        }
        slot.tracking_id = -1;
        slot.fresh = false;
      } else {
        slot.tracking_id = ev.value;
        slot.last_id = static_cast<std::uint32_t>(ev.value);
        slot.fresh = true;
        slot.lifting = false;
      }
      break;
    case ABS_MT_POSITION_X:
      slot.x = ev.value;
      break;
    case ABS_MT_POSITION_Y:
      slot.y = ev.value;
      break;
    case ABS_MT_PRESSURE:
      slot.pressure = ev.value;
      break;
    case ABS_MT_TOUCH_MAJOR:
      slot.major = ev.value;
      break;
    case ABS_MT_TOUCH_MINOR:
      slot.minor = ev.value;
      break;
    case ABS_MT_ORIENTATION:
      slot.orientation = ev.value;
      break;
    default:
      break;
    }
    return std::nullopt;
  }

  if (ev.type != EV_SYN) {
    return std::nullopt;
  }
  if (ev.code == SYN_DROPPED) {
    dropped_ = true;
    return std::nullopt;
  }
  if (ev.code != SYN_REPORT) {
    return std::nullopt;
  }
  if (dropped_) {
    // Состояние слотов неизвестно: отпускаем всё и ждём новых касаний
    dropped_ = false;
    RawTouchFrame frame;
    frame.side = side;
    frame.timestamp = static_cast<double>(ev.input_event_sec) +
                      static_cast<double>(ev.input_event_usec) * 1e-6;
    for (auto &slot : slots_) {
      slot = Slot{};
    }
    return frame;
  }

  RawTouchFrame frame;
  frame.side = side;
  frame.timestamp = static_cast<double>(ev.input_event_sec) +
                    static_cast<double>(ev.input_event_usec) * 1e-6;
  for (auto &slot : slots_) {
    if (slot.tracking_id >= 0) {
      frame.contacts.push_back(make_contact(
          slot, slot.fresh ? ContactState::Starting : ContactState::Touching,
          static_cast<std::uint32_t>(slot.tracking_id)));
      slot.fresh = false;
    } else if (slot.lifting) {
      frame.contacts.push_back(
          make_contact(slot, ContactState::Breaking, slot.last_id));
      slot.lifting = false;
    }
  }
  return frame;
}

// ===========================================================================
// TouchpadReader
// ===========================================================================

TouchpadReader::TouchpadReader(DeviceInfo info, Side side)
    : info_(std::move(info)), side_(side) {}

TouchpadReader::~TouchpadReader() { close(); }

bool TouchpadReader::open(bool grab) {
  close();
  fd_ = ::open(info_.path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) {
    std::cerr << "[glasskey] Warning: cannot open " << info_.path << ": "
              << std::strerror(errno) << "\n";
    return false;
  }

  // Метки событий в той же шкале, что steady_clock
  int clock_id = CLOCK_MONOTONIC;
  if (ioctl(fd_, EVIOCSCLOCKID, &clock_id) < 0) {
    std::cerr << "[glasskey] Warning: EVIOCSCLOCKID failed for "
              << info_.path << "\n";
  }

  const auto x = abs_range(fd_, ABS_MT_POSITION_X);
  const auto y = abs_range(fd_, ABS_MT_POSITION_Y);
  if (!x || !y) {
    std::cerr << "[glasskey] Warning: no MT axes on " << info_.path << "\n";
    close();
    return false;
  }
  const auto pressure = abs_range(fd_, ABS_MT_PRESSURE);
  decoder_.reset();
  decoder_.set_ranges(*x, *y, pressure.value_or(AxisRange{}));

  if (grab) {
    if (ioctl(fd_, EVIOCGRAB, 1) < 0) {
      std::cerr << "[glasskey] Warning: EVIOCGRAB failed for " << info_.path
                << ": " << std::strerror(errno) << "\n";
    } else {
      grabbed_ = true;
    }
  }

  std::cerr << "[glasskey] Opened " << side_name(side_) << " touchpad: "
            << info_.name << " (" << info_.path.string() << ")\n";
  return true;
}

void TouchpadReader::close() {
  if (fd_ < 0) {
    return;
  }
  if (grabbed_) {
    ioctl(fd_, EVIOCGRAB, 0);
    grabbed_ = false;
  }
  ::close(fd_);
  fd_ = -1;
}

void TouchpadReader::adopt(int fd, AxisRange x, AxisRange y,
                           AxisRange pressure) {
  close();
  fd_ = fd;
  decoder_.reset();
  decoder_.set_ranges(x, y, pressure);
}

ReadResult TouchpadReader::read_available(const FrameCallback &callback) {
  if (fd_ < 0) {
    return ReadResult::Disconnected;
  }

  input_event events[64];
  while (true) {
    const ssize_t n = ::read(fd_, events, sizeof(events));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return ReadResult::Ok;
      }
      if (errno == ENODEV) {
        std::cerr << "[glasskey] Touchpad disconnected: " << info_.path
                  << "\n";
        close();
        return ReadResult::Disconnected;
      }
      std::cerr << "[glasskey] Warning: read failed on " << info_.path << ": "
                << std::strerror(errno) << "\n";
      return ReadResult::Error;
    }
    if (n == 0) {
      close();
      return ReadResult::Disconnected;
    }

    const std::size_t count = static_cast<std::size_t>(n) / sizeof(input_event);
    for (std::size_t i = 0; i < count; ++i) {
      if (auto frame = decoder_.feed(events[i], side_)) {
        callback(std::move(*frame));
      }
    }
  }
}

} // namespace glasskey
