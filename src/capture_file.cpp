/**
 * @file capture_file.cpp
 * @brief Запись и чтение файлов захвата
 */

#include "glasskey/capture_file.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <iterator>

namespace glasskey {

namespace {

void put_u8(std::string &out, std::uint8_t v) {
  out.push_back(static_cast<char>(v));
}

void put_u16(std::string &out, std::uint16_t v) {
  put_u8(out, static_cast<std::uint8_t>(v & 0xFF));
  put_u8(out, static_cast<std::uint8_t>(v >> 8));
}

void put_u32(std::string &out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    put_u8(out, static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
  }
}

void put_u64(std::string &out, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    put_u8(out, static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
  }
}

void put_f32(std::string &out, float v) {
  put_u32(out, std::bit_cast<std::uint32_t>(v));
}

void put_f64(std::string &out, double v) {
  put_u64(out, std::bit_cast<std::uint64_t>(v));
}

/// Курсор чтения little-endian значений
class Reader {
public:
  explicit Reader(std::string_view data) : data_(data) {}

  [[nodiscard]] bool has(std::size_t n) const noexcept {
    return data_.size() - pos_ >= n;
  }
  [[nodiscard]] bool done() const noexcept { return pos_ == data_.size(); }

  std::uint8_t u8() { return static_cast<std::uint8_t>(data_[pos_++]); }

  std::uint16_t u16() {
    std::uint16_t lo = u8();
    std::uint16_t hi = u8();
    return static_cast<std::uint16_t>(lo | (hi << 8));
  }

  std::uint32_t u32() {
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      v |= static_cast<std::uint32_t>(u8()) << (i * 8);
    }
    return v;
  }

  std::uint64_t u64() {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
      v |= static_cast<std::uint64_t>(u8()) << (i * 8);
    }
    return v;
  }

  float f32() { return std::bit_cast<float>(u32()); }
  double f64() { return std::bit_cast<double>(u64()); }

  std::string_view bytes(std::size_t n) {
    auto out = data_.substr(pos_, n);
    pos_ += n;
    return out;
  }

private:
  std::string_view data_;
  std::size_t pos_ = 0;
};

std::string encode_header() {
  std::string out{kCaptureMagic};
  put_u32(out, kCaptureVersion);
  put_u32(out, 0);
  return out;
}

} // namespace

// ===========================================================================
// Кодирование
// ===========================================================================

void quantize_for_capture(RawTouchFrame &frame) noexcept {
  for (auto &c : frame.contacts) {
    c.x = static_cast<float>(c.x);
    c.y = static_cast<float>(c.y);
  }
}

void encode_frame(const RawTouchFrame &frame, std::string &out) {
  const std::size_t count = std::min<std::size_t>(frame.contacts.size(), 255);
  put_f64(out, frame.timestamp);
  put_u8(out, static_cast<std::uint8_t>(side_index(frame.side)));
  put_u8(out, static_cast<std::uint8_t>(count));
  put_u16(out, 0);
  for (std::size_t i = 0; i < count; ++i) {
    const Contact &c = frame.contacts[i];
    put_u32(out, c.id);
    put_f32(out, static_cast<float>(c.x));
    put_f32(out, static_cast<float>(c.y));
    put_f32(out, c.major_axis);
    put_f32(out, c.minor_axis);
    put_f32(out, c.pressure);
    put_f32(out, c.angle);
    put_f32(out, c.density);
    put_u8(out, static_cast<std::uint8_t>(c.state));
    put_u8(out, 0);
    put_u16(out, 0);
  }
}

// ===========================================================================
// CaptureWriter
// ===========================================================================

CaptureResult CaptureWriter::open(const std::filesystem::path &path) {
  if (out_.is_open()) {
    return CaptureResult::CaptureActive;
  }
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    return CaptureResult::IoError;
  }
  const std::string header = encode_header();
  out_.write(header.data(), static_cast<std::streamsize>(header.size()));
  if (!out_) {
    out_.close();
    return CaptureResult::IoError;
  }
  path_ = path;
  frames_ = 0;
  failed_ = false;
  return CaptureResult::Ok;
}

CaptureResult CaptureWriter::write(const RawTouchFrame &frame) {
  if (!out_.is_open()) {
    return CaptureResult::CaptureNotActive;
  }
  std::string record;
  record.reserve(kCaptureRecordHeaderSize +
                 frame.contacts.size() * kCaptureContactSize);
  encode_frame(frame, record);
  out_.write(record.data(), static_cast<std::streamsize>(record.size()));
  if (!out_) {
    failed_ = true;
    return CaptureResult::IoError;
  }
  ++frames_;
  return CaptureResult::Ok;
}

CaptureOutcome<std::size_t> CaptureWriter::close() {
  CaptureOutcome<std::size_t> out;
  if (!out_.is_open()) {
    out.result = CaptureResult::CaptureNotActive;
    out.error = "capture not active";
    return out;
  }
  out_.flush();
  const bool flushed = static_cast<bool>(out_);
  out_.close();
  if (!flushed || failed_ || out_.fail()) {
    out.result = CaptureResult::IoError;
    out.error = "failed to flush capture: " + path_.string();
    return out;
  }
  out.value = frames_;
  return out;
}

// ===========================================================================
// Чтение
// ===========================================================================

int CaptureData::frame_index_for_time(double seconds) const noexcept {
  if (frames.empty()) {
    return -1;
  }
  if (seconds <= 0.0) {
    return 0;
  }
  const double target = start_time() + seconds;
  auto it = std::upper_bound(
      frames.begin(), frames.end(), target,
      [](double t, const RawTouchFrame &f) { return t < f.timestamp; });
  if (it == frames.begin()) {
    return 0;
  }
  return static_cast<int>(std::distance(frames.begin(), it)) - 1;
}

CaptureOutcome<CaptureData> parse_capture(std::string_view bytes) {
  CaptureOutcome<CaptureData> out;
  Reader in{bytes};

  if (!in.has(kCaptureHeaderSize)) {
    out.result = CaptureResult::InvalidFormat;
    out.error = "capture header truncated";
    return out;
  }
  if (in.bytes(kCaptureMagic.size()) != kCaptureMagic) {
    out.result = CaptureResult::InvalidFormat;
    out.error = "bad capture magic";
    return out;
  }
  const std::uint32_t version = in.u32();
  in.u32();
  if (version != kCaptureVersion) {
    out.result = CaptureResult::UnsupportedVersion;
    out.error = "unsupported capture version " + std::to_string(version);
    return out;
  }

  while (!in.done()) {
    if (!in.has(kCaptureRecordHeaderSize)) {
      out.result = CaptureResult::InvalidFormat;
      out.error = "truncated frame record";
      out.value = CaptureData{};
      return out;
    }
    RawTouchFrame frame;
    frame.timestamp = in.f64();
    if (!std::isfinite(frame.timestamp) ||
        (!out.value.frames.empty() &&
         frame.timestamp < out.value.frames.back().timestamp)) {
      out.result = CaptureResult::InvalidFormat;
      out.error = "bad frame timestamp";
      out.value = CaptureData{};
      return out;
    }
    const std::uint8_t surface = in.u8();
    const std::uint8_t count = in.u8();
    in.u16();
    if (surface > 1) {
      out.result = CaptureResult::InvalidFormat;
      out.error = "bad surface index";
      out.value = CaptureData{};
      return out;
    }
    frame.side = static_cast<Side>(surface);
    if (!in.has(static_cast<std::size_t>(count) * kCaptureContactSize)) {
      out.result = CaptureResult::InvalidFormat;
      out.error = "truncated contact list";
      out.value = CaptureData{};
      return out;
    }
    frame.contacts.reserve(count);
    for (std::uint8_t i = 0; i < count; ++i) {
      Contact c;
      c.id = in.u32();
      c.x = in.f32();
      c.y = in.f32();
      c.major_axis = in.f32();
      c.minor_axis = in.f32();
      c.pressure = in.f32();
      c.angle = in.f32();
      c.density = in.f32();
      const std::uint8_t state = in.u8();
      in.u8();
      in.u16();
      if (state > static_cast<std::uint8_t>(ContactState::Leaving)) {
        out.result = CaptureResult::InvalidFormat;
        out.error = "bad contact state";
        out.value = CaptureData{};
        return out;
      }
      if (!std::isfinite(c.x) || !std::isfinite(c.y)) {
        out.result = CaptureResult::InvalidFormat;
        out.error = "bad contact position";
        out.value = CaptureData{};
        return out;
      }
      c.x = std::clamp(c.x, 0.0, 1.0);
      c.y = std::clamp(c.y, 0.0, 1.0);
      c.state = static_cast<ContactState>(state);
      frame.contacts.push_back(c);
    }
    out.value.frames.push_back(std::move(frame));
  }
  return out;
}

CaptureOutcome<CaptureData> read_capture(const std::filesystem::path &path) {
  std::ifstream file{path, std::ios::binary};
  if (!file.is_open()) {
    CaptureOutcome<CaptureData> out;
    out.result = CaptureResult::IoError;
    out.error = "cannot open capture: " + path.string();
    return out;
  }
  std::string bytes{std::istreambuf_iterator<char>(file),
                    std::istreambuf_iterator<char>()};
  if (file.bad()) {
    CaptureOutcome<CaptureData> out;
    out.result = CaptureResult::IoError;
    out.error = "read failed: " + path.string();
    return out;
  }
  return parse_capture(bytes);
}

} // namespace glasskey
