/**
 * @file uinput_injector.cpp
 * @brief Реализация генератора событий ввода
 */

#include "glasskey/uinput_injector.hpp"
#include "glasskey/scancode_map.hpp"

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace glasskey {

namespace {

constexpr std::uint16_t button_code(MouseButton b) noexcept {
  switch (b) {
  case MouseButton::Left:
    return BTN_LEFT;
  case MouseButton::Right:
    return BTN_RIGHT;
  case MouseButton::Middle:
    return BTN_MIDDLE;
  }
  return BTN_LEFT;
}

constexpr std::uint16_t kModifierKeys[] = {KEY_LEFTSHIFT, KEY_LEFTCTRL,
                                           KEY_LEFTALT, KEY_LEFTMETA};
constexpr ModifierMask kModifierOrder[] = {kModShift, kModCtrl, kModAlt,
                                           kModMeta};

input_event make_event(std::uint16_t type, std::uint16_t code,
                       std::int32_t value) {
  input_event ev{};
  ev.type = type;
  ev.code = code;
  ev.value = value;
  return ev;
}

} // namespace

// ===========================================================================
// UinputInjector
// ===========================================================================

UinputInjector::UinputInjector(InjectorTarget target) noexcept
    : target_{target} {
  if (target_ == InjectorTarget::Stdout) {
    fd_ = STDOUT_FILENO;
  }
}

UinputInjector::~UinputInjector() { close(); }

bool UinputInjector::open() {
  if (target_ == InjectorTarget::Stdout) {
    return true;
  }
  if (fd_ >= 0) {
    return true;
  }

  int fd = ::open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    std::cerr << "[glasskey] Failed to open /dev/uinput: "
              << std::strerror(errno) << "\n";
    return false;
  }

  bool ok = ioctl(fd, UI_SET_EVBIT, EV_KEY) >= 0 &&
            ioctl(fd, UI_SET_EVBIT, EV_REL) >= 0 &&
            ioctl(fd, UI_SET_EVBIT, EV_SYN) >= 0 &&
            ioctl(fd, UI_SET_RELBIT, REL_X) >= 0 &&
            ioctl(fd, UI_SET_RELBIT, REL_Y) >= 0;
  // Все обычные клавиши плюс кнопки мыши
  for (int code = KEY_ESC; ok && code < KEY_MAX; ++code) {
    if (code >= BTN_MISC && code < KEY_OK) {
      continue;
    }
    ok = ioctl(fd, UI_SET_KEYBIT, code) >= 0;
  }
  ok = ok && ioctl(fd, UI_SET_KEYBIT, BTN_LEFT) >= 0 &&
       ioctl(fd, UI_SET_KEYBIT, BTN_RIGHT) >= 0 &&
       ioctl(fd, UI_SET_KEYBIT, BTN_MIDDLE) >= 0;

  if (ok) {
    uinput_setup setup{};
    std::snprintf(setup.name, UINPUT_MAX_NAME_SIZE, "glasskey virtual input");
    setup.id.bustype = BUS_VIRTUAL;
    setup.id.vendor = 0x676b;
    setup.id.product = 0x0001;
    setup.id.version = 1;
    ok = ioctl(fd, UI_DEV_SETUP, &setup) >= 0 && ioctl(fd, UI_DEV_CREATE) >= 0;
  }

  if (!ok) {
    std::cerr << "[glasskey] Failed to create uinput device: "
              << std::strerror(errno) << "\n";
    ::close(fd);
    return false;
  }

  fd_ = fd;
  std::cerr << "[glasskey] Virtual input device created\n";
  return true;
}

void UinputInjector::close() noexcept {
  if (target_ != InjectorTarget::Uinput || fd_ < 0) {
    return;
  }
  (void)ioctl(fd_, UI_DEV_DESTROY);
  ::close(fd_);
  fd_ = -1;
}

void UinputInjector::write_all_or_die(int fd, const void *data,
                                      std::size_t bytes) {
  const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
  std::size_t remaining = bytes;

  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      remaining -= static_cast<std::size_t>(n);
      continue;
    }

    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
      continue;
    }

    const int e = errno;
    std::cerr << "[glasskey] UinputInjector: write failed (fd=" << fd
              << " bytes=" << bytes << " remaining=" << remaining
              << ") errno=" << e << " (" << std::strerror(e) << ")\n";
    std::exit(1);
  }
}

void UinputInjector::emit_events(std::span<const input_event> events) const {
  if (events.empty() || fd_ < 0) {
    return;
  }
  write_all_or_die(fd_, events.data(), events.size() * sizeof(input_event));
}

void UinputInjector::send(std::uint16_t type, std::uint16_t code,
                          std::int32_t value) const {
  const input_event evs[2] = {make_event(type, code, value),
                              make_event(EV_SYN, SYN_REPORT, 0)};
  emit_events(std::span<const input_event>{evs, 2});
}

void UinputInjector::press_modifiers(ModifierMask mask, bool down) {
  for (std::size_t i = 0; i < std::size(kModifierOrder); ++i) {
    const ModifierMask bit = kModifierOrder[i];
    if ((mask & bit) == 0) {
      continue;
    }
    // Уже зажатый пользователем модификатор не трогаем
    if (held_modifiers_ & bit) {
      continue;
    }
    send(EV_KEY, kModifierKeys[i], down ? 1 : 0);
  }
}

void UinputInjector::key_event(ScanCode code, ModifierMask modifiers,
                               bool down) {
  if (code == 0) {
    return;
  }
  const ModifierMask own = modifier_bit(code);

  if (down) {
    press_modifiers(modifiers, true);
    send(EV_KEY, code, 1);
    held_modifiers_ |= own;
  } else {
    send(EV_KEY, code, 0);
    held_modifiers_ &= static_cast<ModifierMask>(~own);
    press_modifiers(modifiers, false);
  }
}

void UinputInjector::pointer_move(int dx, int dy) {
  if (dx == 0 && dy == 0) {
    return;
  }
  input_event evs[3]{};
  std::size_t n = 0;
  if (dx != 0) {
    evs[n++] = make_event(EV_REL, REL_X, dx);
  }
  if (dy != 0) {
    evs[n++] = make_event(EV_REL, REL_Y, dy);
  }
  evs[n++] = make_event(EV_SYN, SYN_REPORT, 0);
  emit_events(std::span<const input_event>{evs, n});
}

void UinputInjector::click(MouseButton button, int count) {
  for (int i = 0; i < count; ++i) {
    send_button(button, true);
    send_button(button, false);
  }
}

void UinputInjector::send_button(MouseButton button, bool down) const {
  send(EV_KEY, button_code(button), down ? 1 : 0);
}

void UinputInjector::haptic_pulse(double strength, Side device) {
  // У uinput нет актуатора; предупреждаем один раз
  if (!haptic_warned_.exchange(true)) {
    std::cerr << "[glasskey] Haptic feedback unavailable (strength="
              << strength << " device=" << side_name(device)
              << "), ignoring\n";
  }
}

void UinputInjector::release_all_modifiers() {
  for (ScanCode code : {KEY_LEFTSHIFT, KEY_RIGHTSHIFT, KEY_LEFTCTRL,
                        KEY_RIGHTCTRL, KEY_LEFTALT, KEY_RIGHTALT, KEY_LEFTMETA,
                        KEY_RIGHTMETA}) {
    send(EV_KEY, code, 0);
  }
  held_modifiers_ = 0;
}

} // namespace glasskey
