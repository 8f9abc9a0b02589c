/**
 * @file device_session.cpp
 * @brief Реализация сервиса устройств
 */

#include "glasskey/device_session.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>

namespace glasskey {

// ===========================================================================
// Разрешение назначений
// ===========================================================================

DeviceAssignment assignment_for(const DeviceInfo &device) {
  return DeviceAssignment{device.id, device.name, device.is_built_in};
}

AssignmentResolution resolve_assignment(const DeviceAssignment &left,
                                        const DeviceAssignment &right,
                                        std::span<const DeviceInfo> visible) {
  AssignmentResolution out;
  std::vector<bool> claimed(visible.size(), false);
  const std::array<const DeviceAssignment *, kSideCount> saved{&left, &right};

  auto claim = [&](Side side, std::size_t i) {
    out[side] = visible[i];
    claimed[i] = true;
  };

  // 1. Точный id
  for (Side side : kSides) {
    const DeviceAssignment &a = *saved[side_index(side)];
    if (a.id.empty()) {
      continue;
    }
    for (std::size_t i = 0; i < visible.size(); ++i) {
      if (!claimed[i] && visible[i].id == a.id) {
        claim(side, i);
        break;
      }
    }
  }

  // 2. Единственное совпадение (name, is_built_in)
  for (Side side : kSides) {
    const DeviceAssignment &a = *saved[side_index(side)];
    if (out[side] || a.empty()) {
      continue;
    }
    std::optional<std::size_t> match;
    bool unique = true;
    for (std::size_t i = 0; i < visible.size(); ++i) {
      if (claimed[i] || visible[i].name != a.name ||
          visible[i].is_built_in != a.is_built_in) {
        continue;
      }
      if (match) {
        unique = false;
        break;
      }
      match = i;
    }
    if (match && unique) {
      claim(side, *match);
    }
  }

  // 3. Исключение
  std::vector<Side> missing;
  for (Side side : kSides) {
    if (!out[side] && !saved[side_index(side)]->empty()) {
      missing.push_back(side);
    }
  }
  const auto free_count = std::count(claimed.begin(), claimed.end(), false);
  if (missing.size() == 1 && free_count == 1) {
    const auto it = std::find(claimed.begin(), claimed.end(), false);
    claim(missing.front(),
          static_cast<std::size_t>(std::distance(claimed.begin(), it)));
  }

  return out;
}

// ===========================================================================
// DeviceSessionService
// ===========================================================================

DeviceSessionService::DeviceSessionService(DevicesConfig config,
                                           FrameSink sink, Enumerator enumerate,
                                           Opener open)
    : config_(std::move(config)), sink_(std::move(sink)),
      enumerate_(std::move(enumerate)), open_(std::move(open)) {
  if (!enumerate_) {
    enumerate_ = [] { return enumerate_touchpads(); };
  }
  if (!open_) {
    open_ = [](const DeviceInfo &device, Side side, bool grab) {
      auto reader = std::make_unique<TouchpadReader>(device, side);
      if (!reader->open(grab)) {
        reader.reset();
      }
      return reader;
    };
  }
}

DeviceSessionService::~DeviceSessionService() { stop(); }

void DeviceSessionService::start() {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void DeviceSessionService::stop() {
  if (worker_.joinable()) {
    worker_.request_stop();
    worker_.join();
    worker_ = std::jthread{};
  }
  for (auto &reader : readers_) {
    reader.reset();
  }
}

void DeviceSessionService::assign(Side side, DeviceAssignment assignment) {
  config_.compute([&](DevicesConfig &c) {
    (side == Side::Left ? c.left : c.right) = std::move(assignment);
  });
}

void DeviceSessionService::set_assignment_listener(AssignmentListener listener) {
  listener_.set(std::move(listener));
}

double DeviceSessionService::resync_interval() const {
  const DevicesConfig cfg = config_.get();
  const auto roles = roles_.get();
  const bool missing = std::any_of(roles.begin(), roles.end(), [](const auto &r) {
    return r.status == RoleStatus::Disconnected;
  });
  return missing ? cfg.fast_resync_s : cfg.slow_resync_s;
}

void DeviceSessionService::resync() {
  DevicesConfig cfg = config_.get();
  const std::vector<DeviceInfo> visible = enumerate_();

  // Первый запуск без назначений: по порядку путей
  bool changed = false;
  if (cfg.left.empty() && cfg.right.empty() && !visible.empty()) {
    if (visible.size() == 1) {
      cfg.right = assignment_for(visible[0]);
    } else {
      cfg.left = assignment_for(visible[0]);
      cfg.right = assignment_for(visible[1]);
    }
    changed = true;
  }

  const AssignmentResolution resolved =
      resolve_assignment(cfg.left, cfg.right, visible);

  std::array<RoleState, kSideCount> roles;
  for (Side side : kSides) {
    const std::size_t i = side_index(side);
    RoleState &role = roles[i];
    role.assignment = side == Side::Left ? cfg.left : cfg.right;
    role.device = resolved[side];

    auto &reader = readers_[i];
    if (!role.device) {
      if (reader) {
        std::cerr << "[glasskey] " << side_name(side)
                  << " touchpad missing, marking disconnected\n";
        reader.reset();
      }
      role.status = role.assignment.empty() ? RoleStatus::Unassigned
                                            : RoleStatus::Disconnected;
      continue;
    }

    // Обновляем назначение, если устройство найдено не по id
    const DeviceAssignment current = assignment_for(*role.device);
    if (current != role.assignment) {
      role.assignment = current;
      (side == Side::Left ? cfg.left : cfg.right) = current;
      changed = true;
    }

    const bool same_device =
        reader && reader->fd() >= 0 && reader->info().path == role.device->path;
    if (!same_device) {
      reader = open_(*role.device, side, cfg.grab);
    }
    role.status = reader ? RoleStatus::Connected : RoleStatus::Disconnected;
  }

  roles_.set(roles);
  if (changed) {
    config_.set(cfg);
    if (auto listener = listener_.get()) {
      listener(cfg);
    }
  }
}

void DeviceSessionService::poll_once(int timeout_ms) {
  std::array<pollfd, kSideCount> fds{};
  std::array<std::size_t, kSideCount> owners{};
  nfds_t count = 0;
  for (std::size_t i = 0; i < kSideCount; ++i) {
    if (readers_[i] && readers_[i]->fd() >= 0) {
      fds[count] = pollfd{readers_[i]->fd(), POLLIN, 0};
      owners[count] = i;
      ++count;
    }
  }

  if (count == 0) {
    ::poll(nullptr, 0, timeout_ms);
    return;
  }

  const int ret = ::poll(fds.data(), count, timeout_ms);
  if (ret < 0) {
    if (errno != EINTR) {
      std::cerr << "[glasskey] Warning: poll failed on touchpads\n";
    }
    return;
  }

  for (nfds_t k = 0; k < count; ++k) {
    if (fds[k].revents == 0) {
      continue;
    }
    auto &reader = readers_[owners[k]];
    const ReadResult r = reader->read_available(sink_);
    if (r == ReadResult::Disconnected ||
        (fds[k].revents & (POLLHUP | POLLERR | POLLNVAL))) {
      reader.reset();
      roles_.compute([&](auto &roles) {
        roles[owners[k]].status = RoleStatus::Disconnected;
      });
    }
  }
}

void DeviceSessionService::run(std::stop_token st) {
  using clock = std::chrono::steady_clock;
  resync();
  auto next_resync =
      clock::now() + std::chrono::duration_cast<clock::duration>(
                         std::chrono::duration<double>(resync_interval()));

  while (!st.stop_requested()) {
    poll_once(20);

    const auto now = clock::now();
    const auto due = now + std::chrono::duration_cast<clock::duration>(
                               std::chrono::duration<double>(resync_interval()));
    if (now >= next_resync) {
      resync();
      next_resync = now + std::chrono::duration_cast<clock::duration>(
                              std::chrono::duration<double>(resync_interval()));
    } else {
      // Отвалившаяся роль сокращает ожидание до быстрого интервала
      next_resync = std::min(next_resync, due);
    }
  }
}

} // namespace glasskey
