/**
 * @file input_device.cpp
 * @brief Реализация чтения событий evdev
 */

#include "treadle/input_device.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>

namespace treadle {

InputDevice::OpenOutcome InputDevice::open(const std::filesystem::path &path) {
  OpenOutcome out;

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int e = errno;
    out.error = "cannot open " + path.string() + ": " + std::strerror(e);
    if (e == EACCES && ::geteuid() != 0) {
      out.error += " (fix permissions or run as root)";
    }
    return out;
  }

  if (::ioctl(fd, EVIOCGRAB, 1) < 0) {
    const int e = errno;
    out.error = "cannot grab " + path.string() + ": " + std::strerror(e);
    ::close(fd);
    return out;
  }

  std::array<char, 256> name{};
  if (::ioctl(fd, EVIOCGNAME(name.size() - 1), name.data()) >= 0) {
    std::cerr << "[treadle] Grabbed input device \"" << name.data() << "\" ("
              << path.string() << ")\n";
  }

  out.device = std::make_unique<InputDevice>(Private{}, fd, true);
  return out;
}

std::unique_ptr<InputDevice> InputDevice::adopt(int fd) {
  if (fd < 0) {
    return nullptr;
  }
  return std::make_unique<InputDevice>(Private{}, fd, false);
}

InputDevice::~InputDevice() {
  if (fd_ < 0) {
    return;
  }
  if (grabbed_) {
    (void)::ioctl(fd_, EVIOCGRAB, 0);
  }
  ::close(fd_);
}

ReadStatus InputDevice::read_event(input_event &out,
                                   std::chrono::milliseconds timeout) {
  pollfd pfd{fd_, POLLIN, 0};

  int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ret == 0) {
    return ReadStatus::Timeout;
  }
  if (ret < 0) {
    // Сигнал прервал poll: вызывающий проверит флаг остановки
    return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Error;
  }

  // POLLHUP вместе с POLLIN: сначала дочитываем оставшиеся данные
  if (!(pfd.revents & POLLIN)) {
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
      return ReadStatus::Closed;
    }
    return ReadStatus::Timeout;
  }

  auto *p = reinterpret_cast<std::uint8_t *>(&out);
  std::size_t remaining = sizeof(out);
  while (remaining > 0) {
    ssize_t n = ::read(fd_, p, remaining);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      remaining -= static_cast<std::size_t>(n);
      continue;
    }
    if (n == 0) {
      return ReadStatus::Closed;
    }
    if (errno == EINTR) {
      continue;
    }
    const int e = errno;
    if (e == ENODEV) {
      std::cerr << "[treadle] Input device disconnected\n";
      return ReadStatus::Closed;
    }
    std::cerr << "[treadle] Input read failed: " << std::strerror(e) << "\n";
    return ReadStatus::Error;
  }

  return ReadStatus::Event;
}

} // namespace treadle
