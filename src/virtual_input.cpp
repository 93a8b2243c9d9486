/**
 * @file virtual_input.cpp
 * @brief Реализация виртуальной клавиатуры uinput
 */

#include "treadle/virtual_input.hpp"

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>

namespace treadle {

namespace {

/// ioctl с логом ошибки
bool checked_ioctl(int fd, unsigned long request, unsigned long arg,
                   const char *what) {
  if (::ioctl(fd, request, arg) < 0) {
    const int e = errno;
    std::cerr << "[treadle] uinput: " << what << " failed: "
              << std::strerror(e) << "\n";
    return false;
  }
  return true;
}

} // namespace

std::unique_ptr<UinputDevice> UinputDevice::create(std::string_view name) {
  int fd = ::open(kUinputPath, O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    const int e = errno;
    std::cerr << "[treadle] uinput: cannot open " << kUinputPath << ": "
              << std::strerror(e) << "\n";
    return nullptr;
  }

  bool ok = checked_ioctl(fd, UI_SET_EVBIT, EV_KEY, "UI_SET_EVBIT EV_KEY") &&
            checked_ioctl(fd, UI_SET_EVBIT, EV_SYN, "UI_SET_EVBIT EV_SYN");

  // Все клавиши, которые может переслать действие key:<name>
  for (unsigned long code = 1; ok && code < KEY_MAX; ++code) {
    ok = checked_ioctl(fd, UI_SET_KEYBIT, code, "UI_SET_KEYBIT");
  }

  if (ok) {
    uinput_setup setup{};
    setup.id.bustype = BUS_VIRTUAL;
    setup.id.vendor = 0x7472; // "tr"
    setup.id.product = 0x6470;
    setup.id.version = 1;
    const std::size_t len = std::min(name.size(), sizeof(setup.name) - 1);
    std::memcpy(setup.name, name.data(), len);

    if (::ioctl(fd, UI_DEV_SETUP, &setup) < 0) {
      const int e = errno;
      std::cerr << "[treadle] uinput: UI_DEV_SETUP failed: "
                << std::strerror(e) << "\n";
      ok = false;
    }
  }

  ok = ok && checked_ioctl(fd, UI_DEV_CREATE, 0, "UI_DEV_CREATE");

  if (!ok) {
    ::close(fd);
    return nullptr;
  }

  std::cerr << "[treadle] uinput: virtual keyboard created\n";
  return std::make_unique<UinputDevice>(Private{}, fd);
}

UinputDevice::~UinputDevice() {
  if (fd_ >= 0) {
    (void)::ioctl(fd_, UI_DEV_DESTROY);
    ::close(fd_);
  }
}

bool UinputDevice::emit_events(std::span<const input_event> events) {
  const auto *p = reinterpret_cast<const std::uint8_t *>(events.data());
  std::size_t remaining = events.size_bytes();

  while (remaining > 0) {
    ssize_t n = ::write(fd_, p, remaining);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      remaining -= static_cast<std::size_t>(n);
      continue;
    }

    if (n < 0 && errno == EINTR) {
      continue;
    }

    const int e = errno;
    std::cerr << "[treadle] uinput: write failed (remaining=" << remaining
              << ") errno=" << e << " (" << std::strerror(e) << ")\n";
    return false;
  }
  return true;
}

bool UinputDevice::write_key(KeyCode code, bool pressed) {
  input_event ev{};
  ev.type = EV_KEY;
  ev.code = code;
  ev.value = static_cast<std::int32_t>(pressed ? KeyState::Press
                                               : KeyState::Release);
  return emit_events(std::span<const input_event>{&ev, 1});
}

bool UinputDevice::sync() {
  input_event ev{};
  ev.type = EV_SYN;
  ev.code = SYN_REPORT;
  ev.value = 0;
  return emit_events(std::span<const input_event>{&ev, 1});
}

} // namespace treadle
