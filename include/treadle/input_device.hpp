/**
 * @file input_device.hpp
 * @brief Захваченное устройство ввода evdev
 */

#pragma once

#include <linux/input.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace treadle {

/// Результат чтения события
enum class ReadStatus { Event, Timeout, Closed, Error };

class InputDevice {
  struct Private {
    explicit Private() = default;
  };

public:
  struct OpenOutcome {
    std::unique_ptr<InputDevice> device;
    std::string error;
  };

  /**
   * @brief Открывает устройство и захватывает его (EVIOCGRAB)
   *
   * Захват выполняется один раз и снимается при уничтожении объекта.
   */
  [[nodiscard]] static OpenOutcome open(const std::filesystem::path &path);

  /// Оборачивает уже открытый fd без захвата (пайпы, stdin)
  [[nodiscard]] static std::unique_ptr<InputDevice> adopt(int fd);

  InputDevice(Private, int fd, bool grabbed) noexcept
      : fd_{fd}, grabbed_{grabbed} {}
  ~InputDevice();

  InputDevice(const InputDevice &) = delete;
  InputDevice &operator=(const InputDevice &) = delete;

  /**
   * @brief Читает одно событие
   * @param timeout Максимальное ожидание (poll)
   */
  [[nodiscard]] ReadStatus read_event(input_event &out,
                                      std::chrono::milliseconds timeout);

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] bool grabbed() const noexcept { return grabbed_; }

private:
  int fd_ = -1;
  bool grabbed_ = false;
};

} // namespace treadle
