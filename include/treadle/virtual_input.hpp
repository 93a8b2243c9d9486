/**
 * @file virtual_input.hpp
 * @brief Виртуальная клавиатура через uinput
 */

#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

#include <linux/input.h>

#include "treadle/types.hpp"

namespace treadle {

/**
 * @brief Приёмник синтетических нажатий
 */
class VirtualInputSink {
public:
  virtual ~VirtualInputSink() = default;

  /// Записывает EV_KEY (press/release)
  [[nodiscard]] virtual bool write_key(KeyCode code, bool pressed) = 0;

  /// Записывает SYN_REPORT
  [[nodiscard]] virtual bool sync() = 0;
};

/**
 * @brief Виртуальное устройство /dev/uinput
 *
 * Устройство существует, пока жив объект.
 */
class UinputDevice final : public VirtualInputSink {
  struct Private {
    explicit Private() = default;
  };

public:
  static constexpr const char *kUinputPath = "/dev/uinput";

  /**
   * @brief Создаёт виртуальную клавиатуру
   * @return nullptr при ошибке (нет доступа к /dev/uinput и т.п.)
   */
  [[nodiscard]] static std::unique_ptr<UinputDevice>
  create(std::string_view name = "treadle virtual keyboard");

  UinputDevice(Private, int fd) noexcept : fd_{fd} {}
  ~UinputDevice() override;

  UinputDevice(const UinputDevice &) = delete;
  UinputDevice &operator=(const UinputDevice &) = delete;

  bool write_key(KeyCode code, bool pressed) override;
  bool sync() override;

private:
  [[nodiscard]] bool emit_events(std::span<const input_event> events);

  int fd_ = -1;
};

} // namespace treadle
