/**
 * @file event_loop.hpp
 * @brief Главный цикл чтения событий педали
 *
 * Читает input_event из захваченного устройства и передаёт нажатия
 * и отпускания клавиш в реестр действий.
 */

#pragma once

#include <linux/input.h>

#include <atomic>
#include <chrono>

#include "treadle/action_registry.hpp"
#include "treadle/input_device.hpp"
#include "treadle/types.hpp"

namespace treadle {

class EventLoop {
public:
  /// Период проверки флага остановки и состояния окон-прицелов
  static constexpr std::chrono::milliseconds kTick{100};

  EventLoop(ActionRegistry &registry, InputDevice &device,
            bool verbose = false) noexcept
      : registry_{&registry}, device_{&device}, verbose_{verbose} {}

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  /**
   * @brief Запрашивает остановку цикла
   *
   * Thread-safe. Может вызываться из signal handler.
   */
  void request_stop() noexcept;

  /**
   * @brief Запускает главный цикл
   * @return Код возврата: 0 - штатное завершение, 1 - ошибка
   */
  [[nodiscard]] int run();

  /**
   * @brief Обрабатывает одно событие
   *
   * Учитываются только EV_KEY со значением 0 или 1; автоповтор (2)
   * и прочие типы игнорируются.
   */
  ActionResult handle_event(const input_event &ev);

private:
  ActionRegistry *registry_;
  InputDevice *device_;
  bool verbose_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace treadle
