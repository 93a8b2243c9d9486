/**
 * @file resource_context.hpp
 * @brief Общие ресурсы процесса с ленивым созданием
 *
 * Виртуальная клавиатура, сервис уведомлений и оконная система создаются
 * при первом обращении, не более одного раза, и освобождаются в порядке,
 * обратном созданию, при уничтожении контекста.
 */

#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "treadle/notifier.hpp"
#include "treadle/virtual_input.hpp"
#include "treadle/window_system.hpp"

namespace treadle {

class ResourceContext {
public:
  /// Фабрики ресурсов (подменяются в тестах)
  struct Factories {
    std::function<std::unique_ptr<VirtualInputSink>()> input_sink;
    std::function<std::unique_ptr<NotificationService>()> notifications;
    std::function<std::unique_ptr<WindowSystem>()> window_system;
  };

  /// uinput + libnotify + X11
  [[nodiscard]] static Factories system_factories();

  explicit ResourceContext(Factories factories = system_factories());

  /// Освобождает ресурсы в обратном порядке
  ~ResourceContext();

  ResourceContext(const ResourceContext &) = delete;
  ResourceContext &operator=(const ResourceContext &) = delete;

  /// nullptr, если создать не удалось (повторной попытки не будет)
  [[nodiscard]] VirtualInputSink *input_sink();
  [[nodiscard]] NotificationService *notifications();
  [[nodiscard]] WindowSystem *window_system();

  /// Количество созданных ресурсов
  [[nodiscard]] std::size_t acquired() const noexcept {
    return releasers_.size();
  }

private:
  template <class T> struct Slot {
    std::unique_ptr<T> value;
    bool attempted = false;
  };

  template <class T>
  T *acquire(Slot<T> &slot,
             const std::function<std::unique_ptr<T>()> &factory,
             const char *what);

  Factories factories_;

  Slot<VirtualInputSink> input_sink_;
  Slot<NotificationService> notifications_;
  Slot<WindowSystem> window_system_;

  std::vector<std::function<void()>> releasers_;
};

} // namespace treadle
