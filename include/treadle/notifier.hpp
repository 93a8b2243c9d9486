/**
 * @file notifier.hpp
 * @brief Уведомления рабочего стола (libnotify)
 */

#pragma once

#include <memory>
#include <string_view>

namespace treadle {

/**
 * @brief Одно уведомление, которое можно обновлять и показывать повторно
 */
class Notification {
public:
  virtual ~Notification() = default;

  [[nodiscard]] virtual bool update(std::string_view title,
                                    std::string_view body) = 0;

  [[nodiscard]] virtual bool show() = 0;
};

/**
 * @brief Сервис уведомлений
 */
class NotificationService {
public:
  virtual ~NotificationService() = default;

  /// nullptr при ошибке
  [[nodiscard]] virtual std::unique_ptr<Notification>
  create(std::string_view title, std::string_view body) = 0;
};

/**
 * @brief Сервис на libnotify
 *
 * notify_init() при создании, notify_uninit() при уничтожении.
 * Уведомления должны быть уничтожены раньше сервиса.
 */
class LibnotifyService final : public NotificationService {
  struct Private {
    explicit Private() = default;
  };

public:
  /// nullptr, если notify_init() не удался
  [[nodiscard]] static std::unique_ptr<LibnotifyService>
  create_service(std::string_view app_name);

  explicit LibnotifyService(Private) {}
  ~LibnotifyService() override;

  LibnotifyService(const LibnotifyService &) = delete;
  LibnotifyService &operator=(const LibnotifyService &) = delete;

  std::unique_ptr<Notification> create(std::string_view title,
                                       std::string_view body) override;
};

} // namespace treadle
