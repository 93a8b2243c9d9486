/**
 * @file notifier.cpp
 * @brief Реализация уведомлений через libnotify
 */

#include "treadle/notifier.hpp"

#include <glib.h>
#include <libnotify/notify.h>

#include <iostream>
#include <string>

namespace treadle {

namespace {

class LibnotifyNotification final : public Notification {
public:
  explicit LibnotifyNotification(NotifyNotification *n) noexcept
      : notification_{n} {}

  ~LibnotifyNotification() override { g_object_unref(notification_); }

  LibnotifyNotification(const LibnotifyNotification &) = delete;
  LibnotifyNotification &operator=(const LibnotifyNotification &) = delete;

  bool update(std::string_view title, std::string_view body) override {
    const std::string t{title};
    const std::string b{body};
    return notify_notification_update(notification_, t.c_str(), b.c_str(),
                                      nullptr) != FALSE;
  }

  bool show() override {
    GError *error = nullptr;
    if (!notify_notification_show(notification_, &error)) {
      std::cerr << "[treadle] Notification failed: "
                << (error ? error->message : "unknown error") << "\n";
      if (error) {
        g_error_free(error);
      }
      return false;
    }
    return true;
  }

private:
  NotifyNotification *notification_;
};

} // namespace

std::unique_ptr<LibnotifyService>
LibnotifyService::create_service(std::string_view app_name) {
  const std::string name{app_name};
  if (!notify_is_initted() && !notify_init(name.c_str())) {
    std::cerr << "[treadle] notify_init failed\n";
    return nullptr;
  }
  return std::make_unique<LibnotifyService>(Private{});
}

LibnotifyService::~LibnotifyService() {
  if (notify_is_initted()) {
    notify_uninit();
  }
}

std::unique_ptr<Notification>
LibnotifyService::create(std::string_view title, std::string_view body) {
  const std::string t{title};
  const std::string b{body};
  NotifyNotification *n = notify_notification_new(t.c_str(), b.c_str(),
                                                  nullptr);
  if (!n) {
    std::cerr << "[treadle] notify_notification_new failed\n";
    return nullptr;
  }
  return std::make_unique<LibnotifyNotification>(n);
}

} // namespace treadle
