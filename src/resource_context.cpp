/**
 * @file resource_context.cpp
 * @brief Реализация контекста общих ресурсов
 */

#include "treadle/resource_context.hpp"

#include "treadle/x11_window_system.hpp"

#include <iostream>

namespace treadle {

ResourceContext::Factories ResourceContext::system_factories() {
  Factories f;
  f.input_sink = []() -> std::unique_ptr<VirtualInputSink> {
    return UinputDevice::create();
  };
  f.notifications = []() -> std::unique_ptr<NotificationService> {
    return LibnotifyService::create_service(kAppName);
  };
  f.window_system = []() -> std::unique_ptr<WindowSystem> {
    return std::make_unique<X11WindowSystem>();
  };
  return f;
}

ResourceContext::ResourceContext(Factories factories)
    : factories_{std::move(factories)} {}

ResourceContext::~ResourceContext() {
  while (!releasers_.empty()) {
    releasers_.back()();
    releasers_.pop_back();
  }
}

template <class T>
T *ResourceContext::acquire(Slot<T> &slot,
                            const std::function<std::unique_ptr<T>()> &factory,
                            const char *what) {
  if (slot.attempted) {
    return slot.value.get();
  }
  slot.attempted = true;

  if (!factory) {
    std::cerr << "[treadle] No factory for " << what << "\n";
    return nullptr;
  }

  slot.value = factory();
  if (!slot.value) {
    std::cerr << "[treadle] Failed to create " << what << "\n";
    return nullptr;
  }

  releasers_.push_back([&slot] { slot.value.reset(); });
  return slot.value.get();
}

VirtualInputSink *ResourceContext::input_sink() {
  return acquire(input_sink_, factories_.input_sink, "virtual input sink");
}

NotificationService *ResourceContext::notifications() {
  return acquire(notifications_, factories_.notifications,
                 "notification service");
}

WindowSystem *ResourceContext::window_system() {
  return acquire(window_system_, factories_.window_system, "window system");
}

} // namespace treadle
