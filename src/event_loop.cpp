/**
 * @file event_loop.cpp
 * @brief Реализация главного цикла
 */

#include "treadle/event_loop.hpp"

#include <iostream>

#include "treadle/key_names.hpp"

namespace treadle {

namespace {

std::string_view display_name(KeyCode code) {
  auto name = key_code_to_name(code);
  return name.empty() ? std::string_view{"?"} : name;
}

} // namespace

void EventLoop::request_stop() noexcept {
  stop_requested_.store(true, std::memory_order_relaxed);
}

ActionResult EventLoop::handle_event(const input_event &ev) {
  if (ev.type != EV_KEY) {
    return ActionResult::Continue;
  }
  if (ev.value != static_cast<int>(KeyState::Press) &&
      ev.value != static_cast<int>(KeyState::Release)) {
    return ActionResult::Continue;
  }

  const bool pressed = ev.value == static_cast<int>(KeyState::Press);
  if (verbose_) {
    std::cerr << "[treadle] key " << display_name(ev.code) << " (" << ev.code
              << ") " << (pressed ? "down" : "up") << "\n";
  }
  return registry_->dispatch(ev.code, pressed);
}

int EventLoop::run() {
  input_event ev{};

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    if (!registry_->overlays_running()) {
      std::cerr << "[treadle] Overlay window closed, exiting\n";
      return 0;
    }

    switch (device_->read_event(ev, kTick)) {
    case ReadStatus::Timeout:
      continue;

    case ReadStatus::Closed:
      std::cerr << "[treadle] Input closed, exiting gracefully\n";
      return 0;

    case ReadStatus::Error:
      return 1;

    case ReadStatus::Event:
      break;
    }

    switch (handle_event(ev)) {
    case ActionResult::Continue:
      break;
    case ActionResult::Quit:
      std::cerr << "[treadle] Quit requested\n";
      return 0;
    case ActionResult::Failed:
      std::cerr << "[treadle] Action failed for key " << display_name(ev.code)
                << "\n";
      return 1;
    }
  }

  std::cerr << "[treadle] Event loop terminated gracefully\n";
  return 0;
}

} // namespace treadle
