/**
 * @file actions.cpp
 * @brief Реализация действий
 */

#include "treadle/actions.hpp"

#include <glib.h>

#include <iostream>

namespace treadle {

ActionResult PrintAction::invoke(bool pressed) {
  *out_ << label_ << ' ' << (pressed ? 1 : 0) << std::endl;
  return ActionResult::Continue;
}

std::string NotifyAction::body_for(std::uint64_t count) {
  return "Pressed " + std::to_string(count) + (count == 1 ? " time" : " times");
}

ActionResult NotifyAction::invoke(bool pressed) {
  if (!pressed) {
    return ActionResult::Continue;
  }

  ++count_;
  if (!notification_->update(label_, body_for(count_))) {
    std::cerr << "[treadle] Notification update failed for " << label_
              << "\n";
    return ActionResult::Failed;
  }
  if (!notification_->show()) {
    return ActionResult::Failed;
  }
  return ActionResult::Continue;
}

ActionResult KeyAction::invoke(bool pressed) {
  if (!sink_->write_key(code_, pressed) || !sink_->sync()) {
    return ActionResult::Failed;
  }
  return ActionResult::Continue;
}

ActionResult ScriptAction::invoke(bool pressed) {
  if (!pressed) {
    return ActionResult::Continue;
  }

  // Без G_SPAWN_DO_NOT_REAP_CHILD GLib использует промежуточный процесс:
  // zombie не остаётся, ждём только exec().
  gchar *argv[] = {path_.data(), nullptr};
  GError *error = nullptr;
  if (!g_spawn_async(nullptr, argv, nullptr, G_SPAWN_SEARCH_PATH, nullptr,
                     nullptr, nullptr, &error)) {
    std::cerr << "[treadle] Failed to launch " << path_ << ": "
              << (error ? error->message : "unknown error") << "\n";
    if (error) {
      g_error_free(error);
    }
    return ActionResult::Failed;
  }
  return ActionResult::Continue;
}

ActionResult MouseAction::invoke(bool pressed) {
  if (!pressed) {
    return ActionResult::Continue;
  }

  switch (window_->click()) {
  case OverlayResult::Ok:
  case OverlayResult::Stale: // не фатально: клик пропущен
    return ActionResult::Continue;
  case OverlayResult::Failed:
    break;
  }
  return ActionResult::Failed;
}

ActionResult invoke(Action &action, bool pressed) {
  return std::visit([pressed](auto &a) { return a.invoke(pressed); }, action);
}

} // namespace treadle
