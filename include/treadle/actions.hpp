/**
 * @file actions.hpp
 * @brief Действия, привязываемые к клавишам педали
 *
 * Замкнутый набор вариантов {Print, Notify, Key, Script, Mouse, Quit} с
 * одной операцией invoke(pressed). Каждое действие вызывается и на
 * нажатие, и на отпускание.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <variant>

#include "treadle/notifier.hpp"
#include "treadle/overlay_window.hpp"
#include "treadle/types.hpp"
#include "treadle/virtual_input.hpp"

namespace treadle {

/// Печатает "<label> <0|1>"
class PrintAction {
public:
  PrintAction(std::string label, std::ostream &out)
      : label_{std::move(label)}, out_{&out} {}

  ActionResult invoke(bool pressed);

private:
  std::string label_;
  std::ostream *out_;
};

/// Уведомление со счётчиком нажатий
class NotifyAction {
public:
  NotifyAction(std::string label, std::unique_ptr<Notification> notification)
      : label_{std::move(label)}, notification_{std::move(notification)} {}

  ActionResult invoke(bool pressed);

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

  /// "Pressed 1 time", "Pressed N times"
  [[nodiscard]] static std::string body_for(std::uint64_t count);

private:
  std::string label_;
  std::unique_ptr<Notification> notification_;
  std::uint64_t count_ = 0;
};

/// Пересылает нажатие/отпускание 1:1 на виртуальную клавиатуру
class KeyAction {
public:
  KeyAction(VirtualInputSink &sink, KeyCode code)
      : sink_{&sink}, code_{code} {}

  ActionResult invoke(bool pressed);

  [[nodiscard]] KeyCode code() const noexcept { return code_; }

private:
  VirtualInputSink *sink_;
  KeyCode code_;
};

/// Запускает внешнюю программу на нажатие, не дожидаясь её завершения
class ScriptAction {
public:
  explicit ScriptAction(std::string path) : path_{std::move(path)} {}

  ActionResult invoke(bool pressed);

  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  std::string path_;
};

/// Клик в центр окна-прицела на нажатие
class MouseAction {
public:
  explicit MouseAction(std::unique_ptr<OverlayWindow> window)
      : window_{std::move(window)} {}

  ActionResult invoke(bool pressed);

  [[nodiscard]] OverlayWindow &window() noexcept { return *window_; }
  [[nodiscard]] const OverlayWindow &window() const noexcept {
    return *window_;
  }

private:
  std::unique_ptr<OverlayWindow> window_;
};

/// Завершение процесса на нажатие
class QuitAction {
public:
  ActionResult invoke(bool pressed) const noexcept {
    return pressed ? ActionResult::Quit : ActionResult::Continue;
  }
};

using Action = std::variant<PrintAction, NotifyAction, KeyAction,
                            ScriptAction, MouseAction, QuitAction>;

/// Вызов действия любого вида
ActionResult invoke(Action &action, bool pressed);

} // namespace treadle
