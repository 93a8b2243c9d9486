/**
 * @file x11_window_system.hpp
 * @brief Реализация WindowSystem поверх Xlib + SHAPE + XTest
 */

#pragma once

#include <memory>

#include "treadle/window_system.hpp"

namespace treadle {

/**
 * @brief Оконная система X11
 *
 * Каждое окно и каждое соединение открывают собственный Display:
 * соединение Xlib используется только из одного потока. Общие структуры
 * Xlib и расширений защищены XInitThreads(), который вызывается один раз
 * при создании первого объекта.
 */
class X11WindowSystem final : public WindowSystem {
public:
  X11WindowSystem();
  ~X11WindowSystem() override;

  X11WindowSystem(const X11WindowSystem &) = delete;
  X11WindowSystem &operator=(const X11WindowSystem &) = delete;

  [[nodiscard]] CreateOutcome
  create_overlay(const OverlayRequest &request) override;

  [[nodiscard]] std::unique_ptr<DisplayConnection> connect() override;

private:
  bool threads_ready_;
};

} // namespace treadle
