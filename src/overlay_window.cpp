/**
 * @file overlay_window.cpp
 * @brief Реализация окна-прицела
 */

#include "treadle/overlay_window.hpp"

#include <exception>
#include <iostream>

namespace treadle {

OverlayWindow::CreateOutcome OverlayWindow::create(WindowSystem &windows,
                                                   std::string title,
                                                   Rgb color,
                                                   OverlayGeometry geometry) {
  CreateOutcome out;

  OverlayRequest request{title, color, geometry};
  auto created = windows.create_overlay(request);
  if (created.result != SetupError::Ok || !created.surface) {
    out.result = created.result == SetupError::Ok
                     ? SetupError::ResourceUnavailable
                     : created.result;
    out.error = std::move(created.error);
    return out;
  }

  auto surface = std::move(created.surface);

  // Пока оконный менеджер не прислал геометрию: только заголовок
  const int size = geometry.natural_size();
  surface->apply_mask(make_title_mask(geometry, size, size),
                      -geometry.title_height);

  const Rgb actual = surface->background();
  out.window = std::make_unique<OverlayWindow>(
      Private{}, windows, std::move(title), actual, geometry, surface->id());

  OverlayWindow &self = *out.window;
  self.shared_->state.running = true;

  // Поток не ссылается на OverlayWindow: только на общее состояние
  Worker worker{self.shared_, self.title_, geometry};
  self.thread_ = std::jthread(
      [worker = std::move(worker), s = std::move(surface)]() mutable {
        worker.run(std::move(s));
      });

  out.result = SetupError::Ok;
  return out;
}

OverlayWindow::OverlayWindow(Private, WindowSystem &windows, std::string title,
                             Rgb color, OverlayGeometry geometry, WindowId id)
    : windows_{windows}, title_{std::move(title)}, color_{color},
      geometry_{geometry}, id_{id}, shared_{std::make_shared<Shared>()} {}

OverlayWindow::~OverlayWindow() {
  if (!close_for_shutdown()) {
    std::cerr << "[treadle-overlay] '" << title_
              << "' abandoned: window could not be destroyed\n";
    if (thread_.joinable()) {
      thread_.detach();
    }
    return;
  }
  join();
}

bool OverlayWindow::close_for_shutdown() {
  for (int attempt = 1; attempt <= kCloseAttempts; ++attempt) {
    const OverlayResult r = close();
    if (r != OverlayResult::Failed) {
      return true;
    }
    std::cerr << "[treadle-overlay] '" << title_ << "' close failed (attempt "
              << attempt << ")\n";
  }
  return false;
}

void OverlayWindow::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool OverlayWindow::is_running() const {
  std::lock_guard<std::mutex> lock(shared_->mu);
  return shared_->state.running;
}

Point OverlayWindow::target() const {
  std::lock_guard<std::mutex> lock(shared_->mu);
  return shared_->state.target;
}

OverlayResult OverlayWindow::click() {
  Point target;
  {
    std::lock_guard<std::mutex> lock(shared_->mu);
    if (!shared_->state.running) {
      std::cerr << "[treadle-overlay] '" << title_
                << "' already closed, click skipped\n";
      return OverlayResult::Stale;
    }
    target = shared_->state.target;
  }

  // Соединение фонового потока трогать нельзя: открываем своё
  auto conn = windows_.connect();
  if (!conn) {
    return OverlayResult::Failed;
  }

  if (!conn->warp_pointer(target) || !conn->sync()) {
    std::cerr << "[treadle-overlay] warp to (" << target.x << ", " << target.y
              << ") failed\n";
    return OverlayResult::Failed;
  }

  if (!conn->button(kClickButton, true) || !conn->sync()) {
    std::cerr << "[treadle-overlay] button press failed\n";
    return OverlayResult::Failed;
  }

  if (!conn->button(kClickButton, false) || !conn->sync()) {
    std::cerr << "[treadle-overlay] button release failed\n";
    return OverlayResult::Failed;
  }

  return OverlayResult::Ok;
}

OverlayResult OverlayWindow::close() {
  if (!is_running()) {
    return OverlayResult::Stale;
  }

  auto conn = windows_.connect();
  if (!conn) {
    return OverlayResult::Failed;
  }
  if (!conn->destroy_window(id_) || !conn->sync()) {
    return OverlayResult::Failed;
  }
  return OverlayResult::Ok;
}

void OverlayWindow::Worker::run(std::unique_ptr<OverlaySurface> surface) {
  // Единственный переход running: true -> false, на любом пути выхода
  struct StopGuard {
    Shared &shared;
    ~StopGuard() {
      std::lock_guard<std::mutex> lock(shared.mu);
      shared.state.running = false;
    }
  } guard{*shared};

  // Окно освобождается раньше, чем сбрасывается running
  auto owned = std::move(surface);

  try {
    while (true) {
      const OverlayEvent ev = owned->next_event();

      switch (ev.kind) {
      case OverlayEvent::Kind::Configure:
        update_mask(*owned, ev.width, ev.height);
        update_pos(ev.x, ev.y, ev.width, ev.height);
        break;

      case OverlayEvent::Kind::Destroyed:
        std::cerr << "[treadle-overlay] '" << title << "' destroyed\n";
        return;

      case OverlayEvent::Kind::DeleteRequested:
        std::cerr << "[treadle-overlay] '" << title
                  << "' closed by window manager\n";
        return;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[treadle-overlay] '" << title
              << "' event thread failed: " << e.what() << "\n";
  }
}

bool OverlayWindow::Worker::update_mask(OverlaySurface &surface, int width,
                                        int height) {
  if (width == mask_width && height == mask_height) {
    return false;
  }
  mask_width = width;
  mask_height = height;

  surface.apply_mask(make_crosshair_mask(geometry, width, height),
                     -geometry.title_height);
  return true;
}

void OverlayWindow::Worker::update_pos(int x, int y, int width, int height) {
  std::lock_guard<std::mutex> lock(shared->mu);
  shared->state.target = Point{x + width / 2, y + height / 2};
}

} // namespace treadle
