// Общие заглушки для тестов: оконная система, виртуальная клавиатура,
// уведомления. Все заглушки пишут в журнал, который проверяют тесты.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "treadle/notifier.hpp"
#include "treadle/shape_mask.hpp"
#include "treadle/types.hpp"
#include "treadle/virtual_input.hpp"
#include "treadle/window_system.hpp"

namespace test_support {

[[noreturn]] inline void test_fail(const char *expr, const char *file,
                                   int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::test_support::test_fail(#expr, __FILE__, __LINE__);                    \
    }                                                                          \
  } while (0)

using treadle::KeyCode;
using treadle::OverlayEvent;
using treadle::Point;
using treadle::Rgb;
using treadle::ShapeMask;
using treadle::WindowId;

// ===========================================================================
// Оконная система
// ===========================================================================

/// Очередь событий одного окна; next_event() блокируется на ней
class EventQueue {
public:
  void push(OverlayEvent ev) {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(ev);
    waiting_ = false;
    cv_.notify_all();
  }

  OverlayEvent pop() {
    std::unique_lock<std::mutex> lock(mu_);
    waiting_ = events_.empty();
    cv_.notify_all();
    cv_.wait(lock, [this] { return !events_.empty(); });
    OverlayEvent ev = events_.front();
    events_.pop_front();
    waiting_ = false;
    return ev;
  }

  /// true, когда фоновый поток обработал всё и снова ждёт событие
  bool wait_idle() {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::seconds{2},
                        [this] { return waiting_ && events_.empty(); });
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<OverlayEvent> events_;
  bool waiting_ = false;
};

struct AppliedMask {
  WindowId window;
  ShapeMask mask;
  int y_offset;
};

class FakeWindowSystem;

class FakeSurface final : public treadle::OverlaySurface {
public:
  FakeSurface(FakeWindowSystem &owner, WindowId id, Rgb background,
              std::shared_ptr<EventQueue> queue)
      : owner_{owner}, id_{id}, background_{background},
        queue_{std::move(queue)} {}

  ~FakeSurface() override;

  WindowId id() const noexcept override { return id_; }
  Rgb background() const override { return background_; }
  void apply_mask(const ShapeMask &mask, int y_offset) override;
  OverlayEvent next_event() override { return queue_->pop(); }

private:
  FakeWindowSystem &owner_;
  WindowId id_;
  Rgb background_;
  std::shared_ptr<EventQueue> queue_;
};

class FakeConnection final : public treadle::DisplayConnection {
public:
  explicit FakeConnection(FakeWindowSystem &owner) : owner_{owner} {}

  bool warp_pointer(Point to) override;
  bool button(unsigned int button, bool pressed) override;
  bool sync() override;
  bool destroy_window(WindowId id) override;

private:
  FakeWindowSystem &owner_;
};

/**
 * Оконная система в памяти. Должна пережить все созданные окна.
 *
 * Журнал вызовов: "warp X Y", "press N", "release N", "sync",
 * "destroy ID", "surface-released ID".
 */
class FakeWindowSystem final : public treadle::WindowSystem {
public:
  bool shape_supported = true;
  bool connect_ok = true;
  bool warp_ok = true;
  bool sync_ok = true;
  bool destroy_ok = true;
  /// Журнал уничтожения ресурсов (порядок освобождения контекстом)
  std::vector<std::string> *journal = nullptr;
  /// Если задан, окно получает этот цвет вместо запрошенного
  bool override_background = false;
  Rgb background;

  FakeWindowSystem() = default;
  ~FakeWindowSystem() override {
    if (journal) {
      journal->push_back("windows");
    }
  }

  CreateOutcome create_overlay(const treadle::OverlayRequest &request) override {
    CreateOutcome out;
    std::lock_guard<std::mutex> lock(mu_);
    requests_.push_back(request);
    if (!shape_supported) {
      out.result = treadle::SetupError::PlatformCapability;
      out.error = "no SHAPE";
      return out;
    }
    const WindowId id = next_id_++;
    auto queue = std::make_shared<EventQueue>();
    queues_[id] = queue;
    out.surface = std::make_unique<FakeSurface>(
        *this, id, override_background ? background : request.color,
        std::move(queue));
    return out;
  }

  std::unique_ptr<treadle::DisplayConnection> connect() override {
    std::lock_guard<std::mutex> lock(mu_);
    ++connections_;
    if (!connect_ok) {
      return nullptr;
    }
    return std::make_unique<FakeConnection>(*this);
  }

  /// Отправляет событие окну
  void push(WindowId id, OverlayEvent ev) {
    std::shared_ptr<EventQueue> queue;
    {
      std::lock_guard<std::mutex> lock(mu_);
      queue = queues_.at(id);
    }
    queue->push(ev);
  }

  void configure(WindowId id, int x, int y, int width, int height) {
    push(id, OverlayEvent{OverlayEvent::Kind::Configure, x, y, width, height});
  }

  bool wait_idle(WindowId id) {
    std::shared_ptr<EventQueue> queue;
    {
      std::lock_guard<std::mutex> lock(mu_);
      queue = queues_.at(id);
    }
    return queue->wait_idle();
  }

  void log(std::string entry) {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(std::move(entry));
  }

  void record_mask(WindowId id, const ShapeMask &mask, int y_offset) {
    std::lock_guard<std::mutex> lock(mu_);
    masks_.push_back(AppliedMask{id, mask, y_offset});
  }

  bool known(WindowId id) {
    std::lock_guard<std::mutex> lock(mu_);
    return queues_.contains(id);
  }

  std::vector<std::string> calls() {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  void clear_calls() {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.clear();
  }

  std::vector<AppliedMask> masks() {
    std::lock_guard<std::mutex> lock(mu_);
    return masks_;
  }

  std::vector<treadle::OverlayRequest> requests() {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

  int connections() {
    std::lock_guard<std::mutex> lock(mu_);
    return connections_;
  }

private:
  std::mutex mu_;
  WindowId next_id_ = 100;
  std::map<WindowId, std::shared_ptr<EventQueue>> queues_;
  std::vector<std::string> calls_;
  std::vector<AppliedMask> masks_;
  std::vector<treadle::OverlayRequest> requests_;
  int connections_ = 0;
};

inline FakeSurface::~FakeSurface() {
  owner_.log("surface-released " + std::to_string(id_));
}

inline void FakeSurface::apply_mask(const ShapeMask &mask, int y_offset) {
  owner_.record_mask(id_, mask, y_offset);
}

inline bool FakeConnection::warp_pointer(Point to) {
  owner_.log("warp " + std::to_string(to.x) + " " + std::to_string(to.y));
  return owner_.warp_ok;
}

inline bool FakeConnection::button(unsigned int button, bool pressed) {
  owner_.log((pressed ? "press " : "release ") + std::to_string(button));
  return true;
}

inline bool FakeConnection::sync() {
  owner_.log("sync");
  return owner_.sync_ok;
}

inline bool FakeConnection::destroy_window(WindowId id) {
  owner_.log("destroy " + std::to_string(id));
  if (!owner_.destroy_ok || !owner_.known(id)) {
    return false;
  }
  owner_.push(id, OverlayEvent{OverlayEvent::Kind::Destroyed});
  return true;
}

// ===========================================================================
// Виртуальная клавиатура
// ===========================================================================

struct SinkLog {
  std::vector<std::pair<KeyCode, bool>> keys;
  int syncs = 0;
  bool fail = false;
};

class FakeSink final : public treadle::VirtualInputSink {
public:
  explicit FakeSink(std::shared_ptr<SinkLog> log) : log_{std::move(log)} {}

  bool write_key(KeyCode code, bool pressed) override {
    if (log_->fail) {
      return false;
    }
    log_->keys.emplace_back(code, pressed);
    return true;
  }

  bool sync() override {
    if (log_->fail) {
      return false;
    }
    ++log_->syncs;
    return true;
  }

private:
  std::shared_ptr<SinkLog> log_;
};

// ===========================================================================
// Уведомления
// ===========================================================================

struct NotificationLog {
  std::vector<std::pair<std::string, std::string>> updates;
  int shows = 0;
  int created = 0;
  bool fail_show = false;
};

class FakeNotification final : public treadle::Notification {
public:
  explicit FakeNotification(std::shared_ptr<NotificationLog> log)
      : log_{std::move(log)} {}

  bool update(std::string_view title, std::string_view body) override {
    log_->updates.emplace_back(std::string{title}, std::string{body});
    return true;
  }

  bool show() override {
    if (log_->fail_show) {
      return false;
    }
    ++log_->shows;
    return true;
  }

private:
  std::shared_ptr<NotificationLog> log_;
};

class FakeNotificationService final : public treadle::NotificationService {
public:
  explicit FakeNotificationService(std::shared_ptr<NotificationLog> log,
                                   std::vector<std::string> *journal = nullptr)
      : log_{std::move(log)}, journal_{journal} {}

  ~FakeNotificationService() override {
    if (journal_) {
      journal_->push_back("notifications");
    }
  }

  std::unique_ptr<treadle::Notification> create(std::string_view,
                                                std::string_view) override {
    ++log_->created;
    return std::make_unique<FakeNotification>(log_);
  }

private:
  std::shared_ptr<NotificationLog> log_;
  std::vector<std::string> *journal_;
};

} // namespace test_support
