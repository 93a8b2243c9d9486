#include "treadle/overlay_window.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"

namespace {

using test_support::FakeWindowSystem;
using treadle::OverlayEvent;
using treadle::OverlayGeometry;
using treadle::OverlayResult;
using treadle::OverlayWindow;
using treadle::Point;
using treadle::Rgb;
using treadle::SetupError;
using treadle::WindowId;

constexpr Rgb kGreen{0, 255, 0};

bool contains(const std::vector<std::string> &calls, const std::string &entry) {
  return std::find(calls.begin(), calls.end(), entry) != calls.end();
}

std::unique_ptr<OverlayWindow> make_window(FakeWindowSystem &ws,
                                           Rgb color = kGreen) {
  auto created = OverlayWindow::create(ws, "treadle: a", color);
  CHECK(created.result == SetupError::Ok);
  CHECK(created.window != nullptr);
  return std::move(created.window);
}

void test_create_applies_title_mask() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  CHECK(w->is_running());
  CHECK(w->title() == "treadle: a");
  CHECK(ws.requests().size() == 1);
  CHECK(ws.requests()[0].color == kGreen);

  auto masks = ws.masks();
  CHECK(masks.size() == 1);
  CHECK(masks[0].y_offset == -20);
  CHECK(masks[0].mask.width() == 40);
  CHECK(masks[0].mask.height() == 60);
  CHECK(masks[0].mask.count() == 40u * 20u);
}

void test_configure_updates_mask_and_target() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  ws.configure(w->id(), 100, 200, 40, 40);
  CHECK(ws.wait_idle(w->id()));

  CHECK(w->target() == (Point{120, 220}));

  auto masks = ws.masks();
  CHECK(masks.size() == 2);
  const auto &m = masks[1].mask;
  CHECK(masks[1].y_offset == -20);
  CHECK(m.test(0, 0));         // заголовок
  CHECK(!m.test(20, 40));      // прозрачный центр
  CHECK(m.test(33, 53));       // кольцо
  CHECK(!m.test(28, 48));      // между кольцом и центром
  CHECK(m.test(20, 50));       // вертикальная полоса
  CHECK(m.test(21, 50));
  CHECK(!m.test(22, 50));
}

void test_same_size_keeps_mask() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  ws.configure(w->id(), 100, 200, 40, 40);
  ws.configure(w->id(), 300, 50, 40, 40);
  CHECK(ws.wait_idle(w->id()));

  CHECK(ws.masks().size() == 2);
  CHECK(w->target() == (Point{320, 70}));

  ws.configure(w->id(), 300, 50, 60, 80);
  CHECK(ws.wait_idle(w->id()));
  CHECK(ws.masks().size() == 3);
  CHECK(ws.masks()[2].mask.height() == 100);
  CHECK(w->target() == (Point{330, 90}));
}

void test_click_order() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  ws.configure(w->id(), 10, 20, 40, 40);
  CHECK(ws.wait_idle(w->id()));
  ws.clear_calls();

  CHECK(w->click() == OverlayResult::Ok);

  const std::vector<std::string> expected{"warp 30 40", "sync",
                                          "press 1",    "sync",
                                          "release 1",  "sync"};
  CHECK(ws.calls() == expected);
}

void test_click_failures() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  ws.warp_ok = false;
  CHECK(w->click() == OverlayResult::Failed);
  ws.warp_ok = true;

  ws.connect_ok = false;
  CHECK(w->click() == OverlayResult::Failed);
  ws.connect_ok = true;

  // Ошибка X, пойманная на XSync, прерывает клик
  ws.clear_calls();
  ws.sync_ok = false;
  CHECK(w->click() == OverlayResult::Failed);
  CHECK(!contains(ws.calls(), "press 1"));
  ws.sync_ok = true;

  ws.destroy_ok = false;
  CHECK(w->close() == OverlayResult::Failed);
  ws.destroy_ok = true;

  CHECK(w->is_running());
}

void test_close_then_click_is_stale() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  CHECK(w->close() == OverlayResult::Ok);
  w->join();

  CHECK(!w->is_running());

  const int before = ws.connections();
  CHECK(w->click() == OverlayResult::Stale);
  CHECK(w->close() == OverlayResult::Stale);
  CHECK(ws.connections() == before);

  // Окно освобождено фоновым потоком
  CHECK(contains(ws.calls(), "surface-released " + std::to_string(w->id())));
}

void test_delete_request_stops_thread() {
  FakeWindowSystem ws;
  auto w = make_window(ws);

  ws.push(w->id(), OverlayEvent{OverlayEvent::Kind::DeleteRequested});
  w->join();
  CHECK(!w->is_running());
}

void test_destructor_closes_window() {
  FakeWindowSystem ws;
  WindowId id = 0;
  {
    auto w = make_window(ws);
    id = w->id();
  }
  auto calls = ws.calls();
  CHECK(calls.size() == 3);
  CHECK(calls[0] == "destroy " + std::to_string(id));
  CHECK(contains(calls, "sync"));
  CHECK(contains(calls, "surface-released " + std::to_string(id)));
}

void test_destructor_abandons_unclosable_window() {
  using namespace std::chrono_literals;

  FakeWindowSystem ws;
  auto w = make_window(ws);
  const WindowId id = w->id();

  ws.connect_ok = false;
  const int before = ws.connections();

  // Без соединения окно не закрыть: деструктор не должен ждать поток
  auto done = std::async(std::launch::async, [&w] { w.reset(); });
  CHECK(done.wait_for(3s) == std::future_status::ready);
  CHECK(ws.connections() == before + OverlayWindow::kCloseAttempts);

  // Брошенный поток завершается сам, когда окно всё же уничтожено
  const std::string released = "surface-released " + std::to_string(id);
  ws.push(id, OverlayEvent{OverlayEvent::Kind::Destroyed});
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!contains(ws.calls(), released) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  CHECK(contains(ws.calls(), released));
}

void test_actual_background_color() {
  FakeWindowSystem ws;
  ws.override_background = true;
  ws.background = Rgb{0, 254, 1};

  auto w = make_window(ws, kGreen);
  CHECK(w->color() == (Rgb{0, 254, 1}));

  FakeWindowSystem exact;
  auto g = make_window(exact, kGreen);
  CHECK(g->color() == kGreen);
}

void test_missing_shape_extension() {
  FakeWindowSystem ws;
  ws.shape_supported = false;

  auto created = OverlayWindow::create(ws, "treadle: b", kGreen);
  CHECK(created.result == SetupError::PlatformCapability);
  CHECK(created.window == nullptr);
}

void test_custom_geometry() {
  FakeWindowSystem ws;
  OverlayGeometry g;
  g.outer_radius = 30;
  g.title_height = 10;

  auto created = OverlayWindow::create(ws, "treadle: c", kGreen, g);
  CHECK(created.result == SetupError::Ok);

  auto masks = ws.masks();
  CHECK(masks.size() == 1);
  CHECK(masks[0].y_offset == -10);
  CHECK(masks[0].mask.width() == 60);
  CHECK(masks[0].mask.height() == 70);
}

} // namespace

#undef CHECK

int main() {
  test_create_applies_title_mask();
  test_configure_updates_mask_and_target();
  test_same_size_keeps_mask();
  test_click_order();
  test_click_failures();
  test_close_then_click_is_stale();
  test_delete_request_stops_thread();
  test_destructor_closes_window();
  test_destructor_abandons_unclosable_window();
  test_actual_background_color();
  test_missing_shape_extension();
  test_custom_geometry();

  std::cout << "OK\n";
  return 0;
}
