#include "treadle/shape_mask.hpp"

#include "test_support.hpp"

namespace {

using treadle::OverlayGeometry;
using treadle::ShapeMask;

void test_bit_layout() {
  ShapeMask m{10, 2};
  CHECK(m.stride() == 2);
  CHECK(m.bits().size() == 4);
  CHECK(m.count() == 0);

  // XBM: младший бит первым
  m.set(0, 0, true);
  m.set(9, 1, true);
  CHECK(m.bits()[0] == 0x01);
  CHECK(m.bits()[3] == 0x02);
  CHECK(m.test(0, 0));
  CHECK(m.test(9, 1));
  CHECK(m.count() == 2);

  m.set(0, 0, false);
  CHECK(!m.test(0, 0));
  CHECK(m.count() == 1);
}

void test_out_of_range_is_ignored() {
  ShapeMask m{8, 8};
  m.set(-1, 0, true);
  m.set(8, 0, true);
  m.set(0, 8, true);
  CHECK(m.count() == 0);
  CHECK(!m.test(-1, -1));
  CHECK(!m.test(100, 0));

  m.fill_rect(-4, -4, 6, 6, true);
  CHECK(m.count() == 4);

  ShapeMask empty{-3, 5};
  CHECK(empty.width() == 0);
  CHECK(empty.bits().empty());
}

void test_fill_disk() {
  ShapeMask m{11, 11};
  m.fill_disk(5, 5, 2, true);
  // dx^2 + dy^2 <= 4: 13 точек
  CHECK(m.count() == 13);
  CHECK(m.test(5, 3));
  CHECK(!m.test(4, 3));

  m.fill_disk(5, 5, 0, false);
  CHECK(m.count() == 12);
  CHECK(!m.test(5, 5));
}

void test_title_mask() {
  OverlayGeometry g;
  auto m = make_title_mask(g, 40, 40);
  CHECK(m.width() == 40);
  CHECK(m.height() == 60);
  CHECK(m.count() == 40u * 20u);
  CHECK(m.test(39, 19));
  CHECK(!m.test(0, 20));
}

void test_crosshair_mask() {
  OverlayGeometry g;
  auto m = make_crosshair_mask(g, 40, 40);
  const int cx = 20;
  const int cy = 40;

  // Заголовок сохранён целиком
  for (int x = 0; x < 40; ++x) {
    CHECK(m.test(x, 0));
    CHECK(m.test(x, 19));
  }

  // Прозрачный центр радиуса 4
  CHECK(!m.test(cx, cy));
  CHECK(!m.test(cx + 4, cy));
  CHECK(!m.test(cx, cy - 4));
  CHECK(m.test(cx + 5, cy));
  CHECK(m.test(cx, cy + 5));

  // Кольцо между радиусами 16 и 20
  CHECK(m.test(cx + 13, cy + 13));
  CHECK(m.test(cx - 13, cy - 13));
  CHECK(!m.test(cx + 8, cy + 8));
  CHECK(!m.test(cx + 15, cy + 15));

  // Полосы толщиной 3 пикселя
  CHECK(m.test(cx - 1, cy + 10));
  CHECK(m.test(cx + 1, cy - 10));
  CHECK(!m.test(cx + 2, cy + 10));
  CHECK(m.test(cx - 10, cy + 1));
  CHECK(!m.test(cx - 10, cy + 2));

  // Углы клиентской области вне кольца
  CHECK(!m.test(0, 20));
  CHECK(!m.test(39, 59));
}

void test_crosshair_follows_size() {
  OverlayGeometry g;
  auto m = make_crosshair_mask(g, 100, 60);
  CHECK(m.width() == 100);
  CHECK(m.height() == 80);
  CHECK(!m.test(50, 50));
  CHECK(m.test(50 + 18, 50));
  CHECK(!m.test(50 + 25, 50 + 25));
}

} // namespace

#undef CHECK

int main() {
  test_bit_layout();
  test_out_of_range_is_ignored();
  test_fill_disk();
  test_title_mask();
  test_crosshair_mask();
  test_crosshair_follows_size();

  std::cout << "OK\n";
  return 0;
}
