/**
 * @file shape_mask.cpp
 * @brief Растеризация маски формы окна-прицела
 */

#include "treadle/shape_mask.hpp"

#include <algorithm>
#include <bit>

namespace treadle {

ShapeMask::ShapeMask(int width, int height)
    : width_{std::max(width, 0)}, height_{std::max(height, 0)},
      stride_{(static_cast<std::size_t>(width_) + 7) / 8},
      bits_(stride_ * static_cast<std::size_t>(height_), 0) {}

bool ShapeMask::test(int x, int y) const noexcept {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    return false;
  }
  const std::size_t idx = static_cast<std::size_t>(y) * stride_ +
                          static_cast<std::size_t>(x) / 8;
  return (bits_[idx] >> (x % 8)) & 1U;
}

void ShapeMask::set(int x, int y, bool value) noexcept {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    return;
  }
  const std::size_t idx = static_cast<std::size_t>(y) * stride_ +
                          static_cast<std::size_t>(x) / 8;
  const auto bit = static_cast<std::uint8_t>(1U << (x % 8));
  if (value) {
    bits_[idx] |= bit;
  } else {
    bits_[idx] &= static_cast<std::uint8_t>(~bit);
  }
}

void ShapeMask::fill_rect(int x, int y, int w, int h, bool value) noexcept {
  const int x0 = std::max(x, 0);
  const int y0 = std::max(y, 0);
  const int x1 = std::min(x + w, width_);
  const int y1 = std::min(y + h, height_);

  for (int py = y0; py < y1; ++py) {
    for (int px = x0; px < x1; ++px) {
      set(px, py, value);
    }
  }
}

void ShapeMask::fill_disk(int cx, int cy, int radius, bool value) noexcept {
  if (radius < 0) {
    return;
  }
  const int r2 = radius * radius;
  for (int dy = -radius; dy <= radius; ++dy) {
    for (int dx = -radius; dx <= radius; ++dx) {
      if (dx * dx + dy * dy <= r2) {
        set(cx + dx, cy + dy, value);
      }
    }
  }
}

std::size_t ShapeMask::count() const noexcept {
  std::size_t n = 0;
  for (auto b : bits_) {
    n += static_cast<std::size_t>(std::popcount(b));
  }
  return n;
}

ShapeMask make_title_mask(const OverlayGeometry &geometry, int width,
                          int height) {
  ShapeMask mask{width, geometry.title_height + height};
  mask.fill_rect(0, 0, width, geometry.title_height, true);
  return mask;
}

ShapeMask make_crosshair_mask(const OverlayGeometry &geometry, int width,
                              int height) {
  ShapeMask mask = make_title_mask(geometry, width, height);

  const int cx = width / 2;
  const int cy = geometry.title_height + height / 2;
  const int outer = geometry.outer_radius;
  const int half = geometry.bar_half_width;

  // Кольцо
  mask.fill_disk(cx, cy, outer, true);
  mask.fill_disk(cx, cy, geometry.inner_radius, false);

  // Перекрестие внутри кольца
  mask.fill_rect(cx - half, cy - outer, 2 * half + 1, 2 * outer + 1, true);
  mask.fill_rect(cx - outer, cy - half, 2 * outer + 1, 2 * half + 1, true);

  // Прозрачный центр: клик по центру проходит сквозь окно
  mask.fill_disk(cx, cy, geometry.centre_radius, false);

  // Заголовок мог быть задет кругом при малой высоте окна
  mask.fill_rect(0, 0, width, geometry.title_height, true);

  return mask;
}

} // namespace treadle
