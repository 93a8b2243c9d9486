/**
 * @file shape_mask.hpp
 * @brief Битовая маска формы окна-прицела
 *
 * 1 бит на пиксель, формат XBM (строки выровнены по байту, младший бит
 * первым): передаётся в XCreateBitmapFromData без преобразований.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace treadle {

/// Геометрия прицела (константы, не вычисляются)
struct OverlayGeometry {
  int outer_radius = 20;
  int inner_radius = 16;
  /// Полуширина перекрестия: полоса толщиной 2 * half + 1 пиксель
  int bar_half_width = 1;
  /// Радиус прозрачного центра (клик проходит в окно под прицелом)
  int centre_radius = 4;
  /// Высота зоны заголовка, которую рисует оконный менеджер
  int title_height = 20;

  /// Естественный размер клиентской области окна (квадрат)
  [[nodiscard]] constexpr int natural_size() const noexcept {
    return 2 * outer_radius;
  }
};

class ShapeMask {
public:
  ShapeMask(int width, int height);

  [[nodiscard]] int width() const noexcept { return width_; }
  [[nodiscard]] int height() const noexcept { return height_; }

  /// Байт на строку
  [[nodiscard]] std::size_t stride() const noexcept { return stride_; }

  /// Сырые данные (height * stride байт)
  [[nodiscard]] std::span<const std::uint8_t> bits() const noexcept {
    return bits_;
  }

  /// Значение пикселя; за пределами маски: false
  [[nodiscard]] bool test(int x, int y) const noexcept;

  void set(int x, int y, bool value) noexcept;

  /// Прямоугольник, обрезается по границам маски
  void fill_rect(int x, int y, int w, int h, bool value) noexcept;

  /// Закрашенный круг: dx^2 + dy^2 <= r^2
  void fill_disk(int cx, int cy, int radius, bool value) noexcept;

  /// Количество установленных пикселей
  [[nodiscard]] std::size_t count() const noexcept;

private:
  int width_;
  int height_;
  std::size_t stride_;
  std::vector<std::uint8_t> bits_;
};

/**
 * @brief Маска до первой геометрии от оконного менеджера: только заголовок
 *
 * Размер width x (title_height + height).
 */
[[nodiscard]] ShapeMask make_title_mask(const OverlayGeometry &geometry,
                                        int width, int height);

/**
 * @brief Маска прицела: заголовок + кольцо с перекрестием
 *
 * Размер width x (title_height + height). Центр кольца совпадает с центром
 * клиентской области, когда маска применена со смещением -title_height.
 */
[[nodiscard]] ShapeMask make_crosshair_mask(const OverlayGeometry &geometry,
                                            int width, int height);

} // namespace treadle
