/**
 * @file layout.hpp
 * @brief Геометрия кадра: зоны поверхности и размещение сетки
 *
 * Верхние 15% высоты — зона счёта, следующие 80% — игровое поле.
 * Ячейки квадратные, сетка центрируется в зоне поля.
 */

#pragma once

namespace gsnake {
namespace layout {

struct Rect {
  int x;
  int y;
  int w;
  int h;
};

struct RectF {
  double x;
  double y;
  double w;
  double h;
};

struct Zones {
  Rect score;
  Rect field;
};

/// Размещение сетки в зоне: сторона ячейки и левый верхний угол.
struct GridFit {
  double tile;
  double origin_x;
  double origin_y;
};

Zones split_surface(int width, int height) noexcept;

GridFit fit_grid(const Rect& zone, int rows, int cols) noexcept;

/// Квадрат со стороной tile * scale_pct / 100 по центру ячейки.
RectF sprite_rect(const GridFit& fit, int row, int col, int scale_pct) noexcept;

/// Кегль текста счёта: 1/20 меньшей стороны поверхности.
int score_font_size(int width, int height) noexcept;

}  // namespace layout
}  // namespace gsnake
