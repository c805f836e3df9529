#include "layout.hpp"

#include <algorithm>

namespace gsnake {
namespace layout {

namespace {
constexpr double kScoreShare = 0.15;
constexpr double kFieldShare = 0.80;
}  // namespace

Zones split_surface(int width, int height) noexcept {
  const int score_h = static_cast<int>(height * kScoreShare);
  const int field_h = static_cast<int>(height * kFieldShare);
  return Zones{Rect{0, 0, width, score_h}, Rect{0, score_h, width, field_h}};
}

GridFit fit_grid(const Rect& zone, int rows, int cols) noexcept {
  if (rows <= 0 || cols <= 0) {
    return GridFit{0.0, static_cast<double>(zone.x), static_cast<double>(zone.y)};
  }
  const double tile = std::min(static_cast<double>(zone.h) / rows,
                               static_cast<double>(zone.w) / cols);
  return GridFit{tile, zone.x + (zone.w - tile * cols) / 2.0,
                 zone.y + (zone.h - tile * rows) / 2.0};
}

RectF sprite_rect(const GridFit& fit, int row, int col, int scale_pct) noexcept {
  const double side = fit.tile * scale_pct / 100.0;
  const double cx = fit.origin_x + fit.tile * col + fit.tile / 2.0;
  const double cy = fit.origin_y + fit.tile * row + fit.tile / 2.0;
  return RectF{cx - side / 2.0, cy - side / 2.0, side, side};
}

int score_font_size(int width, int height) noexcept {
  return std::max(1, std::min(width, height) / 20);
}

}  // namespace layout
}  // namespace gsnake
