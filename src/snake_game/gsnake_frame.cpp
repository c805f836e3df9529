#include "gsnake_frame.hpp"

namespace gsnake {

namespace {

Sprite_t makeSprite(const Cell& cell, int scale_pct, ViewColor_t color) {
  Sprite_t sprite{};
  sprite.row = cell.row;
  sprite.col = cell.col;
  sprite.scale_pct = scale_pct;
  sprite.color = color;
  return sprite;
}

}  // namespace

Frame build_frame(const GameState& state) {
  Frame frame;
  frame.rows = state.rows();
  frame.cols = state.cols();
  frame.cells.reserve(static_cast<std::size_t>(frame.rows) *
                      static_cast<std::size_t>(frame.cols));
  for (int row = 0; row < frame.rows; ++row) {
    for (int col = 0; col < frame.cols; ++col) {
      frame.cells.push_back(static_cast<int>(state.cellAt(row, col)));
    }
  }

  // Стирание следа рисуется первым, чтобы не перекрыть тело
  for (const Cell& cell : state.trail()) {
    frame.sprites.push_back(makeSprite(cell, kTrailScalePct, VIEW_COLOR_BACKGROUND));
  }
  for (const Cell& cell : state.body()) {
    frame.sprites.push_back(makeSprite(cell, kSnakeScalePct, VIEW_COLOR_SNAKE));
  }
  if (const auto food = state.food()) {
    frame.sprites.push_back(makeSprite(*food, kFoodScalePct, VIEW_COLOR_FOOD));
  }

  frame.score_text = "Score: " + std::to_string(state.score());
  return frame;
}

}  // namespace gsnake
