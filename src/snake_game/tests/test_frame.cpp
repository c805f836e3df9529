#include <gtest/gtest.h>

#include "gsnake_frame.hpp"

using gsnake::Cell;
using gsnake::Direction;
using gsnake::Frame;
using gsnake::GameState;

namespace {

// Ход, который не упирается в стену и не съедает еду
Direction SafeDirection(const GameState& state) {
  const Direction dirs[] = {gsnake::kUp, gsnake::kDown, gsnake::kLeft,
                            gsnake::kRight};
  for (const Direction& dir : dirs) {
    const Cell next{state.head().row + dir.dy, state.head().col + dir.dx};
    if (state.inBounds(next) && state.food() != next) {
      return dir;
    }
  }
  return gsnake::kNone;
}

}  // namespace

TEST(FrameTest, MirrorsGridTags) {
  const GameState state(5, 7, 11);
  const Frame frame = gsnake::build_frame(state);

  EXPECT_EQ(frame.rows, 5);
  EXPECT_EQ(frame.cols, 7);
  ASSERT_EQ(frame.cells.size(), 35u);
  for (int row = 0; row < 5; ++row) {
    for (int col = 0; col < 7; ++col) {
      EXPECT_EQ(frame.cells[row * 7 + col], static_cast<int>(state.cellAt(row, col)))
          << "cell (" << row << ", " << col << ")";
    }
  }
}

TEST(FrameTest, FreshGameHasHeadAndFoodSprites) {
  const GameState state(6, 6, 3);
  const Frame frame = gsnake::build_frame(state);

  ASSERT_EQ(frame.sprites.size(), 2u);
  const Sprite_t& head = frame.sprites[0];
  EXPECT_EQ(head.row, state.head().row);
  EXPECT_EQ(head.col, state.head().col);
  EXPECT_EQ(head.color, VIEW_COLOR_SNAKE);
  EXPECT_EQ(head.scale_pct, gsnake::kSnakeScalePct);

  const Sprite_t& food = frame.sprites[1];
  ASSERT_TRUE(state.food().has_value());
  EXPECT_EQ(food.row, state.food()->row);
  EXPECT_EQ(food.col, state.food()->col);
  EXPECT_EQ(food.color, VIEW_COLOR_FOOD);
  EXPECT_EQ(food.scale_pct, gsnake::kFoodScalePct);

  EXPECT_EQ(frame.score_text, "Score: 0");
}

TEST(FrameTest, TrailIsErasedFirst) {
  GameState state(6, 6, 3);
  const Cell start = state.head();
  const Direction dir = SafeDirection(state);
  ASSERT_FALSE(dir.isZero());
  state.setDirection(dir);
  ASSERT_FALSE(state.advance());

  const Frame frame = gsnake::build_frame(state);
  ASSERT_EQ(frame.sprites.size(), 3u);

  const Sprite_t& erase = frame.sprites[0];
  EXPECT_EQ(erase.row, start.row);
  EXPECT_EQ(erase.col, start.col);
  EXPECT_EQ(erase.color, VIEW_COLOR_BACKGROUND);
  EXPECT_EQ(erase.scale_pct, gsnake::kTrailScalePct);
  EXPECT_GT(gsnake::kTrailScalePct, gsnake::kSnakeScalePct)
      << "Erasure must cover the body square";

  EXPECT_EQ(frame.sprites[1].color, VIEW_COLOR_SNAKE);
  EXPECT_EQ(frame.sprites[1].row, state.head().row);
  EXPECT_EQ(frame.sprites[1].col, state.head().col);
  EXPECT_EQ(frame.sprites[2].color, VIEW_COLOR_FOOD);
}
