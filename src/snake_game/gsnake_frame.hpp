/**
 * @file gsnake_frame.hpp
 * @brief Построение кадра для слоя отображения по запросам к модели
 *
 * Кадр содержит:
 * - матрицу тегов ячеек (для сетки и CLI);
 * - спрайты: тело змейки (70% ячейки), стирание следа хвоста цветом фона
 *   (90% ячейки), еда (60% ячейки);
 * - текст счёта "Score: N", где N = length - 1.
 */

#pragma once

#include <string>
#include <vector>

extern "C" {
#include "../gui/common/view.h"
}

#include "core/gsnake_state.hpp"

namespace gsnake {

constexpr int kSnakeScalePct = 70;
constexpr int kTrailScalePct = 90;
constexpr int kFoodScalePct = 60;

struct Frame {
  int rows = 0;
  int cols = 0;
  std::vector<int> cells;
  std::vector<Sprite_t> sprites;
  std::string score_text;
};

Frame build_frame(const GameState& state);

}  // namespace gsnake
