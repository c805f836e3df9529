/**
 * @file gsnake_state.cpp
 * @brief Реализация модели игры "Змейка"
 *
 * Содержит логику класса `gsnake::GameState`:
 * - инициализация поля, головы и первой еды
 * - правила смены направления и блокировка хода до следующего тика
 * - продвижение на тик: столкновения, рост, обрезка истории
 * - генерация еды на случайной свободной ячейке
 *
 * Генерация еды выбирает ячейку из явного списка пустых ячеек, поэтому
 * всегда завершается. Если пустых ячеек нет, игра заканчивается с
 * итогом `Outcome::GRID_FILLED`.
 */

#include "gsnake_state.hpp"

#include <algorithm>
#include <string>

namespace gsnake {

InvalidDimensions::InvalidDimensions(int rows, int cols)
    : std::invalid_argument("invalid grid dimensions " + std::to_string(rows) +
                            "x" + std::to_string(cols) +
                            " (both sides must be at least 2)"),
      rows_(rows),
      cols_(cols) {}

namespace {

constexpr int kMinSide = 2;

void checkDimensions(int rows, int cols) {
  if (rows < kMinSide || cols < kMinSide) {
    throw InvalidDimensions(rows, cols);
  }
}

std::uint32_t seedFromDevice() {
  std::random_device rd;
  return rd();
}

}  // namespace

GameState::GameState(int rows, int cols) : GameState(rows, cols, 0) {}

GameState::GameState(int rows, int cols, std::uint32_t seed)
    : rows_(rows), cols_(cols) {
  checkDimensions(rows, cols);
  rng_.seed(seed != 0 ? seed : seedFromDevice());
  initialize_();
}

/**
 * @brief Начальное состояние: пустое поле, голова в случайной ячейке, еда.
 *
 * Поле не меньше 2x2, поэтому после размещения головы всегда остаются
 * свободные ячейки и еда появляется гарантированно.
 */
void GameState::initialize_() {
  cells_.assign(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_),
                CellTag::EMPTY);

  std::uniform_int_distribution<int> row_dist(0, rows_ - 1);
  std::uniform_int_distribution<int> col_dist(0, cols_ - 1);
  const Cell start{row_dist(rng_), col_dist(rng_)};

  path_.clear();
  path_.push_back(start);
  length_ = 1;
  direction_ = kNone;
  move_lock_ = false;
  ended_ = false;
  outcome_ = Outcome::RUNNING;
  food_.reset();

  tag_(start) = CellTag::SNAKE_HEAD;
  spawnFood_();
}

void GameState::setDirection(Direction dir) noexcept {
  if (ended_ || move_lock_ || !dir.isUnit()) {
    return;
  }

  // Первое направление запускает движение без задержки на кадр
  if (direction_.isZero()) {
    direction_ = dir;
    return;
  }

  if (dir == direction_.reversed()) {
    return;
  }

  direction_ = dir;
  move_lock_ = true;
}

bool GameState::advance() {
  move_lock_ = false;

  if (ended_) {
    return true;
  }
  if (direction_.isZero()) {
    return false;
  }

  const Cell current = head();
  const Cell next{current.row + direction_.dy, current.col + direction_.dx};

  // Столкновения не меняют ни поле, ни змейку
  if (!inBounds(next)) {
    finish_(Outcome::CRASHED);
    return true;
  }
  const CellTag target = cells_[index_(next)];
  if (target == CellTag::SNAKE_BODY) {
    finish_(Outcome::CRASHED);
    return true;
  }

  tag_(current) = CellTag::EMPTY;
  path_.push_back(next);
  trimHistory_();

  const bool ate = target == CellTag::FOOD;
  if (ate) {
    ++length_;
    food_.reset();
  }

  updateOccupancy_();

  if (ate && !spawnFood_()) {
    finish_(Outcome::GRID_FILLED);
    return true;
  }
  return false;
}

CellTag GameState::cellAt(int row, int col) const {
  if (!inBounds(Cell{row, col})) {
    throw std::out_of_range("cell (" + std::to_string(row) + ", " +
                            std::to_string(col) + ") is outside the grid");
  }
  return cells_[index_(Cell{row, col})];
}

std::vector<Cell> GameState::body() const {
  const std::size_t stale = path_.size() - static_cast<std::size_t>(length_);
  return std::vector<Cell>(path_.begin() + static_cast<std::ptrdiff_t>(stale),
                           path_.end());
}

std::vector<Cell> GameState::trail() const {
  const std::size_t stale = path_.size() - static_cast<std::size_t>(length_);
  return std::vector<Cell>(path_.begin(),
                           path_.begin() + static_cast<std::ptrdiff_t>(stale));
}

// В истории остаётся не больше length + 1 последних позиций.
void GameState::trimHistory_() {
  const std::size_t limit = static_cast<std::size_t>(length_) + 1;
  while (path_.size() > limit) {
    path_.pop_front();
  }
}

/**
 * @brief Перекрашивает ячейки по истории после хода.
 *
 * История содержит не меньше length элементов: каждый тик добавляет одну
 * позицию, а длина растёт не больше чем на единицу за тик. Сначала
 * очищается след хвоста, затем тело, последней — голова.
 */
void GameState::updateOccupancy_() {
  const std::size_t stale = path_.size() - static_cast<std::size_t>(length_);

  for (std::size_t i = 0; i < stale; ++i) {
    tag_(path_[i]) = CellTag::EMPTY;
  }
  for (std::size_t i = stale; i + 1 < path_.size(); ++i) {
    tag_(path_[i]) = CellTag::SNAKE_BODY;
  }
  tag_(path_.back()) = CellTag::SNAKE_HEAD;
}

/**
 * @brief Ставит еду в случайную пустую ячейку.
 * @return false, если пустых ячеек не осталось
 */
bool GameState::spawnFood_() {
  std::vector<Cell> free_cells;
  free_cells.reserve(cells_.size());

  for (int row = 0; row < rows_; ++row) {
    for (int col = 0; col < cols_; ++col) {
      if (cells_[index_(Cell{row, col})] == CellTag::EMPTY) {
        free_cells.push_back(Cell{row, col});
      }
    }
  }

  if (free_cells.empty()) {
    food_.reset();
    return false;
  }

  std::uniform_int_distribution<std::size_t> dist(0, free_cells.size() - 1);
  const Cell chosen = free_cells[dist(rng_)];
  food_ = chosen;
  tag_(chosen) = CellTag::FOOD;
  return true;
}

void GameState::finish_(Outcome outcome) noexcept {
  ended_ = true;
  outcome_ = outcome;
}

#ifdef GSNAKE_TEST_ACCESS
void GameState::rebuildOccupancy_() {
  std::fill(cells_.begin(), cells_.end(), CellTag::EMPTY);
  updateOccupancy_();

  if (food_) {
    if (tag_(*food_) == CellTag::EMPTY) {
      tag_(*food_) = CellTag::FOOD;
    } else {
      food_.reset();
    }
  }
}

void GameState::setHeadForTesting(const Cell& cell) {
  if (!inBounds(cell)) {
    throw std::out_of_range("test head outside the grid");
  }
  path_.clear();
  path_.push_back(cell);
  length_ = 1;
  direction_ = kNone;
  move_lock_ = false;
  ended_ = false;
  outcome_ = Outcome::RUNNING;

  rebuildOccupancy_();
  if (!food_) {
    spawnFood_();
  }
}

void GameState::setFoodForTesting(const Cell& cell) {
  if (!inBounds(cell)) {
    throw std::out_of_range("test food outside the grid");
  }
  const CellTag current = tag_(cell);
  if (current != CellTag::EMPTY && current != CellTag::FOOD) {
    throw std::invalid_argument("test food must be placed on an empty cell");
  }
  if (food_) {
    tag_(*food_) = CellTag::EMPTY;
  }
  food_ = cell;
  tag_(cell) = CellTag::FOOD;
}
#endif

}  // namespace gsnake
