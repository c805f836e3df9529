/**
 * @file gsnake_state.hpp
 * @brief Модель игры "Змейка": поле, змейка, еда, направление, завершение
 *
 * Класс `gsnake::GameState` хранит всё состояние одной игровой сессии.
 * Единственный источник истины — ограниченная история позиций головы
 * (`path_`). Сетка тегов ячеек (`cells_`) является производным индексом
 * занятости и обновляется инкрементально внутри `advance()`.
 *
 * Инварианты:
 * - последние `length()` элементов истории помечены на сетке как
 *   SNAKE_HEAD (последний) и SNAKE_BODY (остальные);
 * - в истории не больше `length() + 1` элементов, лишний элемент — след
 *   хвоста, он всегда помечен EMPTY;
 * - ровно одна ячейка помечена FOOD, пока игра не завершилась заполнением
 *   поля.
 *
 * @note Класс не потокобезопасен — все вызовы из одного потока.
 * @note Модель не выполняет ввод-вывод.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

namespace gsnake {

/// Ячейка поля: строка и столбец.
struct Cell {
  int row;
  int col;

  bool operator==(const Cell& other) const noexcept {
    return row == other.row && col == other.col;
  }
  bool operator!=(const Cell& other) const noexcept {
    return !(*this == other);
  }
};

/**
 * @brief Направление движения как единичный вектор (dx — столбцы, dy — строки).
 *
 * Нулевой вектор означает, что змейка ещё не начала движение.
 */
struct Direction {
  int dx;
  int dy;

  bool operator==(const Direction& other) const noexcept {
    return dx == other.dx && dy == other.dy;
  }
  bool operator!=(const Direction& other) const noexcept {
    return !(*this == other);
  }

  bool isZero() const noexcept { return dx == 0 && dy == 0; }
  bool isUnit() const noexcept {
    return (dx == 0 && (dy == 1 || dy == -1)) ||
           (dy == 0 && (dx == 1 || dx == -1));
  }
  Direction reversed() const noexcept { return Direction{-dx, -dy}; }
};

constexpr Direction kNone{0, 0};
constexpr Direction kUp{0, -1};
constexpr Direction kDown{0, 1};
constexpr Direction kLeft{-1, 0};
constexpr Direction kRight{1, 0};

/**
 * @brief Тег ячейки поля.
 *
 * Значения совпадают с кодами, которые получает слой отображения в матрице.
 */
enum class CellTag : int { EMPTY = 0, SNAKE_BODY = 1, SNAKE_HEAD = 2, FOOD = 3 };

/// Итог игры.
enum class Outcome : int {
  RUNNING = 0,   ///< игра продолжается
  CRASHED,       ///< столкновение со стеной или телом
  GRID_FILLED    ///< свободных ячеек для еды не осталось (победа)
};

/// Размеры поля меньше 2x2.
class InvalidDimensions : public std::invalid_argument {
 public:
  InvalidDimensions(int rows, int cols);

  int rows() const noexcept { return rows_; }
  int cols() const noexcept { return cols_; }

 private:
  int rows_;
  int cols_;
};

class GameState {
 public:
  /**
   * @brief Создаёт поле rows x cols, голову в случайной ячейке и еду.
   * @throws InvalidDimensions если rows < 2 или cols < 2
   */
  GameState(int rows, int cols);

  /// То же, но с детерминированным генератором (seed != 0).
  GameState(int rows, int cols, std::uint32_t seed);

  /**
   * @brief Меняет направление движения.
   *
   * - при установленной блокировке хода — ничего не делает;
   * - пока змейка стоит (нулевое направление) — принимает любое единичное
   *   направление без блокировки;
   * - иначе отклоняет точный разворот на 180°, остальные направления
   *   принимает и ставит блокировку до следующего тика.
   *
   * Неединичные векторы игнорируются.
   */
  void setDirection(Direction dir) noexcept;
  void setDirection(int dx, int dy) noexcept { setDirection(Direction{dx, dy}); }

  /**
   * @brief Продвигает игру на один тик.
   * @return true, если игра завершена (в том числе раньше)
   */
  bool advance();

  int rows() const noexcept { return rows_; }
  int cols() const noexcept { return cols_; }

  /// @throws std::out_of_range для ячейки вне поля
  CellTag cellAt(int row, int col) const;
  CellTag cellAt(const Cell& cell) const { return cellAt(cell.row, cell.col); }

  /// История позиций головы, от старых к новым.
  const std::deque<Cell>& path() const noexcept { return path_; }

  /// Занятые змейкой ячейки, от хвоста к голове.
  std::vector<Cell> body() const;

  /// Устаревшие элементы истории (след хвоста).
  std::vector<Cell> trail() const;

  int length() const noexcept { return length_; }
  int score() const noexcept { return length_ - 1; }
  Cell head() const noexcept { return path_.back(); }
  Direction direction() const noexcept { return direction_; }
  bool moveLocked() const noexcept { return move_lock_; }
  std::optional<Cell> food() const noexcept { return food_; }
  bool ended() const noexcept { return ended_; }
  Outcome outcome() const noexcept { return outcome_; }

  bool inBounds(const Cell& cell) const noexcept {
    return cell.row >= 0 && cell.row < rows_ && cell.col >= 0 &&
           cell.col < cols_;
  }

#ifdef GSNAKE_TEST_ACCESS
  // Для тестирования: перенос змейки длины 1 в заданную ячейку.
  void setHeadForTesting(const Cell& cell);
  // Для тестирования: перенос еды в заданную пустую ячейку.
  void setFoodForTesting(const Cell& cell);
#endif

 private:
  int rows_;
  int cols_;
  std::vector<CellTag> cells_;
  std::deque<Cell> path_;
  int length_ = 1;
  Direction direction_ = kNone;
  bool move_lock_ = false;
  std::optional<Cell> food_;
  bool ended_ = false;
  Outcome outcome_ = Outcome::RUNNING;
  std::mt19937 rng_;

  void initialize_();
  CellTag& tag_(const Cell& cell) { return cells_[index_(cell)]; }
  std::size_t index_(const Cell& cell) const noexcept {
    return static_cast<std::size_t>(cell.row) * static_cast<std::size_t>(cols_) +
           static_cast<std::size_t>(cell.col);
  }
  void trimHistory_();
  void updateOccupancy_();
  bool spawnFood_();
  void finish_(Outcome outcome) noexcept;
#ifdef GSNAKE_TEST_ACCESS
  void rebuildOccupancy_();
#endif
};

}  // namespace gsnake
