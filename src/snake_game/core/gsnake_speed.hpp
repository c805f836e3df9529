/**
 * @file gsnake_speed.hpp
 * @brief Кривая скорости: задержка между тиками в зависимости от длины змейки
 *
 * Пока задержка больше нижней границы, она пересчитывается каждый тик:
 * `delay = floor(starting * 0.85^length)`. Как только задержка опустилась
 * до границы или ниже, она замораживается на последнем вычисленном значении
 * (без подрезки до самой границы).
 */

#pragma once

namespace gsnake {

class TickDelay {
 public:
  TickDelay(int starting_ms, int floor_ms) noexcept
      : starting_ms_(starting_ms), floor_ms_(floor_ms), delay_ms_(starting_ms) {}

  /// Задержка перед тиком при текущей длине змейки.
  int next(int length) noexcept;

  int current() const noexcept { return delay_ms_; }
  bool frozen() const noexcept { return delay_ms_ <= floor_ms_; }

 private:
  int starting_ms_;
  int floor_ms_;
  int delay_ms_;
};

}  // namespace gsnake
