/**
 * @file gsnake_input.hpp
 * @brief Диспетчер ввода: логические клавиши → команды модели
 *
 * Поддерживаются ровно четыре команды направления (WASD, стрелки
 * переводятся бэкендами) и выход ('q', Esc, закрытие окна). Остальные
 * клавиши игнорируются. Выход не завершает процесс, а возвращается
 * вызывающему коду как результат.
 */

#pragma once

extern "C" {
#include "../gui/common/view.h"
}

#include "core/gsnake_state.hpp"

namespace gsnake {

enum class Command { NONE, UP, DOWN, LEFT, RIGHT, QUIT };

Command map_key(int key_code) noexcept;

bool is_direction(Command command) noexcept;

/// Единичный вектор команды; kNone для NONE и QUIT.
Direction to_direction(Command command) noexcept;

struct DispatchResult {
  bool quit = false;
  int directions = 0;  ///< сколько команд направления передано в модель
};

/**
 * @brief Выбирает все ожидающие события и передаёт направления в модель.
 *
 * Останавливается на первой команде выхода. Отпускания клавиш
 * (key_state == 0) пропускаются.
 *
 * @throws ViewError если poll_input вернул ошибку
 */
DispatchResult dispatch_pending(const ViewInterface& view, ViewHandle_t handle,
                                GameState& state);

}  // namespace gsnake
