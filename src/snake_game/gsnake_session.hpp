/**
 * @file gsnake_session.hpp
 * @brief Игровая сессия: цикл тиков, ввод, отрисовка и конечный автомат
 *
 * Сессия связывает модель (`GameState`), кривую скорости (`TickDelay`),
 * бэкенд отображения (`ViewInterface`) и автомат состояний (`fsm_t`).
 *
 * Переходы автомата:
 * - WAITING + FIRST_MOVE → RUNNING: первая клавиша направления;
 * - WAITING + QUIT       → QUIT;
 * - RUNNING + GAME_OVER  → ENDED: модель сообщила о завершении;
 * - RUNNING + QUIT       → QUIT.
 *
 * @note Однопоточная: ожидание между тиками выполняет переданная функция
 *       `WaitFn`, что позволяет подменить её в тестах.
 */

#pragma once

#include <functional>

extern "C" {
#include "../fsm/fsm.h"
#include "../gui/common/view.h"
}

#include "common/gsnake_config.hpp"
#include "core/gsnake_speed.hpp"
#include "core/gsnake_state.hpp"

namespace gsnake {

enum class SessionState : int { WAITING = 1, RUNNING, ENDED, QUIT };

/// Значение 0 зарезервировано автоматом под FSM_EVENT_NONE.
enum class SessionEvent : int { FIRST_MOVE = 1, GAME_OVER, QUIT };

enum class SessionStatus { FINISHED, CANCELLED };

struct SessionResult {
  SessionStatus status;
  int score;
  Outcome outcome;
  long ticks;
};

constexpr fsm_state_t to_fsm_state(SessionState state) noexcept {
  return static_cast<fsm_state_t>(state);
}
constexpr fsm_event_t to_fsm_event(SessionEvent event) noexcept {
  return static_cast<fsm_event_t>(event);
}
constexpr SessionState from_fsm_state(fsm_state_t state) noexcept {
  return static_cast<SessionState>(state);
}

using WaitFn = std::function<void(int milliseconds)>;

/// Ожидание через std::this_thread::sleep_for.
void sleep_ms(int milliseconds);

class Session {
 public:
  /**
   * @param config  Проверенная конфигурация (копируется)
   * @param view    Бэкенд отображения; должен жить дольше сессии
   * @param width   Ширина поверхности в единицах бэкенда
   * @param height  Высота поверхности в единицах бэкенда
   * @param wait    Функция ожидания между тиками
   * @throws InvalidDimensions при недопустимом размере поля
   */
  Session(const GameConfig& config, const ViewInterface& view, int width,
          int height, WaitFn wait = sleep_ms);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Проводит одну игру от ожидания первого хода до конца.
   *
   * View инициализируется в начале и закрывается при любом выходе.
   *
   * @throws ViewError при ошибке бэкенда отображения
   */
  SessionResult run();

  const GameState& state() const noexcept { return state_; }
  SessionState current() const noexcept {
    return from_fsm_state(fsm_current(&fsm_));
  }
  long ticks() const noexcept { return ticks_; }

 private:
  GameConfig config_;
  const ViewInterface& view_;
  int width_;
  int height_;
  WaitFn wait_;
  GameState state_;
  TickDelay delay_;
  fsm_t fsm_{};
  ViewHandle_t handle_ = nullptr;
  long ticks_ = 0;

  static const fsm_transition_t transitions_[];
  static void on_state_enter_(fsm_context_t ctx);

  void openView_();
  void closeView_() noexcept;
  void drawFrame_();
  bool waitFirstMove_();
  void playLoop_();
  void processEvent_(SessionEvent event);
};

}  // namespace gsnake
