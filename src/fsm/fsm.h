/**
 * @file fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Табличный конечный автомат для игровых сессий
 *
 * Пользовательский код задаёт свои состояния, события и таблицу переходов,
 * а автомат ищет подходящее правило и вызывает колбэки выхода и входа.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_FIRST_MOVE = 1, EVT_GAME_OVER, EVT_QUIT };
 * enum { ST_WAITING = 1, ST_RUNNING, ST_ENDED, ST_QUIT };
 *
 * static void on_enter(fsm_context_t ctx) {
 *   Session *s = (Session *)ctx;
 *   log_state(s);
 * }
 *
 * static const fsm_transition_t transitions[] = {
 *   {ST_WAITING, EVT_FIRST_MOVE, ST_RUNNING, NULL, on_enter},
 *   {ST_WAITING, EVT_QUIT,       ST_QUIT,    NULL, on_enter},
 *   {ST_RUNNING, EVT_GAME_OVER,  ST_ENDED,   NULL, on_enter},
 *   {ST_RUNNING, EVT_QUIT,       ST_QUIT,    NULL, on_enter},
 * };
 *
 * fsm_t fsm;
 * fsm_init(&fsm, &session, transitions, 4, ST_WAITING);
 * fsm_process_event(&fsm, EVT_FIRST_MOVE);  // ST_WAITING -> ST_RUNNING
 * @endcode
 *
 * @{
 */

#ifndef FSM_H
#define FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Событие автоматического перехода (без внешнего триггера).
 *
 * Используется fsm_update(). Не используйте 0 для своих событий.
 */
#define FSM_EVENT_NONE 0

/**
 * @typedef fsm_event_t
 * @brief Идентификатор события. Значение 0 зарезервировано под
 * @ref FSM_EVENT_NONE.
 */
typedef int fsm_event_t;

/**
 * @typedef fsm_state_t
 * @brief Идентификатор состояния.
 */
typedef int fsm_state_t;

/**
 * @typedef fsm_context_t
 * @brief Пользовательский контекст, передаваемый в колбэки (может быть NULL).
 */
typedef void *fsm_context_t;

/**
 * @typedef fsm_cb_t
 * @brief Колбэк входа или выхода из состояния.
 *
 * @note Повторный вызов fsm_process_event() из колбэка игнорируется —
 *       флаг `processing` защищает от рекурсии.
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило: "из `src` по `event` перейти в `dst`".
 *
 * @note При совпадении нескольких правил выполняется первое.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;
  fsm_cb_t on_enter;
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Состояние автомата. Не изменяйте поля вручную — используйте API.
 *
 * @var fsm_t::transitions
 *      Таблица переходов (автомат не владеет памятью).
 * @var fsm_t::processing
 *      Флаг, запрещающий рекурсивную обработку событий.
 */
typedef struct {
  const fsm_transition_t *transitions;
  size_t count;
  fsm_state_t current;
  fsm_context_t ctx;
  bool processing;
} fsm_t;

/**
 * @brief Инициализировать автомат.
 *
 * @return false, если fsm или transitions равны NULL, либо count == 0.
 * @note on_enter для start_state не вызывается.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Освободить автомат. Безопасна для NULL.
 *
 * Обнуляет ссылку на таблицу: последующие события не обрабатываются.
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Обработать событие: on_exit → смена состояния → on_enter.
 * @return true, если переход выполнен.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Выполнить первый переход по @ref FSM_EVENT_NONE из текущего
 * состояния, если он есть. Безопасна для NULL.
 */
void fsm_update(fsm_t *fsm);

/**
 * @brief Текущее состояние (или -1 для NULL).
 */
fsm_state_t fsm_current(const fsm_t *fsm);

#ifdef __cplusplus
}
#endif

#endif /* FSM_H */

/** @} */  // end of FSM module
