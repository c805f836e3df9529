/**
 * @file gsnake_session.cpp
 * @brief Реализация игровой сессии
 *
 * Порядок одного тика в состоянии RUNNING:
 * 1. отрисовка кадра по текущему состоянию модели;
 * 2. выборка всех ожидающих событий ввода (выход прерывает цикл);
 * 3. расчёт задержки по текущей длине и ожидание;
 * 4. `GameState::advance()`; завершение модели → событие GAME_OVER.
 */

#include "gsnake_session.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "../gui/common/layout.hpp"
#include "common/gsnake_pref.h"
#include "gsnake_frame.hpp"
#include "gsnake_input.hpp"
#include "gsnake_view.hpp"

namespace gsnake {

namespace {

constexpr const char* kScoreZone = "score";
constexpr const char* kFieldZone = "field";

const char* outcomeName(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::RUNNING:
      return "running";
    case Outcome::CRASHED:
      return "crashed";
    case Outcome::GRID_FILLED:
      return "grid filled";
  }
  return "unknown";
}

}  // namespace

void sleep_ms(int milliseconds) {
  std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

/**
 * @internal
 * @brief Таблица переходов автомата сессии.
 *
 * Состояния ENDED и QUIT конечные: переходов из них нет.
 */
const fsm_transition_t Session::transitions_[] = {
    {to_fsm_state(SessionState::WAITING), to_fsm_event(SessionEvent::FIRST_MOVE),
     to_fsm_state(SessionState::RUNNING), nullptr, &Session::on_state_enter_},

    {to_fsm_state(SessionState::WAITING), to_fsm_event(SessionEvent::QUIT),
     to_fsm_state(SessionState::QUIT), nullptr, &Session::on_state_enter_},

    {to_fsm_state(SessionState::RUNNING), to_fsm_event(SessionEvent::GAME_OVER),
     to_fsm_state(SessionState::ENDED), nullptr, &Session::on_state_enter_},

    {to_fsm_state(SessionState::RUNNING), to_fsm_event(SessionEvent::QUIT),
     to_fsm_state(SessionState::QUIT), nullptr, &Session::on_state_enter_},
};

Session::Session(const GameConfig& config, const ViewInterface& view, int width,
                 int height, WaitFn wait)
    : config_(config),
      view_(view),
      width_(width),
      height_(height),
      wait_(std::move(wait)),
      state_(config.rows, config.cols, config.seed),
      delay_(config.starting_delay_ms, config.delay_floor_ms) {
  const bool ok = fsm_init(&fsm_, this, transitions_,
                           sizeof(transitions_) / sizeof(transitions_[0]),
                           to_fsm_state(SessionState::WAITING));
  if (!ok) {
    throw std::logic_error("session state machine failed to initialise");
  }
}

Session::~Session() {
  closeView_();
  fsm_destroy(&fsm_);
}

SessionResult Session::run() {
  openView_();

  // View закрывается и при исключении
  struct ViewCloser {
    Session* self;
    ~ViewCloser() { self->closeView_(); }
  } closer{this};

  spdlog::info("session started: {}x{} grid, head at ({}, {})", state_.rows(),
               state_.cols(), state_.head().row, state_.head().col);
  drawFrame_();

  if (waitFirstMove_()) {
    playLoop_();
  }

  const SessionStatus status = current() == SessionState::QUIT
                                   ? SessionStatus::CANCELLED
                                   : SessionStatus::FINISHED;
  return SessionResult{status, state_.score(), state_.outcome(), ticks_};
}

void Session::openView_() {
  const ViewConfig_t view_config = make_view_config(config_, width_, height_);
  handle_ = view_.init(&view_config);
  if (handle_ == nullptr) {
    throw ViewError("init", VIEW_NOT_INITIALIZED);
  }

  const layout::Zones zones = layout::split_surface(width_, height_);
  check_view(view_.configure_zone(handle_, kScoreZone, zones.score.x,
                                  zones.score.y, zones.score.w, zones.score.h),
             "configure_zone");
  check_view(view_.configure_zone(handle_, kFieldZone, zones.field.x,
                                  zones.field.y, zones.field.w, zones.field.h),
             "configure_zone");
}

void Session::closeView_() noexcept {
  if (handle_ == nullptr) {
    return;
  }
  const ViewResult_t result = view_.shutdown(handle_);
  handle_ = nullptr;
  if (result != VIEW_OK) {
    spdlog::warn("view shutdown failed: {}", view_result_name(result));
  }
}

void Session::drawFrame_() {
  const Frame frame = build_frame(state_);

  ElementData_t grid{};
  grid.type = ELEMENT_MATRIX;
  grid.content.matrix.data = frame.cells.data();
  grid.content.matrix.width = frame.cols;
  grid.content.matrix.height = frame.rows;
  check_view(view_.draw_element(handle_, kFieldZone, &grid), "draw_element");

  ElementData_t sprites{};
  sprites.type = ELEMENT_SPRITES;
  sprites.content.sprites.data = frame.sprites.data();
  sprites.content.sprites.count = static_cast<int>(frame.sprites.size());
  sprites.content.sprites.grid_rows = frame.rows;
  sprites.content.sprites.grid_cols = frame.cols;
  check_view(view_.draw_element(handle_, kFieldZone, &sprites), "draw_element");

  ElementData_t score{};
  score.type = ELEMENT_TEXT;
  score.content.text = frame.score_text.c_str();
  check_view(view_.draw_element(handle_, kScoreZone, &score), "draw_element");

  check_view(view_.render(handle_), "render");
}

/**
 * @brief Ждёт первую клавишу направления.
 * @return false, если вместо хода пришла команда выхода
 */
bool Session::waitFirstMove_() {
  const int idle_ms = 1000 / GSNAKE_VIEW_FPS;
  InputEvent_t event{};

  for (;;) {
    const ViewResult_t polled = view_.poll_input(handle_, &event);
    if (polled == VIEW_NO_EVENT) {
      wait_(idle_ms);
      continue;
    }
    check_view(polled, "poll_input");
    if (event.key_state == 0) {
      continue;
    }

    const Command command = map_key(event.key_code);
    if (command == Command::QUIT) {
      processEvent_(SessionEvent::QUIT);
      return false;
    }
    if (is_direction(command)) {
      state_.setDirection(to_direction(command));
      processEvent_(SessionEvent::FIRST_MOVE);
      return true;
    }
  }
}

void Session::playLoop_() {
  while (current() == SessionState::RUNNING) {
    drawFrame_();

    const DispatchResult input = dispatch_pending(view_, handle_, state_);
    if (input.quit) {
      processEvent_(SessionEvent::QUIT);
      return;
    }

    wait_(delay_.next(state_.length()));

    const int length_before = state_.length();
    const bool ended = state_.advance();
    ++ticks_;
    if (state_.length() > length_before) {
      spdlog::debug("food eaten at ({}, {}), length {}", state_.head().row,
                    state_.head().col, state_.length());
    }
    if (ended) {
      processEvent_(SessionEvent::GAME_OVER);
    }
  }
  drawFrame_();
}

void Session::processEvent_(SessionEvent event) {
  if (!fsm_process_event(&fsm_, to_fsm_event(event))) {
    spdlog::warn("event {} ignored in state {}", static_cast<int>(event),
                 fsm_current(&fsm_));
  }
}

void Session::on_state_enter_(fsm_context_t ctx) {
  auto* self = static_cast<Session*>(ctx);

  switch (self->current()) {
    case SessionState::RUNNING:
      spdlog::info("first move ({}, {})", self->state_.direction().dx,
                   self->state_.direction().dy);
      break;

    case SessionState::ENDED:
      spdlog::info("game over ({}): score {} after {} ticks",
                   outcomeName(self->state_.outcome()), self->state_.score(),
                   self->ticks_);
      break;

    case SessionState::QUIT:
      spdlog::info("quit requested, score {}", self->state_.score());
      break;

    default:
      break;
  }
}

}  // namespace gsnake
