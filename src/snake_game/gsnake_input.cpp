#include "gsnake_input.hpp"

#include "gsnake_view.hpp"

namespace gsnake {

Command map_key(int key_code) noexcept {
  switch (key_code) {
    case VIEW_KEY_UP:
    case 'W':
      return Command::UP;
    case VIEW_KEY_DOWN:
    case 'S':
      return Command::DOWN;
    case VIEW_KEY_LEFT:
    case 'A':
      return Command::LEFT;
    case VIEW_KEY_RIGHT:
    case 'D':
      return Command::RIGHT;
    case VIEW_KEY_QUIT:
    case 'Q':
    case VIEW_KEY_ESC:
      return Command::QUIT;
    default:
      return Command::NONE;
  }
}

bool is_direction(Command command) noexcept {
  return command == Command::UP || command == Command::DOWN ||
         command == Command::LEFT || command == Command::RIGHT;
}

Direction to_direction(Command command) noexcept {
  switch (command) {
    case Command::UP:
      return kUp;
    case Command::DOWN:
      return kDown;
    case Command::LEFT:
      return kLeft;
    case Command::RIGHT:
      return kRight;
    default:
      return kNone;
  }
}

DispatchResult dispatch_pending(const ViewInterface& view, ViewHandle_t handle,
                                GameState& state) {
  DispatchResult result;
  InputEvent_t event{};

  for (;;) {
    const ViewResult_t polled = view.poll_input(handle, &event);
    if (polled == VIEW_NO_EVENT) {
      break;
    }
    check_view(polled, "poll_input");
    if (event.key_state == 0) {
      continue;
    }

    const Command command = map_key(event.key_code);
    if (command == Command::QUIT) {
      result.quit = true;
      break;
    }
    if (is_direction(command)) {
      state.setDirection(to_direction(command));
      ++result.directions;
    }
  }
  return result;
}

}  // namespace gsnake
