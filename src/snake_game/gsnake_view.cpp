#include "gsnake_view.hpp"

#include "common/gsnake_pref.h"

namespace gsnake {

ViewError::ViewError(const std::string& operation, ViewResult_t result)
    : std::runtime_error("view " + operation + " failed: " +
                         view_result_name(result)),
      result_(result) {}

const char* view_result_name(ViewResult_t result) noexcept {
  switch (result) {
    case VIEW_OK:
      return "ok";
    case VIEW_ERROR:
      return "error";
    case VIEW_INVALID_ID:
      return "invalid element id";
    case VIEW_BAD_DATA:
      return "bad data";
    case VIEW_NOT_INITIALIZED:
      return "not initialized";
    case VIEW_NO_EVENT:
      return "no event";
  }
  return "unknown";
}

void check_view(ViewResult_t result, const char* operation) {
  if (result != VIEW_OK) {
    throw ViewError(operation, result);
  }
}

ViewConfig_t make_view_config(const GameConfig& config, int width, int height) {
  ViewConfig_t view_config{};
  view_config.width = width;
  view_config.height = height;
  view_config.fps = GSNAKE_VIEW_FPS;
  view_config.title = "GridSnake";
  view_config.palette[VIEW_COLOR_BACKGROUND] = config.background_color.c_str();
  view_config.palette[VIEW_COLOR_GRID] = config.grid_color.c_str();
  view_config.palette[VIEW_COLOR_SNAKE] = config.snake_color.c_str();
  view_config.palette[VIEW_COLOR_FOOD] = config.food_color.c_str();
  return view_config;
}

}  // namespace gsnake
