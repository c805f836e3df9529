/**
 * @file cli.cpp
 * @brief Реализация ViewInterface на ncurses
 *
 * Элементы рисуются в буфер stdscr сразу в draw_element(), render()
 * выводит буфер на экран.
 */

#include "cli.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <unordered_map>

// Макросы ncurses (erase, clear, move) ломают заголовки STL после себя
#include <ncurses.h>

namespace {

constexpr int kCellWidth = 2;

struct Zone {
  int x, y, w, h;
};

struct CliContext {
  int width;
  int height;
  bool colors;
  std::unordered_map<std::string, Zone> zones;
};

short colorFromName(const char *name) {
  static const std::unordered_map<std::string, short> table = {
      {"black", COLOR_BLACK},   {"red", COLOR_RED},
      {"green", COLOR_GREEN},   {"yellow", COLOR_YELLOW},
      {"blue", COLOR_BLUE},     {"magenta", COLOR_MAGENTA},
      {"cyan", COLOR_CYAN},     {"white", COLOR_WHITE},
  };
  if (name == nullptr) return COLOR_WHITE;
  auto it = table.find(name);
  return it != table.end() ? it->second : COLOR_WHITE;
}

// Пара ncurses для цвета палитры: индекс + 1 (пара 0 зарезервирована)
short pairFor(ViewColor_t color) { return static_cast<short>(color + 1); }

int keyToLogical(int ch) {
  switch (ch) {
    case KEY_UP: return VIEW_KEY_UP;
    case KEY_DOWN: return VIEW_KEY_DOWN;
    case KEY_LEFT: return VIEW_KEY_LEFT;
    case KEY_RIGHT: return VIEW_KEY_RIGHT;
    default: return ch;
  }
}

void putCell(const CliContext *ctx, int y, int x, const char *glyph, attr_t attrs) {
  if (y < 0 || x < 0 || y >= ctx->height || x + kCellWidth > ctx->width) return;
  attron(attrs);
  mvaddstr(y, x, glyph);
  attroff(attrs);
}

attr_t colorAttr(const CliContext *ctx, ViewColor_t color) {
  return ctx->colors ? COLOR_PAIR(pairFor(color)) : A_NORMAL;
}

void drawMatrix(const CliContext *ctx, const Zone &z, const ElementData_t *data) {
  const int w = data->content.matrix.width;
  const int h = data->content.matrix.height;
  const int *cells = data->content.matrix.data;
  const int ox = z.x + std::max(0, (z.w - w * kCellWidth) / 2);
  const int oy = z.y + std::max(0, (z.h - h) / 2);

  for (int row = 0; row < h; ++row) {
    for (int col = 0; col < w; ++col) {
      if (cells[row * w + col] == 0) {
        putCell(ctx, oy + row, ox + col * kCellWidth, ". ",
                colorAttr(ctx, VIEW_COLOR_GRID));
      }
    }
  }
}

void drawSprites(const CliContext *ctx, const Zone &z, const ElementData_t *data) {
  const int rows = data->content.sprites.grid_rows;
  const int cols = data->content.sprites.grid_cols;
  const int ox = z.x + std::max(0, (z.w - cols * kCellWidth) / 2);
  const int oy = z.y + std::max(0, (z.h - rows) / 2);

  for (int i = 0; i < data->content.sprites.count; ++i) {
    const Sprite_t &s = data->content.sprites.data[i];
    const int y = oy + s.row;
    const int x = ox + s.col * kCellWidth;
    switch (s.color) {
      case VIEW_COLOR_SNAKE:
        putCell(ctx, y, x, ctx->colors ? "  " : "[]",
                colorAttr(ctx, VIEW_COLOR_SNAKE) | (ctx->colors ? A_REVERSE : 0));
        break;
      case VIEW_COLOR_FOOD:
        putCell(ctx, y, x, "()", colorAttr(ctx, VIEW_COLOR_FOOD) | A_BOLD);
        break;
      default:
        putCell(ctx, y, x, "  ", colorAttr(ctx, VIEW_COLOR_BACKGROUND));
        break;
    }
  }
}

void drawText(const CliContext *ctx, const Zone &z, const char *text) {
  const int len = static_cast<int>(std::strlen(text));
  const int y = z.y + z.h / 2;
  if (y >= ctx->height) return;
  move(y, z.x);
  for (int i = 0; i < z.w && z.x + i < ctx->width; ++i) addch(' ');
  const int x = z.x + std::max(0, (z.w - len) / 2);
  attron(colorAttr(ctx, VIEW_COLOR_SNAKE) | A_BOLD);
  mvaddnstr(y, x, text, std::max(0, std::min(len, ctx->width - x)));
  attroff(colorAttr(ctx, VIEW_COLOR_SNAKE) | A_BOLD);
}

ViewHandle_t cli_init(const ViewConfig_t *config) {
  if (config == nullptr || config->width <= 0 || config->height <= 0 ||
      config->fps < 1) {
    return nullptr;
  }
  if (initscr() == nullptr) {
    return nullptr;
  }
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);
  curs_set(0);

  auto *ctx = new CliContext{config->width, config->height, has_colors() == TRUE, {}};
  if (ctx->colors) {
    start_color();
    const short bg = colorFromName(config->palette[VIEW_COLOR_BACKGROUND]);
    for (int c = 0; c < VIEW_COLOR_COUNT; ++c) {
      init_pair(pairFor(static_cast<ViewColor_t>(c)),
                colorFromName(config->palette[c]), bg);
    }
    bkgd(COLOR_PAIR(pairFor(VIEW_COLOR_BACKGROUND)));
  }
  erase();
  return static_cast<ViewHandle_t>(ctx);
}

ViewResult_t cli_configure_zone(ViewHandle_t handle, const char *element_id,
                                int x, int y, int max_w, int max_h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || std::strlen(element_id) == 0) return VIEW_BAD_DATA;
  if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

  auto *ctx = static_cast<CliContext *>(handle);
  ctx->zones[element_id] = Zone{x, y, max_w, max_h};
  return VIEW_OK;
}

ViewResult_t cli_draw_element(ViewHandle_t handle, const char *element_id,
                              const ElementData_t *data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || !data) return VIEW_BAD_DATA;

  auto *ctx = static_cast<CliContext *>(handle);
  auto it = ctx->zones.find(element_id);
  if (it == ctx->zones.end()) return VIEW_INVALID_ID;
  const Zone &z = it->second;

  switch (data->type) {
    case ELEMENT_TEXT:
      if (!data->content.text) return VIEW_BAD_DATA;
      drawText(ctx, z, data->content.text);
      break;
    case ELEMENT_NUMBER:
      drawText(ctx, z, std::to_string(data->content.number).c_str());
      break;
    case ELEMENT_MATRIX:
      if (!data->content.matrix.data) return VIEW_BAD_DATA;
      drawMatrix(ctx, z, data);
      break;
    case ELEMENT_SPRITES:
      if (!data->content.sprites.data && data->content.sprites.count > 0)
        return VIEW_BAD_DATA;
      drawSprites(ctx, z, data);
      break;
  }
  return VIEW_OK;
}

ViewResult_t cli_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  return refresh() == ERR ? VIEW_ERROR : VIEW_OK;
}

ViewResult_t cli_poll_input(ViewHandle_t handle, InputEvent_t *event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!event) return VIEW_ERROR;

  int ch = getch();
  while (ch == KEY_RESIZE) ch = getch();
  if (ch == ERR) return VIEW_NO_EVENT;

  event->key_code = keyToLogical(ch);
  event->key_state = 1;
  return VIEW_OK;
}

ViewResult_t cli_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  delete static_cast<CliContext *>(handle);
  return endwin() == ERR ? VIEW_ERROR : VIEW_OK;
}

}  // namespace

extern "C" {

const ViewInterface cli_view = {
    VIEW_INTERFACE_VERSION,
    cli_init,
    cli_configure_zone,
    cli_draw_element,
    cli_render,
    cli_poll_input,
    cli_shutdown,
};

void cli_surface_for_grid(int rows, int cols, int *width, int *height) {
  if (width) *width = cols * kCellWidth + 2;
  if (height) *height = std::max(7, (rows * 5 + 3) / 4 + 1);
}

}  // extern "C"
