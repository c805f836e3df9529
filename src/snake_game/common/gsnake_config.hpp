/**
 * @file gsnake_config.hpp
 * @brief Неизменяемая конфигурация игровой сессии
 *
 * Значения по умолчанию берутся из gsnake_pref.h. Файл настроек —
 * текст вида `ключ = значение`, строки после `#` игнорируются:
 *
 * @code
 * # ~/.gridsnake/settings.conf
 * rows = 16
 * cols = 20
 * starting_delay_ms = 400
 * snake_color = green
 * @endcode
 *
 * Конфигурация загружается один раз при старте и передаётся по
 * константной ссылке; изменение во время игры не поддерживается.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "gsnake_pref.h"

namespace gsnake {

/// Ошибка чтения или проверки конфигурации.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct GameConfig {
  int rows = GSNAKE_DEFAULT_ROWS;
  int cols = GSNAKE_DEFAULT_COLS;
  int starting_delay_ms = GSNAKE_STARTING_DELAY_MS;
  int delay_floor_ms = GSNAKE_DELAY_FLOOR_MS;

  std::string snake_color = GSNAKE_SNAKE_COLOR;
  std::string food_color = GSNAKE_FOOD_COLOR;
  std::string background_color = GSNAKE_BACKGROUND_COLOR;
  std::string grid_color = GSNAKE_GRID_COLOR;

  int window_width = GSNAKE_WINDOW_WIDTH;
  int window_height = GSNAKE_WINDOW_HEIGHT;

  std::string view = "cli";  ///< "cli" или "desktop"
  std::string log_file;      ///< пусто — ~/.gridsnake/gridsnake.log
  std::string log_level = "info";
  std::uint32_t seed = 0;    ///< 0 — случайное зерно
};

/**
 * @brief Читает файл настроек поверх значений по умолчанию.
 * @throws ConfigError если файл не открывается, ключ неизвестен или
 *         значение не разбирается; сообщение содержит имя файла и строку
 */
GameConfig load_config(const std::string& path);

/// ~/.gridsnake/settings.conf, если он есть, иначе значения по умолчанию.
GameConfig load_default_config();

/// Применяет одну пару ключ/значение. @throws ConfigError
void apply_setting(GameConfig& config, const std::string& key,
                   const std::string& value);

/// @throws ConfigError при нарушении ограничений
void validate(const GameConfig& config);

/// Путь внутри ~/.gridsnake (или ./.gridsnake, если HOME не задан).
std::string home_path(const std::string& name);

/// Путь журнала с учётом значения по умолчанию и префикса `~/`.
std::string resolved_log_file(const GameConfig& config);

}  // namespace gsnake
