/**
 * @file gsnake_log.hpp
 * @brief Настройка журнала (spdlog)
 *
 * Журнал пишется в файл: терминальный интерфейс занимает экран целиком,
 * поэтому вывод в консоль во время игры недопустим.
 */

#pragma once

#include <string>

#include "gsnake_config.hpp"

namespace gsnake {

/**
 * @brief Устанавливает логгер "gridsnake" по умолчанию.
 * @return путь к файлу журнала или пустая строка, если файл открыть не
 *         удалось (тогда журнал отключается, а предупреждение уходит в stderr)
 */
std::string init_logging(const GameConfig& config);

}  // namespace gsnake
