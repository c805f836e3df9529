/**
 * @file cli.h
 * @brief Публичный интерфейс CLI-реализации View для GridSnake (через ncurses).
 *
 * Содержит объявление экспортируемого объекта `cli_view`, реализующего
 * универсальный интерфейс отображения @ref ViewInterface. Ячейка поля
 * занимает два символа по ширине и одну строку по высоте.
 *
 * Пример использования:
 * @code
 * int w = 0, h = 0;
 * cli_surface_for_grid(rows, cols, &w, &h);
 * ViewConfig_t cfg = {w, h, 30, "GridSnake", {"black", "white", "white", "red"}};
 * ViewHandle_t view = cli_view.init(&cfg);
 * // ... configure_zone, draw_element, render, poll_input
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Для компиляции требуется подключение библиотеки ncurses.
 * @note Не используйте ncurses напрямую при работе с этим интерфейсом —
 *       это может привести к конфликту состояний.
 *
 * @defgroup Cli_view Реализация CLI-интерфейса
 * @ingroup View
 */

#ifndef CLI_H
#define CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Экземпляр интерфейса отображения для CLI-бэкенда на базе ncurses.
 *
 * Стрелки и WASD переводятся в логические коды VIEW_KEY_*.
 * Все функции должны вызываться из одного потока.
 */
extern const ViewInterface cli_view;

/**
 * @brief Размер поверхности (в символах), в которую помещается сетка.
 *
 * Высота подбирается так, чтобы 80% зоны поля вмещали все строки,
 * а зона счёта занимала хотя бы одну строку.
 */
void cli_surface_for_grid(int rows, int cols, int *width, int *height);

#ifdef __cplusplus
}
#endif

#endif // CLI_H

/** @} */
