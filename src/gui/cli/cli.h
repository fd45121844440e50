/**
 * @file cli.h
 * @brief Терминальная реализация View для ArcadeSnake (ncurses)
 *
 * Каждая зона рисуется рамкой с именем зоны в заголовке. Клетка матрицы
 * занимает два символа по ширине, чтобы поле выглядело квадратным:
 *
 * | код                          | вид  | цвет    |
 * |------------------------------|------|---------|
 * | ARCADE_CELL_HEAD             | `@@` | зелёный |
 * | ARCADE_CELL_BODY             | `[]` | зелёный |
 * | ARCADE_CELL_FOOD             | `()` | красный |
 * | ARCADE_CELL_OBSTACLE         | `##` | белый   |
 * | ARCADE_CELL_POWERUP_SPEED    | `>>` | жёлтый  |
 * | ARCADE_CELL_POWERUP_INVINCIBLE | `<>` | голубой |
 * | ARCADE_CELL_POWERUP_BONUS    | `$$` | пурпурный |
 *
 * @code
 * ViewHandle_t view = cli_view.init(96, 32, 10);
 * if (view == NULL) {
 *     fprintf(stderr, "terminal is too small\n");
 *     return 1;
 * }
 * cli_view.configure_zone(view, "field", 0, 0, 82, 32);
 * // ... draw_element, render, poll_input
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Реализация сама вызывает initscr() и endwin(); не используйте
 *       ncurses напрямую параллельно с ней.
 *
 * @defgroup Cli_view Реализация CLI-интерфейса
 * @ingroup View
 *
 * @author provemet
 * @version 2.0
 */

#ifndef CLI_H
#define CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/// Не более стольких зон на один экран.
#define CLI_MAX_ZONES 16

/// Место под текст в одной зоне, включая '\0'.
#define CLI_TEXT_CAPACITY 512

extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif // CLI_H

/** @} */
