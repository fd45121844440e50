/**
 * @file options.h
 * @brief Разбор аргументов командной строки исполняемых файлов ArcadeSnake
 *
 * Оба фронтенда принимают одинаковые ключи:
 * @verbatim
 *   -W, --width N        ширина окна в пикселях
 *   -H, --height N       высота окна в пикселях
 *   -c, --cell N         размер клетки в пикселях
 *   -s, --seed N         зерно ГСЧ (0: случайное)
 *   -o, --obstacles N    верхняя граница числа препятствий
 *   -l, --log-file PATH  писать журнал в файл
 *   -L, --log-level LVL  debug | info | warn | error | off
 *   -h, --help           справка
 * @endverbatim
 */

#ifndef ARCADE_OPTIONS_H
#define ARCADE_OPTIONS_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdio.h>

#include "../arcade_game/common/arcade_log.h"
#include "../arcade_game/snake/arcade_snake.h"

typedef enum {
  OPTIONS_OK,
  OPTIONS_HELP,   ///< Запрошена справка, игру не запускать
  OPTIONS_ERROR   ///< Сообщение уже выведено в stderr
} OptionsResult_t;

typedef struct {
  SnakeConfig_t config;
  const char *log_file;        ///< NULL: журнал в stderr
  ArcadeLogLevel_t log_level;
} AppOptions_t;

/**
 * @brief Разобрать argv поверх значений по умолчанию.
 *
 * Проверяет итоговую конфигурацию через snake_validate_config().
 *
 * @param default_log_file Файл журнала, если --log-file не задан (может быть NULL)
 */
OptionsResult_t arcade_parse_options(int argc, char **argv,
                                     const char *default_log_file,
                                     AppOptions_t *out);

void arcade_print_usage(FILE *stream, const char *program);

/**
 * @brief Применить настройки журнала из опций.
 * @return false, если файл журнала не открылся (сообщение в stderr).
 */
bool arcade_apply_log_options(const AppOptions_t *options);

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_OPTIONS_H */
