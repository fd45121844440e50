/**
 * @file arcade_snake.h
 * @brief Публичный C API игры "Змейка"
 *
 * Экземпляр игры скрыт за непрозрачным указателем `void*`. Контроллер
 * создаёт игру, передаёт действия пользователя, вызывает update() раз в
 * тик и читает снимок GameInfo_t для отрисовки.
 *
 * @code
 * SnakeConfig_t cfg;
 * snake_default_config(&cfg);
 * void *game = snake_create_with_config(&cfg);
 * while (running) {
 *   snake_handle_input(game, Up, false);
 *   snake_update(game);
 *   const GameInfo_t *info = snake_get_info(game);
 *   // отрисовка info->field[0] (row-major, info->rows x info->cols)
 * }
 * snake_destroy(game);
 * @endcode
 *
 * @note Все функции noexcept при вызове из C++ и безопасны для NULL.
 * @see arcade_snake_internals.hpp: C++ реализация модели
 */

#ifndef ARCADE_SNAKE_H
#define ARCADE_SNAKE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

#include "../arcade_game.h"

#ifdef __cplusplus
#define ARCADE_NOEXCEPT noexcept
#else
#define ARCADE_NOEXCEPT
#endif

/**
 * @struct SnakeConfig_t
 * @brief Параметры игры, фиксируемые при создании экземпляра.
 */
typedef struct SnakeConfig_t {
  int pixel_width;                     ///< Ширина окна, пиксели
  int pixel_height;                    ///< Высота окна, пиксели
  int cell_size;                       ///< Размер клетки, пиксели
  int invincible_ticks;                ///< Длительность неуязвимости, тики
  int max_obstacles;                   ///< Верхняя граница числа препятствий
  double powerup_probability;          ///< Шанс бонуса после еды
  double obstacle_growth_probability;  ///< Шанс дорастить препятствия за тик
  unsigned int seed;                   ///< Зерно ГСЧ, 0: случайное
} SnakeConfig_t;

/**
 * @enum ConfigResult_t
 * @brief Результат проверки конфигурации.
 */
typedef enum {
  CONFIG_OK,
  CONFIG_NULL,              ///< Передан NULL
  CONFIG_BAD_CELL_SIZE,     ///< cell_size <= 0
  CONFIG_GRID_TOO_SMALL,    ///< Сетка меньше 1 x 1
  CONFIG_GRID_TOO_LARGE,    ///< Клеток больше SNAKE_MAX_GRID_CELLS
  CONFIG_BAD_PROBABILITY,   ///< Вероятность вне [0, 1]
  CONFIG_BAD_INVINCIBILITY, ///< invincible_ticks <= 0
  CONFIG_BAD_OBSTACLES      ///< max_obstacles < 0
} ConfigResult_t;

/**
 * @brief Заполнить конфигурацию значениями из snakepref.h.
 */
void snake_default_config(SnakeConfig_t *config);

/**
 * @brief Проверить конфигурацию.
 * @return CONFIG_OK или код первой найденной ошибки.
 */
ConfigResult_t snake_validate_config(const SnakeConfig_t *config);

/**
 * @brief Текстовое описание кода проверки конфигурации.
 */
const char *snake_config_error_str(ConfigResult_t result);

/**
 * @brief Создать игру с конфигурацией по умолчанию.
 * @return Непрозрачный указатель или NULL при ошибке.
 */
void *snake_create(void) ARCADE_NOEXCEPT;

/**
 * @brief Создать игру с заданной конфигурацией.
 * @return Непрозрачный указатель или NULL, если конфигурация некорректна
 *         или не хватило памяти.
 */
void *snake_create_with_config(const SnakeConfig_t *config) ARCADE_NOEXCEPT;

/**
 * @brief Уничтожить игру. Безопасна для NULL.
 */
void snake_destroy(void *game) ARCADE_NOEXCEPT;

/**
 * @brief Передать действие пользователя.
 *
 * Направления применяются на следующем update(); разворот на 180° молча
 * игнорируется. Start перезапускает игру только в состоянии GAME OVER.
 */
void snake_handle_input(void *game, UserAction_t action, bool hold) ARCADE_NOEXCEPT;

/**
 * @brief Выполнить один игровой тик (ничего не делает на паузе и после
 * GAME OVER).
 */
void snake_update(void *game) ARCADE_NOEXCEPT;

/**
 * @brief Снимок состояния для отрисовки.
 *
 * @return Указатель на данные экземпляра (валиден до следующего update()
 *         или destroy()) либо NULL, если game == NULL.
 */
const GameInfo_t *snake_get_info(const void *game) ARCADE_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_SNAKE_H */
