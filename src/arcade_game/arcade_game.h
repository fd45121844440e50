/**
 * @file arcade_game.h
 * @brief Общие типы публичного API ArcadeSnake
 *
 * Определяет структуры, через которые модель игры обменивается данными с
 * контроллером и модулями отображения:
 * - UserAction_t: действие пользователя
 * - GameInfo_t  : снимок состояния игры для отрисовки
 * - коды ячеек игрового поля (ARCADE_CELL_*)
 * - коды причин завершения игры (ARCADE_COLLISION_*)
 *
 * Заголовок чистый C и подключается как из C, так и из C++ кода.
 *
 * @author provemet
 * @date March 2025
 */

#ifndef ARCADE_GAME_H
#define ARCADE_GAME_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

/**
 * @enum UserAction_t
 * @brief Действия пользователя, которые контроллер передаёт в модель.
 */
typedef enum UserAction_t {
  Start,      ///< Новая игра (после GAME OVER)
  Pause,      ///< Пауза / продолжение
  Terminate,  ///< Сдаться: немедленный переход в GAME OVER
  Left,
  Right,
  Up,
  Down,
  Action      ///< Зарезервировано, змейкой не используется
} UserAction_t;

/**
 * @name Коды ячеек игрового поля
 * Значения, которыми модель заполняет GameInfo_t::field.
 * @{
 */
#define ARCADE_CELL_EMPTY 0
#define ARCADE_CELL_BODY 1
#define ARCADE_CELL_HEAD 2
#define ARCADE_CELL_FOOD 3
#define ARCADE_CELL_OBSTACLE 4
#define ARCADE_CELL_POWERUP_SPEED 5
#define ARCADE_CELL_POWERUP_INVINCIBLE 6
#define ARCADE_CELL_POWERUP_BONUS 7
#define ARCADE_CELL_MAX ARCADE_CELL_POWERUP_BONUS
/** @} */

/**
 * @name Причины завершения игры
 * @{
 */
#define ARCADE_COLLISION_NONE 0
#define ARCADE_COLLISION_WALL 1
#define ARCADE_COLLISION_OBSTACLE 2
#define ARCADE_COLLISION_SELF 3
#define ARCADE_COLLISION_TERMINATED 4
/** @} */

/**
 * @struct GameInfo_t
 * @brief Снимок состояния игры для отрисовки.
 *
 * Поле хранится одним непрерывным блоком rows * cols: `field[y]` указывает на
 * начало строки y, а `field[0]` можно передавать в View как row-major матрицу.
 */
typedef struct GameInfo_t {
  int **field;           ///< Игровое поле [rows][cols], значения ARCADE_CELL_*
  int rows;              ///< Высота поля в клетках
  int cols;              ///< Ширина поля в клетках
  int score;             ///< Текущий счёт
  int high_score;        ///< Рекорд текущего запуска
  int level;             ///< Уровень (с 1)
  int speed;             ///< Тиков в секунду, [10, 25]
  int pause;             ///< 1: игра на паузе
  int invincible;        ///< 1: действует неуязвимость
  int invincible_ticks;  ///< Остаток неуязвимости в тиках
  int game_over;         ///< 1: игра завершена
  int collision;         ///< Причина завершения, ARCADE_COLLISION_*
} GameInfo_t;

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_GAME_H */
