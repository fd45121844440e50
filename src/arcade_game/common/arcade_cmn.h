/**
 * @file arcade_cmn.h
 * @brief Общие утилиты для работы с GameInfo_t
 *
 * Функции этого модуля управляют памятью игрового поля и проверяют
 * корректность данных, которые модель отдаёт на отрисовку:
 * - выделение / освобождение / очистка поля произвольного размера
 * - создание и уничтожение структуры GameInfo_t
 * - валидация действий пользователя и снимка состояния
 *
 * Поле выделяется одним блоком rows * cols плюс массив указателей на строки,
 * поэтому `field[0]`: готовая row-major матрица для ViewInterface.
 *
 * @author provemet
 * @version 2.0
 * @date 2025-03-14
 */

#ifndef ARCADE_CMN_H
#define ARCADE_CMN_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

#include "../arcade_game.h"

/**
 * @brief Выделить память для игрового поля rows x cols
 *
 * Все ячейки инициализируются ARCADE_CELL_EMPTY.
 *
 * @code
 * int **field = arcade_allocate_field(30, 40);
 * field[29][39] = ARCADE_CELL_FOOD;
 * arcade_free_field(field);
 * @endcode
 *
 * @param rows Количество строк (> 0)
 * @param cols Количество столбцов (> 0)
 * @return Указатель на поле или NULL при ошибке/некорректном размере
 *
 * @note Освобождать только через arcade_free_field().
 */
int **arcade_allocate_field(int rows, int cols);

/**
 * @brief Освободить память игрового поля. Безопасна для NULL.
 */
void arcade_free_field(int **field);

/**
 * @brief Заполнить поле значением ARCADE_CELL_EMPTY. Безопасна для NULL.
 */
void arcade_clear_field(int **field, int rows, int cols);

/**
 * @brief Создать структуру GameInfo_t с полем rows x cols
 *
 * Значения по умолчанию: score = 0, high_score = 0, level = 1, speed = 10,
 * все флаги сброшены, collision = ARCADE_COLLISION_NONE.
 *
 * @return Инициализированная структура. При ошибке выделения памяти
 *         `field == NULL`: проверьте перед использованием.
 *
 * @see arcade_destroy_game_info()
 */
GameInfo_t arcade_create_game_info(int rows, int cols);

/**
 * @brief Освободить поле и обнулить структуру. Безопасна для NULL.
 */
void arcade_destroy_game_info(GameInfo_t *info);

/**
 * @brief Проверить, что значение входит в перечисление UserAction_t.
 */
bool arcade_is_valid_action(UserAction_t action);

/**
 * @brief Проверить поле: указатели не NULL, значения в [0, ARCADE_CELL_MAX].
 */
bool arcade_is_valid_field(int **field, int rows, int cols);

/**
 * @brief Проверить корректность снимка состояния
 *
 * Проверяет:
 * - поле (см. arcade_is_valid_field())
 * - score и high_score неотрицательны, high_score >= score
 * - level >= 1, speed в [10, 25]
 * - флаги pause / invincible / game_over равны 0 или 1
 * - invincible_ticks >= 0, причём при invincible == 0 он равен 0
 *
 * @code
 * const GameInfo_t *state = snake_get_info(game);
 * if (state != NULL && arcade_is_valid_game_info(state)) {
 *   // можно рисовать
 * }
 * @endcode
 */
bool arcade_is_valid_game_info(const GameInfo_t *info);

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_CMN_H */
