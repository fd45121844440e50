/**
 * @file controller.h
 * @brief Связка модели "Змейки" с модулем отображения
 *
 * Контроллер владеет экземпляром игры и контекстом View. Каждый кадр:
 * 1. вычитывает весь накопленный ввод и переводит его в UserAction_t;
 * 2. делает один игровой тик (snake_update());
 * 3. перерисовывает поле и информационные зоны.
 *
 * Паузу между кадрами задаёт вызывающая сторона по
 * controller_frame_delay_ms(): 1000 / speed мс, поэтому скорость змейки
 * действительно меняет частоту тиков.
 *
 * Разметка (в условных единицах View):
 * @verbatim
 * +-field----------------------+ +-score------+
 * |                            | +-best-------+
 * |  cols * 2 + 2  x  rows + 2 | +-level------+
 * |                            | +-speed------+
 * |                            | +-status-----+
 * +----------------------------+
 * @endverbatim
 */

#ifndef ARCADE_CONTROLLER_H
#define ARCADE_CONTROLLER_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

#include "../arcade_game/snake/arcade_snake.h"
#include "../gui/common/view.h"

/// Ширина информационной колонки справа от поля.
#define CONTROLLER_INFO_WIDTH 16

typedef struct {
  void *game;
  const ViewInterface *view;
  ViewHandle_t handle;
  int layout_width;
  int layout_height;
  bool quit;
  char status[128];
} Controller_t;

/**
 * @brief Создать игру и открыть View.
 *
 * @param[out] c    Контроллер
 * @param[in]  view Реализация View (cli_view, qt_view)
 * @param[in]  cfg  Конфигурация игры
 * @return false, если конфигурация некорректна, не хватило памяти или
 *         View не инициализировался. Частично созданное освобождается.
 */
bool controller_init(Controller_t *c, const ViewInterface *view,
                     const SnakeConfig_t *cfg);

/**
 * @brief Один кадр: ввод, тик, отрисовка.
 * @return false, когда пользователь запросил выход.
 */
bool controller_tick(Controller_t *c);

/**
 * @brief Пауза до следующего кадра, мс: 1000 / speed.
 */
int controller_frame_delay_ms(const Controller_t *c);

/**
 * @brief Перевести логический код клавиши в действие.
 * @return false, если клавиша ничему не соответствует.
 */
bool controller_map_key(int key_code, UserAction_t *action);

void controller_shutdown(Controller_t *c);

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_CONTROLLER_H */
