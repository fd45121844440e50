#ifndef SNAKEPREF_H
#define SNAKEPREF_H

/*
    Размер окна в пикселях и размер клетки. Сетка игры получается делением:
    800 / 20 = 40 столбцов, 600 / 20 = 30 строк.
*/
#define SNAKE_DEFAULT_PIXEL_WIDTH 800
#define SNAKE_DEFAULT_PIXEL_HEIGHT 600
#define SNAKE_DEFAULT_CELL_SIZE 20

/*
    Начальная длина змейки. На узком поле уменьшается, чтобы хвост
    не выходил за левую границу.
*/
#define SNAKE_INITIAL_LENGTH 3

/*
    Очки: за еду, за бонус, шаг уровня.
*/
#define SNAKE_FOOD_SCORE 10
#define SNAKE_BONUS_SCORE 50
#define SNAKE_LEVEL_STEP 50

/*
    Скорость в тиках в секунду. После еды пересчитывается как
    SNAKE_SPEED_INITIAL + score / SNAKE_SPEED_SCORE_STEP, но не выше
    SNAKE_SPEED_FOOD_CAP. Бонус скорости поднимает её не выше SNAKE_SPEED_MAX.
*/
#define SNAKE_SPEED_INITIAL 10
#define SNAKE_SPEED_MIN 10
#define SNAKE_SPEED_FOOD_CAP 20
#define SNAKE_SPEED_MAX 25
#define SNAKE_SPEED_BOOST 3
#define SNAKE_SPEED_SCORE_STEP 50

/*
    Длительность неуязвимости в тиках (около 5 секунд при 60 тиках в секунду).
*/
#define SNAKE_DEFAULT_INVINCIBLE_TICKS 300

/*
    Вероятность появления бонуса после съеденной еды и вероятность
    дорастить препятствия на каждом тике.
*/
#define SNAKE_DEFAULT_POWERUP_PROBABILITY 0.3
#define SNAKE_DEFAULT_OBSTACLE_GROWTH_PROBABILITY 0.01

/*
    Верхняя граница числа препятствий. Фактический предел: не больше одной
    клетки из SNAKE_OBSTACLE_AREA_DIVISOR.
*/
#define SNAKE_DEFAULT_MAX_OBSTACLES 20
#define SNAKE_OBSTACLE_AREA_DIVISOR 10

/*
    Наибольшее число клеток сетки. Ключи занятых клеток (y * width + x)
    и площадь остаются в пределах int.
*/
#define SNAKE_MAX_GRID_CELLS (1 << 20)

/*
    Число случайных попыток найти свободную клетку, после которого
    свободные клетки перебираются явно.
*/
#define SNAKE_PLACEMENT_MAX_ATTEMPTS 1000

#endif
