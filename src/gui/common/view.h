/**
 * @file view.h
 * @brief Интерфейс модулей отображения ArcadeSnake
 *
 * Модуль отображения ничего не знает об игре: контроллер размечает экран на
 * именованные зоны, кладёт в них текст, числа или матрицу клеток и читает
 * ввод в виде логических кодов клавиш. Так один контроллер работает и с
 * ncurses (cli_view), и с Qt (qt_view).
 *
 * - ViewHandle_t: непрозрачный контекст реализации.
 * - Зоны задаются в условных единицах: в терминале это символы, в Qt -
 *   единицы умножаются на размер ячейки окна.
 * - Значения матрицы: коды ARCADE_CELL_* (arcade_game.h); каждая
 *   реализация сама выбирает для них символы и цвета.
 * - Ввод приводится к кодам VIEW_KEY_*, независимым от бэкенда.
 *
 * @author provemet
 * @date March 2025
 * @defgroup View Интерфейс отображения ArcadeSnake
 * @{
 */

#ifndef VIEW_H
#define VIEW_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат операций View.
 */
typedef enum {
    VIEW_OK,              ///< Операция успешна
    VIEW_ERROR,           ///< Общая ошибка
    VIEW_INVALID_ID,      ///< Зона с таким именем не настроена
    VIEW_BAD_DATA,        ///< Некорректные аргументы или данные
    VIEW_NOT_INITIALIZED, ///< handle == NULL
    VIEW_NO_EVENT         ///< Очередь ввода пуста (poll_input)
} ViewResult_t;

/**
 * @name Логические коды клавиш
 * Реализации сводят стрелки к WASD, Escape к 'q', Enter и пробел к
 * VIEW_KEY_START.
 * @{
 */
#define VIEW_KEY_NONE 0
#define VIEW_KEY_UP 'w'
#define VIEW_KEY_LEFT 'a'
#define VIEW_KEY_DOWN 's'
#define VIEW_KEY_RIGHT 'd'
#define VIEW_KEY_PAUSE 'p'
#define VIEW_KEY_QUIT 'q'
#define VIEW_KEY_TERMINATE 'x'
#define VIEW_KEY_START '\n'
/** @} */

/**
 * @struct InputEvent_t
 * @brief Событие ввода.
 *
 * @var InputEvent_t::key_code
 *     Логический код VIEW_KEY_* или другой печатный символ.
 * @var InputEvent_t::key_state
 *     0: однократное нажатие, 1: автоповтор (клавиша удерживается).
 */
typedef struct {
    int key_code;
    int key_state;
} InputEvent_t;

typedef enum {
    ELEMENT_TEXT,   ///< const char*, допускается '\n'
    ELEMENT_NUMBER, ///< int
    ELEMENT_MATRIX  ///< row-major массив int
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Содержимое зоны.
 *
 * @note Данные не копируются до render(): text и matrix.data должны
 *       оставаться валидными до конца кадра.
 * @note Элемент (x, y) матрицы находится по индексу y * width + x.
 */
typedef struct ElementData_t {
    ElementType_t type;
    union {
        const char *text;
        int         number;
        struct {
            const int *data;
            int        width;
            int        height;
        } matrix;
    } content;
} ElementData_t;

/**
 * @brief Таблица функций модуля отображения.
 *
 * @code
 * extern const ViewInterface cli_view;
 * ViewHandle_t view = cli_view.init(96, 32, 10);
 * cli_view.configure_zone(view, "field", 0, 0, 82, 32);
 * @endcode
 */
typedef struct ViewInterface {
    int version; ///< VIEW_INTERFACE_VERSION

    /**
     * @brief Инициализация.
     * @param width, height Размер всей разметки в условных единицах
     * @param fps           Ожидаемая частота кадров (>= 1)
     * @return Контекст или NULL, если бэкенд недоступен или экран мал
     */
    ViewHandle_t (*init)(int width, int height, int fps);

    /**
     * @brief Создать или перенастроить зону.
     * @param element_id Имя зоны (до 31 символа); выводится как заголовок
     * @return VIEW_OK, VIEW_BAD_DATA при пустом имени или размере <= 0
     */
    ViewResult_t (*configure_zone)(ViewHandle_t handle,
                                   const char   *element_id,
                                   int           x,
                                   int           y,
                                   int           max_width,
                                   int           max_height);

    /**
     * @brief Положить содержимое в зону (в буфер кадра).
     * @return VIEW_INVALID_ID, если зона не настроена
     */
    ViewResult_t (*draw_element)(ViewHandle_t          handle,
                                 const char            *element_id,
                                 const ElementData_t   *data);

    /// Вывести кадр.
    ViewResult_t (*render)(ViewHandle_t handle);

    /**
     * @brief Неблокирующее чтение ввода.
     * @return VIEW_OK и событие в `event` либо VIEW_NO_EVENT
     */
    ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

    /// Освободить ресурсы; handle после вызова недействителен.
    ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

#define VIEW_INTERFACE_VERSION 1

#ifdef __cplusplus
}
#endif

#endif // VIEW_H

/** @} */
