/**
 * @file fsm.h
 * @defgroup FSM Универсальная машина конечных автоматов
 * @brief Универсальная машина конечных автоматов
 *
 * Библиотека реализует абстрактный API для определения своих
 * состояний и событий в пользовательском коде (игровая логика).
 *
 * Библиотека не знает ничего об игре: состояния, события и колбэки задаются
 * таблицей переходов в пользовательском коде. Модель змейки использует её для
 * переключения RUNNING / PAUSED / OVER.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_PAUSE = 1, EVT_COLLISION, EVT_RESET };
 * enum { ST_RUNNING = 0, ST_PAUSED, ST_OVER };
 *
 * typedef struct {
 *   int score;
 *   bool paused;
 * } GameContext;
 *
 * static void on_enter_paused(fsm_context_t ctx) {
 *   ((GameContext *)ctx)->paused = true;
 * }
 *
 * static void on_enter_running(fsm_context_t ctx) {
 *   ((GameContext *)ctx)->paused = false;
 * }
 *
 * static const fsm_transition_t transitions[] = {
 *   {ST_RUNNING, EVT_PAUSE, ST_PAUSED, NULL, on_enter_paused},
 *   {ST_PAUSED, EVT_PAUSE, ST_RUNNING, NULL, on_enter_running},
 *   {ST_RUNNING, EVT_COLLISION, ST_OVER, NULL, NULL},
 *   {ST_OVER, EVT_RESET, ST_RUNNING, NULL, on_enter_running},
 * };
 *
 * fsm_t fsm;
 * GameContext ctx = {0};
 *
 * fsm_init(&fsm, &ctx, transitions, 4, ST_RUNNING);
 * fsm_process_event(&fsm, EVT_COLLISION);  // fsm_current(&fsm) == ST_OVER
 * @endcode
 *
 * @author provemet
 * @date March 2025
 *
 * @{
 */

#ifndef FSM_H
#define FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Зарезервированное "пустое" событие.
 *
 * fsm_process_event() его отклоняет, поэтому пользовательские события
 * нумеруются с 1. Удобно как значение "действие ничего не означает".
 */
#define FSM_EVENT_NONE 0

/// Идентификатор события. 0 занят под @ref FSM_EVENT_NONE.
typedef int fsm_event_t;

/**
 * @typedef fsm_state_t
 * @brief Идентификатор состояния.
 *
 * Обычно значение перечисления. Отрицательные значения не используйте:
 * fsm_current() возвращает -1 как признак ошибки.
 */
typedef int fsm_state_t;

/**
 * @typedef fsm_context_t
 * @brief Данные приложения, передаваемые в колбэки без изменений.
 *
 * В модели змейки это указатель на экземпляр `arcade::SnakeGame`.
 */
typedef void *fsm_context_t;

/**
 * @typedef fsm_cb_t
 * @brief Колбэк входа или выхода из состояния.
 *
 * @note Событие, отправленное из колбэка, отклоняется (флаг `processing`).
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило "из `src` по `event` в `dst`".
 *
 * Колбэки могут быть NULL. Если правил с одинаковыми `src` и `event`
 * несколько, срабатывает первое в таблице.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;   ///< Вызывается до смены состояния
  fsm_cb_t on_enter;  ///< Вызывается после смены состояния
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Экземпляр автомата.
 *
 * Таблица переходов не копируется: она должна жить дольше автомата
 * (обычно это `static const` массив). Поля меняются только через API.
 */
typedef struct {
  const fsm_transition_t *transitions;
  size_t count;
  fsm_state_t current;
  fsm_context_t ctx;
  bool processing;  ///< Идёт переход: повторный вход запрещён
} fsm_t;

/**
 * @brief Подготовить автомат к работе.
 *
 * @param[out] fsm         Автомат.
 * @param[in]  ctx         Контекст для колбэков (может быть NULL).
 * @param[in]  transitions Таблица переходов.
 * @param[in]  count       Число записей в таблице (> 0).
 * @param[in]  start_state Начальное состояние; его on_enter не вызывается.
 * @return false, если fsm или transitions равны NULL либо count == 0.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Отсоединить автомат от таблицы переходов.
 *
 * После вызова все события отклоняются. Память под fsm_t не освобождается.
 * Безопасна для NULL.
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Отправить событие.
 *
 * Выполняет on_exit, смену состояния и on_enter найденного правила.
 *
 * @return true, если переход выполнен. false для NULL, FSM_EVENT_NONE,
 *         события без правила в текущем состоянии и вызова из колбэка.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Текущее состояние или -1, если `fsm == NULL`.
 */
fsm_state_t fsm_current(const fsm_t *fsm);

/**
 * @brief Есть ли правило для `event` в текущем состоянии.
 *
 * Ничего не меняет и колбэки не вызывает.
 */
bool fsm_can_process(const fsm_t *fsm, fsm_event_t event);

#ifdef __cplusplus
}
#endif

#endif /* FSM_H */
