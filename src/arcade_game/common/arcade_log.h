/**
 * @file arcade_log.h
 * @brief Простое журналирование для всех модулей ArcadeSnake
 *
 * Каждая единица трансляции объявляет свой тег перед использованием макросов:
 * @code
 * #define TAG "placement"
 * ARCADE_LOG_WARN(TAG, "no free cell for food (%d occupied)", n);
 * @endcode
 *
 * Формат строки: `2025-03-14 12:00:00 WARN  [placement] no free cell ...`
 *
 * По умолчанию вывод идёт в stderr с порогом ARCADE_LOG_LEVEL_WARN.
 * CLI-интерфейс перенаправляет журнал в файл, чтобы не портить экран ncurses.
 *
 * @note Не потокобезопасно: весь проект однопоточный.
 */

#ifndef ARCADE_LOG_H
#define ARCADE_LOG_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

typedef enum {
  ARCADE_LOG_LEVEL_DEBUG = 0,
  ARCADE_LOG_LEVEL_INFO,
  ARCADE_LOG_LEVEL_WARN,
  ARCADE_LOG_LEVEL_ERROR,
  ARCADE_LOG_LEVEL_OFF
} ArcadeLogLevel_t;

/**
 * @brief Установить минимальный уровень выводимых сообщений.
 */
void arcade_log_set_level(ArcadeLogLevel_t level);

ArcadeLogLevel_t arcade_log_get_level(void);

/**
 * @brief Разобрать имя уровня ("debug", "info", "warn", "error", "off").
 *
 * @param[in]  name  Имя уровня (регистр не важен).
 * @param[out] level Результат.
 * @return false, если имя не распознано (level не меняется).
 */
bool arcade_log_parse_level(const char *name, ArcadeLogLevel_t *level);

/**
 * @brief Перенаправить журнал в файл (дозапись).
 *
 * Ранее открытый файл закрывается.
 *
 * @return false, если файл не удалось открыть; вывод остаётся прежним.
 */
bool arcade_log_open(const char *path);

/**
 * @brief Закрыть файл журнала и вернуть вывод в stderr.
 */
void arcade_log_close(void);

/**
 * @brief Записать сообщение. Обычно вызывается через макросы ARCADE_LOG_*.
 */
void arcade_log_write(ArcadeLogLevel_t level, const char *tag, const char *fmt,
                      ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#define ARCADE_LOG_DEBUG(tag, ...) \
  arcade_log_write(ARCADE_LOG_LEVEL_DEBUG, tag, __VA_ARGS__)
#define ARCADE_LOG_INFO(tag, ...) \
  arcade_log_write(ARCADE_LOG_LEVEL_INFO, tag, __VA_ARGS__)
#define ARCADE_LOG_WARN(tag, ...) \
  arcade_log_write(ARCADE_LOG_LEVEL_WARN, tag, __VA_ARGS__)
#define ARCADE_LOG_ERROR(tag, ...) \
  arcade_log_write(ARCADE_LOG_LEVEL_ERROR, tag, __VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* ARCADE_LOG_H */
