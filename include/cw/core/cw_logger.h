/**
 * @file cw_logger.h
 * @brief Chunkwise - Logging
 *
 * printf-style, tag-based logging. Messages go to stderr unless the host
 * installs its own sink with cw_logger_set_callback().
 */

#ifndef CW_LOGGER_H
#define CW_LOGGER_H

#include "cw/core/cw_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum cw_log_level {
    CW_LOG_LEVEL_TRACE = 0,
    CW_LOG_LEVEL_DEBUG = 1,
    CW_LOG_LEVEL_INFO = 2,
    CW_LOG_LEVEL_WARNING = 3,
    CW_LOG_LEVEL_ERROR = 4,
    CW_LOG_LEVEL_NONE = 5
} cw_log_level_t;

/**
 * @brief Host log sink
 *
 * @param level Message level
 * @param tag Component tag (e.g. "Chunking.Dispatcher")
 * @param message Formatted message, valid only for the duration of the call
 * @param user_data Pointer passed to cw_logger_set_callback()
 */
typedef void (*cw_log_callback_t)(
    cw_log_level_t level,
    const char* tag,
    const char* message,
    void* user_data
);

/**
 * @brief Drop messages below level (default CW_LOG_LEVEL_INFO)
 */
CW_API void cw_logger_set_min_level(cw_log_level_t level);

CW_API cw_log_level_t cw_logger_get_min_level(void);

/**
 * @brief Install a log sink; NULL restores the stderr sink
 *
 * The sink is called without any library lock held and may log or install
 * another sink. A replaced sink can still receive messages already in flight.
 */
CW_API void cw_logger_set_callback(cw_log_callback_t callback, void* user_data);

CW_API void cw_log(cw_log_level_t level, const char* tag, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#define CW_LOG_TRACE(tag, ...)   cw_log(CW_LOG_LEVEL_TRACE, tag, __VA_ARGS__)
#define CW_LOG_DEBUG(tag, ...)   cw_log(CW_LOG_LEVEL_DEBUG, tag, __VA_ARGS__)
#define CW_LOG_INFO(tag, ...)    cw_log(CW_LOG_LEVEL_INFO, tag, __VA_ARGS__)
#define CW_LOG_WARNING(tag, ...) cw_log(CW_LOG_LEVEL_WARNING, tag, __VA_ARGS__)
#define CW_LOG_ERROR(tag, ...)   cw_log(CW_LOG_LEVEL_ERROR, tag, __VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif // CW_LOGGER_H
