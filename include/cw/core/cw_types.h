/**
 * @file cw_types.h
 * @brief Chunkwise - Common C types and memory helpers
 */

#ifndef CW_TYPES_H
#define CW_TYPES_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#define CW_API __declspec(dllexport)
#else
#define CW_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef int32_t cw_bool_t;

#define CW_TRUE 1
#define CW_FALSE 0

/**
 * @brief Allocate memory that crosses the C boundary
 *
 * Everything returned to the caller by the C API is allocated here and must
 * be released with cw_free().
 */
CW_API void* cw_alloc(size_t size);

/**
 * @brief Release memory obtained from cw_alloc() or cw_strdup()
 */
CW_API void cw_free(void* ptr);

/**
 * @brief Duplicate a NUL-terminated string with cw_alloc()
 *
 * @return Copy of str, or NULL if str is NULL or allocation failed
 */
CW_API char* cw_strdup(const char* str);

#ifdef __cplusplus
}
#endif

#endif // CW_TYPES_H
