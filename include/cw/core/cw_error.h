/**
 * @file cw_error.h
 * @brief Chunkwise - Result codes
 */

#ifndef CW_ERROR_H
#define CW_ERROR_H

#include "cw/core/cw_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef int32_t cw_result_t;

#define CW_SUCCESS                    0
#define CW_ERROR_NULL_POINTER        -1   /**< Required pointer argument was NULL */
#define CW_ERROR_INVALID_ARGUMENT    -2   /**< Argument outside its contract */
#define CW_ERROR_INVALID_ENCODING    -3   /**< Text is not valid UTF-8 */
#define CW_ERROR_INVALID_FORMAT      -4   /**< Malformed configuration JSON */
#define CW_ERROR_OUT_OF_MEMORY       -5   /**< Allocation failed */
#define CW_ERROR_PROCESSING_FAILED   -6   /**< Unexpected failure while chunking */

/**
 * @brief Get a static, human-readable description of a result code
 */
CW_API const char* cw_error_message(cw_result_t result);

#ifdef __cplusplus
}
#endif

#endif // CW_ERROR_H
