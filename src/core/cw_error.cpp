/**
 * @file cw_error.cpp
 * @brief Result code descriptions and C boundary allocation
 */

#include "cw/core/cw_error.h"

#include <cstdlib>
#include <cstring>

extern "C" {

const char* cw_error_message(cw_result_t result) {
    switch (result) {
        case CW_SUCCESS:                 return "Success";
        case CW_ERROR_NULL_POINTER:      return "Null pointer argument";
        case CW_ERROR_INVALID_ARGUMENT:  return "Invalid argument";
        case CW_ERROR_INVALID_ENCODING:  return "Text is not valid UTF-8";
        case CW_ERROR_INVALID_FORMAT:    return "Malformed configuration";
        case CW_ERROR_OUT_OF_MEMORY:     return "Out of memory";
        case CW_ERROR_PROCESSING_FAILED: return "Processing failed";
        default:                         return "Unknown error";
    }
}

void* cw_alloc(size_t size) {
    return std::malloc(size);
}

void cw_free(void* ptr) {
    std::free(ptr);
}

char* cw_strdup(const char* str) {
    if (str == nullptr) {
        return nullptr;
    }
    const size_t length = std::strlen(str);
    char* copy = static_cast<char*>(cw_alloc(length + 1));
    if (copy == nullptr) {
        return nullptr;
    }
    std::memcpy(copy, str, length + 1);
    return copy;
}

} // extern "C"
