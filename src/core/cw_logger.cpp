/**
 * @file cw_logger.cpp
 * @brief Logging implementation
 */

#include "cw/core/cw_logger.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace {

std::atomic<int> g_min_level{CW_LOG_LEVEL_INFO};

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

cw_log_callback_t g_callback = nullptr;
void* g_user_data = nullptr;

const char* level_name(cw_log_level_t level) {
    switch (level) {
        case CW_LOG_LEVEL_TRACE:   return "TRACE";
        case CW_LOG_LEVEL_DEBUG:   return "DEBUG";
        case CW_LOG_LEVEL_INFO:    return "INFO";
        case CW_LOG_LEVEL_WARNING: return "WARN";
        case CW_LOG_LEVEL_ERROR:   return "ERROR";
        default:                   return "NONE";
    }
}

std::string format_message(const char* format, va_list args) {
    char stack_buffer[512];

    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(stack_buffer, sizeof(stack_buffer), format, copy);
    va_end(copy);

    if (needed < 0) {
        return format;
    }
    if (static_cast<size_t>(needed) < sizeof(stack_buffer)) {
        return std::string(stack_buffer, static_cast<size_t>(needed));
    }

    std::vector<char> heap_buffer(static_cast<size_t>(needed) + 1);
    std::vsnprintf(heap_buffer.data(), heap_buffer.size(), format, args);
    return std::string(heap_buffer.data(), static_cast<size_t>(needed));
}

} // namespace

extern "C" {

void cw_logger_set_min_level(cw_log_level_t level) {
    g_min_level.store(level);
}

cw_log_level_t cw_logger_get_min_level(void) {
    return static_cast<cw_log_level_t>(g_min_level.load());
}

void cw_logger_set_callback(cw_log_callback_t callback, void* user_data) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    g_callback = callback;
    g_user_data = user_data;
}

void cw_log(cw_log_level_t level, const char* tag, const char* format, ...) {
    if (format == nullptr || level < g_min_level.load() || level >= CW_LOG_LEVEL_NONE) {
        return;
    }

    va_list args;
    va_start(args, format);
    const std::string message = format_message(format, args);
    va_end(args);

    const char* safe_tag = tag != nullptr ? tag : "Chunkwise";

    cw_log_callback_t callback = nullptr;
    void* user_data = nullptr;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        callback = g_callback;
        user_data = g_user_data;
    }

    // Sink runs unlocked so it may log or swap sinks itself
    if (callback != nullptr) {
        callback(level, safe_tag, message.c_str(), user_data);
        return;
    }
    std::fprintf(stderr, "[%s][%s] %s\n", level_name(level), safe_tag, message.c_str());
}

} // extern "C"
