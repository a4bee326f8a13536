/**
 * @file vgl_logger.cpp
 * @brief Virgil Commons - Logger Implementation
 */

#include "vgl/core/vgl_logger.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>

namespace vgl {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setCallback(vgl_log_callback_fn callback, void* user_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    user_data_ = user_data;
}

void Logger::setMinLevel(vgl_log_level_t level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

vgl_log_level_t Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setStderrFallback(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_fallback_ = enabled;
}

void Logger::log(vgl_log_level_t level, const char* category, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(minLevel())) {
        return;
    }

    // Format the message
    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    write(level, category, buffer);
}

void Logger::write(vgl_log_level_t level, const char* category, const char* message) {
    // Route to callback or fallback
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    if (callback_) {
        callback_(level, category ? category : "", message ? message : "", user_data_);
    } else if (stderr_fallback_) {
        logToStderr(level, category ? category : "", message ? message : "");
    }
}

void Logger::logToStderr(vgl_log_level_t level, const char* category, const char* message) {
    FILE* stream = (level >= VGL_LOG_LEVEL_ERROR) ? stderr : stdout;
    fprintf(stream, "[%s][%s] %s\n", vgl_log_level_name(level), category, message);
    fflush(stream);
}

}  // namespace vgl

// =============================================================================
// C API
// =============================================================================

extern "C" {

void vgl_log(vgl_log_level_t level, const char* category, const char* format, ...) {
    auto& logger = vgl::Logger::instance();
    if (static_cast<int>(level) < static_cast<int>(logger.minLevel())) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    logger.write(level, category, buffer);
}

void vgl_logger_set_callback(vgl_log_callback_fn callback, void* user_data) {
    vgl::Logger::instance().setCallback(callback, user_data);
}

void vgl_logger_set_min_level(vgl_log_level_t level) {
    vgl::Logger::instance().setMinLevel(level);
}

vgl_log_level_t vgl_logger_get_min_level(void) {
    return vgl::Logger::instance().minLevel();
}

vgl_bool_t vgl_log_level_from_string(const char* name, vgl_log_level_t* out_level) {
    if (name == nullptr || out_level == nullptr) {
        return VGL_FALSE;
    }

    std::string lowered(name);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "trace") {
        *out_level = VGL_LOG_LEVEL_TRACE;
    } else if (lowered == "debug") {
        *out_level = VGL_LOG_LEVEL_DEBUG;
    } else if (lowered == "info") {
        *out_level = VGL_LOG_LEVEL_INFO;
    } else if (lowered == "warn" || lowered == "warning") {
        *out_level = VGL_LOG_LEVEL_WARNING;
    } else if (lowered == "error") {
        *out_level = VGL_LOG_LEVEL_ERROR;
    } else if (lowered == "fatal") {
        *out_level = VGL_LOG_LEVEL_FATAL;
    } else {
        return VGL_FALSE;
    }
    return VGL_TRUE;
}

const char* vgl_log_level_name(vgl_log_level_t level) {
    switch (level) {
        case VGL_LOG_LEVEL_TRACE:
            return "TRACE";
        case VGL_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case VGL_LOG_LEVEL_INFO:
            return "INFO";
        case VGL_LOG_LEVEL_WARNING:
            return "WARN";
        case VGL_LOG_LEVEL_ERROR:
            return "ERROR";
        case VGL_LOG_LEVEL_FATAL:
            return "FATAL";
        default:
            return "???";
    }
}

}  // extern "C"
