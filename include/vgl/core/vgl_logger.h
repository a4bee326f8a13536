/**
 * @file vgl_logger.h
 * @brief Virgil Commons - Logger
 *
 * Simple logging utilities that can be optionally connected to an external
 * logging system (e.g., the host application's log sink).
 *
 * Usage:
 *   VGL_LOG_INFO("Bridge", "Model loaded: %s", path);
 *   VGL_LOG_ERROR("Bridge", "Failed to load: %s", error);
 */

#ifndef VGL_LOGGER_H
#define VGL_LOGGER_H

#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// LOG LEVELS
// =============================================================================

typedef enum vgl_log_level {
    VGL_LOG_LEVEL_TRACE = 0,
    VGL_LOG_LEVEL_DEBUG = 1,
    VGL_LOG_LEVEL_INFO = 2,
    VGL_LOG_LEVEL_WARNING = 3,
    VGL_LOG_LEVEL_ERROR = 4,
    VGL_LOG_LEVEL_FATAL = 5,
} vgl_log_level_t;

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Bridge")
 * @param message Formatted message
 * @param user_data Optional user context
 */
typedef void (*vgl_log_callback_fn)(vgl_log_level_t level, const char* category,
                                    const char* message, void* user_data);

/**
 * @brief Log a printf-style message
 */
VGL_API void vgl_log(vgl_log_level_t level, const char* category, const char* format, ...);

/**
 * @brief Route log output to an external callback (NULL restores stderr output)
 */
VGL_API void vgl_logger_set_callback(vgl_log_callback_fn callback, void* user_data);

/**
 * @brief Set minimum log level; messages below it are discarded
 */
VGL_API void vgl_logger_set_min_level(vgl_log_level_t level);

/**
 * @brief Get current minimum log level
 */
VGL_API vgl_log_level_t vgl_logger_get_min_level(void);

/**
 * @brief Parse "trace", "debug", "info", "warn"/"warning", "error", "fatal"
 *
 * @param name Level name (case-insensitive)
 * @param out_level Parsed level
 * @return VGL_TRUE if the name was recognised
 */
VGL_API vgl_bool_t vgl_log_level_from_string(const char* name, vgl_log_level_t* out_level);

/**
 * @brief Short upper-case label for a level ("INFO", "WARN", ...)
 */
VGL_API const char* vgl_log_level_name(vgl_log_level_t level);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include <mutex>

namespace vgl {

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance();

    // Set external callback for routing logs
    void setCallback(vgl_log_callback_fn callback, void* user_data = nullptr);

    // Set minimum log level
    void setMinLevel(vgl_log_level_t level);
    vgl_log_level_t minLevel() const;

    // Enable/disable stderr fallback
    void setStderrFallback(bool enabled);

    // Core log function
    void log(vgl_log_level_t level, const char* category, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    // Pre-formatted message
    void write(vgl_log_level_t level, const char* category, const char* message);

   private:
    Logger() = default;

    void logToStderr(vgl_log_level_t level, const char* category, const char* message);

    mutable std::mutex mutex_;
    vgl_log_callback_fn callback_ = nullptr;
    void* user_data_ = nullptr;
    vgl_log_level_t min_level_ = VGL_LOG_LEVEL_INFO;
    bool stderr_fallback_ = true;
};

}  // namespace vgl

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define VGL_LOG_TRACE(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_TRACE, category, __VA_ARGS__)

#define VGL_LOG_DEBUG(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_DEBUG, category, __VA_ARGS__)

#define VGL_LOG_INFO(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_INFO, category, __VA_ARGS__)

#define VGL_LOG_WARNING(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_WARNING, category, __VA_ARGS__)

#define VGL_LOG_ERROR(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_ERROR, category, __VA_ARGS__)

#define VGL_LOG_FATAL(category, ...) \
    vgl::Logger::instance().log(VGL_LOG_LEVEL_FATAL, category, __VA_ARGS__)

#endif  // __cplusplus

#endif  // VGL_LOGGER_H
