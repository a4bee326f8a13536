/**
 * @file vgl_session_config.h
 * @brief Virgil Commons - Speech session configuration
 *
 * Example:
 *   {
 *     "model_path": "models/ggml-tiny.en.bin",
 *     "wake_words": ["Hey Assistant"],
 *     "listen_window_ms": 1000,
 *     "channel_capacity": 64,
 *     "worker_threads": 1,
 *     "log_level": "info",
 *     "native_library": "libvirgil_native.so"
 *   }
 *
 * VGL_MODEL_PATH and VGL_LOG_LEVEL override the file.
 */

#ifndef VGL_CLIENT_SESSION_CONFIG_H
#define VGL_CLIENT_SESSION_CONFIG_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_logger.h"

namespace vgl {
namespace client {

class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message), code_(VGL_ERROR_CONFIG_INVALID) {}

    vgl_result_t code() const noexcept { return code_; }

   private:
    vgl_result_t code_;
};

struct SessionConfig {
    std::string model_path;
    std::vector<std::string> wake_words;
    uint64_t listen_window_ms = 1000;
    size_t channel_capacity = 64;
    size_t worker_threads = 1;
    std::string log_level = "info";
    // Empty: use the entry points linked into this program
    std::string native_library;

    /** @throws ConfigError on wrong types or invalid values */
    static SessionConfig from_json(const nlohmann::json& json);

    /** @throws ConfigError if the text is not valid JSON or not a valid config */
    static SessionConfig parse(const std::string& text);

    /** @throws ConfigError if the file cannot be read or is invalid */
    static SessionConfig load(const std::string& path);

    void apply_env_overrides();

    /** @throws ConfigError */
    void validate() const;

    vgl_log_level_t log_level_value() const;

    nlohmann::json to_json() const;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_SESSION_CONFIG_H
