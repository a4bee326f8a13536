#include "vgl/client/vgl_session_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vgl {
namespace client {

namespace {

template <typename T>
T read_field(const nlohmann::json& json, const char* key, const T& fallback) {
    if (!json.contains(key) || json[key].is_null()) {
        return fallback;
    }
    try {
        return json[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for \"") + key + "\": " + e.what());
    }
}

// nlohmann converts -1 to a huge unsigned value, so check the sign first
uint64_t read_unsigned(const nlohmann::json& json, const char* key, uint64_t fallback) {
    if (!json.contains(key) || json[key].is_null()) {
        return fallback;
    }
    if (!json[key].is_number_unsigned()) {
        throw ConfigError(std::string("\"") + key + "\" must be a non-negative integer");
    }
    return json[key].get<uint64_t>();
}

}  // namespace

SessionConfig SessionConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("Session config must be a JSON object");
    }

    SessionConfig config;
    config.model_path = read_field(json, "model_path", config.model_path);
    config.wake_words = read_field(json, "wake_words", config.wake_words);
    config.listen_window_ms = read_unsigned(json, "listen_window_ms", config.listen_window_ms);
    config.channel_capacity =
        static_cast<size_t>(read_unsigned(json, "channel_capacity", config.channel_capacity));
    config.worker_threads =
        static_cast<size_t>(read_unsigned(json, "worker_threads", config.worker_threads));
    config.log_level = read_field(json, "log_level", config.log_level);
    config.native_library = read_field(json, "native_library", config.native_library);

    config.validate();
    return config;
}

SessionConfig SessionConfig::parse(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON: ") + e.what());
    }
    return from_json(json);
}

SessionConfig SessionConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

void SessionConfig::apply_env_overrides() {
    const char* env_model = std::getenv("VGL_MODEL_PATH");
    if (env_model) model_path = env_model;

    const char* env_level = std::getenv("VGL_LOG_LEVEL");
    if (env_level) log_level = env_level;

    validate();
}

void SessionConfig::validate() const {
    if (listen_window_ms == 0) {
        throw ConfigError("listen_window_ms must be greater than zero");
    }
    if (channel_capacity == 0) {
        throw ConfigError("channel_capacity must be greater than zero");
    }
    if (worker_threads == 0) {
        throw ConfigError("worker_threads must be greater than zero");
    }
    vgl_log_level_t level;
    if (!vgl_log_level_from_string(log_level.c_str(), &level)) {
        throw ConfigError("Unknown log_level: " + log_level);
    }
}

vgl_log_level_t SessionConfig::log_level_value() const {
    vgl_log_level_t level = VGL_LOG_LEVEL_INFO;
    vgl_log_level_from_string(log_level.c_str(), &level);
    return level;
}

nlohmann::json SessionConfig::to_json() const {
    nlohmann::json json;
    json["model_path"] = model_path;
    json["wake_words"] = wake_words;
    json["listen_window_ms"] = listen_window_ms;
    json["channel_capacity"] = channel_capacity;
    json["worker_threads"] = worker_threads;
    json["log_level"] = log_level;
    if (!native_library.empty()) {
        json["native_library"] = native_library;
    }
    return json;
}

}  // namespace client
}  // namespace vgl
