/**
 * @file test_session_config.cpp
 * @brief Tests for JSON session configuration
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "vgl/client/vgl_session_config.h"

using vgl::client::ConfigError;
using vgl::client::SessionConfig;

namespace {

class EnvGuard {
   public:
    explicit EnvGuard(const char* name) : name_(name) {
        const char* value = std::getenv(name);
        if (value) {
            had_value_ = true;
            saved_ = value;
        }
    }

    ~EnvGuard() {
        if (had_value_) {
            setenv(name_, saved_.c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

   private:
    const char* name_;
    bool had_value_ = false;
    std::string saved_;
};

}  // namespace

TEST(SessionConfig, Defaults) {
    SessionConfig config = SessionConfig::parse("{}");
    EXPECT_TRUE(config.model_path.empty());
    EXPECT_TRUE(config.wake_words.empty());
    EXPECT_EQ(config.listen_window_ms, 1000u);
    EXPECT_EQ(config.channel_capacity, 64u);
    EXPECT_EQ(config.worker_threads, 1u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.log_level_value(), VGL_LOG_LEVEL_INFO);
}

TEST(SessionConfig, ParsesAllFields) {
    SessionConfig config = SessionConfig::parse(R"({
        "model_path": "models/ggml-tiny.en.bin",
        "wake_words": ["Hey Assistant", "Virgil"],
        "listen_window_ms": 500,
        "channel_capacity": 8,
        "worker_threads": 2,
        "log_level": "debug",
        "native_library": "libvirgil_native.so"
    })");

    EXPECT_EQ(config.model_path, "models/ggml-tiny.en.bin");
    ASSERT_EQ(config.wake_words.size(), 2u);
    EXPECT_EQ(config.wake_words[1], "Virgil");
    EXPECT_EQ(config.listen_window_ms, 500u);
    EXPECT_EQ(config.channel_capacity, 8u);
    EXPECT_EQ(config.worker_threads, 2u);
    EXPECT_EQ(config.log_level_value(), VGL_LOG_LEVEL_DEBUG);
    EXPECT_EQ(config.native_library, "libvirgil_native.so");
}

TEST(SessionConfig, ToJsonRoundTrips) {
    SessionConfig config;
    config.model_path = "model.bin";
    config.wake_words = {"Hey Assistant"};
    config.listen_window_ms = 250;

    SessionConfig parsed = SessionConfig::from_json(config.to_json());
    EXPECT_EQ(parsed.model_path, config.model_path);
    EXPECT_EQ(parsed.wake_words, config.wake_words);
    EXPECT_EQ(parsed.listen_window_ms, 250u);
    EXPECT_FALSE(config.to_json().contains("native_library"));
}

TEST(SessionConfig, RejectsInvalidDocuments) {
    EXPECT_THROW(SessionConfig::parse("not json"), ConfigError);
    EXPECT_THROW(SessionConfig::parse("[1, 2]"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"model_path": 7})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"wake_words": "Hey"})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"listen_window_ms": -1})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"listen_window_ms": 0})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"channel_capacity": 1.5})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"worker_threads": 0})"), ConfigError);
    EXPECT_THROW(SessionConfig::parse(R"({"log_level": "loud"})"), ConfigError);
}

TEST(SessionConfig, ConfigErrorCarriesCode) {
    try {
        SessionConfig::parse(R"({"log_level": "loud"})");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), VGL_ERROR_CONFIG_INVALID);
        EXPECT_NE(std::string(e.what()).find("loud"), std::string::npos);
    }
}

TEST(SessionConfig, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "vgl_session_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"model_path": "from-file.bin", "wake_words": ["Hey Assistant"]})";
    }

    SessionConfig config = SessionConfig::load(path);
    EXPECT_EQ(config.model_path, "from-file.bin");
    std::remove(path.c_str());

    EXPECT_THROW(SessionConfig::load(path), ConfigError);
}

TEST(SessionConfig, EnvironmentOverridesFile) {
    EnvGuard model_guard("VGL_MODEL_PATH");
    EnvGuard level_guard("VGL_LOG_LEVEL");
    setenv("VGL_MODEL_PATH", "env-model.bin", 1);
    setenv("VGL_LOG_LEVEL", "error", 1);

    SessionConfig config = SessionConfig::parse(R"({"model_path": "file.bin"})");
    config.apply_env_overrides();

    EXPECT_EQ(config.model_path, "env-model.bin");
    EXPECT_EQ(config.log_level_value(), VGL_LOG_LEVEL_ERROR);

    setenv("VGL_LOG_LEVEL", "bogus", 1);
    EXPECT_THROW(config.apply_env_overrides(), ConfigError);
}
