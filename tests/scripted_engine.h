/**
 * @file scripted_engine.h
 * @brief Test engine provider whose transcription is a scripted function
 *
 * Registered with a priority above every real provider, so the native side
 * runs end to end without a model file. Paths containing "corrupt" fail to
 * load; paths containing "unsupported" are declined.
 */

#ifndef VGL_TESTS_SCRIPTED_ENGINE_H
#define VGL_TESTS_SCRIPTED_ENGINE_H

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "vgl/bridge/vgl_bridge.h"
#include "vgl/client/vgl_diagnostics.h"
#include "vgl/client/vgl_ownership.h"
#include "vgl/core/vgl_audio_utils.h"
#include "vgl/engine/vgl_engine.h"

namespace vgl_test {

using Script = std::function<std::string(const std::vector<float>&)>;

constexpr const char* kWakeSentence = "Hey Assistant, open the door";

class ScriptedEngine {
   public:
    static ScriptedEngine& instance() {
        static ScriptedEngine engine;
        return engine;
    }

    // Registers the provider on first use and restores the default script.
    void install() {
        std::call_once(registered_, [] {
            vgl_engine_provider_t provider = {};
            provider.name = "ScriptedTestEngine";
            provider.priority = 1000;
            provider.can_handle = &ScriptedEngine::can_handle;
            provider.create = &ScriptedEngine::create;
            provider.user_data = nullptr;
            vgl_engine_register_provider(&provider);
        });
        set_script([](const std::vector<float>&) { return std::string(kWakeSentence); });
        calls_ = 0;
        loads_ = 0;
    }

    void set_script(Script script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    size_t transcribe_calls() const { return calls_.load(); }
    size_t model_loads() const { return loads_.load(); }

   private:
    ScriptedEngine() = default;

    std::string run(const float* samples, size_t num_samples) {
        Script script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            script = script_;
        }
        ++calls_;
        return script(std::vector<float>(samples, samples + num_samples));
    }

    static vgl_result_t transcribe(void* /*impl*/, const float* samples, size_t num_samples,
                                   char** out_text) {
        const std::string text = instance().run(samples, num_samples);
        *out_text = static_cast<char*>(std::malloc(text.size() + 1));
        std::memcpy(*out_text, text.c_str(), text.size() + 1);
        return VGL_SUCCESS;
    }

    static void free_text(void* /*impl*/, char* text) { std::free(text); }

    static void destroy(void* /*impl*/) {}

    static vgl_bool_t can_handle(const char* model_path, void* /*user_data*/) {
        return std::strstr(model_path, "unsupported") == nullptr ? VGL_TRUE : VGL_FALSE;
    }

    static vgl_result_t create(const char* model_path, void* /*user_data*/,
                               vgl_engine_t* out_engine) {
        if (std::strstr(model_path, "corrupt") != nullptr) {
            return VGL_ERROR_MODEL_LOAD_FAILED;
        }
        static const vgl_engine_ops_t ops = {&ScriptedEngine::transcribe,
                                             &ScriptedEngine::free_text, &ScriptedEngine::destroy};
        out_engine->ops = &ops;
        out_engine->impl = &instance();
        ++instance().loads_;
        return VGL_SUCCESS;
    }

    std::once_flag registered_;
    std::mutex mutex_;
    Script script_;
    std::atomic<size_t> calls_{0};
    std::atomic<size_t> loads_{0};
};

/** One second of non-silent 16 kHz audio. */
inline std::vector<float> one_second_audio(float value = 0.25f) {
    return std::vector<float>(VGL_ENGINE_SAMPLE_RATE, value);
}

/**
 * Allocator that records every call and refuses double frees.
 */
class CountingAllocator : public vgl::client::Allocator {
   public:
    void* allocate(size_t size) override {
        void* ptr = std::malloc(size);
        std::lock_guard<std::mutex> lock(mutex_);
        ++allocations;
        live_.insert(ptr);
        return ptr;
    }

    void deallocate(void* ptr, size_t /*size*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++deallocations;
        if (live_.erase(ptr) == 0) {
            ++double_frees;
            return;
        }
        std::free(ptr);
    }

    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.size();
    }

    size_t allocations = 0;
    size_t deallocations = 0;
    size_t double_frees = 0;

   private:
    mutable std::mutex mutex_;
    std::set<void*> live_;
};

/**
 * Allocator whose platform hands a non-null sentinel across for empty payloads.
 */
class SentinelAllocator : public CountingAllocator {
   public:
    void* empty_sentinel() override { return &sentinel_; }
    const void* sentinel() const { return &sentinel_; }

   private:
    unsigned char sentinel_ = 0;
};

/**
 * Diagnostics sink that keeps every event.
 */
class RecordingDiagnostics : public vgl::client::DiagnosticsSink {
   public:
    void record(const vgl::client::DiagnosticEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<vgl::client::DiagnosticEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(vgl_log_level_t level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (event.level == level) ++n;
        }
        return n;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<vgl::client::DiagnosticEvent> events_;
};

}  // namespace vgl_test

#endif  // VGL_TESTS_SCRIPTED_ENGINE_H
