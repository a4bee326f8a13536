/**
 * @file speech_engine.h
 * @brief Virgil Commons - Native engine session
 *
 * Holds the loaded engine, the session wake words and the staged audio
 * behind a single mutex. The underlying engines are not reentrant, so every
 * operation that touches them is serialized here regardless of how the
 * caller schedules its calls.
 */

#ifndef VGL_SPEECH_ENGINE_H
#define VGL_SPEECH_ENGINE_H

#include <mutex>
#include <string>
#include <vector>

#include "vgl/bridge/vgl_bridge.h"
#include "vgl/engine/vgl_engine.h"
#include "vgl/wire/vgl_messages.h"

namespace vgl {
namespace engine {

constexpr uint64_t kDefaultListenWindowMs = 1000;

class SpeechEngine {
   public:
    static SpeechEngine& instance();

    SpeechEngine(const SpeechEngine&) = delete;
    SpeechEngine& operator=(const SpeechEngine&) = delete;

    /**
     * Load (or reuse) the model and return the initial context.
     * @throws EngineFault if no provider can load the model
     */
    wire::Context init_context(const std::string& model_path,
                               const std::vector<std::string>& wake_words);

    /** Session-level operations. Failures are reported as an Error reply. */
    wire::Response handle(const wire::Message& message);

    /**
     * Context-bearing operations. The returned context keeps the input's
     * model path and wake words and carries only this call's transcript.
     */
    wire::AdvanceResult advance(wire::MessageTag op, const wire::Context& context,
                                const wire::AudioWindow& window);

    vgl_result_t register_delivery(vgl_delivery_fn fn, void* user_data);

    /**
     * Clears the callback only if fn and user_data are the current
     * registration. Blocks while a fragment is being pushed to it.
     */
    void unregister_delivery(vgl_delivery_fn fn, void* user_data);

    void shutdown();

   private:
    SpeechEngine() = default;
    ~SpeechEngine();

    // All private helpers expect mutex_ to be held.
    void ensure_model(const std::string& model_path);
    std::string transcribe(const std::vector<float>& samples);
    wire::Response listen(const std::vector<float>& samples, uint64_t window_ms,
                          std::string& transcript);

    std::mutex mutex_;
    vgl_engine_t engine_{nullptr, nullptr};
    std::string model_path_;
    std::vector<std::string> wake_words_;
    std::vector<float> audio_;

    // Held for the duration of every push
    std::mutex delivery_mutex_;
    vgl_delivery_fn delivery_ = nullptr;
    void* delivery_user_data_ = nullptr;
};

}  // namespace engine
}  // namespace vgl

#endif  // VGL_SPEECH_ENGINE_H
