/**
 * @file speech_engine.cpp
 * @brief Virgil Commons - Native engine session implementation
 */

#include "speech_engine.h"

#include <algorithm>
#include <variant>

#include "vgl/core/vgl_audio_utils.h"
#include "vgl/core/vgl_logger.h"
#include "vgl/wire/vgl_errors.h"
#include "wake_words.h"

#ifdef VGL_HAS_WHISPERCPP
#include "vgl/backends/vgl_engine_whispercpp.h"
#endif

namespace vgl {
namespace engine {

namespace {

const char* LOG_CAT = "SpeechEngine";

void register_default_providers() {
    static std::once_flag once;
    std::call_once(once, [] {
#ifdef VGL_HAS_WHISPERCPP
        vgl_result_t result = vgl_backend_whispercpp_register();
        if (result != VGL_SUCCESS && result != VGL_ERROR_PROVIDER_ALREADY_REGISTERED) {
            VGL_LOG_WARNING(LOG_CAT, "whisper.cpp provider unavailable: %s",
                            vgl_error_message(result));
        }
#endif
    });
}

// One engine call per window; a trailing partial window is still transcribed.
// A window longer than the audio covers all of it.
std::vector<std::vector<float>> split_windows(const std::vector<float>& samples,
                                              uint64_t window_ms) {
    const uint64_t audio_ms =
        static_cast<uint64_t>(samples.size()) * 1000 / VGL_ENGINE_SAMPLE_RATE + 1;
    window_ms = std::min(window_ms, audio_ms);
    const size_t window = std::min(
        samples.size(),
        std::max<size_t>(1, static_cast<size_t>(VGL_ENGINE_SAMPLE_RATE * window_ms / 1000)));
    std::vector<std::vector<float>> windows;
    for (size_t offset = 0; offset < samples.size(); offset += window) {
        const size_t end = std::min(samples.size(), offset + window);
        windows.emplace_back(samples.begin() + offset, samples.begin() + end);
    }
    return windows;
}

}  // namespace

SpeechEngine& SpeechEngine::instance() {
    static SpeechEngine engine;
    return engine;
}

SpeechEngine::~SpeechEngine() {
    vgl_engine_destroy(&engine_);
}

// =============================================================================
// ENGINE LIFECYCLE
// =============================================================================

void SpeechEngine::ensure_model(const std::string& model_path) {
    if (model_path.empty()) {
        throw EngineFault("Model path is empty", VGL_ERROR_INVALID_ARGUMENT);
    }
    if (engine_.ops != nullptr && model_path == model_path_) {
        return;
    }

    register_default_providers();

    vgl_engine_t replacement{nullptr, nullptr};
    vgl_result_t result = vgl_engine_create(model_path.c_str(), &replacement);
    if (result != VGL_SUCCESS) {
        throw EngineFault("Failed to load model " + model_path + ": " + vgl_error_message(result),
                          result);
    }

    vgl_engine_destroy(&engine_);
    engine_ = replacement;
    model_path_ = model_path;
    VGL_LOG_INFO(LOG_CAT, "Model loaded: %s", model_path.c_str());
}

std::string SpeechEngine::transcribe(const std::vector<float>& samples) {
    if (engine_.ops == nullptr) {
        throw EngineFault("No model loaded", VGL_ERROR_MODEL_NOT_LOADED);
    }
    if (samples.empty()) {
        return std::string();
    }

    char* raw = nullptr;
    vgl_result_t result = engine_.ops->transcribe(engine_.impl, samples.data(), samples.size(), &raw);
    if (result != VGL_SUCCESS) {
        throw EngineFault(std::string("Transcription failed: ") + vgl_error_message(result), result);
    }

    std::string text = raw != nullptr ? raw : "";
    if (raw != nullptr && engine_.ops->free_text != nullptr) {
        engine_.ops->free_text(engine_.impl, raw);
    }
    return text;
}

wire::Response SpeechEngine::listen(const std::vector<float>& samples, uint64_t window_ms,
                                    std::string& transcript) {
    if (engine_.ops == nullptr) {
        throw EngineFault("No model loaded", VGL_ERROR_MODEL_NOT_LOADED);
    }

    vgl_delivery_fn delivery = nullptr;
    void* user_data = nullptr;
    {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        delivery = delivery_;
        user_data = delivery_user_data_;
    }
    if (delivery == nullptr) {
        return wire::Error{"delivery channel not registered"};
    }

    // Pushes go only to the channel registered when the listen started, and
    // only while it is still registered.
    const auto push = [&](const std::string& fragment) {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        if (delivery_ != delivery || delivery_user_data_ != user_data) {
            return false;
        }
        return delivery(fragment.data(), fragment.size(), user_data) != VGL_FALSE;
    };

    if (window_ms == 0) {
        window_ms = kDefaultListenWindowMs;
    }

    bool open = true;
    transcript.clear();
    for (const auto& window : split_windows(samples, window_ms)) {
        const std::string fragment = transcribe(window);
        if (fragment.empty()) {
            continue;
        }
        if (!transcript.empty()) {
            transcript += ' ';
        }
        transcript += fragment;

        if (open && !push(fragment)) {
            VGL_LOG_DEBUG(LOG_CAT, "Delivery channel closed; remaining fragments not pushed");
            open = false;
        }
    }

    return wire::Text{transcript};
}

// =============================================================================
// OPERATIONS
// =============================================================================

wire::Context SpeechEngine::init_context(const std::string& model_path,
                                         const std::vector<std::string>& wake_words) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_model(model_path);
    wake_words_ = wake_words;

    wire::Context context;
    context.model_path = model_path;
    context.wake_words = wake_words;
    return context;
}

wire::Response SpeechEngine::handle(const wire::Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        switch (wire::tag_of(message)) {
            case wire::MessageTag::LoadModel: {
                const auto& load = std::get<wire::LoadModel>(message);
                ensure_model(load.path);
                return wire::Text{load.path};
            }
            case wire::MessageTag::SetWakeWords:
                wake_words_ = std::get<wire::SetWakeWords>(message).words;
                return wire::Text{""};
            case wire::MessageTag::UpdateAudioData:
                audio_ = std::get<wire::UpdateAudioData>(message).samples;
                VGL_LOG_DEBUG(LOG_CAT, "Staged %zu samples", audio_.size());
                return wire::Text{""};
            case wire::MessageTag::DetectWakeWords:
                return detect_wake_words(transcribe(audio_), wake_words_);
            case wire::MessageTag::Transcribe:
                return wire::Text{strip_wake_phrase(transcribe(audio_), wake_words_)};
            case wire::MessageTag::Debug: {
                const auto& debug = std::get<wire::Debug>(message);
                VGL_LOG_DEBUG(LOG_CAT, "%s", debug.text.c_str());
                return wire::Text{debug.text};
            }
            case wire::MessageTag::Listen: {
                std::string transcript;
                return listen(audio_, std::get<wire::Listen>(message).window_ms, transcript);
            }
        }
    } catch (const EngineFault& e) {
        VGL_LOG_ERROR(LOG_CAT, "[%s] %s", e.category(), e.what());
        return wire::Error{e.what()};
    }

    return wire::Error{"Unknown message tag: " +
                       std::to_string(static_cast<int>(wire::tag_of(message)))};
}

wire::AdvanceResult SpeechEngine::advance(wire::MessageTag op, const wire::Context& context,
                                          const wire::AudioWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);

    wire::AdvanceResult result{context, wire::Text{""}};
    result.context.transcript.clear();

    try {
        ensure_model(context.model_path);
        const std::vector<float>& samples = window.samples.empty() ? audio_ : window.samples;

        switch (op) {
            case wire::MessageTag::DetectWakeWords:
                result.context.transcript = transcribe(samples);
                result.response = detect_wake_words(result.context.transcript, context.wake_words);
                return result;
            case wire::MessageTag::Transcribe:
                result.context.transcript =
                    strip_wake_phrase(transcribe(samples), context.wake_words);
                result.response = wire::Text{result.context.transcript};
                return result;
            case wire::MessageTag::Listen:
                result.response = listen(samples, window.window_ms, result.context.transcript);
                return result;
            case wire::MessageTag::LoadModel:
            case wire::MessageTag::SetWakeWords:
            case wire::MessageTag::UpdateAudioData:
            case wire::MessageTag::Debug:
                break;
        }
    } catch (const EngineFault& e) {
        VGL_LOG_ERROR(LOG_CAT, "[%s] %s", e.category(), e.what());
        result.response = wire::Error{e.what()};
        return result;
    }

    result.response = wire::Error{std::string(wire::message_tag_name(op)) +
                                  " does not operate on a context"};
    return result;
}

// =============================================================================
// DELIVERY CHANNEL
// =============================================================================

vgl_result_t SpeechEngine::register_delivery(vgl_delivery_fn fn, void* user_data) {
    if (fn == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    delivery_ = fn;
    delivery_user_data_ = user_data;
    VGL_LOG_DEBUG(LOG_CAT, "Delivery channel registered");
    return VGL_SUCCESS;
}

void SpeechEngine::unregister_delivery(vgl_delivery_fn fn, void* user_data) {
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    if (delivery_ != fn || delivery_user_data_ != user_data) {
        VGL_LOG_DEBUG(LOG_CAT, "Unregister ignored; callback is not the registered one");
        return;
    }
    delivery_ = nullptr;
    delivery_user_data_ = nullptr;
    VGL_LOG_DEBUG(LOG_CAT, "Delivery channel unregistered");
}

void SpeechEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        delivery_ = nullptr;
        delivery_user_data_ = nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    vgl_engine_destroy(&engine_);
    model_path_.clear();
    wake_words_.clear();
    audio_.clear();
    VGL_LOG_INFO(LOG_CAT, "Engine shut down");
}

}  // namespace engine
}  // namespace vgl
