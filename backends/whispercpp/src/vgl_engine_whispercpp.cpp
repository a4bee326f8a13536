/**
 * @file vgl_engine_whispercpp.cpp
 * @brief Virgil Commons - whisper.cpp engine provider implementation
 */

#include "vgl/backends/vgl_engine_whispercpp.h"

#include <whisper.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include "vgl/core/vgl_logger.h"
#include "vgl/engine/vgl_engine.h"

namespace {

const char* LOG_CAT = "WhisperCPP";

struct WhisperEngine {
    whisper_context* ctx = nullptr;
    int num_threads = 0;
};

std::string trim(const std::string& text) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// =============================================================================
// ENGINE OPS
// =============================================================================

vgl_result_t whisper_engine_transcribe(void* impl, const float* samples, size_t num_samples,
                                       char** out_text) {
    if (impl == nullptr || out_text == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }
    if (samples == nullptr || num_samples == 0) {
        return VGL_ERROR_EMPTY_AUDIO;
    }

    auto* engine = static_cast<WhisperEngine*>(impl);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_realtime = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.translate = false;
    params.language = "en";
    params.n_threads = engine->num_threads;

    const int rc = whisper_full(engine->ctx, params, samples, static_cast<int>(num_samples));
    if (rc != 0) {
        VGL_LOG_ERROR(LOG_CAT, "whisper_full failed: %d", rc);
        return VGL_ERROR_INFERENCE_FAILED;
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(engine->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text(engine->ctx, i);
        if (segment != nullptr) {
            text += segment;
        }
    }
    text = trim(text);

    *out_text = static_cast<char*>(std::malloc(text.size() + 1));
    if (*out_text == nullptr) {
        return VGL_ERROR_OUT_OF_MEMORY;
    }
    std::memcpy(*out_text, text.c_str(), text.size() + 1);

    VGL_LOG_DEBUG(LOG_CAT, "Transcribed %zu samples into %d segments", num_samples, n_segments);
    return VGL_SUCCESS;
}

void whisper_engine_free_text(void* /*impl*/, char* text) {
    std::free(text);
}

void whisper_engine_destroy(void* impl) {
    auto* engine = static_cast<WhisperEngine*>(impl);
    if (engine == nullptr) {
        return;
    }
    if (engine->ctx != nullptr) {
        whisper_free(engine->ctx);
    }
    delete engine;
}

const vgl_engine_ops_t g_whisper_ops = {
    whisper_engine_transcribe,
    whisper_engine_free_text,
    whisper_engine_destroy,
};

// =============================================================================
// PROVIDER
// =============================================================================

/**
 * Handles .bin whisper GGML models.
 */
vgl_bool_t whispercpp_can_handle(const char* model_path, void* /*user_data*/) {
    if (model_path == nullptr) {
        return VGL_FALSE;
    }

    const size_t len = std::strlen(model_path);
    if (len < 4) {
        return VGL_FALSE;
    }

    const char* ext = model_path + len - 4;
    return (std::strcmp(ext, ".bin") == 0 || std::strcmp(ext, ".BIN") == 0) ? VGL_TRUE
                                                                            : VGL_FALSE;
}

vgl_result_t whispercpp_create(const char* model_path, void* /*user_data*/,
                               vgl_engine_t* out_engine) {
    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path, cparams);
    if (ctx == nullptr) {
        VGL_LOG_ERROR(LOG_CAT, "Failed to load model: %s", model_path);
        return VGL_ERROR_MODEL_LOAD_FAILED;
    }

    auto* engine = new WhisperEngine();
    engine->ctx = ctx;
    engine->num_threads =
        static_cast<int>(std::min(4u, std::max(1u, std::thread::hardware_concurrency())));

    out_engine->ops = &g_whisper_ops;
    out_engine->impl = engine;

    VGL_LOG_INFO(LOG_CAT, "Loaded model %s (%d threads)", model_path, engine->num_threads);
    return VGL_SUCCESS;
}

bool g_registered = false;

}  // namespace

// =============================================================================
// REGISTRATION API
// =============================================================================

extern "C" {

vgl_result_t vgl_backend_whispercpp_register(void) {
    if (g_registered) {
        return VGL_ERROR_PROVIDER_ALREADY_REGISTERED;
    }

    vgl_engine_provider_t provider = {};
    provider.name = VGL_WHISPERCPP_PROVIDER_NAME;
    provider.priority = 50;
    provider.can_handle = whispercpp_can_handle;
    provider.create = whispercpp_create;
    provider.user_data = nullptr;

    vgl_result_t result = vgl_engine_register_provider(&provider);
    if (result != VGL_SUCCESS) {
        return result;
    }

    g_registered = true;
    return VGL_SUCCESS;
}

vgl_result_t vgl_backend_whispercpp_unregister(void) {
    if (!g_registered) {
        return VGL_ERROR_PROVIDER_NOT_FOUND;
    }

    vgl_engine_unregister_provider(VGL_WHISPERCPP_PROVIDER_NAME);
    g_registered = false;
    return VGL_SUCCESS;
}

}  // extern "C"
