/**
 * @file engine_registry.cpp
 * @brief Virgil Commons - Engine provider registry implementation
 *
 * Providers are kept sorted by priority; creation walks them in order and
 * uses the first one whose can_handle accepts the model path.
 */

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

#include "vgl/core/vgl_logger.h"
#include "vgl/engine/vgl_engine.h"

// =============================================================================
// INTERNAL STORAGE
// =============================================================================

namespace {

const char* LOG_CAT = "EngineRegistry";

struct ProviderEntry {
    std::string name;
    int32_t priority;
    vgl_engine_can_handle_fn can_handle;
    vgl_engine_create_fn create;
    void* user_data;
};

std::mutex g_registry_mutex;
std::vector<ProviderEntry> g_providers;

}  // namespace

// =============================================================================
// ENGINE REGISTRATION API
// =============================================================================

extern "C" {

vgl_result_t vgl_engine_register_provider(const vgl_engine_provider_t* provider) {
    if (provider == nullptr || provider->name == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }

    if (provider->can_handle == nullptr || provider->create == nullptr) {
        VGL_LOG_ERROR(LOG_CAT, "Provider %s: can_handle and create are required", provider->name);
        return VGL_ERROR_NULL_POINTER;
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);

    const std::string name = provider->name;
    auto existing = std::find_if(g_providers.begin(), g_providers.end(),
                                 [&name](const ProviderEntry& entry) { return entry.name == name; });
    if (existing != g_providers.end()) {
        return VGL_ERROR_PROVIDER_ALREADY_REGISTERED;
    }

    ProviderEntry entry;
    entry.name = name;
    entry.priority = provider->priority;
    entry.can_handle = provider->can_handle;
    entry.create = provider->create;
    entry.user_data = provider->user_data;
    g_providers.push_back(std::move(entry));

    // Higher priority first; stable so equal priorities keep registration order
    std::stable_sort(
        g_providers.begin(), g_providers.end(),
        [](const ProviderEntry& a, const ProviderEntry& b) { return a.priority > b.priority; });

    VGL_LOG_INFO(LOG_CAT, "Registered engine provider: %s (priority %d)", name.c_str(),
                 provider->priority);
    return VGL_SUCCESS;
}

vgl_result_t vgl_engine_unregister_provider(const char* name) {
    if (name == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);

    auto remove_it =
        std::remove_if(g_providers.begin(), g_providers.end(),
                       [name](const ProviderEntry& entry) { return entry.name == name; });
    if (remove_it == g_providers.end()) {
        return VGL_ERROR_PROVIDER_NOT_FOUND;
    }

    g_providers.erase(remove_it, g_providers.end());
    return VGL_SUCCESS;
}

vgl_result_t vgl_engine_create(const char* model_path, vgl_engine_t* out_engine) {
    if (model_path == nullptr || out_engine == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }

    out_engine->ops = nullptr;
    out_engine->impl = nullptr;

    // Copy the candidates so a slow model load does not hold the registry lock
    std::vector<ProviderEntry> candidates;
    {
        std::lock_guard<std::mutex> lock(g_registry_mutex);
        candidates = g_providers;
    }

    if (candidates.empty()) {
        VGL_LOG_ERROR(LOG_CAT, "No engine providers registered");
        return VGL_ERROR_NO_CAPABLE_ENGINE;
    }

    vgl_result_t last_error = VGL_ERROR_NO_CAPABLE_ENGINE;
    for (const auto& provider : candidates) {
        if (!provider.can_handle(model_path, provider.user_data)) {
            continue;
        }

        vgl_result_t result = provider.create(model_path, provider.user_data, out_engine);
        if (result == VGL_SUCCESS && out_engine->ops != nullptr) {
            VGL_LOG_DEBUG(LOG_CAT, "Engine created by provider: %s", provider.name.c_str());
            return VGL_SUCCESS;
        }

        VGL_LOG_WARNING(LOG_CAT, "Provider %s failed to load %s: %s", provider.name.c_str(),
                        model_path, vgl_error_message(result));
        last_error = result != VGL_SUCCESS ? result : VGL_ERROR_MODEL_LOAD_FAILED;
    }

    return last_error;
}

void vgl_engine_destroy(vgl_engine_t* engine) {
    if (engine == nullptr) {
        return;
    }
    if (engine->ops != nullptr && engine->ops->destroy != nullptr) {
        engine->ops->destroy(engine->impl);
    }
    engine->ops = nullptr;
    engine->impl = nullptr;
}

size_t vgl_engine_provider_count(void) {
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    return g_providers.size();
}

}  // extern "C"
