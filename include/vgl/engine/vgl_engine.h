/**
 * @file vgl_engine.h
 * @brief Virgil Commons - Speech engine provider registry
 *
 * The native side never recognises speech itself. It asks the registry for
 * the highest-priority provider whose can_handle() accepts the model path and
 * lets that provider create the engine.
 */

#ifndef VGL_ENGINE_H
#define VGL_ENGINE_H

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Operations implemented by an engine instance
 */
typedef struct vgl_engine_ops {
    /**
     * Transcribe 16 kHz mono float32 samples.
     * On success *out_text is allocated by the engine and released with free_text.
     */
    vgl_result_t (*transcribe)(void* impl, const float* samples, size_t num_samples,
                               char** out_text);

    /** Release text returned by transcribe */
    void (*free_text)(void* impl, char* text);

    /** Destroy the engine instance */
    void (*destroy)(void* impl);
} vgl_engine_ops_t;

/**
 * @brief An engine instance: an ops table plus its private state
 */
typedef struct vgl_engine {
    const vgl_engine_ops_t* ops;
    void* impl;
} vgl_engine_t;

typedef vgl_bool_t (*vgl_engine_can_handle_fn)(const char* model_path, void* user_data);

typedef vgl_result_t (*vgl_engine_create_fn)(const char* model_path, void* user_data,
                                             vgl_engine_t* out_engine);

/**
 * @brief Engine provider registration
 */
typedef struct vgl_engine_provider {
    const char* name;                    /**< Unique provider name */
    int32_t priority;                    /**< Higher is tried first */
    vgl_engine_can_handle_fn can_handle; /**< Required */
    vgl_engine_create_fn create;         /**< Required */
    void* user_data;                     /**< Passed to both callbacks */
} vgl_engine_provider_t;

VGL_API vgl_result_t vgl_engine_register_provider(const vgl_engine_provider_t* provider);

VGL_API vgl_result_t vgl_engine_unregister_provider(const char* name);

/**
 * @brief Create an engine with the first provider that can handle model_path
 *
 * @return VGL_SUCCESS, VGL_ERROR_NO_CAPABLE_ENGINE or the provider's error
 */
VGL_API vgl_result_t vgl_engine_create(const char* model_path, vgl_engine_t* out_engine);

/**
 * @brief Destroy an engine created by vgl_engine_create (safe on a zeroed struct)
 */
VGL_API void vgl_engine_destroy(vgl_engine_t* engine);

/**
 * @brief Number of registered providers
 */
VGL_API size_t vgl_engine_provider_count(void);

#ifdef __cplusplus
}
#endif

#endif  // VGL_ENGINE_H
