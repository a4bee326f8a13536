/**
 * @file vgl_engine_whispercpp.h
 * @brief Virgil Commons - whisper.cpp engine provider
 *
 * Handles GGML Whisper models (".bin"). Registered automatically the first
 * time the native side needs an engine when built with VGL_HAS_WHISPERCPP.
 */

#ifndef VGL_ENGINE_WHISPERCPP_H
#define VGL_ENGINE_WHISPERCPP_H

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VGL_WHISPERCPP_PROVIDER_NAME "WhisperCPPEngine"

VGL_API vgl_result_t vgl_backend_whispercpp_register(void);

VGL_API vgl_result_t vgl_backend_whispercpp_unregister(void);

#ifdef __cplusplus
}
#endif

#endif  // VGL_ENGINE_WHISPERCPP_H
