/**
 * @file vgl_error.h
 * @brief Virgil Commons - Result codes
 *
 * Codes are negative and grouped in ranges so that vgl_error_category()
 * can classify them without a lookup table.
 */

#ifndef VGL_ERROR_H
#define VGL_ERROR_H

#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VGL_SUCCESS 0

// Initialization (-100 .. -109)
#define VGL_ERROR_NOT_INITIALIZED (-100)
#define VGL_ERROR_ALREADY_INITIALIZED (-101)

// Model (-110 .. -129)
#define VGL_ERROR_MODEL_NOT_LOADED (-110)
#define VGL_ERROR_MODEL_LOAD_FAILED (-111)
#define VGL_ERROR_NO_CAPABLE_ENGINE (-112)

// Inference (-130 .. -149)
#define VGL_ERROR_INFERENCE_FAILED (-130)

// Validation (-250 .. -279)
#define VGL_ERROR_INVALID_ARGUMENT (-250)
#define VGL_ERROR_NULL_POINTER (-251)
#define VGL_ERROR_INVALID_HANDLE (-252)

// Audio (-280 .. -299)
#define VGL_ERROR_EMPTY_AUDIO (-280)
#define VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT (-281)

// Protocol (-380 .. -399)
#define VGL_ERROR_PROTOCOL_UNKNOWN_TAG (-380)
#define VGL_ERROR_PROTOCOL_TRUNCATED (-381)
#define VGL_ERROR_PROTOCOL_MALFORMED (-382)
#define VGL_ERROR_PROTOCOL_TRAILING_BYTES (-383)
#define VGL_ERROR_PROTOCOL_SHAPE_MISMATCH (-384)

// Engine providers (-400 .. -499)
#define VGL_ERROR_PROVIDER_NOT_FOUND (-400)
#define VGL_ERROR_PROVIDER_ALREADY_REGISTERED (-401)

// Engine (-600 .. -699)
#define VGL_ERROR_ENGINE_FAULT (-600)
#define VGL_ERROR_NULL_RESPONSE (-601)

// Delivery channel (-700 .. -799)
#define VGL_ERROR_CHANNEL_CLOSED (-700)
#define VGL_ERROR_CHANNEL_NOT_REGISTERED (-701)
#define VGL_ERROR_READER_ATTACHED (-702)

// Other (-800 .. -899)
#define VGL_ERROR_OUT_OF_MEMORY (-800)
#define VGL_ERROR_INTERNAL (-801)
#define VGL_ERROR_NOT_SUPPORTED (-802)
#define VGL_ERROR_FILE_NOT_FOUND (-803)
#define VGL_ERROR_CONFIG_INVALID (-804)

/**
 * @brief Get a static, human-readable message for a result code
 *
 * @param code Result code
 * @return Never NULL
 */
VGL_API const char* vgl_error_message(vgl_result_t code);

#ifdef __cplusplus
}
#endif

#endif  // VGL_ERROR_H
