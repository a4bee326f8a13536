/**
 * @file vgl_error_model.h
 * @brief Virgil Commons - Error categories and retry classification
 *
 * Groups result codes by the range they belong to in vgl_error.h. Both
 * sides of the boundary use the category when logging a failure, and the
 * caller side uses the retry flag to tell a per-call engine failure from a
 * protocol disagreement.
 */

#ifndef VGL_ERROR_MODEL_H
#define VGL_ERROR_MODEL_H

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct vgl_error_model {
    vgl_result_t code;
    const char* message;   /**< vgl_error_message(code) */
    const char* category;  /**< "Model", "Protocol", "Channel", ... */
    vgl_bool_t retryable;  /**< The same call may succeed if issued again */
} vgl_error_model_t;

VGL_API vgl_error_model_t vgl_make_error_model(vgl_result_t code);

/**
 * @brief Category of a result code ("Success" for 0, "Unknown" outside every range)
 */
VGL_API const char* vgl_error_category(vgl_result_t code);

/**
 * @brief Whether a failure with this code is worth retrying
 *
 * Model, inference and engine failures are. Protocol, validation and
 * channel failures repeat on every attempt.
 */
VGL_API vgl_bool_t vgl_error_is_retryable(vgl_result_t code);

#ifdef __cplusplus
}
#endif

#endif  // VGL_ERROR_MODEL_H
