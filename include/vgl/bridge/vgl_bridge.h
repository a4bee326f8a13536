/**
 * @file vgl_bridge.h
 * @brief Virgil Commons - Native call boundary
 *
 * Entry points exported by the native engine library. Every pointer
 * returned here is owned by the native side and must be released with
 * vgl_free_buffer(), never with the caller's own allocator.
 *
 * Requests and replies use the encoding in vgl/wire/vgl_codec.h. The reply
 * tag is written to *resp_tag_out so the caller can dispatch on it before
 * decoding the payload. A NULL return means the native side could not
 * produce a reply at all.
 */

#ifndef VGL_BRIDGE_H
#define VGL_BRIDGE_H

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_logger.h"
#include "vgl/core/vgl_types.h"
#include "vgl/wire/vgl_tags.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Delivery channel callback
 *
 * Receives one transcription fragment. The text is borrowed and only valid
 * for the duration of the call.
 *
 * @return VGL_FALSE once the receiving channel is closed
 */
typedef vgl_bool_t (*vgl_delivery_fn)(const char* text, size_t len, void* user_data);

/**
 * @brief Configure native logging (call once at startup)
 */
VGL_API void vgl_setup_logs(vgl_log_level_t level);

/**
 * @brief Load a model and build the initial session context
 *
 * @param model_path Encoded string
 * @param wake_words Encoded sequence of strings
 * @param ctx_len_out Length of the returned encoded Context
 * @return Encoded Context, or NULL on failure
 */
VGL_API void* vgl_init_context(const void* model_path, size_t model_path_len,
                               const void* wake_words, size_t wake_words_len,
                               size_t* ctx_len_out);

/**
 * @brief Send one message to the engine session
 *
 * @param tag A vgl_message_tag_t value
 * @param payload Encoded message payload (may be NULL when payload_len is 0)
 * @param resp_tag_out Receives a vgl_response_tag_t value
 * @param resp_len_out Receives the reply length
 */
VGL_API void* vgl_send_message(uint8_t tag, const void* payload, size_t payload_len,
                               uint8_t* resp_tag_out, size_t* resp_len_out);

/**
 * @brief Run a context-bearing operation
 *
 * @param op VGL_MESSAGE_DETECT_WAKE_WORDS, VGL_MESSAGE_TRANSCRIBE or VGL_MESSAGE_LISTEN
 * @param ctx Encoded Context
 * @param window Encoded AudioWindow, or zero bytes to use the staged audio
 * @return Context followed by the reply body; for an Error reply, the
 *         error string only
 */
VGL_API void* vgl_advance_context(uint8_t op, const void* ctx, size_t ctx_len,
                                  const void* window, size_t window_len, uint8_t* resp_tag_out,
                                  size_t* resp_len_out);

/**
 * @brief Release a buffer returned by any entry point above (NULL is a no-op)
 */
VGL_API void vgl_free_buffer(void* ptr, size_t len);

/**
 * @brief Establish the delivery channel before issuing streaming calls
 */
VGL_API vgl_result_t vgl_register_callback(vgl_delivery_fn fn, void* user_data);

/**
 * @brief Remove the delivery callback installed with the same fn and user_data
 *
 * Another registration is left untouched. Waits for a fragment being
 * delivered to this callback, so once it returns the callback is not
 * invoked again.
 */
VGL_API void vgl_unregister_callback(vgl_delivery_fn fn, void* user_data);

/**
 * @brief Number of native buffers returned but not yet freed
 */
VGL_API size_t vgl_outstanding_buffers(void);

/**
 * @brief Unload the engine and clear session state
 */
VGL_API void vgl_shutdown(void);

// =============================================================================
// BOUNDARY TABLE
// =============================================================================

/**
 * @brief The entry points above as a table of function pointers
 *
 * Filled either from the linked library (vgl_boundary_get_native) or from
 * a library opened at runtime.
 */
typedef struct vgl_boundary {
    void (*setup_logs)(vgl_log_level_t level);
    void* (*init_context)(const void* model_path, size_t model_path_len, const void* wake_words,
                          size_t wake_words_len, size_t* ctx_len_out);
    void* (*send_message)(uint8_t tag, const void* payload, size_t payload_len,
                          uint8_t* resp_tag_out, size_t* resp_len_out);
    void* (*advance_context)(uint8_t op, const void* ctx, size_t ctx_len, const void* window,
                             size_t window_len, uint8_t* resp_tag_out, size_t* resp_len_out);
    void (*free_buffer)(void* ptr, size_t len);
    vgl_result_t (*register_callback)(vgl_delivery_fn fn, void* user_data);
    void (*unregister_callback)(vgl_delivery_fn fn, void* user_data);
    size_t (*outstanding_buffers)(void);
    void (*shutdown)(void);
} vgl_boundary_t;

VGL_API vgl_result_t vgl_boundary_get_native(vgl_boundary_t* out_boundary);

#ifdef __cplusplus
}
#endif

#endif  // VGL_BRIDGE_H
