/**
 * @file vgl_error.cpp
 * @brief Virgil Commons - Result code messages
 */

#include "vgl/core/vgl_error.h"

extern "C" {

const char* vgl_error_message(vgl_result_t code) {
    switch (code) {
        case VGL_SUCCESS:
            return "Success";
        case VGL_ERROR_NOT_INITIALIZED:
            return "Not initialized";
        case VGL_ERROR_ALREADY_INITIALIZED:
            return "Already initialized";
        case VGL_ERROR_MODEL_NOT_LOADED:
            return "No model loaded";
        case VGL_ERROR_MODEL_LOAD_FAILED:
            return "Failed to load model";
        case VGL_ERROR_NO_CAPABLE_ENGINE:
            return "No engine provider can handle the model";
        case VGL_ERROR_INFERENCE_FAILED:
            return "Inference failed";
        case VGL_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case VGL_ERROR_NULL_POINTER:
            return "Null pointer";
        case VGL_ERROR_INVALID_HANDLE:
            return "Invalid handle";
        case VGL_ERROR_EMPTY_AUDIO:
            return "No audio data";
        case VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT:
            return "Unsupported audio format";
        case VGL_ERROR_PROTOCOL_UNKNOWN_TAG:
            return "Unknown tag";
        case VGL_ERROR_PROTOCOL_TRUNCATED:
            return "Truncated buffer";
        case VGL_ERROR_PROTOCOL_MALFORMED:
            return "Malformed value";
        case VGL_ERROR_PROTOCOL_TRAILING_BYTES:
            return "Trailing bytes after value";
        case VGL_ERROR_PROTOCOL_SHAPE_MISMATCH:
            return "Unexpected response shape";
        case VGL_ERROR_PROVIDER_NOT_FOUND:
            return "Engine provider not found";
        case VGL_ERROR_PROVIDER_ALREADY_REGISTERED:
            return "Engine provider already registered";
        case VGL_ERROR_ENGINE_FAULT:
            return "Engine reported an error";
        case VGL_ERROR_NULL_RESPONSE:
            return "Invalid response from native engine";
        case VGL_ERROR_CHANNEL_CLOSED:
            return "Delivery channel closed";
        case VGL_ERROR_CHANNEL_NOT_REGISTERED:
            return "Delivery channel not registered";
        case VGL_ERROR_READER_ATTACHED:
            return "Delivery channel already has a reader";
        case VGL_ERROR_OUT_OF_MEMORY:
            return "Out of memory";
        case VGL_ERROR_INTERNAL:
            return "Internal error";
        case VGL_ERROR_NOT_SUPPORTED:
            return "Not supported";
        case VGL_ERROR_FILE_NOT_FOUND:
            return "File not found";
        case VGL_ERROR_CONFIG_INVALID:
            return "Invalid configuration";
        default:
            return "Unknown error";
    }
}

}  // extern "C"
