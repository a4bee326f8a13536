/**
 * @file vgl_bridge.cpp
 * @brief Virgil Commons - Exported boundary entry points
 *
 * Each entry point decodes its arguments, runs the operation on the engine
 * session and encodes the reply into a ledger-owned buffer. No exception
 * escapes through the C ABI: decode failures and engine failures both come
 * back as an Error reply.
 */

#include "vgl/bridge/vgl_bridge.h"

#include <exception>
#include <string>

#include "buffer_ledger.h"
#include "vgl/core/vgl_logger.h"
#include "vgl/wire/vgl_errors.h"
#include "vgl/wire/vgl_messages.h"
#include "engine/speech_engine.h"

using vgl::bridge::BufferLedger;
using vgl::engine::SpeechEngine;

namespace {

const char* LOG_CAT = "Bridge";

const uint8_t* as_bytes(const void* ptr) {
    return static_cast<const uint8_t*>(ptr);
}

void* emit(const vgl::wire::Bytes& bytes, vgl::wire::ResponseTag tag, uint8_t* resp_tag_out,
           size_t* resp_len_out) {
    void* ptr = BufferLedger::instance().allocate(bytes);
    if (ptr == nullptr) {
        return nullptr;
    }
    *resp_tag_out = static_cast<uint8_t>(tag);
    *resp_len_out = bytes.size();
    return ptr;
}

void* emit_response(const vgl::wire::Response& response, uint8_t* resp_tag_out,
                    size_t* resp_len_out) {
    return emit(vgl::wire::encode_response(response), vgl::wire::tag_of(response), resp_tag_out,
                resp_len_out);
}

void* emit_error(const std::string& message, uint8_t* resp_tag_out, size_t* resp_len_out) {
    return emit_response(vgl::wire::Error{message}, resp_tag_out, resp_len_out);
}

bool is_known_message_tag(uint8_t tag) {
    try {
        vgl::wire::parse_message_tag(tag);
        return true;
    } catch (const vgl::ProtocolError&) {
        return false;
    }
}

}  // namespace

extern "C" {

void vgl_setup_logs(vgl_log_level_t level) {
    vgl_logger_set_min_level(level);
    VGL_LOG_INFO(LOG_CAT, "Native logging at level %s", vgl_log_level_name(level));
}

void* vgl_init_context(const void* model_path, size_t model_path_len, const void* wake_words,
                       size_t wake_words_len, size_t* ctx_len_out) {
    if (ctx_len_out == nullptr) {
        return nullptr;
    }

    try {
        const std::string path = vgl::wire::decode_string(as_bytes(model_path), model_path_len);
        const std::vector<std::string> words =
            vgl::wire::decode_strings(as_bytes(wake_words), wake_words_len);

        const vgl::wire::Context context = SpeechEngine::instance().init_context(path, words);
        const vgl::wire::Bytes bytes = vgl::wire::encode_context(context);

        void* ptr = BufferLedger::instance().allocate(bytes);
        if (ptr != nullptr) {
            *ctx_len_out = bytes.size();
        }
        return ptr;
    } catch (const std::exception& e) {
        VGL_LOG_ERROR(LOG_CAT, "init_context failed: %s", e.what());
        return nullptr;
    }
}

void* vgl_send_message(uint8_t tag, const void* payload, size_t payload_len,
                       uint8_t* resp_tag_out, size_t* resp_len_out) {
    if (resp_tag_out == nullptr || resp_len_out == nullptr) {
        return nullptr;
    }

    try {
        if (!is_known_message_tag(tag)) {
            VGL_LOG_WARNING(LOG_CAT, "Unknown message tag: %u", static_cast<unsigned>(tag));
            return emit_error("Unknown message tag: " + std::to_string(tag), resp_tag_out,
                              resp_len_out);
        }

        vgl::wire::Message message;
        try {
            message = vgl::wire::decode_message(tag, as_bytes(payload), payload_len);
        } catch (const vgl::ProtocolError& e) {
            VGL_LOG_ERROR(LOG_CAT, "Malformed payload for tag %u: %s", static_cast<unsigned>(tag),
                          e.what());
            return emit_error(std::string("Malformed payload: ") + e.what(), resp_tag_out,
                              resp_len_out);
        }

        return emit_response(SpeechEngine::instance().handle(message), resp_tag_out,
                             resp_len_out);
    } catch (const std::exception& e) {
        VGL_LOG_ERROR(LOG_CAT, "send_message failed: %s", e.what());
        return emit_error(e.what(), resp_tag_out, resp_len_out);
    }
}

void* vgl_advance_context(uint8_t op, const void* ctx, size_t ctx_len, const void* window,
                          size_t window_len, uint8_t* resp_tag_out, size_t* resp_len_out) {
    if (resp_tag_out == nullptr || resp_len_out == nullptr) {
        return nullptr;
    }

    try {
        if (!is_known_message_tag(op)) {
            return emit_error("Unknown message tag: " + std::to_string(op), resp_tag_out,
                              resp_len_out);
        }

        vgl::wire::Context context;
        vgl::wire::AudioWindow audio;
        try {
            context = vgl::wire::decode_context(as_bytes(ctx), ctx_len);
            audio = vgl::wire::decode_window(as_bytes(window), window_len);
        } catch (const vgl::ProtocolError& e) {
            VGL_LOG_ERROR(LOG_CAT, "Malformed context or window: %s", e.what());
            return emit_error(std::string("Malformed payload: ") + e.what(), resp_tag_out,
                              resp_len_out);
        }

        const vgl::wire::AdvanceResult result = SpeechEngine::instance().advance(
            static_cast<vgl::wire::MessageTag>(op), context, audio);
        return emit(vgl::wire::encode_advance_reply(result.context, result.response),
                    vgl::wire::tag_of(result.response), resp_tag_out, resp_len_out);
    } catch (const std::exception& e) {
        VGL_LOG_ERROR(LOG_CAT, "advance_context failed: %s", e.what());
        return emit_error(e.what(), resp_tag_out, resp_len_out);
    }
}

void vgl_free_buffer(void* ptr, size_t len) {
    BufferLedger::instance().release(ptr, len);
}

vgl_result_t vgl_register_callback(vgl_delivery_fn fn, void* user_data) {
    return SpeechEngine::instance().register_delivery(fn, user_data);
}

void vgl_unregister_callback(vgl_delivery_fn fn, void* user_data) {
    SpeechEngine::instance().unregister_delivery(fn, user_data);
}

size_t vgl_outstanding_buffers(void) {
    return BufferLedger::instance().outstanding();
}

void vgl_shutdown(void) {
    SpeechEngine::instance().shutdown();
}

vgl_result_t vgl_boundary_get_native(vgl_boundary_t* out_boundary) {
    if (out_boundary == nullptr) {
        return VGL_ERROR_NULL_POINTER;
    }

    out_boundary->setup_logs = vgl_setup_logs;
    out_boundary->init_context = vgl_init_context;
    out_boundary->send_message = vgl_send_message;
    out_boundary->advance_context = vgl_advance_context;
    out_boundary->free_buffer = vgl_free_buffer;
    out_boundary->register_callback = vgl_register_callback;
    out_boundary->unregister_callback = vgl_unregister_callback;
    out_boundary->outstanding_buffers = vgl_outstanding_buffers;
    out_boundary->shutdown = vgl_shutdown;
    return VGL_SUCCESS;
}

}  // extern "C"
