#include "vgl/client/vgl_dispatcher.h"

#include <utility>

namespace vgl {
namespace client {

const char* const kNullResponseMessage = "Invalid response from native engine";

namespace {

const char* COMPONENT = "Dispatcher";

}  // namespace

Dispatcher::Dispatcher(const Boundary& boundary, Allocator& allocator,
                       DiagnosticsSink& diagnostics, OwnershipTracker* tracker)
    : boundary_(boundary), allocator_(allocator), diagnostics_(diagnostics), tracker_(tracker) {}

void Dispatcher::report(vgl_log_level_t level, const std::string& message) const {
    diagnostics_.record(DiagnosticEvent{level, COMPONENT, message});
}

wire::Response Dispatcher::dispatch(const wire::Message& message) const {
    const wire::MessageTag tag = wire::tag_of(message);
    CallerBuffer request = make_caller_buffer(allocator_, wire::encode_message(message), tracker_);

    uint8_t resp_tag = 0;
    size_t resp_len = 0;
    void* reply = boundary_.table().send_message(static_cast<uint8_t>(tag), request.data(),
                                                 request.size(), &resp_tag, &resp_len);
    if (reply == nullptr) {
        report(VGL_LOG_LEVEL_ERROR,
               std::string(wire::message_tag_name(tag)) + ": null reply from native engine");
        return wire::Error{kNullResponseMessage};
    }
    CalleeBuffer response = boundary_.adopt(reply, resp_len, tracker_);

    try {
        return wire::decode_response(resp_tag, response.bytes(), response.size());
    } catch (const ProtocolError& e) {
        report(VGL_LOG_LEVEL_ERROR,
               std::string(wire::message_tag_name(tag)) + ": undecodable reply [" + e.category() +
                   "]: " + e.what());
        throw;
    }
}

wire::Context Dispatcher::initialize(const std::string& model_path,
                                     const std::vector<std::string>& wake_words) const {
    CallerBuffer path = make_caller_buffer(allocator_, wire::encode_string(model_path), tracker_);
    CallerBuffer words =
        make_caller_buffer(allocator_, wire::encode_strings(wake_words), tracker_);

    size_t ctx_len = 0;
    void* reply = boundary_.table().init_context(path.data(), path.size(), words.data(),
                                                 words.size(), &ctx_len);
    if (reply == nullptr) {
        report(VGL_LOG_LEVEL_ERROR, "init_context failed for model " + model_path);
        throw EngineFault(kNullResponseMessage, VGL_ERROR_NULL_RESPONSE);
    }
    CalleeBuffer context = boundary_.adopt(reply, ctx_len, tracker_);

    try {
        wire::Context decoded = wire::decode_context(context.bytes(), context.size());
        report(VGL_LOG_LEVEL_INFO, "Context initialized for model " + decoded.model_path);
        return decoded;
    } catch (const ProtocolError& e) {
        report(VGL_LOG_LEVEL_ERROR,
               std::string("undecodable context [") + e.category() + "]: " + e.what());
        throw;
    }
}

wire::AdvanceResult Dispatcher::advance(wire::MessageTag op, const wire::Context& context,
                                        const wire::AudioWindow& window) const {
    CallerBuffer ctx = make_caller_buffer(allocator_, wire::encode_context(context), tracker_);
    CallerBuffer audio = make_caller_buffer(allocator_, wire::encode_window(window), tracker_);

    uint8_t resp_tag = 0;
    size_t resp_len = 0;
    void* reply =
        boundary_.table().advance_context(static_cast<uint8_t>(op), ctx.data(), ctx.size(),
                                          audio.data(), audio.size(), &resp_tag, &resp_len);
    if (reply == nullptr) {
        report(VGL_LOG_LEVEL_ERROR,
               std::string(wire::message_tag_name(op)) + ": null reply from native engine");
        return wire::AdvanceResult{context, wire::Error{kNullResponseMessage}};
    }
    CalleeBuffer response = boundary_.adopt(reply, resp_len, tracker_);

    try {
        return wire::decode_advance_reply(resp_tag, response.bytes(), response.size(), context);
    } catch (const ProtocolError& e) {
        report(VGL_LOG_LEVEL_ERROR,
               std::string(wire::message_tag_name(op)) + ": undecodable reply [" + e.category() +
                   "]: " + e.what());
        throw;
    }
}

// =============================================================================
// RESPONSE HELPERS
// =============================================================================

wire::Response unwrap(wire::Response response) {
    if (const auto* error = std::get_if<wire::Error>(&response)) {
        throw EngineFault(error->message);
    }
    return response;
}

std::string unwrap_text(const wire::Response& response) {
    wire::Response checked = unwrap(response);
    if (auto* text = std::get_if<wire::Text>(&checked)) {
        return std::move(text->text);
    }
    throw ProtocolError(VGL_ERROR_PROTOCOL_SHAPE_MISMATCH,
                        std::string("expected Text, got ") +
                            wire::response_tag_name(wire::tag_of(checked)));
}

wire::WakeWordDetection unwrap_detection(const wire::Response& response) {
    wire::Response checked = unwrap(response);
    if (const auto* detection = std::get_if<wire::WakeWordDetection>(&checked)) {
        return *detection;
    }
    throw ProtocolError(VGL_ERROR_PROTOCOL_SHAPE_MISMATCH,
                        std::string("expected WakeWordDetection, got ") +
                            wire::response_tag_name(wire::tag_of(checked)));
}

}  // namespace client
}  // namespace vgl
