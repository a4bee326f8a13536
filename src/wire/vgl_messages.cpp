/**
 * @file vgl_messages.cpp
 * @brief Virgil Commons - Message, response and context encoding
 */

#include "vgl/wire/vgl_messages.h"

#include "vgl/wire/vgl_errors.h"

namespace vgl {
namespace wire {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

// =============================================================================
// EQUALITY
// =============================================================================

bool operator==(const LoadModel& a, const LoadModel& b) {
    return a.path == b.path;
}
bool operator==(const SetWakeWords& a, const SetWakeWords& b) {
    return a.words == b.words;
}
bool operator==(const UpdateAudioData& a, const UpdateAudioData& b) {
    return a.samples == b.samples;
}
bool operator==(const DetectWakeWords&, const DetectWakeWords&) {
    return true;
}
bool operator==(const Transcribe&, const Transcribe&) {
    return true;
}
bool operator==(const Debug& a, const Debug& b) {
    return a.text == b.text;
}
bool operator==(const Listen& a, const Listen& b) {
    return a.window_ms == b.window_ms;
}
bool operator==(const Text& a, const Text& b) {
    return a.text == b.text;
}
bool operator==(const WakeWordDetection& a, const WakeWordDetection& b) {
    return a.detected == b.detected && a.start_index == b.start_index &&
           a.end_index == b.end_index;
}
bool operator==(const Error& a, const Error& b) {
    return a.message == b.message;
}
bool operator==(const Context& a, const Context& b) {
    return a.model_path == b.model_path && a.wake_words == b.wake_words &&
           a.transcript == b.transcript;
}
bool operator!=(const Context& a, const Context& b) {
    return !(a == b);
}

// =============================================================================
// MESSAGES
// =============================================================================

MessageTag tag_of(const Message& message) {
    return std::visit(overloaded{
                          [](const LoadModel&) { return MessageTag::LoadModel; },
                          [](const SetWakeWords&) { return MessageTag::SetWakeWords; },
                          [](const UpdateAudioData&) { return MessageTag::UpdateAudioData; },
                          [](const DetectWakeWords&) { return MessageTag::DetectWakeWords; },
                          [](const Transcribe&) { return MessageTag::Transcribe; },
                          [](const Debug&) { return MessageTag::Debug; },
                          [](const Listen&) { return MessageTag::Listen; },
                      },
                      message);
}

const char* message_tag_name(MessageTag tag) {
    switch (tag) {
        case MessageTag::LoadModel:
            return "LoadModel";
        case MessageTag::SetWakeWords:
            return "SetWakeWords";
        case MessageTag::UpdateAudioData:
            return "UpdateAudioData";
        case MessageTag::DetectWakeWords:
            return "DetectWakeWords";
        case MessageTag::Transcribe:
            return "Transcribe";
        case MessageTag::Debug:
            return "Debug";
        case MessageTag::Listen:
            return "Listen";
    }
    return "Unknown";
}

MessageTag parse_message_tag(uint8_t raw) {
    switch (static_cast<MessageTag>(raw)) {
        case MessageTag::LoadModel:
        case MessageTag::SetWakeWords:
        case MessageTag::UpdateAudioData:
        case MessageTag::DetectWakeWords:
        case MessageTag::Transcribe:
        case MessageTag::Debug:
        case MessageTag::Listen:
            return static_cast<MessageTag>(raw);
    }
    throw ProtocolError(VGL_ERROR_PROTOCOL_UNKNOWN_TAG,
                        "Unknown message tag: " + std::to_string(raw));
}

Bytes encode_message(const Message& message) {
    Writer writer;
    std::visit(overloaded{
                   [&](const LoadModel& m) { writer.write_string(m.path); },
                   [&](const SetWakeWords& m) { writer.write_string_seq(m.words); },
                   [&](const UpdateAudioData& m) { writer.write_f32_seq(m.samples); },
                   [](const DetectWakeWords&) {},
                   [](const Transcribe&) {},
                   [&](const Debug& m) { writer.write_string(m.text); },
                   [&](const Listen& m) { writer.write_u64(m.window_ms); },
               },
               message);
    return writer.take();
}

Message decode_message(uint8_t tag, const uint8_t* data, size_t size) {
    const MessageTag parsed = parse_message_tag(tag);
    Reader reader(data, size);
    Message message;
    switch (parsed) {
        case MessageTag::LoadModel:
            message = LoadModel{reader.read_string()};
            break;
        case MessageTag::SetWakeWords:
            message = SetWakeWords{reader.read_string_seq()};
            break;
        case MessageTag::UpdateAudioData:
            message = UpdateAudioData{reader.read_f32_seq()};
            break;
        case MessageTag::DetectWakeWords:
            message = DetectWakeWords{};
            break;
        case MessageTag::Transcribe:
            message = Transcribe{};
            break;
        case MessageTag::Debug:
            message = Debug{reader.read_string()};
            break;
        case MessageTag::Listen:
            message = Listen{reader.read_u64()};
            break;
    }
    reader.expect_end();
    return message;
}

// =============================================================================
// RESPONSES
// =============================================================================

ResponseTag tag_of(const Response& response) {
    return std::visit(overloaded{
                          [](const Text&) { return ResponseTag::Text; },
                          [](const WakeWordDetection&) { return ResponseTag::WakeWordDetection; },
                          [](const Error&) { return ResponseTag::Error; },
                      },
                      response);
}

const char* response_tag_name(ResponseTag tag) {
    switch (tag) {
        case ResponseTag::Text:
            return "Text";
        case ResponseTag::WakeWordDetection:
            return "WakeWordDetection";
        case ResponseTag::Error:
            return "Error";
    }
    return "Unknown";
}

ResponseTag parse_response_tag(uint8_t raw) {
    switch (static_cast<ResponseTag>(raw)) {
        case ResponseTag::Text:
        case ResponseTag::WakeWordDetection:
        case ResponseTag::Error:
            return static_cast<ResponseTag>(raw);
    }
    throw ProtocolError(VGL_ERROR_PROTOCOL_UNKNOWN_TAG,
                        "Unknown response tag: " + std::to_string(raw));
}

void write_response(Writer& writer, const Response& response) {
    std::visit(overloaded{
                   [&](const Text& r) { writer.write_string(r.text); },
                   [&](const WakeWordDetection& r) {
                       writer.write_bool(r.detected);
                       writer.write_optional_u64(r.start_index);
                       writer.write_optional_u64(r.end_index);
                   },
                   [&](const Error& r) { writer.write_string(r.message); },
               },
               response);
}

Response read_response(ResponseTag tag, Reader& reader) {
    switch (tag) {
        case ResponseTag::Text:
            return Text{reader.read_string()};
        case ResponseTag::WakeWordDetection: {
            WakeWordDetection detection;
            detection.detected = reader.read_bool();
            detection.start_index = reader.read_optional_u64();
            detection.end_index = reader.read_optional_u64();
            return detection;
        }
        case ResponseTag::Error:
            return Error{reader.read_string()};
    }
    throw ProtocolError(VGL_ERROR_PROTOCOL_UNKNOWN_TAG,
                        "Unknown response tag: " + std::to_string(static_cast<int>(tag)));
}

Bytes encode_response(const Response& response) {
    Writer writer;
    write_response(writer, response);
    return writer.take();
}

Response decode_response(uint8_t tag, const uint8_t* data, size_t size) {
    const ResponseTag parsed = parse_response_tag(tag);
    Reader reader(data, size);
    Response response = read_response(parsed, reader);
    reader.expect_end();
    return response;
}

// =============================================================================
// CONTEXT
// =============================================================================

void write_context(Writer& writer, const Context& context) {
    writer.write_string(context.model_path);
    writer.write_string_seq(context.wake_words);
    writer.write_string(context.transcript);
}

Context read_context(Reader& reader) {
    Context context;
    context.model_path = reader.read_string();
    context.wake_words = reader.read_string_seq();
    context.transcript = reader.read_string();
    return context;
}

Bytes encode_context(const Context& context) {
    Writer writer;
    write_context(writer, context);
    return writer.take();
}

Context decode_context(const uint8_t* data, size_t size) {
    Reader reader(data, size);
    Context context = read_context(reader);
    reader.expect_end();
    return context;
}

Bytes encode_window(const AudioWindow& window) {
    if (window.samples.empty() && window.window_ms == 0) {
        return {};
    }
    Writer writer;
    writer.write_f32_seq(window.samples);
    writer.write_u64(window.window_ms);
    return writer.take();
}

AudioWindow decode_window(const uint8_t* data, size_t size) {
    AudioWindow window;
    if (size == 0) {
        return window;
    }
    Reader reader(data, size);
    window.samples = reader.read_f32_seq();
    window.window_ms = reader.read_u64();
    reader.expect_end();
    return window;
}

Bytes encode_advance_reply(const Context& context, const Response& response) {
    Writer writer;
    if (!std::holds_alternative<Error>(response)) {
        write_context(writer, context);
    }
    write_response(writer, response);
    return writer.take();
}

AdvanceResult decode_advance_reply(uint8_t tag, const uint8_t* data, size_t size,
                                   const Context& previous) {
    const ResponseTag parsed = parse_response_tag(tag);
    Reader reader(data, size);
    if (parsed == ResponseTag::Error) {
        Response response = read_response(parsed, reader);
        reader.expect_end();
        return AdvanceResult{previous, std::move(response)};
    }
    Context context = read_context(reader);
    Response response = read_response(parsed, reader);
    reader.expect_end();
    return AdvanceResult{std::move(context), std::move(response)};
}

}  // namespace wire
}  // namespace vgl
