/**
 * @file vgl_messages.h
 * @brief Virgil Commons - Typed messages, responses and session context
 *
 * Message and Response are closed variant sets. Every switch over their
 * tags is exhaustive, so adding a variant fails to compile until both the
 * encoder and decoder handle it.
 */

#ifndef VGL_MESSAGES_H
#define VGL_MESSAGES_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "vgl/wire/vgl_codec.h"
#include "vgl/wire/vgl_tags.h"

namespace vgl {
namespace wire {

// =============================================================================
// MESSAGES
// =============================================================================

enum class MessageTag : uint8_t {
    LoadModel = VGL_MESSAGE_LOAD_MODEL,
    SetWakeWords = VGL_MESSAGE_SET_WAKE_WORDS,
    UpdateAudioData = VGL_MESSAGE_UPDATE_AUDIO_DATA,
    DetectWakeWords = VGL_MESSAGE_DETECT_WAKE_WORDS,
    Transcribe = VGL_MESSAGE_TRANSCRIBE,
    Debug = VGL_MESSAGE_DEBUG,
    Listen = VGL_MESSAGE_LISTEN,
};

static_assert(static_cast<uint8_t>(MessageTag::LoadModel) == 0, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::SetWakeWords) == 1, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::UpdateAudioData) == 2, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::DetectWakeWords) == 3, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::Transcribe) == 4, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::Debug) == 5, "tag drift");
static_assert(static_cast<uint8_t>(MessageTag::Listen) == 6, "tag drift");

struct LoadModel {
    std::string path;
};

struct SetWakeWords {
    std::vector<std::string> words;
};

struct UpdateAudioData {
    std::vector<float> samples;
};

struct DetectWakeWords {};

struct Transcribe {};

struct Debug {
    std::string text;
};

// Transcribe the staged audio in windows of window_ms, pushing each
// fragment through the delivery channel.
struct Listen {
    uint64_t window_ms = 0;
};

using Message =
    std::variant<LoadModel, SetWakeWords, UpdateAudioData, DetectWakeWords, Transcribe, Debug, Listen>;

bool operator==(const LoadModel& a, const LoadModel& b);
bool operator==(const SetWakeWords& a, const SetWakeWords& b);
bool operator==(const UpdateAudioData& a, const UpdateAudioData& b);
bool operator==(const DetectWakeWords& a, const DetectWakeWords& b);
bool operator==(const Transcribe& a, const Transcribe& b);
bool operator==(const Debug& a, const Debug& b);
bool operator==(const Listen& a, const Listen& b);

MessageTag tag_of(const Message& message);
const char* message_tag_name(MessageTag tag);

/**
 * @brief Validate a raw tag byte
 * @throws ProtocolError (VGL_ERROR_PROTOCOL_UNKNOWN_TAG) for unknown values
 */
MessageTag parse_message_tag(uint8_t raw);

/** Payload only; the tag travels separately. Zero-sized variants yield an empty buffer. */
Bytes encode_message(const Message& message);

/**
 * @brief Decode a payload for a given tag byte
 * @throws ProtocolError on unknown tag, truncation or trailing bytes
 */
Message decode_message(uint8_t tag, const uint8_t* data, size_t size);

// =============================================================================
// RESPONSES
// =============================================================================

enum class ResponseTag : uint8_t {
    Text = VGL_RESPONSE_TEXT,
    WakeWordDetection = VGL_RESPONSE_WAKE_WORD_DETECTION,
    Error = VGL_RESPONSE_ERROR,
};

static_assert(static_cast<uint8_t>(ResponseTag::Text) == 0, "tag drift");
static_assert(static_cast<uint8_t>(ResponseTag::WakeWordDetection) == 1, "tag drift");
static_assert(static_cast<uint8_t>(ResponseTag::Error) == 2, "tag drift");

struct Text {
    std::string text;
};

struct WakeWordDetection {
    bool detected = false;
    std::optional<uint64_t> start_index;
    std::optional<uint64_t> end_index;
};

struct Error {
    std::string message;
};

using Response = std::variant<Text, WakeWordDetection, Error>;

bool operator==(const Text& a, const Text& b);
bool operator==(const WakeWordDetection& a, const WakeWordDetection& b);
bool operator==(const Error& a, const Error& b);

ResponseTag tag_of(const Response& response);
const char* response_tag_name(ResponseTag tag);
ResponseTag parse_response_tag(uint8_t raw);

void write_response(Writer& writer, const Response& response);
Response read_response(ResponseTag tag, Reader& reader);

Bytes encode_response(const Response& response);
Response decode_response(uint8_t tag, const uint8_t* data, size_t size);

// =============================================================================
// CONTEXT
// =============================================================================

/** Session state threaded through successive calls by value. */
struct Context {
    std::string model_path;
    std::vector<std::string> wake_words;
    std::string transcript;
};

bool operator==(const Context& a, const Context& b);
bool operator!=(const Context& a, const Context& b);

void write_context(Writer& writer, const Context& context);
Context read_context(Reader& reader);

Bytes encode_context(const Context& context);
Context decode_context(const uint8_t* data, size_t size);

/** Audio carried by a context-bearing call. */
struct AudioWindow {
    std::vector<float> samples;
    uint64_t window_ms = 0;
};

/** An empty window encodes to zero bytes and means "use the staged audio". */
Bytes encode_window(const AudioWindow& window);
AudioWindow decode_window(const uint8_t* data, size_t size);

struct AdvanceResult {
    Context context;
    Response response;
};

/**
 * @brief Layout of a vgl_advance_context reply
 *
 * Non-Error tags: context followed by the response body.
 * Error tag: the error string only.
 */
Bytes encode_advance_reply(const Context& context, const Response& response);

/**
 * @brief Decode a vgl_advance_context reply
 *
 * @param previous Returned unchanged alongside an Error response
 */
AdvanceResult decode_advance_reply(uint8_t tag, const uint8_t* data, size_t size,
                                   const Context& previous);

}  // namespace wire
}  // namespace vgl

#endif  // VGL_MESSAGES_H
