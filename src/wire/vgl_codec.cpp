/**
 * @file vgl_codec.cpp
 * @brief Virgil Commons - Binary field codec implementation
 */

#include "vgl/wire/vgl_codec.h"

#include <cstring>
#include <limits>

#include "vgl/wire/vgl_errors.h"

namespace vgl {
namespace wire {

// =============================================================================
// WRITER
// =============================================================================

void Writer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Writer::write_bool(bool value) {
    buffer_.push_back(value ? 1 : 0);
}

void Writer::write_u64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void Writer::write_f32(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
    }
}

void Writer::write_string(const std::string& value) {
    write_u64(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void Writer::write_string_seq(const std::vector<std::string>& values) {
    write_u64(values.size());
    for (const auto& value : values) {
        write_string(value);
    }
}

void Writer::write_f32_seq(const std::vector<float>& values) {
    write_u64(values.size());
    buffer_.reserve(buffer_.size() + values.size() * 4);
    for (float value : values) {
        write_f32(value);
    }
}

void Writer::write_optional_u64(const std::optional<uint64_t>& value) {
    write_bool(value.has_value());
    if (value) {
        write_u64(*value);
    }
}

// =============================================================================
// READER
// =============================================================================

Reader::Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {
    if (!data_ && size_ > 0) {
        throw ProtocolError(VGL_ERROR_NULL_POINTER, "null buffer with non-zero length");
    }
}

void Reader::require(size_t count, const char* what) const {
    if (count > remaining()) {
        throw ProtocolError(VGL_ERROR_PROTOCOL_TRUNCATED,
                            std::string("truncated buffer reading ") + what + ": need " +
                                std::to_string(count) + " bytes, " +
                                std::to_string(remaining()) + " left");
    }
}

uint8_t Reader::read_u8() {
    require(1, "u8");
    return data_[offset_++];
}

bool Reader::read_bool() {
    require(1, "bool");
    const uint8_t value = data_[offset_++];
    if (value > 1) {
        throw ProtocolError(VGL_ERROR_PROTOCOL_MALFORMED,
                            "invalid bool byte " + std::to_string(value));
    }
    return value == 1;
}

uint64_t Reader::read_u64() {
    require(8, "u64");
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += 8;
    return value;
}

float Reader::read_f32() {
    require(4, "f32");
    uint32_t bits = 0;
    for (int i = 0; i < 4; ++i) {
        bits |= static_cast<uint32_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += 4;
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

size_t Reader::read_length(size_t element_size, const char* what) {
    const uint64_t count = read_u64();
    // Reject before reserving anything: a corrupt prefix must not turn
    // into a huge allocation.
    if (count > remaining() / element_size) {
        throw ProtocolError(VGL_ERROR_PROTOCOL_TRUNCATED,
                            std::string("length prefix of ") + what + " (" +
                                std::to_string(count) + ") exceeds remaining " +
                                std::to_string(remaining()) + " bytes");
    }
    return static_cast<size_t>(count);
}

std::string Reader::read_string() {
    const size_t length = read_length(1, "string");
    std::string value(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return value;
}

std::vector<std::string> Reader::read_string_seq() {
    // Every string needs at least its 8-byte length prefix.
    const size_t count = read_length(8, "string sequence");
    std::vector<std::string> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(read_string());
    }
    return values;
}

std::vector<float> Reader::read_f32_seq() {
    const size_t count = read_length(4, "f32 sequence");
    std::vector<float> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(read_f32());
    }
    return values;
}

std::optional<uint64_t> Reader::read_optional_u64() {
    if (!read_bool()) {
        return std::nullopt;
    }
    return read_u64();
}

void Reader::expect_end() const {
    if (remaining() != 0) {
        throw ProtocolError(VGL_ERROR_PROTOCOL_TRAILING_BYTES,
                            std::to_string(remaining()) + " trailing bytes after payload");
    }
}

// =============================================================================
// HELPERS
// =============================================================================

Bytes encode_string(const std::string& value) {
    Writer writer;
    writer.write_string(value);
    return writer.take();
}

Bytes encode_strings(const std::vector<std::string>& values) {
    Writer writer;
    writer.write_string_seq(values);
    return writer.take();
}

std::string decode_string(const uint8_t* data, size_t size) {
    Reader reader(data, size);
    std::string value = reader.read_string();
    reader.expect_end();
    return value;
}

std::vector<std::string> decode_strings(const uint8_t* data, size_t size) {
    Reader reader(data, size);
    std::vector<std::string> values = reader.read_string_seq();
    reader.expect_end();
    return values;
}

}  // namespace wire
}  // namespace vgl
