/**
 * @file vgl_codec.h
 * @brief Virgil Commons - Binary field codec
 *
 * Layout (little-endian, fixed width):
 *   u8 / bool     1 byte (bool must be 0 or 1)
 *   u64           8 bytes
 *   f32           4 bytes, IEEE-754
 *   string        u64 byte length, UTF-8 bytes
 *   sequence<T>   u64 element count, elements
 *   optional<T>   presence byte, value if present
 *
 * Reader methods throw vgl::ProtocolError on any read past the end of the
 * buffer, so a length prefix is never trusted before it has been checked.
 */

#ifndef VGL_CODEC_H
#define VGL_CODEC_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vgl {
namespace wire {

using Bytes = std::vector<uint8_t>;

class Writer {
   public:
    void write_u8(uint8_t value);
    void write_bool(bool value);
    void write_u64(uint64_t value);
    void write_f32(float value);
    void write_string(const std::string& value);
    void write_string_seq(const std::vector<std::string>& values);
    void write_f32_seq(const std::vector<float>& values);
    void write_optional_u64(const std::optional<uint64_t>& value);

    const Bytes& bytes() const { return buffer_; }
    Bytes take() { return std::move(buffer_); }

   private:
    Bytes buffer_;
};

class Reader {
   public:
    Reader(const uint8_t* data, size_t size);
    explicit Reader(const Bytes& bytes) : Reader(bytes.data(), bytes.size()) {}

    uint8_t read_u8();
    bool read_bool();
    uint64_t read_u64();
    float read_f32();
    std::string read_string();
    std::vector<std::string> read_string_seq();
    std::vector<float> read_f32_seq();
    std::optional<uint64_t> read_optional_u64();

    size_t remaining() const { return size_ - offset_; }

    // Throws if any bytes are left unread.
    void expect_end() const;

   private:
    void require(size_t count, const char* what) const;
    size_t read_length(size_t element_size, const char* what);

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

// Standalone helpers for the init_context arguments.
Bytes encode_string(const std::string& value);
Bytes encode_strings(const std::vector<std::string>& values);
std::string decode_string(const uint8_t* data, size_t size);
std::vector<std::string> decode_strings(const uint8_t* data, size_t size);

}  // namespace wire
}  // namespace vgl

#endif  // VGL_CODEC_H
