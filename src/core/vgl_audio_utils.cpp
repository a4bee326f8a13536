/**
 * @file vgl_audio_utils.cpp
 * @brief Virgil Commons - Audio Utility Functions Implementation
 */

#include "vgl/core/vgl_audio_utils.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>

#include "vgl/core/vgl_logger.h"

static const char* LOG_CAT = "Audio";

// WAV file constants
static constexpr uint16_t WAV_FORMAT_PCM = 1;
static constexpr uint16_t WAV_FORMAT_IEEE_FLOAT = 3;

/**
 * @brief Read a little-endian uint16_t from a buffer
 */
static uint16_t read_uint16_le(const uint8_t* buffer) {
    return static_cast<uint16_t>(buffer[0] | (buffer[1] << 8));
}

/**
 * @brief Read a little-endian uint32_t from a buffer
 */
static uint32_t read_uint32_le(const uint8_t* buffer) {
    return static_cast<uint32_t>(buffer[0]) | (static_cast<uint32_t>(buffer[1]) << 8) |
           (static_cast<uint32_t>(buffer[2]) << 16) | (static_cast<uint32_t>(buffer[3]) << 24);
}

extern "C" {

vgl_result_t vgl_audio_int16_to_float(const int16_t* samples, size_t num_samples,
                                      float* out_samples) {
    if ((num_samples > 0 && (!samples || !out_samples))) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }

    for (size_t i = 0; i < num_samples; ++i) {
        out_samples[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return VGL_SUCCESS;
}

vgl_result_t vgl_audio_downmix_to_mono(const float* samples, size_t num_frames, int32_t channels,
                                       float* out_samples) {
    if (channels <= 0 || (num_frames > 0 && (!samples || !out_samples))) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }

    if (channels == 1) {
        if (num_frames > 0) {
            std::memmove(out_samples, samples, num_frames * sizeof(float));
        }
        return VGL_SUCCESS;
    }

    for (size_t frame = 0; frame < num_frames; ++frame) {
        float sum = 0.0f;
        for (int32_t c = 0; c < channels; ++c) {
            sum += samples[frame * static_cast<size_t>(channels) + static_cast<size_t>(c)];
        }
        out_samples[frame] = sum / static_cast<float>(channels);
    }
    return VGL_SUCCESS;
}

size_t vgl_audio_resampled_length(size_t num_samples, int32_t from_rate, int32_t to_rate) {
    if (from_rate <= 0 || to_rate <= 0 || num_samples == 0) {
        return 0;
    }
    if (from_rate == to_rate) {
        return num_samples;
    }
    return static_cast<size_t>(static_cast<double>(num_samples) * to_rate / from_rate);
}

vgl_result_t vgl_audio_resample_linear(const float* samples, size_t num_samples,
                                       int32_t from_rate, int32_t to_rate, float* out_samples,
                                       size_t out_capacity, size_t* out_num_samples) {
    if (!out_num_samples || from_rate <= 0 || to_rate <= 0) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }
    if (num_samples > 0 && !samples) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }

    const size_t out_len = vgl_audio_resampled_length(num_samples, from_rate, to_rate);
    if (out_len > out_capacity || (out_len > 0 && !out_samples)) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }

    if (from_rate == to_rate) {
        if (out_len > 0) {
            std::memmove(out_samples, samples, out_len * sizeof(float));
        }
        *out_num_samples = out_len;
        return VGL_SUCCESS;
    }

    const double ratio = static_cast<double>(from_rate) / to_rate;
    for (size_t i = 0; i < out_len; ++i) {
        const double src = static_cast<double>(i) * ratio;
        const size_t idx = static_cast<size_t>(src);
        const double frac = src - static_cast<double>(idx);
        const float a = samples[std::min(idx, num_samples - 1)];
        const float b = samples[std::min(idx + 1, num_samples - 1)];
        out_samples[i] = static_cast<float>(a + (b - a) * frac);
    }

    *out_num_samples = out_len;
    return VGL_SUCCESS;
}

}  // extern "C"

namespace vgl {
namespace audio {

vgl_result_t parse_wav(const uint8_t* data, size_t size, WavAudio& out) {
    if (!data || size < 12) {
        return VGL_ERROR_INVALID_ARGUMENT;
    }

    // --- RIFF header ---
    if (std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
        VGL_LOG_ERROR(LOG_CAT, "parse_wav: not a RIFF/WAVE file");
        return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
    }

    // --- Find fmt and data chunks ---
    bool found_fmt = false;
    uint16_t audio_format = 0;
    uint16_t bits_per_sample = 0;
    size_t offset = 12;

    while (offset + 8 <= size) {
        const uint8_t* chunk = data + offset;
        const uint32_t chunk_size = read_uint32_le(chunk + 4);
        const size_t body = offset + 8;
        if (chunk_size > size - body) {
            VGL_LOG_ERROR(LOG_CAT, "parse_wav: chunk exceeds file size");
            return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
        }

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            // fmt chunk layout (16 bytes minimum):
            //   AudioFormat(2) Channels(2) SampleRate(4)
            //   ByteRate(4) BlockAlign(2) BitsPerSample(2)
            if (chunk_size < 16) {
                return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
            }
            audio_format = read_uint16_le(data + body);
            out.channels = read_uint16_le(data + body + 2);
            out.sample_rate = static_cast<int32_t>(read_uint32_le(data + body + 4));
            bits_per_sample = read_uint16_le(data + body + 14);
            found_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!found_fmt || out.channels == 0 || out.sample_rate <= 0) {
                VGL_LOG_ERROR(LOG_CAT, "parse_wav: data chunk before fmt chunk");
                return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
            }

            const uint8_t* pcm = data + body;
            if (audio_format == WAV_FORMAT_PCM && bits_per_sample == 16) {
                const size_t n = chunk_size / 2;
                out.samples.resize(n);
                for (size_t i = 0; i < n; ++i) {
                    const auto s = static_cast<int16_t>(read_uint16_le(pcm + i * 2));
                    out.samples[i] = static_cast<float>(s) / 32768.0f;
                }
            } else if (audio_format == WAV_FORMAT_IEEE_FLOAT && bits_per_sample == 32) {
                const size_t n = chunk_size / 4;
                out.samples.resize(n);
                for (size_t i = 0; i < n; ++i) {
                    const uint32_t bits = read_uint32_le(pcm + i * 4);
                    std::memcpy(&out.samples[i], &bits, sizeof(float));
                }
            } else {
                VGL_LOG_ERROR(LOG_CAT, "parse_wav: unsupported format %u / %u bits",
                              static_cast<unsigned>(audio_format),
                              static_cast<unsigned>(bits_per_sample));
                return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
            }
            return VGL_SUCCESS;
        }

        // Chunks are word-aligned
        offset = body + chunk_size + (chunk_size & 1u);
    }

    VGL_LOG_ERROR(LOG_CAT, "parse_wav: no data chunk");
    return VGL_ERROR_UNSUPPORTED_AUDIO_FORMAT;
}

vgl_result_t read_wav(const std::string& path, WavAudio& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        VGL_LOG_ERROR(LOG_CAT, "read_wav: cannot open %s", path.c_str());
        return VGL_ERROR_FILE_NOT_FOUND;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return parse_wav(bytes.data(), bytes.size(), out);
}

std::vector<float> to_engine_input(const WavAudio& wav) {
    if (wav.channels == 0 || wav.samples.empty()) {
        return {};
    }

    const size_t frames = wav.samples.size() / wav.channels;
    std::vector<float> mono(frames);
    if (vgl_audio_downmix_to_mono(wav.samples.data(), frames, wav.channels, mono.data()) !=
        VGL_SUCCESS) {
        return {};
    }

    std::vector<float> resampled(
        vgl_audio_resampled_length(mono.size(), wav.sample_rate, VGL_ENGINE_SAMPLE_RATE));
    size_t written = 0;
    if (vgl_audio_resample_linear(mono.data(), mono.size(), wav.sample_rate,
                                  VGL_ENGINE_SAMPLE_RATE, resampled.data(), resampled.size(),
                                  &written) != VGL_SUCCESS) {
        return {};
    }
    resampled.resize(written);
    return resampled;
}

}  // namespace audio
}  // namespace vgl
