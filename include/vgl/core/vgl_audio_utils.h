/**
 * @file vgl_audio_utils.h
 * @brief Virgil Commons - Audio Utility Functions
 *
 * Converts captured audio into the 16 kHz mono float32 layout the engine
 * expects. Capture itself happens outside this library.
 */

#ifndef VGL_AUDIO_UTILS_H
#define VGL_AUDIO_UTILS_H

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/** Sample rate expected by the speech engine. */
#define VGL_ENGINE_SAMPLE_RATE 16000

/**
 * @brief Convert Int16 PCM samples to float32 in [-1, 1]
 *
 * @param samples Input samples
 * @param num_samples Number of samples
 * @param out_samples Output buffer with room for num_samples floats
 * @return VGL_SUCCESS or VGL_ERROR_INVALID_ARGUMENT
 */
VGL_API vgl_result_t vgl_audio_int16_to_float(const int16_t* samples, size_t num_samples,
                                              float* out_samples);

/**
 * @brief Average interleaved channels into a single channel
 *
 * @param samples Interleaved input (num_frames * channels values)
 * @param num_frames Number of frames
 * @param channels Channel count (>= 1)
 * @param out_samples Output buffer with room for num_frames floats
 * @return VGL_SUCCESS or VGL_ERROR_INVALID_ARGUMENT
 */
VGL_API vgl_result_t vgl_audio_downmix_to_mono(const float* samples, size_t num_frames,
                                               int32_t channels, float* out_samples);

/**
 * @brief Number of samples produced by resampling num_samples from one rate to another
 */
VGL_API size_t vgl_audio_resampled_length(size_t num_samples, int32_t from_rate,
                                          int32_t to_rate);

/**
 * @brief Resample mono audio using linear interpolation
 *
 * @param samples Input samples
 * @param num_samples Number of input samples
 * @param from_rate Input sample rate in Hz
 * @param to_rate Output sample rate in Hz
 * @param out_samples Output buffer
 * @param out_capacity Capacity of out_samples (see vgl_audio_resampled_length)
 * @param out_num_samples Number of samples written
 * @return VGL_SUCCESS or error code
 */
VGL_API vgl_result_t vgl_audio_resample_linear(const float* samples, size_t num_samples,
                                               int32_t from_rate, int32_t to_rate,
                                               float* out_samples, size_t out_capacity,
                                               size_t* out_num_samples);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include <string>
#include <vector>

namespace vgl {
namespace audio {

struct WavAudio {
    std::vector<float> samples;  // interleaved, float32
    int32_t sample_rate = 0;
    uint16_t channels = 0;
};

/**
 * @brief Parse an in-memory RIFF/WAVE file (PCM16 or IEEE float32)
 */
vgl_result_t parse_wav(const uint8_t* data, size_t size, WavAudio& out);

/**
 * @brief Read and parse a WAV file from disk
 */
vgl_result_t read_wav(const std::string& path, WavAudio& out);

/**
 * @brief Downmix and resample to the engine's 16 kHz mono layout
 */
std::vector<float> to_engine_input(const WavAudio& wav);

}  // namespace audio
}  // namespace vgl

#endif  // __cplusplus

#endif  // VGL_AUDIO_UTILS_H
