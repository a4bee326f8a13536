#ifndef VGL_ENGINE_WAKE_WORDS_H
#define VGL_ENGINE_WAKE_WORDS_H

#include <string>
#include <vector>

#include "vgl/wire/vgl_messages.h"

namespace vgl {
namespace engine {

std::string to_lower(const std::string& text);

/**
 * Case-insensitive search for the first wake word (in list order) that
 * occurs in the transcript. Indices are byte offsets into the transcript;
 * end_index is exclusive.
 */
wire::WakeWordDetection detect_wake_words(const std::string& transcript,
                                          const std::vector<std::string>& wake_words);

/**
 * Remove the detected wake phrase, then trim surrounding whitespace and the
 * punctuation left behind at the front ("Hey Assistant, open" -> "open").
 */
std::string strip_wake_phrase(const std::string& transcript,
                              const std::vector<std::string>& wake_words);

}  // namespace engine
}  // namespace vgl

#endif  // VGL_ENGINE_WAKE_WORDS_H
