#include "wake_words.h"

#include <algorithm>
#include <cctype>

namespace vgl {
namespace engine {

namespace {

bool is_leading_noise(unsigned char c) {
    return std::isspace(c) || std::ispunct(c);
}

}  // namespace

std::string to_lower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

wire::WakeWordDetection detect_wake_words(const std::string& transcript,
                                          const std::vector<std::string>& wake_words) {
    const std::string haystack = to_lower(transcript);

    for (const auto& word : wake_words) {
        if (word.empty()) {
            continue;
        }
        const size_t pos = haystack.find(to_lower(word));
        if (pos != std::string::npos) {
            wire::WakeWordDetection detection;
            detection.detected = true;
            detection.start_index = pos;
            detection.end_index = pos + word.size();
            return detection;
        }
    }

    return wire::WakeWordDetection{};
}

std::string strip_wake_phrase(const std::string& transcript,
                              const std::vector<std::string>& wake_words) {
    std::string text = transcript;

    const wire::WakeWordDetection detection = detect_wake_words(transcript, wake_words);
    if (detection.detected) {
        const size_t start = static_cast<size_t>(*detection.start_index);
        const size_t end = static_cast<size_t>(*detection.end_index);
        text.erase(start, end - start);
    }

    auto begin = std::find_if(text.begin(), text.end(),
                              [](unsigned char c) { return !is_leading_noise(c); });
    auto last = std::find_if(text.rbegin(), text.rend(),
                             [](unsigned char c) { return !std::isspace(c); })
                    .base();
    return begin < last ? std::string(begin, last) : std::string();
}

}  // namespace engine
}  // namespace vgl
