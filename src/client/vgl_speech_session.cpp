#include "vgl/client/vgl_speech_session.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace vgl {
namespace client {

namespace {

const char* COMPONENT = "SpeechSession";

std::atomic<uint64_t> g_next_context_id{1};

std::string trim(const std::string& text) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* const kOpen = "open";

}  // namespace

std::optional<std::string> extract_command(const std::string& sentence) {
    const size_t open_idx = to_lower(sentence).find(kOpen);
    if (open_idx == std::string::npos) {
        return std::nullopt;
    }
    const std::string target = trim(sentence.substr(open_idx + std::strlen(kOpen)));
    if (target.empty()) {
        return std::nullopt;
    }
    return "Open: " + target;
}

SpeechSession::SpeechSession(SessionConfig config, const Boundary& boundary,
                             DiagnosticsSink& diagnostics, OwnershipTracker* tracker)
    : config_(std::move(config)),
      boundary_(boundary),
      diagnostics_(diagnostics),
      dispatcher_(boundary_, allocator_, diagnostics_, tracker),
      worker_(diagnostics_, config_.worker_threads),
      client_(dispatcher_, worker_),
      channel_(diagnostics_, config_.channel_capacity) {}

SpeechSession::~SpeechSession() {
    stop();
}

void SpeechSession::report(vgl_log_level_t level, const std::string& message) const {
    diagnostics_.record(DiagnosticEvent{level, COMPONENT, message});
}

// =============================================================================
// LIFECYCLE
// =============================================================================

void SpeechSession::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_ || stopped_) {
            throw std::logic_error("speech session can only be started once");
        }
        started_ = true;
    }

    boundary_.table().setup_logs(config_.log_level_value());

    // The channel must exist before any call that can stream
    vgl_result_t result = channel_.connect(boundary_);
    if (result != VGL_SUCCESS) {
        throw EngineFault("Delivery channel handshake failed", result);
    }

    wire::Context context = client_.initialize(config_.model_path, config_.wake_words).get();
    auto handle = std::make_shared<ContextHandle>(g_next_context_id++, std::move(context));

    DeliveryChannel::Receiver receiver = channel_.open_reader();
    std::thread reader([this, receiver = std::move(receiver)]() mutable {
        while (auto fragment = receiver.receive()) {
            add_fragment(std::move(*fragment));
        }
    });

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle_ = std::move(handle);
        reader_ = std::move(reader);
    }
    report(VGL_LOG_LEVEL_INFO, "Session started with model " + config_.model_path);
}

void SpeechSession::stop() {
    std::thread reader;
    bool was_started = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        was_started = started_;
        reader = std::move(reader_);
    }

    // Queued calls finish first, then the reader takes what they pushed.
    // Joining the reader makes every taken fragment visible in transcript().
    worker_.shutdown();
    channel_.drain_and_close();
    if (reader.joinable()) {
        reader.join();
    }

    if (was_started) {
        boundary_.table().shutdown();
        report(VGL_LOG_LEVEL_INFO, "Session stopped");
    }
}

bool SpeechSession::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return handle_ != nullptr && !stopped_;
}

std::shared_ptr<ContextHandle> SpeechSession::require_handle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (handle_ == nullptr || stopped_) {
        throw std::logic_error("speech session is not running");
    }
    return handle_;
}

// =============================================================================
// OPERATIONS
// =============================================================================

std::future<wire::Response> SpeechSession::stage_audio(std::vector<float> samples) {
    require_handle();
    return client_.send(wire::UpdateAudioData{std::move(samples)});
}

std::future<wire::WakeWordDetection> SpeechSession::detect(std::vector<float> samples) {
    return client_.advance(require_handle(), wire::MessageTag::DetectWakeWords,
                           wire::AudioWindow{std::move(samples), 0},
                           [](wire::AdvanceResult result) {
                               return unwrap_detection(result.response);
                           });
}

std::future<std::string> SpeechSession::transcribe(std::vector<float> samples) {
    return client_.advance(require_handle(), wire::MessageTag::Transcribe,
                           wire::AudioWindow{std::move(samples), 0},
                           [](wire::AdvanceResult result) { return unwrap_text(result.response); });
}

std::future<std::string> SpeechSession::listen(std::vector<float> samples, uint64_t window_ms) {
    if (window_ms == 0) {
        window_ms = config_.listen_window_ms;
    }
    return client_.advance(require_handle(), wire::MessageTag::Listen,
                           wire::AudioWindow{std::move(samples), window_ms},
                           [](wire::AdvanceResult result) { return unwrap_text(result.response); });
}

std::future<std::string> SpeechSession::debug(std::string text) {
    std::future<wire::Response> reply = client_.send(wire::Debug{std::move(text)});
    // Unwrap lazily on the caller's get()
    return std::async(std::launch::deferred,
                      [reply = std::move(reply)]() mutable { return unwrap_text(reply.get()); });
}

wire::Context SpeechSession::context() const {
    return require_handle()->snapshot();
}

// =============================================================================
// TRANSCRIPT
// =============================================================================

void SpeechSession::add_fragment(std::string fragment) {
    std::lock_guard<std::mutex> lock(transcript_mutex_);
    if (seen_.insert(fragment).second) {
        fragments_.push_back(std::move(fragment));
    }
}

std::vector<std::string> SpeechSession::transcript() const {
    std::lock_guard<std::mutex> lock(transcript_mutex_);
    return fragments_;
}

std::optional<std::string> SpeechSession::process_commands() {
    std::lock_guard<std::mutex> lock(transcript_mutex_);

    std::string sentence;
    if (fragments_.size() >= 2) {
        sentence = fragments_[fragments_.size() - 2] + " " + fragments_.back();
    } else if (!fragments_.empty()) {
        sentence = fragments_.back();
    }
    if (sentence.empty()) {
        return command_;
    }

    // Without "open" the previous command stands
    if (to_lower(sentence).find(kOpen) != std::string::npos) {
        command_ = extract_command(sentence);
        if (command_) {
            report(VGL_LOG_LEVEL_INFO, "Command: " + *command_);
        }
    }
    return command_;
}

std::optional<std::string> SpeechSession::command() const {
    std::lock_guard<std::mutex> lock(transcript_mutex_);
    return command_;
}

}  // namespace client
}  // namespace vgl
