/**
 * @file vgl_speech_session.h
 * @brief Virgil Commons - Application-side speech session
 *
 * Wires the boundary components together for one model and one set of wake
 * words:
 *   - the Worker runs every boundary call off the calling thread
 *   - the ContextHandle keeps advances on the session context in order
 *   - a reader thread drains the DeliveryChannel into the transcript
 *
 * Usage:
 *   LoggerDiagnostics diagnostics;
 *   SpeechSession session(config, Boundary::native(), diagnostics);
 *   session.start();
 *   auto detection = session.detect(samples).get();
 *   auto command = session.transcribe(samples).get();
 *   session.stop();
 */

#ifndef VGL_CLIENT_SPEECH_SESSION_H
#define VGL_CLIENT_SPEECH_SESSION_H

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "vgl/client/vgl_boundary.h"
#include "vgl/client/vgl_bridge_client.h"
#include "vgl/client/vgl_context_handle.h"
#include "vgl/client/vgl_delivery_channel.h"
#include "vgl/client/vgl_diagnostics.h"
#include "vgl/client/vgl_dispatcher.h"
#include "vgl/client/vgl_ownership.h"
#include "vgl/client/vgl_session_config.h"
#include "vgl/client/vgl_worker.h"

namespace vgl {
namespace client {

/**
 * Find "open <target>" (case-insensitive) in a sentence.
 * @return "Open: <target>", or nullopt if there is no command or no target
 */
std::optional<std::string> extract_command(const std::string& sentence);

class SpeechSession {
   public:
    SpeechSession(SessionConfig config, const Boundary& boundary, DiagnosticsSink& diagnostics,
                  OwnershipTracker* tracker = nullptr);
    ~SpeechSession();

    SpeechSession(const SpeechSession&) = delete;
    SpeechSession& operator=(const SpeechSession&) = delete;

    /**
     * Handshake with the delivery channel, load the model and build the
     * initial context. Blocks until the context is ready.
     *
     * @throws BridgeError if the channel or the context cannot be set up
     * @throws std::logic_error if called twice
     */
    void start();

    /** Replace the audio staged on the native side. */
    std::future<wire::Response> stage_audio(std::vector<float> samples);

    /** Empty samples use the staged audio. */
    std::future<wire::WakeWordDetection> detect(std::vector<float> samples = {});

    /** Transcript with the wake phrase removed. */
    std::future<std::string> transcribe(std::vector<float> samples = {});

    /**
     * Transcribe in windows, streaming each fragment into transcript().
     * window_ms of 0 uses the configured listen window.
     */
    std::future<std::string> listen(std::vector<float> samples = {}, uint64_t window_ms = 0);

    std::future<std::string> debug(std::string text);

    /** Unique fragments received so far, in arrival order. */
    std::vector<std::string> transcript() const;

    /**
     * Look for "open <target>" in the last two fragments.
     * @return "Open: <target>", or the previous command if nothing new matched
     */
    std::optional<std::string> process_commands();

    std::optional<std::string> command() const;

    /** Current session context. */
    wire::Context context() const;

    const SessionConfig& config() const { return config_; }
    bool is_running() const;

    /**
     * Finish queued calls, let the reader drain the channel, close it and
     * unload the engine. Every fragment pushed before stop() is in
     * transcript() once it returns.
     */
    void stop();

   private:
    std::shared_ptr<ContextHandle> require_handle() const;
    void add_fragment(std::string fragment);
    void report(vgl_log_level_t level, const std::string& message) const;

    SessionConfig config_;
    Boundary boundary_;
    DiagnosticsSink& diagnostics_;
    HeapAllocator allocator_;
    Dispatcher dispatcher_;
    Worker worker_;
    BridgeClient client_;
    DeliveryChannel channel_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<ContextHandle> handle_;
    bool started_ = false;
    bool stopped_ = false;
    std::thread reader_;

    mutable std::mutex transcript_mutex_;
    std::vector<std::string> fragments_;
    std::unordered_set<std::string> seen_;
    std::optional<std::string> command_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_SPEECH_SESSION_H
