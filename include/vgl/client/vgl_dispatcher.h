/**
 * @file vgl_dispatcher.h
 * @brief Virgil Commons - One request/response exchange across the boundary
 *
 * Every call follows the same steps:
 *   1. encode the request
 *   2. copy it into a caller-owned buffer (skipped for zero-length payloads)
 *   3. call the entry point
 *   4. turn a NULL reply into an Error response
 *   5. decode the reply by its tag
 *   6. release both buffers
 *
 * Step 6 is done by the buffer guards, so it runs exactly once on every
 * path out of the call, including a thrown ProtocolError.
 *
 * Dispatcher does no scheduling of its own; Worker runs it off the
 * interactive thread.
 */

#ifndef VGL_CLIENT_DISPATCHER_H
#define VGL_CLIENT_DISPATCHER_H

#include <string>
#include <vector>

#include "vgl/client/vgl_boundary.h"
#include "vgl/client/vgl_diagnostics.h"
#include "vgl/client/vgl_ownership.h"
#include "vgl/wire/vgl_errors.h"
#include "vgl/wire/vgl_messages.h"

namespace vgl {
namespace client {

/** Message used when the native side returns no reply buffer. */
extern const char* const kNullResponseMessage;

class Dispatcher {
   public:
    Dispatcher(const Boundary& boundary, Allocator& allocator, DiagnosticsSink& diagnostics,
               OwnershipTracker* tracker = nullptr);

    /**
     * @return The decoded reply. An engine failure is an Error response.
     * @throws ProtocolError if the reply cannot be decoded
     */
    wire::Response dispatch(const wire::Message& message) const;

    /**
     * @throws EngineFault if the native side could not build a context
     * @throws ProtocolError if the context cannot be decoded
     */
    wire::Context initialize(const std::string& model_path,
                             const std::vector<std::string>& wake_words) const;

    /**
     * Run a context-bearing operation. On an Error response the returned
     * context is the one passed in.
     *
     * @throws ProtocolError if the reply cannot be decoded
     */
    wire::AdvanceResult advance(wire::MessageTag op, const wire::Context& context,
                                const wire::AudioWindow& window) const;

    const Boundary& boundary() const { return boundary_; }

   private:
    void report(vgl_log_level_t level, const std::string& message) const;

    Boundary boundary_;
    Allocator& allocator_;
    DiagnosticsSink& diagnostics_;
    OwnershipTracker* tracker_;
};

/**
 * @return response unchanged unless it is an Error
 * @throws EngineFault carrying the error string
 */
wire::Response unwrap(wire::Response response);

/** @throws EngineFault on Error, ProtocolError on any tag other than Text */
std::string unwrap_text(const wire::Response& response);

/** @throws EngineFault on Error, ProtocolError on any tag other than WakeWordDetection */
wire::WakeWordDetection unwrap_detection(const wire::Response& response);

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_DISPATCHER_H
