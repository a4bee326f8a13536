/**
 * @file vgl_diagnostics.h
 * @brief Virgil Commons - Caller-side diagnostics sink
 *
 * Caller components never reach for a global logger. A sink is built once
 * at startup and passed by reference to everything that reports events.
 */

#ifndef VGL_CLIENT_DIAGNOSTICS_H
#define VGL_CLIENT_DIAGNOSTICS_H

#include <string>

#include "vgl/core/vgl_logger.h"

namespace vgl {
namespace client {

struct DiagnosticEvent {
    vgl_log_level_t level = VGL_LOG_LEVEL_INFO;
    std::string component;
    std::string message;
};

class DiagnosticsSink {
   public:
    virtual ~DiagnosticsSink() = default;
    virtual void record(const DiagnosticEvent& event) = 0;
};

/**
 * Forwards events to vgl::Logger, so caller and native logs share one
 * output and one level filter.
 */
class LoggerDiagnostics : public DiagnosticsSink {
   public:
    void record(const DiagnosticEvent& event) override;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_DIAGNOSTICS_H
