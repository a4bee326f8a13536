/**
 * @file vgl_errors.h
 * @brief Virgil Commons - Exceptions raised by the C++ side of the boundary
 *
 * Both kinds of failure surface as a single BridgeError; kind() tells the
 * caller whether the two sides disagree about the protocol (not worth
 * retrying) or the engine reported a failure for this call.
 */

#ifndef VGL_WIRE_ERRORS_H
#define VGL_WIRE_ERRORS_H

#include <stdexcept>
#include <string>

#include "vgl/core/vgl_error.h"
#include "vgl/core/vgl_error_model.h"

namespace vgl {

enum class ErrorKind {
    Protocol,
    Engine,
};

class BridgeError : public std::runtime_error {
   public:
    BridgeError(ErrorKind kind, vgl_result_t code, const std::string& message)
        : std::runtime_error(message), kind_(kind), code_(code) {}

    ErrorKind kind() const noexcept { return kind_; }
    vgl_result_t code() const noexcept { return code_; }

    /** Category of code(), e.g. "Protocol" or "Engine". */
    const char* category() const noexcept { return vgl_error_category(code_); }
    bool retryable() const noexcept { return vgl_error_is_retryable(code_) == VGL_TRUE; }

   private:
    ErrorKind kind_;
    vgl_result_t code_;
};

/** Malformed tag, truncated buffer or unexpected response shape. */
class ProtocolError : public BridgeError {
   public:
    ProtocolError(vgl_result_t code, const std::string& message)
        : BridgeError(ErrorKind::Protocol, code, message) {}
};

/** Null response pointer or an explicit Error reply from the engine. */
class EngineFault : public BridgeError {
   public:
    explicit EngineFault(const std::string& message, vgl_result_t code = VGL_ERROR_ENGINE_FAULT)
        : BridgeError(ErrorKind::Engine, code, message) {}
};

}  // namespace vgl

#endif  // VGL_WIRE_ERRORS_H
