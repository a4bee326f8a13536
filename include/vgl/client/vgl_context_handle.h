/**
 * @file vgl_context_handle.h
 * @brief Virgil Commons - Single-flight holder for a session Context
 *
 * The native engine state behind a Context is not reentrant, so at most one
 * advance may be in flight per handle. Callers take a Ticket when they
 * submit work; tickets are served strictly in the order they were taken.
 */

#ifndef VGL_CLIENT_CONTEXT_HANDLE_H
#define VGL_CLIENT_CONTEXT_HANDLE_H

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>

#include "vgl/wire/vgl_messages.h"

namespace vgl {
namespace client {

class ContextHandle {
   public:
    class Ticket {
       public:
        Ticket() = default;
        ~Ticket();

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;

        uint64_t number() const { return number_; }
        bool valid() const { return owner_ != nullptr; }

       private:
        friend class ContextHandle;
        Ticket(ContextHandle* owner, uint64_t number) : owner_(owner), number_(number) {}

        ContextHandle* owner_ = nullptr;
        uint64_t number_ = 0;
    };

    using Operation = std::function<wire::AdvanceResult(const wire::Context&)>;

    ContextHandle(uint64_t id, wire::Context initial);

    ContextHandle(const ContextHandle&) = delete;
    ContextHandle& operator=(const ContextHandle&) = delete;

    uint64_t id() const { return id_; }

    /** Copy of the currently held context. */
    wire::Context snapshot() const;

    /** Reserve the next place in line. */
    Ticket take_ticket();

    /**
     * Wait for the ticket's turn, run op on the held context and, if op
     * returns, replace the held context with the result's context. If op
     * throws, the held context is left as it was.
     *
     * @throws std::logic_error if the ticket is not from this handle
     */
    wire::AdvanceResult run(Ticket ticket, const Operation& op);

   private:
    void finish(uint64_t number);

    const uint64_t id_;

    mutable std::mutex mutex_;
    std::condition_variable turn_cv_;
    wire::Context context_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
    // Tickets dropped before their turn came up
    std::set<uint64_t> abandoned_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_CONTEXT_HANDLE_H
