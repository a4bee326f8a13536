#include "vgl/client/vgl_context_handle.h"

#include <stdexcept>
#include <utility>

namespace vgl {
namespace client {

// =============================================================================
// TICKET
// =============================================================================

ContextHandle::Ticket::~Ticket() {
    if (owner_ != nullptr) {
        owner_->finish(number_);
    }
}

ContextHandle::Ticket::Ticket(Ticket&& other) noexcept
    : owner_(other.owner_), number_(other.number_) {
    other.owner_ = nullptr;
}

ContextHandle::Ticket& ContextHandle::Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        if (owner_ != nullptr) {
            owner_->finish(number_);
        }
        owner_ = other.owner_;
        number_ = other.number_;
        other.owner_ = nullptr;
    }
    return *this;
}

// =============================================================================
// CONTEXT HANDLE
// =============================================================================

ContextHandle::ContextHandle(uint64_t id, wire::Context initial)
    : id_(id), context_(std::move(initial)) {}

wire::Context ContextHandle::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
}

ContextHandle::Ticket ContextHandle::take_ticket() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Ticket(this, next_ticket_++);
}

wire::AdvanceResult ContextHandle::run(Ticket ticket, const Operation& op) {
    if (ticket.owner_ != this) {
        throw std::logic_error("ticket does not belong to this context handle");
    }

    wire::Context current;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        turn_cv_.wait(lock, [&] { return serving_ == ticket.number_; });
        current = context_;
    }

    // Runs without the lock; the ticket keeps everyone else waiting and its
    // destructor passes the turn on, also when op throws.
    wire::AdvanceResult result = op(current);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        context_ = result.context;
    }
    return result;
}

void ContextHandle::finish(uint64_t number) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (number != serving_) {
            abandoned_.insert(number);
            return;
        }
        ++serving_;
        while (abandoned_.erase(serving_) > 0) {
            ++serving_;
        }
    }
    turn_cv_.notify_all();
}

}  // namespace client
}  // namespace vgl
