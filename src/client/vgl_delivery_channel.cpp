#include "vgl/client/vgl_delivery_channel.h"

#include <stdexcept>
#include <utility>

namespace vgl {
namespace client {

namespace {
const char* COMPONENT = "DeliveryChannel";
}  // namespace

// =============================================================================
// RECEIVER
// =============================================================================

DeliveryChannel::Receiver::~Receiver() {
    if (channel_ != nullptr) {
        channel_->detach_reader();
    }
}

DeliveryChannel::Receiver::Receiver(Receiver&& other) noexcept : channel_(other.channel_) {
    other.channel_ = nullptr;
}

DeliveryChannel::Receiver& DeliveryChannel::Receiver::operator=(Receiver&& other) noexcept {
    if (this != &other) {
        if (channel_ != nullptr) {
            channel_->detach_reader();
        }
        channel_ = other.channel_;
        other.channel_ = nullptr;
    }
    return *this;
}

std::optional<std::string> DeliveryChannel::Receiver::receive() {
    if (channel_ == nullptr) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(channel_->mutex_);
    channel_->not_empty_.wait(lock,
                              [this] { return channel_->closed_ || !channel_->items_.empty(); });
    return channel_->pop_locked();
}

std::optional<std::string> DeliveryChannel::Receiver::try_receive() {
    if (channel_ == nullptr) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(channel_->mutex_);
    return channel_->pop_locked();
}

std::optional<std::string> DeliveryChannel::Receiver::receive_for(
    std::chrono::milliseconds timeout) {
    if (channel_ == nullptr) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(channel_->mutex_);
    channel_->not_empty_.wait_for(
        lock, timeout, [this] { return channel_->closed_ || !channel_->items_.empty(); });
    return channel_->pop_locked();
}

// =============================================================================
// CHANNEL
// =============================================================================

DeliveryChannel::DeliveryChannel(DiagnosticsSink& diagnostics, size_t capacity)
    : diagnostics_(diagnostics), capacity_(capacity == 0 ? 1 : capacity) {}

DeliveryChannel::~DeliveryChannel() {
    close();
}

vgl_result_t DeliveryChannel::connect(const Boundary& boundary) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return VGL_ERROR_CHANNEL_CLOSED;
        }
    }

    vgl_result_t result = boundary.table().register_callback(&DeliveryChannel::on_native_fragment,
                                                             this);
    if (result != VGL_SUCCESS) {
        diagnostics_.record(DiagnosticEvent{VGL_LOG_LEVEL_ERROR, COMPONENT,
                                            std::string("Handshake failed: ") +
                                                vgl_error_message(result)});
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    boundary_ = boundary;
    diagnostics_.record(DiagnosticEvent{VGL_LOG_LEVEL_DEBUG, COMPONENT, "Connected"});
    return VGL_SUCCESS;
}

bool DeliveryChannel::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return boundary_.has_value() && !closed_;
}

bool DeliveryChannel::push(std::string item) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
}

DeliveryChannel::Receiver DeliveryChannel::open_reader() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw std::logic_error("delivery channel is closed");
    }
    if (reader_attached_) {
        throw std::logic_error("delivery channel already has a reader");
    }
    reader_attached_ = true;
    return Receiver(this);
}

void DeliveryChannel::detach_reader() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_attached_ = false;
    }
    drained_.notify_all();
}

void DeliveryChannel::close() {
    std::optional<Boundary> boundary;
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        discarded = items_.size();
        items_.clear();
        boundary.swap(boundary_);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    drained_.notify_all();

    if (boundary) {
        boundary->table().unregister_callback(&DeliveryChannel::on_native_fragment, this);
    }
    diagnostics_.record(DiagnosticEvent{
        VGL_LOG_LEVEL_DEBUG, COMPONENT,
        "Closed, discarded " + std::to_string(discarded) + " undelivered item(s)"});
}

bool DeliveryChannel::drain_and_close(std::chrono::milliseconds timeout) {
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained = drained_.wait_for(lock, timeout, [this] {
            return closed_ || items_.empty() || !reader_attached_;
        });
        drained = drained && items_.empty();
    }
    if (!drained) {
        diagnostics_.record(DiagnosticEvent{VGL_LOG_LEVEL_WARNING, COMPONENT,
                                            "Reader did not drain the channel before close"});
    }
    close();
    return drained;
}

bool DeliveryChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t DeliveryChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::optional<std::string> DeliveryChannel::pop_locked() {
    if (closed_ || items_.empty()) {
        return std::nullopt;
    }
    std::string item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    if (items_.empty()) {
        drained_.notify_all();
    }
    return item;
}

vgl_bool_t DeliveryChannel::on_native_fragment(const char* text, size_t len, void* user_data) {
    auto* channel = static_cast<DeliveryChannel*>(user_data);
    if (channel == nullptr || (text == nullptr && len > 0)) {
        return VGL_FALSE;
    }
    // The fragment is borrowed; copy it before the native side reuses it.
    return channel->push(len > 0 ? std::string(text, len) : std::string()) ? VGL_TRUE : VGL_FALSE;
}

}  // namespace client
}  // namespace vgl
