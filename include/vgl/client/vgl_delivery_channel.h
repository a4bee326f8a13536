/**
 * @file vgl_delivery_channel.h
 * @brief Virgil Commons - Push path for incremental transcription results
 *
 * The native engine pushes fragments through a registered callback; the
 * application pulls them from a single Receiver. Items are delivered in
 * the order they were pushed and none are dropped while the channel is
 * open: a push into a full channel waits for the reader.
 *
 * close() is terminal. It unregisters the callback, throws away anything
 * still buffered and makes every later push fail. drain_and_close() first
 * lets an attached reader take what is already buffered.
 */

#ifndef VGL_CLIENT_DELIVERY_CHANNEL_H
#define VGL_CLIENT_DELIVERY_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "vgl/client/vgl_boundary.h"
#include "vgl/client/vgl_diagnostics.h"

namespace vgl {
namespace client {

constexpr size_t kDefaultChannelCapacity = 64;
constexpr std::chrono::milliseconds kDefaultDrainTimeout{5000};

class DeliveryChannel {
   public:
    class Receiver {
       public:
        Receiver() = default;
        ~Receiver();

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        Receiver(Receiver&& other) noexcept;
        Receiver& operator=(Receiver&& other) noexcept;

        /** Block until an item arrives. Returns nullopt once the channel is closed. */
        std::optional<std::string> receive();

        std::optional<std::string> try_receive();

        std::optional<std::string> receive_for(std::chrono::milliseconds timeout);

       private:
        friend class DeliveryChannel;
        explicit Receiver(DeliveryChannel* channel) : channel_(channel) {}

        DeliveryChannel* channel_ = nullptr;
    };

    DeliveryChannel(DiagnosticsSink& diagnostics, size_t capacity = kDefaultChannelCapacity);
    ~DeliveryChannel();

    DeliveryChannel(const DeliveryChannel&) = delete;
    DeliveryChannel& operator=(const DeliveryChannel&) = delete;

    /**
     * Handshake: register this channel as the native delivery callback.
     * Must happen before any call that streams results.
     */
    vgl_result_t connect(const Boundary& boundary);
    bool connected() const;

    /**
     * Producer side. Waits while the channel is full.
     * @return false if the channel is closed
     */
    bool push(std::string item);

    /**
     * Attach the only reader.
     * @throws std::logic_error if a Receiver is already attached or the channel is closed
     */
    Receiver open_reader();

    void close();

    /**
     * Wait until the reader has taken every buffered item (or detaches, or
     * the timeout passes), then close. Without a reader this is close().
     * @return true if nothing was discarded
     */
    bool drain_and_close(std::chrono::milliseconds timeout = kDefaultDrainTimeout);

    bool is_closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

   private:
    static vgl_bool_t on_native_fragment(const char* text, size_t len, void* user_data);

    void detach_reader();
    std::optional<std::string> pop_locked();

    DiagnosticsSink& diagnostics_;
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable drained_;
    std::deque<std::string> items_;
    bool closed_ = false;
    bool reader_attached_ = false;

    std::optional<Boundary> boundary_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_DELIVERY_CHANNEL_H
