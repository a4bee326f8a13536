/**
 * @file vgl_bridge_client.h
 * @brief Virgil Commons - Asynchronous front end to the Dispatcher
 *
 * Every call is handed to the Worker and returns a future. Calls that carry
 * a context take their place in the ContextHandle's line at submission
 * time, so two advances on one handle complete in the order they were
 * submitted. Stateless calls are not ordered against anything.
 */

#ifndef VGL_CLIENT_BRIDGE_CLIENT_H
#define VGL_CLIENT_BRIDGE_CLIENT_H

#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "vgl/client/vgl_context_handle.h"
#include "vgl/client/vgl_dispatcher.h"
#include "vgl/client/vgl_worker.h"

namespace vgl {
namespace client {

class BridgeClient {
   public:
    BridgeClient(const Dispatcher& dispatcher, Worker& worker)
        : dispatcher_(dispatcher), worker_(worker) {}

    std::future<wire::Response> send(wire::Message message);

    std::future<wire::Context> initialize(std::string model_path,
                                          std::vector<std::string> wake_words);

    std::future<wire::AdvanceResult> advance(std::shared_ptr<ContextHandle> handle,
                                             wire::MessageTag op, wire::AudioWindow window);

    /**
     * Like advance(), but then(result) also runs on the worker and its
     * value is what the future carries.
     */
    template <typename Then>
    std::future<std::invoke_result_t<Then, wire::AdvanceResult>> advance(
        std::shared_ptr<ContextHandle> handle, wire::MessageTag op, wire::AudioWindow window,
        Then then) {
        auto ticket = std::make_shared<ContextHandle::Ticket>(handle->take_ticket());
        const Dispatcher* dispatcher = &dispatcher_;
        return worker_.submit([dispatcher, handle, ticket, op, window = std::move(window),
                               then = std::move(then)]() mutable {
            wire::AdvanceResult result =
                handle->run(std::move(*ticket), [&](const wire::Context& context) {
                    return dispatcher->advance(op, context, window);
                });
            return then(std::move(result));
        });
    }

   private:
    const Dispatcher& dispatcher_;
    Worker& worker_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_BRIDGE_CLIENT_H
