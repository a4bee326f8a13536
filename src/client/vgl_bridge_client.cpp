#include "vgl/client/vgl_bridge_client.h"

namespace vgl {
namespace client {

std::future<wire::Response> BridgeClient::send(wire::Message message) {
    const Dispatcher* dispatcher = &dispatcher_;
    return worker_.submit(
        [dispatcher, message = std::move(message)] { return dispatcher->dispatch(message); });
}

std::future<wire::Context> BridgeClient::initialize(std::string model_path,
                                                    std::vector<std::string> wake_words) {
    const Dispatcher* dispatcher = &dispatcher_;
    return worker_.submit(
        [dispatcher, model_path = std::move(model_path), wake_words = std::move(wake_words)] {
            return dispatcher->initialize(model_path, wake_words);
        });
}

std::future<wire::AdvanceResult> BridgeClient::advance(std::shared_ptr<ContextHandle> handle,
                                                       wire::MessageTag op,
                                                       wire::AudioWindow window) {
    return advance(std::move(handle), op, std::move(window),
                   [](wire::AdvanceResult result) { return result; });
}

}  // namespace client
}  // namespace vgl
