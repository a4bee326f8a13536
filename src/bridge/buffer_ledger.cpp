#include "buffer_ledger.h"

#include <cstdlib>
#include <cstring>

#include "vgl/core/vgl_logger.h"

namespace vgl {
namespace bridge {

namespace {
const char* LOG_CAT = "BufferLedger";
}  // namespace

BufferLedger& BufferLedger::instance() {
    static BufferLedger ledger;
    return ledger;
}

void* BufferLedger::allocate(const std::vector<uint8_t>& bytes) {
    // malloc(0) may return NULL, which the caller would read as a failure
    void* ptr = std::malloc(bytes.empty() ? 1 : bytes.size());
    if (ptr == nullptr) {
        VGL_LOG_ERROR(LOG_CAT, "Failed to allocate %zu bytes", bytes.size());
        return nullptr;
    }
    if (!bytes.empty()) {
        std::memcpy(ptr, bytes.data(), bytes.size());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    live_[ptr] = bytes.size();
    return ptr;
}

void BufferLedger::release(void* ptr, size_t len) {
    if (ptr == nullptr) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(ptr);
        if (it == live_.end()) {
            VGL_LOG_ERROR(LOG_CAT, "Ignoring free of unknown buffer %p (%zu bytes)", ptr, len);
            return;
        }
        if (it->second != len) {
            VGL_LOG_WARNING(LOG_CAT, "Buffer %p freed with length %zu, allocated with %zu", ptr,
                            len, it->second);
        }
        live_.erase(it);
    }

    std::free(ptr);
}

size_t BufferLedger::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

}  // namespace bridge
}  // namespace vgl
