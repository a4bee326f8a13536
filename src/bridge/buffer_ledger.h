#ifndef VGL_BRIDGE_BUFFER_LEDGER_H
#define VGL_BRIDGE_BUFFER_LEDGER_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vgl {
namespace bridge {

/**
 * Native-side record of every buffer handed across the boundary.
 *
 * Buffers are allocated with malloc and must come back through release().
 * A pointer the ledger does not know is reported and left alone rather than
 * handed to free().
 */
class BufferLedger {
   public:
    static BufferLedger& instance();

    // Copies bytes into a fresh buffer. Never returns NULL for a successful
    // allocation, even when bytes is empty. Returns NULL on allocation failure.
    void* allocate(const std::vector<uint8_t>& bytes);

    void release(void* ptr, size_t len);

    size_t outstanding() const;

   private:
    BufferLedger() = default;

    mutable std::mutex mutex_;
    std::unordered_map<void*, size_t> live_;
};

}  // namespace bridge
}  // namespace vgl

#endif  // VGL_BRIDGE_BUFFER_LEDGER_H
