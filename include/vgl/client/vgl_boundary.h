/**
 * @file vgl_boundary.h
 * @brief Virgil Commons - Caller-side binding of the native entry points
 */

#ifndef VGL_CLIENT_BOUNDARY_H
#define VGL_CLIENT_BOUNDARY_H

#include <memory>
#include <string>

#include "vgl/bridge/vgl_bridge.h"
#include "vgl/client/vgl_ownership.h"

namespace vgl {
namespace client {

/**
 * A complete vgl_boundary_t table plus, for a library opened at runtime,
 * the library handle that keeps its code mapped. Copies share the handle;
 * the library is closed when the last copy goes away.
 */
class Boundary {
   public:
    /**
     * @throws EngineFault if any entry point is missing from the table
     */
    explicit Boundary(const vgl_boundary_t& table);

    /** Entry points of the native library this program links against. */
    static Boundary native();

    /**
     * Open a native library with dlopen and resolve every vgl_* entry point.
     * @throws EngineFault (VGL_ERROR_NOT_INITIALIZED) if the library or a symbol is missing
     */
    static Boundary load(const std::string& library_path);

    const vgl_boundary_t& table() const { return table_; }

    // The only way a callee-owned buffer is released.
    void free_buffer(void* ptr, size_t len) const { table_.free_buffer(ptr, len); }

    /** Wrap a pointer returned by an entry point so it is freed exactly once. */
    CalleeBuffer adopt(void* ptr, size_t len, OwnershipTracker* tracker = nullptr) const;

   private:
    Boundary(const vgl_boundary_t& table, std::shared_ptr<void> library);

    vgl_boundary_t table_;
    std::shared_ptr<void> library_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_BOUNDARY_H
