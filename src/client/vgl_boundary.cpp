#include "vgl/client/vgl_boundary.h"

#include <dlfcn.h>

#include "vgl/wire/vgl_errors.h"

namespace vgl {
namespace client {

namespace {

bool is_complete(const vgl_boundary_t& table) {
    return table.setup_logs != nullptr && table.init_context != nullptr &&
           table.send_message != nullptr && table.advance_context != nullptr &&
           table.free_buffer != nullptr && table.register_callback != nullptr &&
           table.unregister_callback != nullptr && table.outstanding_buffers != nullptr &&
           table.shutdown != nullptr;
}

template <typename Fn>
void resolve(void* handle, const char* name, Fn& out, const std::string& library_path) {
    dlerror();  // Clear any existing error
    void* symbol = dlsym(handle, name);
    const char* error = dlerror();
    if (error != nullptr || symbol == nullptr) {
        throw EngineFault("Symbol " + std::string(name) + " not found in " + library_path + ": " +
                              (error ? error : "unknown error"),
                          VGL_ERROR_NOT_INITIALIZED);
    }
    out = reinterpret_cast<Fn>(symbol);
}

}  // namespace

Boundary::Boundary(const vgl_boundary_t& table) : Boundary(table, nullptr) {}

Boundary::Boundary(const vgl_boundary_t& table, std::shared_ptr<void> library)
    : table_(table), library_(std::move(library)) {
    if (!is_complete(table_)) {
        throw EngineFault("Boundary table is missing entry points", VGL_ERROR_NULL_POINTER);
    }
}

Boundary Boundary::native() {
    vgl_boundary_t table = {};
    vgl_result_t result = vgl_boundary_get_native(&table);
    if (result != VGL_SUCCESS) {
        throw EngineFault("Native boundary unavailable", result);
    }
    return Boundary(table);
}

Boundary Boundary::load(const std::string& library_path) {
    // RTLD_NOW so a missing symbol fails here, not in the middle of a call
    void* handle = dlopen(library_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* error = dlerror();
        throw EngineFault("Failed to open " + library_path + ": " + (error ? error : "unknown error"),
                          VGL_ERROR_NOT_INITIALIZED);
    }
    std::shared_ptr<void> library(handle, [](void* h) { dlclose(h); });

    vgl_boundary_t table = {};
    resolve(handle, "vgl_setup_logs", table.setup_logs, library_path);
    resolve(handle, "vgl_init_context", table.init_context, library_path);
    resolve(handle, "vgl_send_message", table.send_message, library_path);
    resolve(handle, "vgl_advance_context", table.advance_context, library_path);
    resolve(handle, "vgl_free_buffer", table.free_buffer, library_path);
    resolve(handle, "vgl_register_callback", table.register_callback, library_path);
    resolve(handle, "vgl_unregister_callback", table.unregister_callback, library_path);
    resolve(handle, "vgl_outstanding_buffers", table.outstanding_buffers, library_path);
    resolve(handle, "vgl_shutdown", table.shutdown, library_path);

    return Boundary(table, std::move(library));
}

CalleeBuffer Boundary::adopt(void* ptr, size_t len, OwnershipTracker* tracker) const {
    if (ptr == nullptr) {
        return CalleeBuffer();
    }
    // Capture the table and library handle by value so the buffer stays
    // releasable even if this Boundary is destroyed first.
    auto free_fn = table_.free_buffer;
    auto library = library_;
    return CalleeBuffer(
        ptr, len, [free_fn, library](void* p, size_t n) { free_fn(p, n); }, tracker);
}

}  // namespace client
}  // namespace vgl
