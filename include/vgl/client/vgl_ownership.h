/**
 * @file vgl_ownership.h
 * @brief Virgil Commons - Ownership of buffers that cross the boundary
 *
 * Two allocators are involved in every call: the caller's, which owns
 * request buffers, and the native library's, which owns reply buffers.
 * A buffer must go back to the allocator that produced it, exactly once.
 *
 * OwnedBuffer<Owner> is a move-only guard that performs that release when
 * it goes out of scope. The Owner parameter keeps the two kinds distinct
 * at compile time, so a reply buffer cannot be passed where a request
 * buffer is expected.
 */

#ifndef VGL_CLIENT_OWNERSHIP_H
#define VGL_CLIENT_OWNERSHIP_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vgl {
namespace client {

enum class Owner {
    Caller,
    Callee,
};

const char* owner_name(Owner owner);

// =============================================================================
// ALLOCATOR
// =============================================================================

/**
 * Caller-side allocator for request buffers.
 */
class Allocator {
   public:
    virtual ~Allocator() = default;

    virtual void* allocate(size_t size) = 0;
    virtual void deallocate(void* ptr, size_t size) = 0;

    /**
     * Pointer passed across the boundary for a zero-length payload. No
     * allocation is made for it and it is never released. Platforms whose
     * FFI rejects NULL return a sentinel here.
     */
    virtual void* empty_sentinel() { return nullptr; }
};

class HeapAllocator : public Allocator {
   public:
    void* allocate(size_t size) override;
    void deallocate(void* ptr, size_t size) override;
};

// =============================================================================
// OWNERSHIP TRACKER
// =============================================================================

struct AllocationRecord {
    Owner owner;
    const void* pointer;
    size_t length;
};

/**
 * Optional instrumentation: counts acquisitions and releases per owner and
 * keeps every live record, so tests and debug builds can assert that each
 * allocation was released exactly once.
 */
class OwnershipTracker {
   public:
    void on_acquire(Owner owner, const void* pointer, size_t length);
    void on_release(Owner owner, const void* pointer, size_t length);

    size_t acquired(Owner owner) const;
    size_t released(Owner owner) const;
    size_t outstanding() const;
    std::vector<AllocationRecord> outstanding_records() const;

    // Double releases, releases by the wrong owner and unknown pointers
    std::vector<std::string> violations() const;

    bool balanced() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<const void*, AllocationRecord> live_;
    size_t acquired_[2] = {0, 0};
    size_t released_[2] = {0, 0};
    std::vector<std::string> violations_;
};

// =============================================================================
// OWNED BUFFER
// =============================================================================

template <Owner O>
class OwnedBuffer {
   public:
    using ReleasePolicy = std::function<void(void*, size_t)>;

    OwnedBuffer() = default;

    OwnedBuffer(void* data, size_t size, ReleasePolicy release, OwnershipTracker* tracker = nullptr)
        : data_(data), size_(size), release_(std::move(release)), tracker_(tracker) {
        if (tracker_ != nullptr && release_) {
            tracker_->on_acquire(O, data_, size_);
        }
    }

    ~OwnedBuffer() { reset(); }

    OwnedBuffer(const OwnedBuffer&) = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;

    OwnedBuffer(OwnedBuffer&& other) noexcept
        : data_(other.data_),
          size_(other.size_),
          release_(std::move(other.release_)),
          tracker_(other.tracker_) {
        other.data_ = nullptr;
        other.size_ = 0;
        other.release_ = nullptr;
        other.tracker_ = nullptr;
    }

    OwnedBuffer& operator=(OwnedBuffer&& other) noexcept {
        if (this != &other) {
            reset();
            data_ = other.data_;
            size_ = other.size_;
            release_ = std::move(other.release_);
            tracker_ = other.tracker_;
            other.data_ = nullptr;
            other.size_ = 0;
            other.release_ = nullptr;
            other.tracker_ = nullptr;
        }
        return *this;
    }

    static constexpr Owner owner() { return O; }

    const uint8_t* bytes() const { return static_cast<const uint8_t*>(data_); }
    void* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // True while a release is still pending.
    bool owns() const { return static_cast<bool>(release_); }

    void reset() {
        if (!release_) {
            return;
        }
        ReleasePolicy release = std::move(release_);
        release_ = nullptr;
        release(data_, size_);
        if (tracker_ != nullptr) {
            tracker_->on_release(O, data_, size_);
        }
        data_ = nullptr;
        size_ = 0;
    }

   private:
    void* data_ = nullptr;
    size_t size_ = 0;
    ReleasePolicy release_;
    OwnershipTracker* tracker_ = nullptr;
};

using CallerBuffer = OwnedBuffer<Owner::Caller>;
using CalleeBuffer = OwnedBuffer<Owner::Callee>;

/**
 * Copy bytes into a new caller-owned buffer. A zero-length payload skips
 * the allocator entirely and carries allocator.empty_sentinel().
 *
 * @throws std::bad_alloc if the allocator returns NULL
 */
CallerBuffer make_caller_buffer(Allocator& allocator, const std::vector<uint8_t>& bytes,
                                OwnershipTracker* tracker = nullptr);

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_OWNERSHIP_H
