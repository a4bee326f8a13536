#include "vgl/client/vgl_ownership.h"

#include <cstdlib>
#include <cstring>
#include <new>
#include <sstream>

namespace vgl {
namespace client {

namespace {

size_t index_of(Owner owner) {
    return owner == Owner::Caller ? 0 : 1;
}

std::string describe(Owner owner, const void* pointer, size_t length) {
    std::ostringstream out;
    out << owner_name(owner) << " buffer " << pointer << " (" << length << " bytes)";
    return out.str();
}

}  // namespace

const char* owner_name(Owner owner) {
    switch (owner) {
        case Owner::Caller:
            return "caller";
        case Owner::Callee:
            return "callee";
    }
    return "unknown";
}

// =============================================================================
// HEAP ALLOCATOR
// =============================================================================

void* HeapAllocator::allocate(size_t size) {
    if (size == 0) {
        return nullptr;
    }
    return std::malloc(size);
}

void HeapAllocator::deallocate(void* ptr, size_t /*size*/) {
    std::free(ptr);
}

// =============================================================================
// OWNERSHIP TRACKER
// =============================================================================

void OwnershipTracker::on_acquire(Owner owner, const void* pointer, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    acquired_[index_of(owner)]++;
    if (pointer == nullptr) {
        violations_.push_back("acquired null " + describe(owner, pointer, length));
        return;
    }
    auto inserted = live_.emplace(pointer, AllocationRecord{owner, pointer, length});
    if (!inserted.second) {
        violations_.push_back("pointer acquired twice: " + describe(owner, pointer, length));
    }
}

void OwnershipTracker::on_release(Owner owner, const void* pointer, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    released_[index_of(owner)]++;

    auto it = live_.find(pointer);
    if (it == live_.end()) {
        violations_.push_back("release of unknown or already released " +
                              describe(owner, pointer, length));
        return;
    }
    if (it->second.owner != owner) {
        violations_.push_back("released by wrong owner: " +
                              describe(it->second.owner, pointer, length));
    }
    if (it->second.length != length) {
        violations_.push_back("length mismatch on release: " + describe(owner, pointer, length));
    }
    live_.erase(it);
}

size_t OwnershipTracker::acquired(Owner owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquired_[index_of(owner)];
}

size_t OwnershipTracker::released(Owner owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_[index_of(owner)];
}

size_t OwnershipTracker::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

std::vector<AllocationRecord> OwnershipTracker::outstanding_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AllocationRecord> records;
    records.reserve(live_.size());
    for (const auto& entry : live_) {
        records.push_back(entry.second);
    }
    return records;
}

std::vector<std::string> OwnershipTracker::violations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return violations_;
}

bool OwnershipTracker::balanced() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.empty() && violations_.empty() && acquired_[0] == released_[0] &&
           acquired_[1] == released_[1];
}

// =============================================================================
// CALLER BUFFERS
// =============================================================================

CallerBuffer make_caller_buffer(Allocator& allocator, const std::vector<uint8_t>& bytes,
                                OwnershipTracker* tracker) {
    if (bytes.empty()) {
        return CallerBuffer(allocator.empty_sentinel(), 0, nullptr);
    }

    void* ptr = allocator.allocate(bytes.size());
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    std::memcpy(ptr, bytes.data(), bytes.size());

    Allocator* owner = &allocator;
    return CallerBuffer(
        ptr, bytes.size(), [owner](void* p, size_t n) { owner->deallocate(p, n); }, tracker);
}

}  // namespace client
}  // namespace vgl
