/**
 * @file test_ownership.cpp
 * @brief Tests for scoped buffer ownership and the ownership tracker
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "scripted_engine.h"
#include "vgl/client/vgl_ownership.h"

using namespace vgl::client;
using vgl_test::CountingAllocator;
using vgl_test::SentinelAllocator;

static_assert(CallerBuffer::owner() == Owner::Caller, "caller buffer owner");
static_assert(CalleeBuffer::owner() == Owner::Callee, "callee buffer owner");
static_assert(!std::is_same<CallerBuffer, CalleeBuffer>::value,
              "caller and callee buffers are distinct types");
static_assert(!std::is_copy_constructible<CallerBuffer>::value, "buffers are move-only");

TEST(Ownership, HeapAllocatorReturnsNullForZeroBytes) {
    HeapAllocator allocator;
    EXPECT_EQ(allocator.allocate(0), nullptr);
    EXPECT_EQ(allocator.empty_sentinel(), nullptr);
}

TEST(Ownership, EmptyPayloadSkipsAllocatorWithNullPointer) {
    CountingAllocator allocator;
    OwnershipTracker tracker;
    {
        CallerBuffer buffer = make_caller_buffer(allocator, {}, &tracker);
        EXPECT_EQ(buffer.data(), nullptr);
        EXPECT_EQ(buffer.size(), 0u);
        EXPECT_FALSE(buffer.owns());
    }
    EXPECT_EQ(allocator.allocations, 0u);
    EXPECT_EQ(allocator.deallocations, 0u);
    EXPECT_EQ(tracker.acquired(Owner::Caller), 0u);
}

TEST(Ownership, EmptyPayloadSkipsAllocatorWithSentinelPointer) {
    SentinelAllocator allocator;
    {
        CallerBuffer buffer = make_caller_buffer(allocator, {});
        EXPECT_EQ(buffer.data(), allocator.sentinel());
        EXPECT_NE(buffer.data(), nullptr);
        EXPECT_FALSE(buffer.owns());
    }
    EXPECT_EQ(allocator.allocations, 0u);
    EXPECT_EQ(allocator.deallocations, 0u);
}

TEST(Ownership, CallerBufferReleasedOnceOnScopeExit) {
    CountingAllocator allocator;
    OwnershipTracker tracker;
    {
        CallerBuffer buffer = make_caller_buffer(allocator, {1, 2, 3}, &tracker);
        ASSERT_NE(buffer.data(), nullptr);
        EXPECT_EQ(buffer.bytes()[2], 3);
        EXPECT_EQ(tracker.outstanding(), 1u);
    }
    EXPECT_EQ(allocator.allocations, 1u);
    EXPECT_EQ(allocator.deallocations, 1u);
    EXPECT_EQ(allocator.double_frees, 0u);
    EXPECT_TRUE(tracker.balanced());
}

TEST(Ownership, MoveTransfersTheSingleRelease) {
    CountingAllocator allocator;
    CallerBuffer target;
    {
        CallerBuffer source = make_caller_buffer(allocator, {7});
        target = std::move(source);
        EXPECT_FALSE(source.owns());
    }
    EXPECT_EQ(allocator.deallocations, 0u);

    target.reset();
    target.reset();
    EXPECT_EQ(allocator.deallocations, 1u);
    EXPECT_EQ(allocator.double_frees, 0u);
}

TEST(Ownership, ReleaseRunsWhenExceptionUnwinds) {
    CountingAllocator allocator;
    try {
        CallerBuffer buffer = make_caller_buffer(allocator, {1});
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(allocator.allocations, allocator.deallocations);
}

TEST(Ownership, CalleeBufferUsesItsOwnReleasePolicy) {
    int callee_frees = 0;
    CountingAllocator caller_allocator;
    OwnershipTracker tracker;
    {
        void* native = std::malloc(4);
        CalleeBuffer buffer(native, 4,
                            [&callee_frees](void* p, size_t) {
                                ++callee_frees;
                                std::free(p);
                            },
                            &tracker);
        EXPECT_EQ(tracker.acquired(Owner::Callee), 1u);
    }
    EXPECT_EQ(callee_frees, 1);
    EXPECT_EQ(caller_allocator.deallocations, 0u);
    EXPECT_EQ(tracker.released(Owner::Callee), 1u);
    EXPECT_TRUE(tracker.balanced());
}

TEST(Ownership, TrackerReportsOutstandingRecords) {
    OwnershipTracker tracker;
    int a = 0;
    int b = 0;
    tracker.on_acquire(Owner::Caller, &a, 4);
    tracker.on_acquire(Owner::Callee, &b, 8);
    tracker.on_release(Owner::Caller, &a, 4);

    auto records = tracker.outstanding_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].owner, Owner::Callee);
    EXPECT_EQ(records[0].pointer, &b);
    EXPECT_EQ(records[0].length, 8u);
    EXPECT_FALSE(tracker.balanced());
}

TEST(Ownership, TrackerRecordsDoubleReleaseAndWrongOwner) {
    OwnershipTracker tracker;
    int a = 0;
    int b = 0;
    tracker.on_acquire(Owner::Caller, &a, 4);
    tracker.on_release(Owner::Caller, &a, 4);
    tracker.on_release(Owner::Caller, &a, 4);

    tracker.on_acquire(Owner::Callee, &b, 4);
    tracker.on_release(Owner::Caller, &b, 4);

    EXPECT_EQ(tracker.violations().size(), 2u);
    EXPECT_FALSE(tracker.balanced());
}
