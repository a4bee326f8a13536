/**
 * @file test_context.cpp
 * @brief Tests for context threading and single-flight ordering
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "scripted_engine.h"
#include "vgl/client/vgl_bridge_client.h"
#include "vgl/client/vgl_context_handle.h"
#include "vgl/client/vgl_dispatcher.h"
#include "vgl/client/vgl_worker.h"

using namespace vgl::client;
namespace wire = vgl::wire;
using vgl_test::one_second_audio;
using vgl_test::RecordingDiagnostics;
using vgl_test::ScriptedEngine;

namespace {

wire::AdvanceResult with_transcript(const wire::Context& context, const std::string& text) {
    wire::AdvanceResult result{context, wire::Text{text}};
    result.context.transcript = text;
    return result;
}

}  // namespace

// =============================================================================
// CONTEXT HANDLE
// =============================================================================

TEST(ContextHandle, RunReplacesHeldContext) {
    ContextHandle handle(1, wire::Context{"model.bin", {"Hey Assistant"}, ""});

    wire::AdvanceResult result = handle.run(handle.take_ticket(), [](const wire::Context& c) {
        return with_transcript(c, "hello");
    });

    EXPECT_EQ(result.context.transcript, "hello");
    EXPECT_EQ(handle.snapshot(), result.context);
    EXPECT_EQ(handle.id(), 1u);
}

TEST(ContextHandle, ThrowingOperationLeavesContextAndPassesTurn) {
    ContextHandle handle(1, wire::Context{"model.bin", {}, "before"});

    ContextHandle::Ticket first = handle.take_ticket();
    ContextHandle::Ticket second = handle.take_ticket();

    EXPECT_THROW(handle.run(std::move(first),
                            [](const wire::Context&) -> wire::AdvanceResult {
                                throw std::runtime_error("engine went away");
                            }),
                 std::runtime_error);
    EXPECT_EQ(handle.snapshot().transcript, "before");

    wire::AdvanceResult result = handle.run(std::move(second), [](const wire::Context& c) {
        return with_transcript(c, "after");
    });
    EXPECT_EQ(result.context.transcript, "after");
}

TEST(ContextHandle, TicketsAreServedInOrderTaken) {
    ContextHandle handle(1, wire::Context{});
    constexpr int kCount = 8;

    std::vector<ContextHandle::Ticket> tickets;
    for (int i = 0; i < kCount; ++i) {
        tickets.push_back(handle.take_ticket());
    }

    std::mutex order_mutex;
    std::vector<uint64_t> order;

    // Start the threads in reverse so arrival order disagrees with ticket order
    std::vector<std::thread> threads;
    for (int i = kCount - 1; i >= 0; --i) {
        threads.emplace_back([&, ticket = std::move(tickets[i])]() mutable {
            const uint64_t number = ticket.number();
            handle.run(std::move(ticket), [&](const wire::Context& c) {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(number);
                return with_transcript(c, std::to_string(number));
            });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(order.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(order[i], static_cast<uint64_t>(i));
    }
    EXPECT_EQ(handle.snapshot().transcript, std::to_string(kCount - 1));
}

TEST(ContextHandle, AbandonedTicketDoesNotStallTheLine) {
    ContextHandle handle(1, wire::Context{});

    ContextHandle::Ticket first = handle.take_ticket();
    {
        ContextHandle::Ticket dropped = handle.take_ticket();
    }
    ContextHandle::Ticket third = handle.take_ticket();

    auto later = std::async(std::launch::async, [&] {
        return handle.run(std::move(third),
                          [](const wire::Context& c) { return with_transcript(c, "third"); });
    });

    handle.run(std::move(first), [](const wire::Context& c) { return with_transcript(c, "first"); });

    ASSERT_EQ(later.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(later.get().context.transcript, "third");
}

TEST(ContextHandle, ForeignTicketIsRejected) {
    ContextHandle a(1, wire::Context{});
    ContextHandle b(2, wire::Context{});

    EXPECT_THROW(a.run(b.take_ticket(), [](const wire::Context& c) {
        return with_transcript(c, "x");
    }),
                 std::logic_error);
    EXPECT_THROW(a.run(ContextHandle::Ticket(), [](const wire::Context& c) {
        return with_transcript(c, "x");
    }),
                 std::logic_error);
}

// =============================================================================
// CONTEXT THREADING THROUGH THE NATIVE ENGINE
// =============================================================================

class ContextFlowTest : public ::testing::Test {
   protected:
    void SetUp() override {
        vgl_shutdown();
        ScriptedEngine::instance().install();
    }

    void TearDown() override { vgl_shutdown(); }

    RecordingDiagnostics diagnostics_;
    HeapAllocator allocator_;
};

TEST_F(ContextFlowTest, DetectThenTranscribe) {
    Dispatcher dispatcher(Boundary::native(), allocator_, diagnostics_);
    Worker worker(diagnostics_);
    BridgeClient client(dispatcher, worker);

    wire::Context initial = client.initialize("model.bin", {"Hey Assistant"}).get();
    EXPECT_EQ(initial.model_path, "model.bin");
    auto handle = std::make_shared<ContextHandle>(1, initial);

    wire::AdvanceResult detected =
        client
            .advance(handle, wire::MessageTag::DetectWakeWords,
                     wire::AudioWindow{one_second_audio(), 0})
            .get();
    EXPECT_EQ(std::get<wire::WakeWordDetection>(detected.response),
              (wire::WakeWordDetection{true, 0, 13}));
    EXPECT_EQ(handle->snapshot().transcript, vgl_test::kWakeSentence);

    wire::AdvanceResult transcribed =
        client
            .advance(handle, wire::MessageTag::Transcribe,
                     wire::AudioWindow{one_second_audio(), 0})
            .get();
    EXPECT_EQ(std::get<wire::Text>(transcribed.response).text, "open the door");
    EXPECT_EQ(transcribed.context.transcript, "open the door");
    EXPECT_EQ(transcribed.context.model_path, "model.bin");
    EXPECT_EQ(handle->snapshot(), transcribed.context);
    EXPECT_EQ(handle->snapshot().wake_words, std::vector<std::string>{"Hey Assistant"});

    worker.shutdown();
}

TEST_F(ContextFlowTest, ErrorReplyKeepsPreviousContext) {
    Dispatcher dispatcher(Boundary::native(), allocator_, diagnostics_);
    Worker worker(diagnostics_);
    BridgeClient client(dispatcher, worker);

    auto handle =
        std::make_shared<ContextHandle>(1, wire::Context{"models/corrupt.bin", {}, "earlier"});

    wire::AdvanceResult result =
        client.advance(handle, wire::MessageTag::Transcribe, wire::AudioWindow{}).get();

    ASSERT_TRUE(std::holds_alternative<wire::Error>(result.response));
    EXPECT_EQ(handle->snapshot().transcript, "earlier");
    worker.shutdown();
}

TEST_F(ContextFlowTest, ConcurrentAdvancesCompleteInSubmissionOrder) {
    std::atomic<int> call{0};
    ScriptedEngine::instance().set_script([&call](const std::vector<float>&) {
        const int n = call++;
        // Early calls take longer, so a reordering would show up
        std::this_thread::sleep_for(std::chrono::milliseconds(n < 3 ? 20 : 0));
        return "call " + std::to_string(n);
    });

    Dispatcher dispatcher(Boundary::native(), allocator_, diagnostics_);
    Worker worker(diagnostics_, 4);
    BridgeClient client(dispatcher, worker);
    auto handle = std::make_shared<ContextHandle>(1, wire::Context{"model.bin", {}, ""});

    std::vector<std::future<wire::AdvanceResult>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(client.advance(handle, wire::MessageTag::Transcribe,
                                         wire::AudioWindow{one_second_audio(), 0}));
    }

    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(futures[i].get().context.transcript, "call " + std::to_string(i));
    }
    EXPECT_EQ(handle->snapshot().transcript, "call 5");
    worker.shutdown();
}
