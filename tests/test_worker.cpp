/**
 * @file test_worker.cpp
 * @brief Tests for the background task runner
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "scripted_engine.h"
#include "vgl/client/vgl_worker.h"

using vgl::client::Worker;
using vgl_test::RecordingDiagnostics;

TEST(Worker, ReturnsTaskResultThroughFuture) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics);

    auto future = worker.submit([] { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST(Worker, RunsOffTheCallingThread) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics);

    auto future = worker.submit([] { return std::this_thread::get_id(); });
    EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST(Worker, ExceptionIsDeliveredThroughFuture) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics);

    auto failing = worker.submit([]() -> int { throw std::runtime_error("engine fault"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // The worker keeps running after a failed task
    EXPECT_EQ(worker.submit([] { return 1; }).get(), 1);
}

TEST(Worker, SingleThreadRunsTasksInSubmissionOrder) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics, 1);

    std::mutex mutex;
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(worker.submit([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(Worker, ShutdownDrainsQueuedTasks) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics, 1);

    std::atomic<int> completed{0};
    for (int i = 0; i < 5; ++i) {
        worker.submit([&completed] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++completed;
        });
    }

    worker.shutdown();
    EXPECT_EQ(completed.load(), 5);
    EXPECT_FALSE(worker.is_running());
    EXPECT_EQ(worker.pending(), 0u);
}

TEST(Worker, SubmitAfterShutdownThrows) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics);
    worker.shutdown();
    worker.shutdown();

    EXPECT_THROW(worker.submit([] { return 0; }), std::logic_error);
}

TEST(Worker, PoolRunsTasksConcurrently) {
    RecordingDiagnostics diagnostics;
    Worker worker(diagnostics, 2);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> started{0};

    auto first = worker.submit([&, gate] {
        ++started;
        gate.wait();
    });
    auto second = worker.submit([&, gate] {
        ++started;
        gate.wait();
    });

    for (int i = 0; i < 200 && started.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(started.load(), 2);

    release.set_value();
    first.get();
    second.get();
}
