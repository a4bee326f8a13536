#include "vgl/client/vgl_worker.h"

#include <string>

namespace vgl {
namespace client {

namespace {
const char* COMPONENT = "Worker";
}  // namespace

Worker::Worker(DiagnosticsSink& diagnostics, size_t num_threads) : diagnostics_(diagnostics) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    threads_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back(&Worker::run, this);
    }
    diagnostics_.record(DiagnosticEvent{VGL_LOG_LEVEL_DEBUG, COMPONENT,
                                        "Started " + std::to_string(num_threads) + " thread(s)"});
}

Worker::~Worker() {
    shutdown();
}

void Worker::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            throw std::logic_error("worker is shut down");
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

size_t Worker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Worker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load() && threads_.empty()) {
            return;
        }
        stopping_.store(true);
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    diagnostics_.record(DiagnosticEvent{VGL_LOG_LEVEL_DEBUG, COMPONENT, "Stopped"});
}

// Consumer: wait for tasks, run them as they arrive
void Worker::run() {
    while (true) {
        std::function<void()> task;

        // Wait for work or the stop signal
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || stopping_.load(); });

            if (queue_.empty()) break;  // stopping and drained

            task = std::move(queue_.front());
            queue_.pop();
        }

        // packaged_task stores exceptions in the future, so nothing escapes here
        task();
    }
}

}  // namespace client
}  // namespace vgl
