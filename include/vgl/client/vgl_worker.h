/**
 * @file vgl_worker.h
 * @brief Virgil Commons - Background execution for boundary calls
 *
 * A native call can block for a whole listen window, so the interactive
 * thread only submits work and waits on the returned future. Tasks are
 * started in submission order. There is no cancellation: a task that has
 * started runs to completion.
 */

#ifndef VGL_CLIENT_WORKER_H
#define VGL_CLIENT_WORKER_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "vgl/client/vgl_diagnostics.h"

namespace vgl {
namespace client {

class Worker {
   public:
    explicit Worker(DiagnosticsSink& diagnostics, size_t num_threads = 1);
    ~Worker();

    // Non-copyable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * Queue fn for execution. Its result, or the exception it throws, is
     * delivered through the future.
     *
     * @throws std::logic_error after shutdown()
     */
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> submit(Fn&& fn) {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    /** Run what is already queued, then stop and join. Safe to call twice. */
    void shutdown();

    bool is_running() const { return !stopping_.load(); }
    size_t pending() const;

   private:
    void enqueue(std::function<void()> task);
    void run();

    DiagnosticsSink& diagnostics_;

    std::queue<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_{false};

    std::vector<std::thread> threads_;
};

}  // namespace client
}  // namespace vgl

#endif  // VGL_CLIENT_WORKER_H
