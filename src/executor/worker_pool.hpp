/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool for container cleanup work.
 *
 * The Reaper and the Orchestrator hand blocking runtime calls (stop,
 * remove, workspace deletion) to this pool so that no single slow
 * container delays the others.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace sandbox_orchestrator {

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable; its result (or exception) is delivered via the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Fire-and-forget variant. Returns false once the pool is shutting down.
    bool post(std::function<void()> func);

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    /// Stop accepting work, run what is queued, then join the workers.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);
    bool enqueue(std::function<void()> task);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("worker pool is shut down")));
    }
    return future;
}

}  // namespace sandbox_orchestrator
