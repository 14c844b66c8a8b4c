/**
 * @file reaper.hpp
 * @brief Background deadline enforcement and container cleanup.
 *
 * Every interval the Reaper scans active executions: an exited container
 * finalizes its record as SUCCEEDED/FAILED by exit code, a container past
 * its deadline is marked TIMED_OUT. Terminal executions whose container
 * still exists are handed to the WorkerPool for stop + remove; failures
 * are logged and retried on the next cycle. Records past the retention
 * window are evicted together with their staged workspace.
 */

#pragma once

#include "container/lifecycle_manager.hpp"
#include "core/logger.hpp"
#include "executor/worker_pool.hpp"
#include "logs/log_collector.hpp"
#include "telemetry/metrics_collector.hpp"
#include "tracker/execution_tracker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_set>

namespace sandbox_orchestrator {

class Reaper {
public:
    struct Options {
        Duration interval{500};
        std::chrono::seconds stop_grace{5};     ///< Also bounds how long removal waits for output
        std::chrono::seconds retention{600};
    };

    Reaper(ExecutionTracker& tracker,
           LifecycleManager& lifecycle,
           LogCollector& collector,
           WorkerPool& pool,
           Logger& logger,
           MetricsCollector* metrics,
           Options options);
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return thread_.joinable(); }

    /// One scan. Cleanup is queued on the pool, not awaited.
    void run_once();

    /**
     * @brief Stop and remove an execution's container now.
     *
     * Waits up to the grace period for the log to drain before removal.
     * Returns false when the runtime refused; the next cycle retries.
     */
    bool cleanup(const ExecutionId& id);

    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_.load(); }

private:
    void loop(std::stop_token stop);
    void check(const ExecutionId& id, SteadyTime now);
    void schedule_cleanup(const ExecutionId& id);
    void evict();

    ExecutionTracker& tracker_;
    LifecycleManager& lifecycle_;
    LogCollector& collector_;
    WorkerPool& pool_;
    Logger& logger_;
    MetricsCollector* metrics_;
    Options options_;

    std::mutex inflight_mutex_;
    std::unordered_set<ExecutionId> inflight_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::atomic<uint64_t> cycles_{0};
    std::jthread thread_;
};

}  // namespace sandbox_orchestrator
