/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Submitting an ExecutionRequest and getting an id back immediately
 *   2. Polling status and logs, or following output through a cursor
 *   3. Cancelling, awaiting and deleting executions
 *
 * The container runtime is injected by reference; the caller owns it and
 * keeps it alive for the Orchestrator's lifetime (DockerRuntime in
 * production, MockRuntime in tests and dry runs).
 */

#pragma once

#include "catalog/runtime_catalog.hpp"
#include "container/container_runtime.hpp"
#include "container/lifecycle_manager.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/request.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/resource_limiter.hpp"
#include "executor/worker_pool.hpp"
#include "logs/log_collector.hpp"
#include "orchestrator/records.hpp"
#include "orchestrator/workspace.hpp"
#include "reaper/reaper.hpp"
#include "telemetry/metrics_collector.hpp"
#include "tracker/execution_tracker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace sandbox_orchestrator {

class Orchestrator {
public:
    struct Options {
        Config config;
        RuntimeCatalog catalog;                     ///< Empty = built-in environments
        std::unique_ptr<ILogSink> log_sink;         ///< Null = discard
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;     ///< Null = no metrics
    };

    Orchestrator(IContainerRuntime& runtime, Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Ping the runtime, sweep orphans from earlier processes, start the reaper.
    Result<void> start();

    /// Cancel every active execution, remove its container and stop all threads.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Executions ───────────────────────────

    /**
     * @brief Submit a request; returns once the container is started.
     *
     * Never waits for the program to finish. Fails with UnsupportedRuntime
     * or InvalidResourceRequest before any container is created, and with
     * ContainerCreateError/ContainerStartError when the runtime refuses.
     * A start failure still leaves a FAILED record behind for inspection.
     */
    Result<ExecutionId> execute(const ExecutionRequest& request);

    Result<ExecutionStatusInfo> status(const ExecutionId& id) const;

    /// Everything logged from `since` onward, in order.
    Result<ExecutionLog> logs(const ExecutionId& id, std::optional<uint64_t> since = std::nullopt) const;

    /// Resumable cursor over the execution's log.
    Result<LogCursor> follow(const ExecutionId& id, uint64_t since = 0) const;

    /**
     * @brief Request termination.
     *
     * The record moves to CANCELLED before the container is stopped, so a
     * concurrently observed exit cannot overwrite it. Fails with
     * InvalidTransition if the execution already finished.
     */
    Result<void> cancel(const ExecutionId& id);

    /// Block the caller until the execution is terminal and its log closed.
    Result<ExecutionResponse> wait(const ExecutionId& id, Duration timeout);

    /// Current response snapshot, terminal or not.
    Result<ExecutionResponse> response(const ExecutionId& id) const;

    /// Explicit deletion: cancel if active, remove the container, evict the record.
    Result<void> remove(const ExecutionId& id);

    /// Containers of executions still tracked by this process, optionally
    /// only those of one project.
    [[nodiscard]] std::vector<ContainerInfo> containers(const std::optional<ProjectId>& project_id = std::nullopt);

    [[nodiscard]] const std::vector<RuntimeEnvironment>& environments() const noexcept {
        return catalog_.environments();
    }

    /// Remove managed containers no tracked execution owns. Returns how many.
    Result<size_t> sweep_orphans();

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    ExecutionTracker& tracker() { return tracker_; }
    Reaper& reaper() { return reaper_; }
    LogCollector& collector() { return collector_; }

private:
    Result<RuntimeEnvironment> resolve_environment(const ExecutionRequest& request);
    Result<ExecutionId> fail_pending(const ExecutionId& id, const Error& error);
    void on_transition(const ExecutionId& id, ExecutionStatus from, ExecutionStatus to,
                       std::optional<int> exit_code);

    Config config_;
    RuntimeCatalog catalog_;
    Logger logger_;
    std::unique_ptr<MetricsCollector> metrics_;

    ResourceLimiter limiter_;
    WorkspaceStager stager_;
    ExecutionTracker tracker_;
    LifecycleManager lifecycle_;
    LogCollector collector_;
    Reaper reaper_;

    // Declared last: destroyed first, draining queued cleanup while the
    // components it references are still alive.
    WorkerPool pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};

}  // namespace sandbox_orchestrator
