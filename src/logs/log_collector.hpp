/**
 * @file log_collector.hpp
 * @brief Streams container output into the ExecutionTracker and hands
 *        consumers a resumable cursor over it.
 */

#pragma once

#include "container/lifecycle_manager.hpp"
#include "core/logger.hpp"
#include "tracker/execution_tracker.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace sandbox_orchestrator {

/**
 * @brief Lazy, restartable sequence over one execution's log.
 *
 * A cursor is just (execution id, next sequence number). Constructing a
 * new cursor at a saved position() resumes without loss or duplication.
 */
class LogCursor {
public:
    static constexpr size_t BATCH_SIZE = 256;

    LogCursor(const ExecutionTracker& tracker, ExecutionId id, uint64_t since = 0);

    /**
     * @brief Next chunk, suspending the caller up to `timeout`.
     *
     * ReadStatus::Closed once the log is closed and fully consumed.
     * Fails with ExecutionNotFound if the execution was evicted.
     */
    Result<ReadStatus> next(LogChunk& out, Duration timeout);

    [[nodiscard]] uint64_t position() const noexcept { return position_; }
    [[nodiscard]] const ExecutionId& execution_id() const noexcept { return id_; }

private:
    const ExecutionTracker* tracker_;
    ExecutionId id_;
    uint64_t position_;                 ///< Sequence of the next chunk to hand out
    std::deque<LogChunk> buffered_;
    bool closed_{false};
};

/**
 * @brief Owns one pump thread per attached execution.
 *
 * The pump copies frames from the runtime's follow-mode log stream into
 * the tracker and closes the record's log when the stream ends, fails,
 * or the execution is detached.
 */
class LogCollector {
public:
    static constexpr Duration POLL_INTERVAL{100};

    LogCollector(ExecutionTracker& tracker, LifecycleManager& lifecycle, Logger& logger);
    ~LogCollector();

    LogCollector(const LogCollector&) = delete;
    LogCollector& operator=(const LogCollector&) = delete;

    /// Open the log stream and start pumping. No-op if already attached.
    Result<void> attach(const ExecutionId& id, const ContainerHandle& handle);

    /// Stop the pump and release its runtime connection. Safe to call twice.
    void detach(const ExecutionId& id);
    void detach_all();

    [[nodiscard]] LogCursor cursor(const ExecutionId& id, uint64_t since = 0) const;
    [[nodiscard]] size_t attached_count() const;

private:
    void pump(std::stop_token stop, ExecutionId id, std::unique_ptr<ILogStream> stream);

    ExecutionTracker& tracker_;
    LifecycleManager& lifecycle_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, std::jthread> pumps_;
};

}  // namespace sandbox_orchestrator
