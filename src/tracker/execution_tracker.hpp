/**
 * @file execution_tracker.hpp
 * @brief Registry of in-flight executions; the orchestrator's only shared
 *        mutable state.
 *
 * The id → slot map is guarded by a shared_mutex (writers only insert and
 * erase). Every slot has its own mutex and condition variable, so updates
 * to one execution never contend with another. Nothing outside this class
 * touches an ExecutionRecord; callers get copies.
 */

#pragma once

#include "container/lifecycle_manager.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandbox_orchestrator {

struct ExecutionRecord {
    ExecutionId id;
    ProjectId project_id;
    RuntimeId runtime_id;
    std::optional<ContainerHandle> container;
    ExecutionStatus status{ExecutionStatus::Pending};

    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    SteadyTime deadline{};              ///< Fixed at submission, never extended
    std::chrono::seconds timeout{0};

    std::vector<LogChunk> logs;
    std::optional<int> exit_code;
    std::string error;

    bool log_closed{false};             ///< No more chunks will be appended
    bool container_removed{false};
    std::optional<SteadyTime> terminal_at;
    std::filesystem::path workspace;    ///< Staged directory to delete on eviction, may be empty
};

/**
 * @brief A slice of an execution's log.
 */
struct LogSlice {
    std::vector<LogChunk> chunks;
    uint64_t next_sequence{0};          ///< Resume point for the following read
    bool closed{false};                 ///< Log closed and this slice reaches its end
    ExecutionStatus status{ExecutionStatus::Pending};
};

class ExecutionTracker {
public:
    using TransitionObserver = std::function<void(const ExecutionId&, ExecutionStatus from,
                                                  ExecutionStatus to, std::optional<int> exit_code)>;

    ExecutionTracker() = default;

    ExecutionTracker(const ExecutionTracker&) = delete;
    ExecutionTracker& operator=(const ExecutionTracker&) = delete;

    /// Generate a fresh opaque execution id.
    [[nodiscard]] static ExecutionId generate_id();

    /// Whether `from → to` is an edge of the execution state machine.
    [[nodiscard]] static bool is_valid_transition(ExecutionStatus from, ExecutionStatus to) noexcept;

    /**
     * @brief Insert a new record in PENDING.
     *
     * An empty id is replaced by a generated one. Fails with
     * DuplicateExecution if the id is taken.
     */
    Result<ExecutionId> submit(ExecutionRecord record);

    /**
     * @brief Move a record along the state machine.
     *
     * Sets started_at on RUNNING and finished_at on terminal statuses.
     * Fails with InvalidTransition if the record is terminal or the edge
     * does not exist, and ExecutionNotFound for unknown ids.
     */
    Result<void> transition(const ExecutionId& id, ExecutionStatus to,
                            std::optional<int> exit_code = std::nullopt,
                            std::string error = {});

    /// Snapshot copy. Logs are omitted when `with_logs` is false.
    Result<ExecutionRecord> get(const ExecutionId& id, bool with_logs = true) const;

    /// Ids of non-terminal records.
    [[nodiscard]] std::vector<ExecutionId> list_active() const;

    /// Ids of terminal records whose container still needs removal.
    [[nodiscard]] std::vector<ExecutionId> list_cleanup_pending() const;

    [[nodiscard]] std::vector<ExecutionId> list_all() const;

    Result<void> attach_container(const ExecutionId& id, ContainerHandle handle);
    Result<void> set_workspace(const ExecutionId& id, std::filesystem::path workspace);

    /// Append output; returns the chunk's sequence number.
    Result<uint64_t> append_log(const ExecutionId& id, StreamType stream, std::string text);

    /// No more output will arrive. Wakes every waiting reader.
    Result<void> close_log(const ExecutionId& id);

    /**
     * @brief Read up to `max` chunks starting at `since`.
     *
     * When nothing is available yet and the log is still open, waits up to
     * `wait` for new output or closure. Only the caller is suspended.
     */
    Result<LogSlice> read_log(const ExecutionId& id, uint64_t since,
                              size_t max = std::numeric_limits<size_t>::max(),
                              Duration wait = Duration::zero()) const;

    /// Wait until the record is terminal or `timeout` elapses; returns the status seen.
    Result<ExecutionStatus> wait_terminal(const ExecutionId& id, Duration timeout) const;

    /// Wait until the log is closed or `timeout` elapses; returns whether it closed.
    Result<bool> wait_log_closed(const ExecutionId& id, Duration timeout) const;

    Result<void> mark_container_removed(const ExecutionId& id);

    /**
     * @brief Drop terminal records older than `retention` whose container
     *        is gone. Returns the evicted records without logs.
     */
    std::vector<ExecutionRecord> evict_expired(std::chrono::seconds retention);

    /// Remove a record regardless of state.
    Result<ExecutionRecord> erase(const ExecutionId& id);

    void set_transition_observer(TransitionObserver observer);

    [[nodiscard]] size_t size() const;

private:
    struct Slot {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        ExecutionRecord record;
    };

    std::shared_ptr<Slot> find(const ExecutionId& id) const;
    static Error not_found(const ExecutionId& id);

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<ExecutionId, std::shared_ptr<Slot>> slots_;

    std::mutex observer_mutex_;
    TransitionObserver observer_;
};

}  // namespace sandbox_orchestrator
