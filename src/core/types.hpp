/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxOrchestrator.
 *
 * Identity aliases, clocks, execution status and log stream vocabulary.
 * All types are value types and safe to copy across threads.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ExecutionId = std::string;
using ContainerId = std::string;
using ProjectId = std::string;
using RuntimeId = std::string;

using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Pending,       ///< Registered, container not yet running
    Running,       ///< Container start confirmed
    Succeeded,     ///< Exited with code 0
    Failed,        ///< Non-zero exit, or create/start failure
    TimedOut,      ///< Deadline passed before the container exited
    Cancelled      ///< Explicit stop request
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Pending:   return "pending";
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Succeeded: return "succeeded";
        case ExecutionStatus::Failed:    return "failed";
        case ExecutionStatus::TimedOut:  return "timed_out";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// Terminal statuses admit no further transitions.
[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Succeeded
        || status == ExecutionStatus::Failed
        || status == ExecutionStatus::TimedOut
        || status == ExecutionStatus::Cancelled;
}

std::optional<ExecutionStatus> parse_execution_status(std::string_view text);

// ─────────────────────────────────────────────
// Log Streams
// ─────────────────────────────────────────────

enum class StreamType : uint8_t {
    Stdout,
    Stderr
};

[[nodiscard]] constexpr std::string_view to_string(StreamType stream) noexcept {
    switch (stream) {
        case StreamType::Stdout: return "stdout";
        case StreamType::Stderr: return "stderr";
    }
    return "unknown";
}

/// Outcome of a timed read from a log source.
enum class ReadStatus : uint8_t {
    Data,       ///< A chunk was produced
    Timeout,    ///< Nothing arrived before the timeout
    Closed      ///< The source is finished and drained
};

/**
 * @brief One chunk of container output.
 *
 * Sequence numbers are assigned by the ExecutionTracker, start at 0 and
 * are dense within one execution.
 */
struct LogChunk {
    StreamType stream{StreamType::Stdout};
    std::string text;
    uint64_t sequence{0};

    bool operator==(const LogChunk&) const = default;
};

}  // namespace sandbox_orchestrator
