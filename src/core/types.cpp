/**
 * @file types.cpp
 * @brief Parsing helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <array>

namespace sandbox_orchestrator {

std::optional<ExecutionStatus> parse_execution_status(std::string_view text) {
    static constexpr std::array kAll = {
        ExecutionStatus::Pending,  ExecutionStatus::Running,  ExecutionStatus::Succeeded,
        ExecutionStatus::Failed,   ExecutionStatus::TimedOut, ExecutionStatus::Cancelled,
    };
    for (auto status : kAll) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

}  // namespace sandbox_orchestrator
