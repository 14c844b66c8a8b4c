/**
 * @file records.hpp
 * @brief Records exposed to collaborators, with JSON serialization.
 */

#pragma once

#include "container/container_runtime.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

struct ExecutionResponse {
    ExecutionId execution_id;
    ExecutionStatus status{ExecutionStatus::Pending};
    std::optional<std::string> output;
    std::optional<std::string> error;
    Timestamp start_time{};
    std::optional<Timestamp> end_time;
    std::optional<int> exit_code;
};

struct ExecutionLog {
    ExecutionId execution_id;
    std::vector<LogChunk> logs;
    uint64_t next_sequence{0};
    bool complete{false};               ///< Log closed and fully returned
};

struct ExecutionStatusInfo {
    ExecutionId execution_id;
    ExecutionStatus status{ExecutionStatus::Pending};
};

struct ContainerInfo {
    ContainerId container_id;
    ProjectId project_id;
    ExecutionId execution_id;
    std::string status;
    Timestamp created_at{};
    std::vector<PortBinding> ports;
};

/// ISO 8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.000Z".
std::string format_timestamp(Timestamp ts);

void to_json(nlohmann::json& j, const LogChunk& chunk);
void to_json(nlohmann::json& j, const PortBinding& port);
void to_json(nlohmann::json& j, const ExecutionResponse& response);
void to_json(nlohmann::json& j, const ExecutionLog& log);
void to_json(nlohmann::json& j, const ExecutionStatusInfo& info);
void to_json(nlohmann::json& j, const ContainerInfo& info);

}  // namespace sandbox_orchestrator
