/**
 * @file request.hpp
 * @brief ExecutionRequest, the input record submitted by collaborators.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sandbox_orchestrator {

/**
 * @brief A request to run a project (or an inline source) once.
 *
 * Numeric requests are signed so that negative values coming from an API
 * layer reach the Resource Limiter and are rejected there.
 */
struct ExecutionRequest {
    ProjectId project_id;
    std::optional<std::string> command;                 ///< Overrides the runtime's entry command
    std::optional<int64_t> timeout_seconds;
    std::map<std::string, std::string> environment_vars;

    std::optional<std::string> language;                ///< Defaults to project metadata
    std::optional<std::string> version;
    std::optional<int64_t> memory_bytes;
    std::optional<std::string> source;                  ///< Inline code, staged as the runtime's inline file
};

}  // namespace sandbox_orchestrator
