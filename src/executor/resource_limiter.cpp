/**
 * @file resource_limiter.cpp
 * @brief ResourceLimiter implementation.
 */

#include "executor/resource_limiter.hpp"

#include <algorithm>
#include <cmath>

namespace sandbox_orchestrator {

namespace {

constexpr int64_t kNanoCpusPerCore = 1'000'000'000;

}  // namespace

ResourceLimiter::ResourceLimiter(OrchestratorConfig orchestrator, LimitsConfig limits)
    : default_timeout_(orchestrator.default_timeout_s)
    , max_timeout_(orchestrator.max_timeout_s)
    , limits_(limits) {}

Result<ResourceLimits> ResourceLimiter::derive(const ExecutionRequest& request,
                                               const RuntimeEnvironment& environment) const {
    std::chrono::seconds timeout = environment.default_timeout.value_or(default_timeout_);
    if (request.timeout_seconds) {
        if (*request.timeout_seconds <= 0) {
            return Error{ErrorCode::InvalidResourceRequest,
                         "timeout must be positive, got " + std::to_string(*request.timeout_seconds)};
        }
        timeout = std::chrono::seconds{*request.timeout_seconds};
    }
    timeout = std::min(timeout, max_timeout_);

    uint64_t memory = limits_.default_memory_bytes;
    if (request.memory_bytes) {
        if (*request.memory_bytes <= 0) {
            return Error{ErrorCode::InvalidResourceRequest,
                         "memory must be positive, got " + std::to_string(*request.memory_bytes)};
        }
        memory = static_cast<uint64_t>(*request.memory_bytes);
    }
    memory = std::min(memory, limits_.max_memory_bytes);

    ResourceLimits out;
    out.memory_bytes = memory;
    out.cpu_shares = limits_.cpu_shares;
    out.timeout = timeout;
    out.nano_cpus = limits_.cpus > 0.0
        ? static_cast<int64_t>(std::llround(limits_.cpus * static_cast<double>(kNanoCpusPerCore)))
        : 0;
    out.pids_limit = std::max<int64_t>(limits_.pids_limit, 0);
    return out;
}

}  // namespace sandbox_orchestrator
