/**
 * @file resource_limiter.hpp
 * @brief Translates an ExecutionRequest into concrete container limits.
 */

#pragma once

#include "catalog/runtime_catalog.hpp"
#include "core/config.hpp"
#include "core/request.hpp"
#include "core/result.hpp"

#include <chrono>
#include <cstdint>

namespace sandbox_orchestrator {

struct ResourceLimits {
    uint64_t memory_bytes{0};
    uint32_t cpu_shares{0};
    std::chrono::seconds timeout{0};
    int64_t nano_cpus{0};       ///< 0 = no CPU quota
    int64_t pids_limit{0};      ///< 0 = unlimited

    bool operator==(const ResourceLimits&) const = default;
};

/**
 * @brief Pure function of (request, environment) plus the process-wide
 *        defaults and maxima it was constructed with.
 */
class ResourceLimiter {
public:
    ResourceLimiter(OrchestratorConfig orchestrator, LimitsConfig limits);

    /**
     * @brief Derive limits for one execution.
     *
     * Timeout: request, else the environment default, else the configured
     * default; clamped to the configured maximum. Memory: request, else the
     * configured default; clamped to the configured maximum. Zero or
     * negative requests fail with ErrorCode::InvalidResourceRequest.
     */
    [[nodiscard]] Result<ResourceLimits> derive(const ExecutionRequest& request,
                                                const RuntimeEnvironment& environment) const;

    [[nodiscard]] std::chrono::seconds max_timeout() const noexcept { return max_timeout_; }

private:
    std::chrono::seconds default_timeout_;
    std::chrono::seconds max_timeout_;
    LimitsConfig limits_;
};

}  // namespace sandbox_orchestrator
