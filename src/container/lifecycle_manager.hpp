/**
 * @file lifecycle_manager.hpp
 * @brief Container lifecycle on top of IContainerRuntime.
 *
 * Adds the orchestrator's policy to raw runtime calls:
 *   - transient connectivity failures during create/start are retried
 *     with exponential backoff before surfacing;
 *   - create is idempotent through deterministic names (a name conflict
 *     adopts the container a previous attempt already created);
 *   - stop and remove treat "already stopped" / "already gone" as success.
 */

#pragma once

#include "container/container_runtime.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief The orchestrator's reference to one container.
 *
 * Owned by exactly one ExecutionRecord.
 */
struct ContainerHandle {
    ContainerId id;
    std::string name;
    std::string image;
    ResourceLimits limits;
    std::vector<PortBinding> ports;
    std::string host_workdir;           ///< Host directory mounted at `workdir`
    std::string workdir;
};

struct CreateRequest {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::string workdir;
    std::vector<VolumeMount> volumes;
    std::map<std::string, std::string> env;
    ResourceLimits limits;
    std::map<std::string, std::string> labels;
    std::vector<uint16_t> ports;
};

class LifecycleManager {
public:
    static constexpr std::string_view MANAGED_LABEL = "sandbox.managed";
    static constexpr std::string_view EXECUTION_LABEL = "sandbox.execution_id";
    static constexpr std::string_view PROJECT_LABEL = "sandbox.project_id";

    LifecycleManager(IContainerRuntime& runtime, DockerConfig config, Logger& logger,
                     MetricsCollector* metrics = nullptr);

    /// Fails with ContainerCreateError (image missing, runtime unavailable, quota).
    Result<ContainerHandle> create(const CreateRequest& request);

    /// Fails with ContainerStartError. Starting a started container succeeds.
    Result<void> start(const ContainerHandle& handle);

    /// Non-blocking poll. ContainerNotFound if the container is gone.
    Result<ContainerState> inspect(const ContainerHandle& handle);

    /// Idempotent: stopping a stopped or missing container is a no-op.
    Result<void> stop(const ContainerHandle& handle, std::chrono::seconds grace);

    /// Idempotent: removing a missing container is a no-op.
    Result<void> remove(const ContainerId& id);
    Result<void> remove(const ContainerHandle& handle) { return remove(handle.id); }

    Result<std::unique_ptr<ILogStream>> open_logs(const ContainerHandle& handle);

    /// Containers carrying the managed label, including ones from earlier processes.
    Result<std::vector<ContainerSummary>> list_managed();

    Result<void> ping();

    [[nodiscard]] const DockerConfig& config() const noexcept { return config_; }

private:
    template <typename F>
    std::invoke_result_t<F> with_retry(std::string_view operation, F&& call);

    Result<ContainerHandle> adopt_existing(const CreateRequest& request);

    IContainerRuntime& runtime_;
    DockerConfig config_;
    Logger& logger_;
    MetricsCollector* metrics_;
};

}  // namespace sandbox_orchestrator
