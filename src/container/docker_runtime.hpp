/**
 * @file docker_runtime.hpp
 * @brief IContainerRuntime backed by the Docker Engine API.
 */

#pragma once

#include "container/container_runtime.hpp"
#include "container/http_transport.hpp"
#include "core/config.hpp"

#include <string>

namespace sandbox_orchestrator {

/**
 * @brief Talks to dockerd over its UNIX socket.
 *
 * Holds no per-execution state; every call opens its own connection.
 */
class DockerRuntime : public IContainerRuntime {
public:
    explicit DockerRuntime(const DockerConfig& config);

    Result<void> ping() override;

    Result<ContainerId> create(const ContainerSpec& spec) override;
    Result<void> start(const ContainerId& id) override;
    Result<ContainerState> inspect(const std::string& id_or_name) override;
    Result<void> stop(const ContainerId& id, std::chrono::seconds grace) override;
    Result<void> remove(const ContainerId& id, bool force) override;

    Result<std::unique_ptr<ILogStream>> logs(const ContainerId& id, bool follow) override;
    Result<std::vector<ContainerSummary>> list(
        const std::map<std::string, std::string>& labels) override;
    Result<void> pull(const std::string& image) override;

private:
    [[nodiscard]] std::string endpoint(std::string_view path) const;

    HttpTransport transport_;
    std::string api_prefix_;            ///< "/v1.41", or empty for the engine default
    uint32_t call_timeout_ms_;
    uint32_t pull_timeout_ms_;
};

}  // namespace sandbox_orchestrator
