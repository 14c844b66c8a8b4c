/**
 * @file container_runtime.hpp
 * @brief Abstract container runtime API consumed by the LifecycleManager.
 *
 * IContainerRuntime is the single seam between the orchestrator and the
 * host's container engine. DockerRuntime speaks the Docker Engine API;
 * MockRuntime simulates containers in memory for tests and dry runs.
 *
 * Error contract for implementations:
 *   - ErrorCode::RuntimeUnavailable  engine unreachable or timed out
 *   - ErrorCode::ContainerNotFound   unknown container id or name
 *   - ErrorCode::ContainerConflict   name already in use / state conflict
 *   - ErrorCode::ImageNotFound       create with an image absent locally
 *   - ErrorCode::ProtocolError       malformed engine response
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/resource_limiter.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Container Description
// ─────────────────────────────────────────────

struct VolumeMount {
    std::string host_path;
    std::string container_path;
    bool read_only{true};

    bool operator==(const VolumeMount&) const = default;
};

struct PortBinding {
    uint16_t container_port{0};
    uint16_t host_port{0};          ///< 0 until the engine assigns one

    bool operator==(const PortBinding&) const = default;
};

/**
 * @brief Everything needed to create one container.
 */
struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;   ///< argv, e.g. {"/bin/sh", "-c", "python main.py"}
    std::string workdir;
    std::vector<VolumeMount> volumes;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;
    std::vector<uint16_t> exposed_ports;
    std::string network_mode;
    ResourceLimits limits;
};

/**
 * @brief Result of a non-blocking inspect.
 */
struct ContainerState {
    ContainerId id;
    std::string name;
    bool running{false};
    std::optional<int> exit_code;       ///< Set once the container has exited
    std::string status;                 ///< Engine status word: created, running, exited...
    std::vector<PortBinding> ports;
};

/**
 * @brief One entry of a container listing.
 */
struct ContainerSummary {
    ContainerId id;
    std::string name;
    std::string image;
    std::string state;
    std::map<std::string, std::string> labels;
    Timestamp created_at;
};

struct LogFrame {
    StreamType stream{StreamType::Stdout};
    std::string text;
};

struct LogRead {
    ReadStatus status{ReadStatus::Timeout};
    LogFrame frame;                     ///< Valid when status == Data
};

// ─────────────────────────────────────────────
// ILogStream
// ─────────────────────────────────────────────

/**
 * @brief Follow-mode output of one container.
 *
 * Reports Closed after the container has stopped and all output was
 * delivered. Destroying the stream releases the engine connection.
 */
class ILogStream {
public:
    virtual ~ILogStream() = default;

    virtual Result<LogRead> next(Duration timeout) = 0;
    virtual void close() = 0;
};

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    virtual Result<void> ping() = 0;

    virtual Result<ContainerId> create(const ContainerSpec& spec) = 0;
    virtual Result<void> start(const ContainerId& id) = 0;

    /// Accepts a container id or name.
    virtual Result<ContainerState> inspect(const std::string& id_or_name) = 0;

    /// Graceful termination, forced kill after `grace`. Stopping a stopped container succeeds.
    virtual Result<void> stop(const ContainerId& id, std::chrono::seconds grace) = 0;
    virtual Result<void> remove(const ContainerId& id, bool force) = 0;

    virtual Result<std::unique_ptr<ILogStream>> logs(const ContainerId& id, bool follow) = 0;

    /// Containers (running or not) carrying every label in `labels`.
    virtual Result<std::vector<ContainerSummary>> list(
        const std::map<std::string, std::string>& labels) = 0;

    virtual Result<void> pull(const std::string& image) = 0;
};

}  // namespace sandbox_orchestrator
