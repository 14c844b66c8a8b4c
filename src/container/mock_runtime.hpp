/**
 * @file mock_runtime.hpp
 * @brief In-memory IContainerRuntime for tests and dry runs.
 *
 * Containers follow a Script: timed output frames, a run time and an exit
 * code. By default the script is derived from the container's shell
 * command, understanding `echo` (with `>&2`), `sleep`, `exit`, `true` and
 * `false` joined by `;` or `&&`. Real time is used, so `sleep 2` keeps the
 * container running for two seconds.
 *
 * Deterministic failure injection and per-operation call counters make
 * retry and idempotence paths testable.
 */

#pragma once

#include "container/container_runtime.hpp"

#include <array>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sandbox_orchestrator {

class MockRuntime : public IContainerRuntime {
public:
    enum class Operation : uint8_t { Ping, Create, Start, Inspect, Stop, Remove, Logs, List, Pull, Count_ };

    static constexpr int KILLED_EXIT_CODE = 137;

    struct Script {
        std::vector<std::pair<Duration, LogFrame>> output;  ///< Offsets from start
        Duration run_time{0};
        std::optional<int> exit_code{0};                    ///< nullopt = runs until stopped
    };

    using ScriptFn = std::function<Script(const ContainerSpec&)>;

    MockRuntime();
    ~MockRuntime() override;

    /// Build a script from a `/bin/sh -c` command string.
    [[nodiscard]] static Script interpret(std::string_view command);

    void set_script(ScriptFn fn);

    /// Make the next `times` calls of `op` fail with `code`.
    void fail_next(Operation op, ErrorCode code, uint32_t times = 1);

    /// Restrict create to these images (empty = every image exists).
    void set_available_images(std::set<std::string> images);

    /// Delete a container without going through the API.
    void vanish(const ContainerId& id);

    [[nodiscard]] uint32_t calls(Operation op) const;
    [[nodiscard]] size_t live_containers() const;
    [[nodiscard]] bool exists(const ContainerId& id) const;
    [[nodiscard]] std::optional<ContainerSpec> spec_of(const ContainerId& id) const;
    [[nodiscard]] std::vector<ContainerId> container_ids() const;

    // ── IContainerRuntime ────────────────────
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

    struct Container;
    struct State;

private:
    std::optional<Error> take_failure(Operation op);

    std::shared_ptr<State> state_;
};

}  // namespace sandbox_orchestrator
