/**
 * @file workspace.hpp
 * @brief Resolves projects and stages the host directory mounted into
 *        an execution's container.
 */

#pragma once

#include "catalog/runtime_catalog.hpp"
#include "core/request.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sandbox_orchestrator {

struct StagedWorkspace {
    std::filesystem::path host_dir;     ///< Absolute path to mount
    bool owned{false};                  ///< Created for this execution; delete on eviction
};

class WorkspaceStager {
public:
    static constexpr const char* METADATA_FILE = "metadata.json";

    WorkspaceStager(std::filesystem::path projects_dir, std::filesystem::path work_dir);

    /// Fails with ProjectNotFound for unknown or unsafe ids.
    [[nodiscard]] Result<std::filesystem::path> project_dir(const ProjectId& project) const;

    /// The `language` field of the project's metadata.json, if readable.
    [[nodiscard]] std::optional<std::string> project_language(const ProjectId& project) const;

    /**
     * @brief Pick or build the directory to mount for one execution.
     *
     * A project without inline source is mounted in place. Inline source
     * is written as the runtime's inline file into a fresh directory under
     * the work dir, on top of a copy of the project when one is named.
     */
    [[nodiscard]] Result<StagedWorkspace> stage(const ExecutionId& id,
                                                const ExecutionRequest& request,
                                                const RuntimeEnvironment& environment) const;

private:
    std::filesystem::path projects_dir_;
    std::filesystem::path work_dir_;
};

}  // namespace sandbox_orchestrator
