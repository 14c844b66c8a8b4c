/**
 * @file workspace.cpp
 * @brief WorkspaceStager implementation.
 */

#include "orchestrator/workspace.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace sandbox_orchestrator {

namespace {

bool is_safe_project_id(const ProjectId& id) {
    if (id.empty() || id.front() == '.') return false;
    return id.find('/') == std::string::npos
        && id.find('\\') == std::string::npos
        && id.find("..") == std::string::npos;
}

}  // namespace

WorkspaceStager::WorkspaceStager(std::filesystem::path projects_dir, std::filesystem::path work_dir)
    : projects_dir_(std::move(projects_dir))
    , work_dir_(std::move(work_dir)) {}

Result<std::filesystem::path> WorkspaceStager::project_dir(const ProjectId& project) const {
    if (!is_safe_project_id(project)) {
        return Error{ErrorCode::ProjectNotFound, "Invalid project id: '" + project + "'"};
    }

    std::error_code ec;
    auto dir = std::filesystem::absolute(projects_dir_ / project, ec);
    if (ec || !std::filesystem::is_directory(dir, ec)) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + project};
    }
    return dir;
}

std::optional<std::string> WorkspaceStager::project_language(const ProjectId& project) const {
    auto dir = project_dir(project);
    if (!dir) return std::nullopt;

    std::ifstream in(*dir / METADATA_FILE);
    if (!in) return std::nullopt;

    auto metadata = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (!metadata.is_object()) return std::nullopt;

    auto language = metadata.find("language");
    if (language == metadata.end() || !language->is_string()) return std::nullopt;
    return language->get<std::string>();
}

Result<StagedWorkspace> WorkspaceStager::stage(const ExecutionId& id,
                                               const ExecutionRequest& request,
                                               const RuntimeEnvironment& environment) const {
    std::optional<std::filesystem::path> project;
    if (!request.project_id.empty()) {
        auto dir = project_dir(request.project_id);
        if (!dir) return dir.error();
        project = *dir;
    }

    if (!request.source) {
        if (!project) {
            return Error{ErrorCode::ProjectNotFound, "Request names neither a project nor inline source"};
        }
        return StagedWorkspace{*project, false};
    }

    std::error_code ec;
    auto dir = std::filesystem::absolute(work_dir_ / id, ec);
    if (!ec) std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::Internal, "Cannot create workspace " + dir.string() + ": " + ec.message()};
    }

    if (project) {
        std::filesystem::copy(*project, dir,
                              std::filesystem::copy_options::recursive
                                  | std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove_all(dir, ignored);
            return Error{ErrorCode::Internal, "Cannot copy project " + request.project_id + ": " + ec.message()};
        }
    }

    auto file = dir / (environment.inline_file.empty() ? std::string{"main"} : environment.inline_file);
    std::ofstream out(file, std::ios::trunc | std::ios::binary);
    out << *request.source;
    out.close();
    if (!out) {
        std::error_code ignored;
        std::filesystem::remove_all(dir, ignored);
        return Error{ErrorCode::Internal, "Cannot write " + file.string()};
    }

    return StagedWorkspace{dir, true};
}

}  // namespace sandbox_orchestrator
