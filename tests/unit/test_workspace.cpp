/**
 * @file test_workspace.cpp
 * @brief Unit tests for project resolution and workspace staging.
 */

#include "orchestrator/workspace.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sandbox_orchestrator;
namespace fs = std::filesystem;

namespace {

std::string read(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

class WorkspaceStagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "sandbox_workspace_test";
        fs::remove_all(root_);
        fs::create_directories(root_ / "projects" / "hello");
        std::ofstream(root_ / "projects" / "hello" / "main.py") << "print('project')\n";
        std::ofstream(root_ / "projects" / "hello" / "metadata.json") << R"({"language": "python"})";

        fs::create_directories(root_ / "projects" / "broken");
        std::ofstream(root_ / "projects" / "broken" / "metadata.json") << "{ not json";

        env_.id = "python-3.10";
        env_.language = "python";
        env_.inline_file = "main.py";
    }

    void TearDown() override { fs::remove_all(root_); }

    WorkspaceStager stager() const { return WorkspaceStager(root_ / "projects", root_ / "work"); }

    fs::path root_;
    RuntimeEnvironment env_;
};

TEST_F(WorkspaceStagerTest, ResolvesExistingProject) {
    auto dir = stager().project_dir("hello");
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(dir->is_absolute());
    EXPECT_TRUE(fs::exists(*dir / "main.py"));
}

TEST_F(WorkspaceStagerTest, RejectsUnknownAndUnsafeIds) {
    auto s = stager();
    for (const char* id : {"", "missing", "../projects", "hello/..", ".hidden", "a\\b", "/etc"}) {
        auto dir = s.project_dir(id);
        ASSERT_FALSE(dir.has_value()) << id;
        EXPECT_EQ(dir.error().code, ErrorCode::ProjectNotFound) << id;
    }
}

TEST_F(WorkspaceStagerTest, ReadsMetadataLanguage) {
    auto s = stager();
    EXPECT_EQ(s.project_language("hello"), "python");
    EXPECT_FALSE(s.project_language("broken").has_value());
    EXPECT_FALSE(s.project_language("missing").has_value());
}

TEST_F(WorkspaceStagerTest, ProjectWithoutSourceIsMountedInPlace) {
    ExecutionRequest request;
    request.project_id = "hello";

    auto staged = stager().stage("exec-1", request, env_);
    ASSERT_TRUE(staged.has_value());
    EXPECT_FALSE(staged->owned);
    EXPECT_EQ(staged->host_dir, *stager().project_dir("hello"));
    EXPECT_FALSE(fs::exists(root_ / "work" / "exec-1"));
}

TEST_F(WorkspaceStagerTest, InlineSourceGetsOwnDirectory) {
    ExecutionRequest request;
    request.source = "print('inline')\n";

    auto staged = stager().stage("exec-2", request, env_);
    ASSERT_TRUE(staged.has_value());
    EXPECT_TRUE(staged->owned);
    EXPECT_EQ(staged->host_dir.filename(), "exec-2");
    EXPECT_EQ(read(staged->host_dir / "main.py"), "print('inline')\n");
}

TEST_F(WorkspaceStagerTest, InlineSourceOverlaysProjectCopy) {
    ExecutionRequest request;
    request.project_id = "hello";
    request.source = "print('override')\n";

    auto staged = stager().stage("exec-3", request, env_);
    ASSERT_TRUE(staged.has_value());
    EXPECT_TRUE(staged->owned);
    EXPECT_EQ(read(staged->host_dir / "main.py"), "print('override')\n");
    EXPECT_TRUE(fs::exists(staged->host_dir / "metadata.json"));
    // The project itself is untouched.
    EXPECT_EQ(read(root_ / "projects" / "hello" / "main.py"), "print('project')\n");
}

TEST_F(WorkspaceStagerTest, NeitherProjectNorSourceIsRejected) {
    auto staged = stager().stage("exec-4", ExecutionRequest{}, env_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code, ErrorCode::ProjectNotFound);
}

TEST_F(WorkspaceStagerTest, UnknownProjectWithSourceIsRejected) {
    ExecutionRequest request;
    request.project_id = "missing";
    request.source = "x";
    auto staged = stager().stage("exec-5", request, env_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code, ErrorCode::ProjectNotFound);
    EXPECT_FALSE(fs::exists(root_ / "work" / "exec-5"));
}
