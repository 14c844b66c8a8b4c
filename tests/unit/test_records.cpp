/**
 * @file test_records.cpp
 * @brief Unit tests for record JSON serialization.
 */

#include "orchestrator/records.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;
using namespace std::chrono;

namespace {

// 2024-05-01T12:00:00Z
Timestamp fixed_time(int millis = 0) {
    return Timestamp{seconds{1714564800}} + milliseconds{millis};
}

}  // namespace

TEST(RecordsTest, FormatTimestampIsUtcWithMillis) {
    EXPECT_EQ(format_timestamp(fixed_time()), "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(format_timestamp(fixed_time(42)), "2024-05-01T12:00:00.042Z");
}

TEST(RecordsTest, RunningResponseHasNullOptionals) {
    ExecutionResponse response{
        .execution_id = "abc",
        .status = ExecutionStatus::Running,
        .start_time = fixed_time(),
    };
    nlohmann::json j = response;

    EXPECT_EQ(j["execution_id"], "abc");
    EXPECT_EQ(j["status"], "running");
    EXPECT_EQ(j["start_time"], "2024-05-01T12:00:00.000Z");
    EXPECT_TRUE(j["output"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["end_time"].is_null());
    EXPECT_TRUE(j["exit_code"].is_null());
}

TEST(RecordsTest, FinishedResponseCarriesOutcome) {
    ExecutionResponse response{
        .execution_id = "abc",
        .status = ExecutionStatus::TimedOut,
        .output = "partial\n",
        .error = "Execution timed out after 2 seconds",
        .start_time = fixed_time(),
        .end_time = fixed_time(2000),
        .exit_code = 137,
    };
    nlohmann::json j = response;

    EXPECT_EQ(j["status"], "timed_out");
    EXPECT_EQ(j["output"], "partial\n");
    EXPECT_EQ(j["error"], "Execution timed out after 2 seconds");
    EXPECT_EQ(j["end_time"], "2024-05-01T12:00:02.000Z");
    EXPECT_EQ(j["exit_code"], 137);
}

TEST(RecordsTest, LogSerializesChunksInOrder) {
    ExecutionLog log{
        .execution_id = "abc",
        .logs = {
            {.stream = StreamType::Stdout, .text = "out\n", .sequence = 0},
            {.stream = StreamType::Stderr, .text = "err\n", .sequence = 1},
        },
        .next_sequence = 2,
        .complete = true,
    };
    nlohmann::json j = log;

    ASSERT_EQ(j["logs"].size(), 2u);
    EXPECT_EQ(j["logs"][0]["stream"], "stdout");
    EXPECT_EQ(j["logs"][1]["stream"], "stderr");
    EXPECT_EQ(j["logs"][1]["text"], "err\n");
    EXPECT_EQ(j["logs"][1]["sequence"], 1);
    EXPECT_EQ(j["next_sequence"], 2);
    EXPECT_TRUE(j["complete"].get<bool>());
}

TEST(RecordsTest, ContainerInfoIncludesPorts) {
    ContainerInfo info{
        .container_id = "c1",
        .project_id = "webapp",
        .execution_id = "abc",
        .status = "running",
        .created_at = fixed_time(),
        .ports = {{.container_port = 3000, .host_port = 49153}},
    };
    nlohmann::json j = info;

    EXPECT_EQ(j["container_id"], "c1");
    EXPECT_EQ(j["project_id"], "webapp");
    EXPECT_EQ(j["created_at"], "2024-05-01T12:00:00.000Z");
    ASSERT_EQ(j["ports"].size(), 1u);
    EXPECT_EQ(j["ports"][0]["container_port"], 3000);
    EXPECT_EQ(j["ports"][0]["host_port"], 49153);
}

TEST(RecordsTest, StatusInfo) {
    nlohmann::json j = ExecutionStatusInfo{.execution_id = "abc", .status = ExecutionStatus::Cancelled};
    EXPECT_EQ(j, (nlohmann::json{{"execution_id", "abc"}, {"status", "cancelled"}}));
}
