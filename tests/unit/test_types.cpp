/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;

TEST(ExecutionStatusTest, ToString) {
    EXPECT_EQ(to_string(ExecutionStatus::Pending), "pending");
    EXPECT_EQ(to_string(ExecutionStatus::Running), "running");
    EXPECT_EQ(to_string(ExecutionStatus::Succeeded), "succeeded");
    EXPECT_EQ(to_string(ExecutionStatus::TimedOut), "timed_out");
    EXPECT_EQ(to_string(ExecutionStatus::Cancelled), "cancelled");
}

TEST(ExecutionStatusTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(ExecutionStatus::Pending));
    EXPECT_FALSE(is_terminal(ExecutionStatus::Running));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Succeeded));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Failed));
    EXPECT_TRUE(is_terminal(ExecutionStatus::TimedOut));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Cancelled));
}

TEST(ExecutionStatusTest, ParseRoundTrip) {
    for (auto status : {ExecutionStatus::Pending, ExecutionStatus::Running, ExecutionStatus::Succeeded,
                        ExecutionStatus::Failed, ExecutionStatus::TimedOut, ExecutionStatus::Cancelled}) {
        auto parsed = parse_execution_status(to_string(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(parse_execution_status("RUNNING").has_value());
    EXPECT_FALSE(parse_execution_status("").has_value());
}

TEST(StreamTypeTest, ToString) {
    EXPECT_EQ(to_string(StreamType::Stdout), "stdout");
    EXPECT_EQ(to_string(StreamType::Stderr), "stderr");
}

TEST(LogChunkTest, Equality) {
    LogChunk a{.stream = StreamType::Stderr, .text = "oops\n", .sequence = 3};
    LogChunk b = a;
    EXPECT_EQ(a, b);
    b.sequence = 4;
    EXPECT_NE(a, b);
}
