/**
 * @file test_resource_limiter.cpp
 * @brief Unit tests for limit derivation.
 */

#include "executor/resource_limiter.hpp"

#include <gtest/gtest.h>

using namespace sandbox_orchestrator;

class ResourceLimiterTest : public ::testing::Test {
protected:
    ResourceLimiterTest() : limiter_(make_orchestrator(), make_limits()) {}

    static OrchestratorConfig make_orchestrator() {
        OrchestratorConfig cfg;
        cfg.default_timeout_s = 30;
        cfg.max_timeout_s = 120;
        return cfg;
    }

    static LimitsConfig make_limits() {
        LimitsConfig cfg;
        cfg.default_memory_bytes = 256ULL * 1024 * 1024;
        cfg.max_memory_bytes = 1024ULL * 1024 * 1024;
        cfg.cpu_shares = 512;
        cfg.cpus = 1.5;
        cfg.pids_limit = 128;
        return cfg;
    }

    RuntimeEnvironment python_{.id = "python-3.10", .language = "python"};
    ResourceLimiter limiter_;
};

TEST_F(ResourceLimiterTest, Defaults) {
    auto limits = limiter_.derive(ExecutionRequest{.project_id = "p"}, python_);
    ASSERT_TRUE(limits.has_value()) << limits.error().message;
    EXPECT_EQ(limits->timeout.count(), 30);
    EXPECT_EQ(limits->memory_bytes, 256ULL * 1024 * 1024);
    EXPECT_EQ(limits->cpu_shares, 512u);
    EXPECT_EQ(limits->nano_cpus, 1'500'000'000);
    EXPECT_EQ(limits->pids_limit, 128);
}

TEST_F(ResourceLimiterTest, RequestedValuesWin) {
    ExecutionRequest request{.project_id = "p", .timeout_seconds = 5, .memory_bytes = 64 * 1024 * 1024};
    auto limits = limiter_.derive(request, python_);
    ASSERT_TRUE(limits.has_value());
    EXPECT_EQ(limits->timeout.count(), 5);
    EXPECT_EQ(limits->memory_bytes, 64ULL * 1024 * 1024);
}

TEST_F(ResourceLimiterTest, EnvironmentDefaultTimeout) {
    python_.default_timeout = std::chrono::seconds{45};
    auto limits = limiter_.derive(ExecutionRequest{.project_id = "p"}, python_);
    ASSERT_TRUE(limits.has_value());
    EXPECT_EQ(limits->timeout.count(), 45);
}

TEST_F(ResourceLimiterTest, ClampsToMaximum) {
    ExecutionRequest request{.project_id = "p", .timeout_seconds = 3600,
                             .memory_bytes = 8LL * 1024 * 1024 * 1024};
    auto limits = limiter_.derive(request, python_);
    ASSERT_TRUE(limits.has_value());
    EXPECT_EQ(limits->timeout, limiter_.max_timeout());
    EXPECT_EQ(limits->timeout.count(), 120);
    EXPECT_EQ(limits->memory_bytes, 1024ULL * 1024 * 1024);
}

TEST_F(ResourceLimiterTest, RejectsNonPositiveTimeout) {
    for (int64_t bad : {int64_t{0}, int64_t{-1}}) {
        auto limits = limiter_.derive(ExecutionRequest{.project_id = "p", .timeout_seconds = bad}, python_);
        ASSERT_FALSE(limits.has_value());
        EXPECT_EQ(limits.error().code, ErrorCode::InvalidResourceRequest);
    }
}

TEST_F(ResourceLimiterTest, RejectsNonPositiveMemory) {
    auto limits = limiter_.derive(ExecutionRequest{.project_id = "p", .memory_bytes = -1}, python_);
    ASSERT_FALSE(limits.has_value());
    EXPECT_EQ(limits.error().code, ErrorCode::InvalidResourceRequest);
}

TEST_F(ResourceLimiterTest, DeterministicForSameInput) {
    ExecutionRequest request{.project_id = "p", .timeout_seconds = 7};
    EXPECT_EQ(*limiter_.derive(request, python_), *limiter_.derive(request, python_));
}

TEST(ResourceLimiterCpuTest, ZeroCpusMeansNoQuota) {
    LimitsConfig limits;
    limits.cpus = 0.0;
    ResourceLimiter limiter(OrchestratorConfig{}, limits);
    auto derived = limiter.derive(ExecutionRequest{.project_id = "p"}, RuntimeEnvironment{});
    ASSERT_TRUE(derived.has_value());
    EXPECT_EQ(derived->nano_cpus, 0);
}
