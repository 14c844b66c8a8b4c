/**
 * @file test_execution_tracker.cpp
 * @brief Unit tests for the execution registry and state machine.
 */

#include "tracker/execution_tracker.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace sandbox_orchestrator;
using S = ExecutionStatus;

namespace {

ExecutionRecord make_record(ExecutionId id = {}) {
    ExecutionRecord rec;
    rec.id = std::move(id);
    rec.project_id = "demo";
    rec.runtime_id = "python-3.10";
    rec.timeout = std::chrono::seconds{30};
    rec.deadline = std::chrono::steady_clock::now() + rec.timeout;
    return rec;
}

ContainerHandle make_handle(std::string id) {
    ContainerHandle handle;
    handle.id = std::move(id);
    handle.name = "sandbox-" + handle.id;
    return handle;
}

}  // namespace

// ── State machine ────────────────────────────

TEST(TransitionTableTest, AllowedEdges) {
    EXPECT_TRUE(ExecutionTracker::is_valid_transition(S::Pending, S::Running));
    EXPECT_TRUE(ExecutionTracker::is_valid_transition(S::Pending, S::Failed));
    EXPECT_TRUE(ExecutionTracker::is_valid_transition(S::Pending, S::Cancelled));
    EXPECT_FALSE(ExecutionTracker::is_valid_transition(S::Pending, S::Succeeded));
    EXPECT_FALSE(ExecutionTracker::is_valid_transition(S::Pending, S::TimedOut));

    for (auto to : {S::Succeeded, S::Failed, S::TimedOut, S::Cancelled}) {
        EXPECT_TRUE(ExecutionTracker::is_valid_transition(S::Running, to));
    }
    EXPECT_FALSE(ExecutionTracker::is_valid_transition(S::Running, S::Pending));

    for (auto from : {S::Succeeded, S::Failed, S::TimedOut, S::Cancelled}) {
        for (auto to : {S::Pending, S::Running, S::Succeeded, S::Failed, S::TimedOut, S::Cancelled}) {
            EXPECT_FALSE(ExecutionTracker::is_valid_transition(from, to));
        }
    }
}

TEST(ExecutionTrackerTest, GeneratedIdsAreUnique) {
    std::set<ExecutionId> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(ExecutionTracker::generate_id());
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(ExecutionTrackerTest, SubmitStartsPending) {
    ExecutionTracker tracker;
    auto id = tracker.submit(make_record());
    ASSERT_TRUE(id.has_value());
    EXPECT_FALSE(id->empty());

    auto rec = tracker.get(*id);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, S::Pending);
    EXPECT_NE(rec->created_at, Timestamp{});
    EXPECT_FALSE(rec->started_at.has_value());
}

TEST(ExecutionTrackerTest, DuplicateIdRejected) {
    ExecutionTracker tracker;
    ASSERT_TRUE(tracker.submit(make_record("x")).has_value());
    auto again = tracker.submit(make_record("x"));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateExecution);
}

TEST(ExecutionTrackerTest, LifecycleSetsTimestampsAndExitCode) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());

    ASSERT_TRUE(tracker.transition(id, S::Running).has_value());
    auto running = tracker.get(id);
    ASSERT_TRUE(running->started_at.has_value());
    EXPECT_FALSE(running->finished_at.has_value());

    ASSERT_TRUE(tracker.transition(id, S::Failed, 3, "Execution failed with exit code 3").has_value());
    auto done = tracker.get(id);
    EXPECT_EQ(done->status, S::Failed);
    EXPECT_EQ(done->exit_code, 3);
    EXPECT_EQ(done->error, "Execution failed with exit code 3");
    ASSERT_TRUE(done->finished_at.has_value());
    EXPECT_GE(*done->finished_at, *done->started_at);
}

TEST(ExecutionTrackerTest, TerminalStatusIsFinal) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    ASSERT_TRUE(tracker.transition(id, S::Running).has_value());
    ASSERT_TRUE(tracker.transition(id, S::Cancelled).has_value());

    auto late = tracker.transition(id, S::Succeeded, 0);
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(tracker.get(id)->status, S::Cancelled);
    EXPECT_FALSE(tracker.get(id)->exit_code.has_value());
}

TEST(ExecutionTrackerTest, UnknownIdReportsNotFound) {
    ExecutionTracker tracker;
    EXPECT_EQ(tracker.get("nope").error().code, ErrorCode::ExecutionNotFound);
    EXPECT_EQ(tracker.transition("nope", S::Running).error().code, ErrorCode::ExecutionNotFound);
    EXPECT_EQ(tracker.append_log("nope", StreamType::Stdout, "x").error().code, ErrorCode::ExecutionNotFound);
}

TEST(ExecutionTrackerTest, ObserverSeesEveryTransition) {
    ExecutionTracker tracker;
    std::vector<std::pair<S, S>> seen;
    tracker.set_transition_observer([&](const ExecutionId&, S from, S to, std::optional<int>) {
        seen.emplace_back(from, to);
    });

    auto id = *tracker.submit(make_record());
    ASSERT_TRUE(tracker.transition(id, S::Running).has_value());
    ASSERT_TRUE(tracker.transition(id, S::Succeeded, 0).has_value());
    EXPECT_FALSE(tracker.transition(id, S::Failed).has_value());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], std::make_pair(S::Pending, S::Running));
    EXPECT_EQ(seen[1], std::make_pair(S::Running, S::Succeeded));
}

// ── Listings ─────────────────────────────────

TEST(ExecutionTrackerTest, ActiveAndCleanupListings) {
    ExecutionTracker tracker;
    auto a = *tracker.submit(make_record("a"));
    auto b = *tracker.submit(make_record("b"));
    ASSERT_TRUE(tracker.attach_container(b, make_handle("c-b")).has_value());
    ASSERT_TRUE(tracker.transition(b, S::Running).has_value());
    ASSERT_TRUE(tracker.transition(b, S::TimedOut).has_value());

    EXPECT_EQ(tracker.list_active(), std::vector<ExecutionId>{a});
    EXPECT_EQ(tracker.list_cleanup_pending(), std::vector<ExecutionId>{b});

    ASSERT_TRUE(tracker.mark_container_removed(b).has_value());
    EXPECT_TRUE(tracker.list_cleanup_pending().empty());
    EXPECT_EQ(tracker.list_all().size(), 2u);
}

TEST(ExecutionTrackerTest, OneContainerPerExecution) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    ASSERT_TRUE(tracker.attach_container(id, make_handle("c1")).has_value());
    auto second = tracker.attach_container(id, make_handle("c2"));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(tracker.get(id)->container->id, "c1");
}

// ── Logs ─────────────────────────────────────

TEST(ExecutionTrackerTest, LogSequencesAreDense) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    EXPECT_EQ(*tracker.append_log(id, StreamType::Stdout, "a\n"), 0u);
    EXPECT_EQ(*tracker.append_log(id, StreamType::Stderr, "b\n"), 1u);
    EXPECT_EQ(*tracker.append_log(id, StreamType::Stdout, "c\n"), 2u);

    auto slice = tracker.read_log(id, 1);
    ASSERT_TRUE(slice.has_value());
    ASSERT_EQ(slice->chunks.size(), 2u);
    EXPECT_EQ(slice->chunks[0].sequence, 1u);
    EXPECT_EQ(slice->chunks[0].stream, StreamType::Stderr);
    EXPECT_EQ(slice->next_sequence, 3u);
    EXPECT_FALSE(slice->closed);

    auto limited = tracker.read_log(id, 0, 1);
    ASSERT_EQ(limited->chunks.size(), 1u);
    EXPECT_EQ(limited->next_sequence, 1u);
}

TEST(ExecutionTrackerTest, ClosedOnlyWhenSliceReachesEnd) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    ASSERT_TRUE(tracker.append_log(id, StreamType::Stdout, "x").has_value());
    ASSERT_TRUE(tracker.append_log(id, StreamType::Stdout, "y").has_value());
    ASSERT_TRUE(tracker.close_log(id).has_value());

    EXPECT_FALSE(tracker.read_log(id, 0, 1)->closed);
    EXPECT_TRUE(tracker.read_log(id, 0)->closed);
    EXPECT_TRUE(tracker.read_log(id, 5)->closed);
}

TEST(ExecutionTrackerTest, ReadLogWaitsForNewOutput) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());

    std::jthread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        (void)tracker.append_log(id, StreamType::Stdout, "late\n");
    });

    auto slice = tracker.read_log(id, 0, 10, Duration{2000});
    ASSERT_TRUE(slice.has_value());
    ASSERT_EQ(slice->chunks.size(), 1u);
    EXPECT_EQ(slice->chunks[0].text, "late\n");
}

TEST(ExecutionTrackerTest, ReadLogTimesOutWithoutData) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    auto slice = tracker.read_log(id, 0, 10, Duration{20});
    ASSERT_TRUE(slice.has_value());
    EXPECT_TRUE(slice->chunks.empty());
    EXPECT_FALSE(slice->closed);
}

TEST(ExecutionTrackerTest, WaitTerminalWakesOnTransition) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    ASSERT_TRUE(tracker.transition(id, S::Running).has_value());

    EXPECT_EQ(*tracker.wait_terminal(id, Duration{10}), S::Running);

    std::jthread finisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        (void)tracker.transition(id, S::Succeeded, 0);
    });
    EXPECT_EQ(*tracker.wait_terminal(id, Duration{2000}), S::Succeeded);
}

TEST(ExecutionTrackerTest, WaitLogClosed) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    EXPECT_FALSE(*tracker.wait_log_closed(id, Duration{10}));
    ASSERT_TRUE(tracker.close_log(id).has_value());
    EXPECT_TRUE(*tracker.wait_log_closed(id, Duration{10}));
}

// ── Retention ────────────────────────────────

TEST(ExecutionTrackerTest, EvictsOnlyFinishedAndCleanedRecords) {
    ExecutionTracker tracker;
    auto active = *tracker.submit(make_record("active"));
    auto done = *tracker.submit(make_record("done"));
    auto dirty = *tracker.submit(make_record("dirty"));

    ASSERT_TRUE(tracker.transition(done, S::Failed).has_value());
    ASSERT_TRUE(tracker.attach_container(dirty, make_handle("c")).has_value());
    ASSERT_TRUE(tracker.transition(dirty, S::Cancelled).has_value());

    auto evicted = tracker.evict_expired(std::chrono::seconds{0});
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0].id, done);
    EXPECT_EQ(tracker.get(done).error().code, ErrorCode::ExecutionNotFound);
    EXPECT_TRUE(tracker.get(active).has_value());
    EXPECT_TRUE(tracker.get(dirty).has_value());

    EXPECT_TRUE(tracker.evict_expired(std::chrono::seconds{3600}).empty());
}

TEST(ExecutionTrackerTest, EraseRemovesRegardlessOfState) {
    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    auto erased = tracker.erase(id);
    ASSERT_TRUE(erased.has_value());
    EXPECT_EQ(erased->id, id);
    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_FALSE(tracker.erase(id).has_value());
}

// ── Concurrency ──────────────────────────────

TEST(ExecutionTrackerTest, ConcurrentTerminalTransitionsHaveOneWinner) {
    for (int round = 0; round < 50; ++round) {
        ExecutionTracker tracker;
        auto id = *tracker.submit(make_record());
        ASSERT_TRUE(tracker.transition(id, S::Running).has_value());

        std::atomic<int> winners{0};
        {
            std::vector<std::jthread> threads;
            for (auto to : {S::Succeeded, S::Failed, S::TimedOut, S::Cancelled}) {
                threads.emplace_back([&, to] {
                    if (tracker.transition(id, to)) winners.fetch_add(1);
                });
            }
        }
        EXPECT_EQ(winners.load(), 1);
        EXPECT_TRUE(is_terminal(tracker.get(id)->status));
    }
}

TEST(ExecutionTrackerTest, ConcurrentSubmitAndAppend) {
    ExecutionTracker tracker;
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 100;
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < PER_THREAD; ++i) {
                    auto id = tracker.submit(make_record());
                    ASSERT_TRUE(id.has_value());
                    ASSERT_TRUE(tracker.append_log(*id, StreamType::Stdout, "x").has_value());
                }
            });
        }
    }
    EXPECT_EQ(tracker.size(), static_cast<size_t>(THREADS * PER_THREAD));
}
