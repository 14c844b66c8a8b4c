/**
 * @file bench_tracker.cpp
 * @brief Performance benchmarks for the execution registry, log path and
 *        engine wire decoding.
 *
 * Measures per-operation cost of the tracker under contention, cursor
 * throughput and the end-to-end submit path on the in-memory runtime.
 *
 * Usage: ./bench_tracker [--csv]
 */

#include "container/docker_protocol.hpp"
#include "container/mock_runtime.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "tracker/execution_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace sandbox_orchestrator;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string group;
    std::string name;
    size_t iterations;
    double p50_us;
    double p99_us;
    double mean_us;
    double ops_per_sec;
    std::string note;
};

/// Time `iterations` calls of `fn` after a short warmup; percentiles by nearest rank.
template <typename Fn>
BenchResult measure(std::string group, std::string name, size_t iterations, Fn&& fn,
                    std::string note = {}) {
    for (size_t i = 0; i < std::min<size_t>(3, iterations); ++i) fn();

    std::vector<double> samples(iterations);
    auto total_start = Clock::now();
    for (auto& sample : samples) {
        auto t0 = Clock::now();
        fn();
        sample = std::chrono::duration<double, std::micro>(Clock::now() - t0).count();
    }
    double total_s = std::chrono::duration<double>(Clock::now() - total_start).count();

    std::sort(samples.begin(), samples.end());
    auto rank = [&](double q) {
        auto idx = static_cast<size_t>(std::ceil(q * static_cast<double>(iterations))) - 1;
        return samples[std::min(idx, iterations - 1)];
    };

    BenchResult r;
    r.group = std::move(group);
    r.name = std::move(name);
    r.iterations = iterations;
    r.p50_us = rank(0.50);
    r.p99_us = rank(0.99);
    r.mean_us = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(iterations);
    r.ops_per_sec = total_s > 0.0 ? static_cast<double>(iterations) / total_s : 0.0;
    r.note = std::move(note);
    return r;
}

void report(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "group,name,iterations,p50_us,p99_us,mean_us,ops_per_sec,note\n";
        for (const auto& r : results) {
            std::cout << r.group << ',' << r.name << ',' << r.iterations << ','
                      << std::fixed << std::setprecision(2)
                      << r.p50_us << ',' << r.p99_us << ',' << r.mean_us << ','
                      << std::setprecision(0) << r.ops_per_sec << ',' << r.note << '\n';
        }
        return;
    }

    std::string group;
    for (const auto& r : results) {
        if (r.group != group) {
            group = r.group;
            std::cout << "\n── " << group << " ──\n"
                      << std::left << std::setw(36) << "name"
                      << std::right << std::setw(10) << "p50(us)" << std::setw(10) << "p99(us)"
                      << std::setw(10) << "mean(us)" << std::setw(12) << "ops/s" << "  note\n";
        }
        std::cout << std::left << std::setw(36) << r.name << std::right
                  << std::fixed << std::setprecision(1)
                  << std::setw(10) << r.p50_us << std::setw(10) << r.p99_us << std::setw(10) << r.mean_us
                  << std::setprecision(0) << std::setw(12) << r.ops_per_sec
                  << "  " << r.note << '\n';
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

ExecutionRecord make_record() {
    ExecutionRecord rec;
    rec.project_id = "bench";
    rec.runtime_id = "python-3.10";
    rec.timeout = std::chrono::seconds{30};
    rec.deadline = std::chrono::steady_clock::now() + rec.timeout;
    return rec;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_tracker() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;

    {
        ExecutionTracker tracker;
        R.push_back(measure("Tracker", "submit", N,
            [&]{ auto id = tracker.submit(make_record()); (void)id; }));
    }

    {
        ExecutionTracker tracker;
        R.push_back(measure("Tracker", "submit+run+finish", N, [&]{
            auto id = tracker.submit(make_record());
            if (!id) return;
            (void)tracker.transition(*id, ExecutionStatus::Running);
            (void)tracker.transition(*id, ExecutionStatus::Succeeded, 0);
        }));
    }

    for (size_t records : {100, 1000, 10000}) {
        ExecutionTracker tracker;
        ExecutionId target;
        for (size_t i = 0; i < records; ++i) target = *tracker.submit(make_record());
        R.push_back(measure("Tracker", "get(" + std::to_string(records) + ")", N,
            [&]{ auto rec = tracker.get(target, false); (void)rec; },
            std::to_string(records) + " records"));
        R.push_back(measure("Tracker", "list_active(" + std::to_string(records) + ")", 100,
            [&]{ auto ids = tracker.list_active(); (void)ids; },
            std::to_string(records) + " records"));
    }

    // Appends to distinct records from several threads at once.
    for (size_t threads : {1, 4, 8}) {
        ExecutionTracker tracker;
        std::vector<ExecutionId> ids;
        for (size_t t = 0; t < threads; ++t) ids.push_back(*tracker.submit(make_record()));
        R.push_back(measure("Tracker", "append_log x" + std::to_string(threads) + " threads", 200, [&]{
            std::vector<std::jthread> workers;
            for (size_t t = 0; t < threads; ++t) {
                workers.emplace_back([&, t] {
                    for (int i = 0; i < 100; ++i) {
                        (void)tracker.append_log(ids[t], StreamType::Stdout, "line\n");
                    }
                });
            }
        }, std::to_string(threads * 100) + " appends"));
    }
    return R;
}

std::vector<BenchResult> bench_logs() {
    std::vector<BenchResult> R;

    ExecutionTracker tracker;
    auto id = *tracker.submit(make_record());
    for (int i = 0; i < 10000; ++i) (void)tracker.append_log(id, StreamType::Stdout, "output line\n");
    (void)tracker.close_log(id);

    R.push_back(measure("Logs", "cursor drain(10k)", 50, [&]{
        LogCursor cursor(tracker, id);
        LogChunk chunk;
        while (true) {
            auto read = cursor.next(chunk, Duration::zero());
            if (!read || *read != ReadStatus::Data) break;
        }
    }, "10000 chunks"));

    R.push_back(measure("Logs", "read_log tail", 5000,
        [&]{ auto slice = tracker.read_log(id, 9990); (void)slice; }, "10 chunks"));

    for (size_t payload : {64, 4096, 65536}) {
        std::string frame = docker::encode_frame(StreamType::Stdout, std::string(payload, 'x'));
        std::string stream;
        for (int i = 0; i < 16; ++i) stream += frame;
        R.push_back(measure("Logs", "frame decode(" + std::to_string(payload) + "B)", 1000, [&]{
            docker::FrameDecoder decoder;
            decoder.feed(stream);
            while (true) {
                auto frame_read = decoder.pop();
                if (!frame_read || !*frame_read) break;
            }
        }, "16 frames"));
    }
    return R;
}

std::vector<BenchResult> bench_pipeline() {
    std::vector<BenchResult> R;

    auto root = std::filesystem::temp_directory_path() / "sandbox_bench";
    std::filesystem::create_directories(root / "projects" / "bench");

    Config config = default_config();
    config.orchestrator.projects_dir = root / "projects";
    config.orchestrator.work_dir = root / "work";
    config.orchestrator.reaper_interval_ms = 50;

    MockRuntime runtime;
    {
        Orchestrator orchestrator(runtime, Orchestrator::Options{.config = config});
        if (!orchestrator.start()) return R;

        ExecutionRequest request;
        request.project_id = "bench";
        request.command = "echo hi; exit 0";

        R.push_back(measure("Pipeline", "execute (mock runtime)", 500,
            [&]{ auto id = orchestrator.execute(request); (void)id; }));
        R.push_back(measure("Pipeline", "execute+wait (mock runtime)", 100, [&]{
            auto id = orchestrator.execute(request);
            if (id) (void)orchestrator.wait(*id, Duration{5000});
        }));
    }
    std::filesystem::remove_all(root);
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "sandbox_orchestrator benchmarks ("
                  << std::thread::hardware_concurrency() << " hardware threads)\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_tracker());
    append(bench_logs());
    append(bench_pipeline());

    report(all, csv);
    if (!csv) std::cout << '\n' << all.size() << " benchmarks\n";
    return 0;
}
