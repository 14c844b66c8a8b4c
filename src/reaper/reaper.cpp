/**
 * @file reaper.cpp
 * @brief Reaper implementation.
 */

#include "reaper/reaper.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace sandbox_orchestrator {

Reaper::Reaper(ExecutionTracker& tracker,
               LifecycleManager& lifecycle,
               LogCollector& collector,
               WorkerPool& pool,
               Logger& logger,
               MetricsCollector* metrics,
               Options options)
    : tracker_(tracker)
    , lifecycle_(lifecycle)
    , collector_(collector)
    , pool_(pool)
    , logger_(logger)
    , metrics_(metrics)
    , options_(options) {}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        loop(stop);
    });
}

void Reaper::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wake_cv_.notify_all();
    thread_.join();
    thread_ = std::jthread{};
}

void Reaper::loop(std::stop_token stop) {
    logger_.debug("reaper started", {{"interval_ms", options_.interval.count()}});

    while (!stop.stop_requested()) {
        run_once();

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, options_.interval, [] { return false; });
    }

    logger_.debug("reaper stopped", {{"cycles", cycles_.load()}});
}

// ─────────────────────────────────────────────
// Scan
// ─────────────────────────────────────────────

void Reaper::run_once() {
    ++cycles_;
    auto now = std::chrono::steady_clock::now();

    for (const auto& id : tracker_.list_active()) {
        check(id, now);
    }
    for (const auto& id : tracker_.list_cleanup_pending()) {
        schedule_cleanup(id);
    }
    evict();
}

void Reaper::check(const ExecutionId& id, SteadyTime now) {
    auto rec = tracker_.get(id, /*with_logs=*/false);
    if (!rec) return;   // evicted or deleted since the listing

    // PENDING belongs to the submitting thread until the start is confirmed.
    if (rec->status != ExecutionStatus::Running || !rec->container) return;

    auto state = lifecycle_.inspect(*rec->container);
    if (!state) {
        if (state.error().code == ErrorCode::ContainerNotFound) {
            logger_.warn("container disappeared", {{"execution", id}, {"container", rec->container->id}});
            auto moved = tracker_.transition(id, ExecutionStatus::Failed, std::nullopt,
                                             "Container disappeared before the execution finished");
            if (!moved) return;
            if (auto marked = tracker_.mark_container_removed(id); !marked) {
                logger_.debug("record deleted during reap", {{"execution", id}});
            }
            return;
        }
        if (now < rec->deadline) {
            logger_.warn("inspect failed, retrying next cycle",
                         {{"execution", id}, {"error", state.error().describe()}});
            return;
        }
        logger_.warn("inspect failed past the deadline",
                     {{"execution", id}, {"error", state.error().describe()}});
    } else if (!state->running && state->exit_code) {
        int code = *state->exit_code;
        auto status = code == 0 ? ExecutionStatus::Succeeded : ExecutionStatus::Failed;
        std::string error = code == 0 ? std::string{}
                                      : "Execution failed with exit code " + std::to_string(code);
        auto moved = tracker_.transition(id, status, code, std::move(error));
        if (!moved) {
            // A concurrent cancel got there first.
            logger_.debug("exit observed after terminal transition",
                          {{"execution", id}, {"error", moved.error().describe()}});
        }
        return;
    }

    // Past the deadline the status no longer depends on what the engine
    // reports; stop and remove are retried by the cleanup pass.
    if (now >= rec->deadline) {
        auto moved = tracker_.transition(
            id, ExecutionStatus::TimedOut, std::nullopt,
            "Execution timed out after " + std::to_string(rec->timeout.count()) + " seconds");
        if (moved) {
            logger_.info("execution timed out", {{"execution", id}, {"timeout_s", rec->timeout.count()}});
            schedule_cleanup(id);
        }
    }
}

// ─────────────────────────────────────────────
// Cleanup
// ─────────────────────────────────────────────

void Reaper::schedule_cleanup(const ExecutionId& id) {
    {
        std::lock_guard lock(inflight_mutex_);
        if (!inflight_.insert(id).second) return;
    }

    bool queued = pool_.post([this, id] {
        cleanup(id);
        std::lock_guard lock(inflight_mutex_);
        inflight_.erase(id);
    });

    if (!queued) {
        std::lock_guard lock(inflight_mutex_);
        inflight_.erase(id);
    }
}

bool Reaper::cleanup(const ExecutionId& id) {
    auto rec = tracker_.get(id, /*with_logs=*/false);
    if (!rec || !rec->container || rec->container_removed) return true;
    const auto& handle = *rec->container;

    bool may_run = rec->status == ExecutionStatus::TimedOut
        || rec->status == ExecutionStatus::Cancelled
        || !rec->exit_code;
    if (may_run) {
        auto stopped = lifecycle_.stop(handle, options_.stop_grace);
        if (!stopped) {
            logger_.warn("stop failed, retrying next cycle",
                         {{"execution", id}, {"container", handle.id}, {"error", stopped.error().describe()}});
            return false;
        }
    }

    // Let the pump drain what the container printed before it goes away.
    if (!rec->log_closed) {
        Duration wait = options_.stop_grace;
        if (rec->terminal_at) {
            auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - *rec->terminal_at);
            wait = std::max(Duration::zero(), wait - elapsed);
        }
        auto closed = tracker_.wait_log_closed(id, wait);
        if (closed && !*closed) {
            logger_.debug("removing container before its log drained", {{"execution", id}});
        }
    }

    auto removed = lifecycle_.remove(handle);
    if (metrics_) metrics_->record_cleanup(id, handle.id, removed.has_value());
    if (!removed) {
        logger_.warn("remove failed, retrying next cycle",
                     {{"execution", id}, {"container", handle.id}, {"error", removed.error().describe()}});
        return false;
    }

    // The record may have been deleted meanwhile; nothing left to mark then.
    if (auto marked = tracker_.mark_container_removed(id); !marked) {
        logger_.debug("container removed after record deletion", {{"execution", id}});
    }
    collector_.detach(id);
    logger_.info("container removed", {{"execution", id}, {"container", handle.id}});
    return true;
}

void Reaper::evict() {
    for (const auto& rec : tracker_.evict_expired(options_.retention)) {
        collector_.detach(rec.id);
        if (!rec.workspace.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(rec.workspace, ec);
            if (ec) {
                logger_.warn("failed to delete workspace",
                             {{"execution", rec.id}, {"path", rec.workspace.string()}, {"error", ec.message()}});
            }
        }
        logger_.debug("execution evicted", {{"execution", rec.id}});
    }
}

}  // namespace sandbox_orchestrator
