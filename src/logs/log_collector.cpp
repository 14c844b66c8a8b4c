/**
 * @file log_collector.cpp
 * @brief LogCollector and LogCursor implementation.
 */

#include "logs/log_collector.hpp"

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// LogCursor
// ─────────────────────────────────────────────

LogCursor::LogCursor(const ExecutionTracker& tracker, ExecutionId id, uint64_t since)
    : tracker_(&tracker), id_(std::move(id)), position_(since) {}

Result<ReadStatus> LogCursor::next(LogChunk& out, Duration timeout) {
    if (buffered_.empty() && !closed_) {
        auto slice = tracker_->read_log(id_, position_, BATCH_SIZE, timeout);
        if (!slice) return slice.error();
        for (auto& chunk : slice->chunks) buffered_.push_back(std::move(chunk));
        closed_ = slice->closed;
    }

    if (!buffered_.empty()) {
        out = std::move(buffered_.front());
        buffered_.pop_front();
        position_ = out.sequence + 1;
        return ReadStatus::Data;
    }
    return closed_ ? ReadStatus::Closed : ReadStatus::Timeout;
}

// ─────────────────────────────────────────────
// LogCollector
// ─────────────────────────────────────────────

LogCollector::LogCollector(ExecutionTracker& tracker, LifecycleManager& lifecycle, Logger& logger)
    : tracker_(tracker), lifecycle_(lifecycle), logger_(logger) {}

LogCollector::~LogCollector() {
    detach_all();
}

Result<void> LogCollector::attach(const ExecutionId& id, const ContainerHandle& handle) {
    {
        std::lock_guard lock(mutex_);
        if (pumps_.count(id)) return Result<void>{};
    }

    auto stream = lifecycle_.open_logs(handle);
    if (!stream) return stream.error();

    std::lock_guard lock(mutex_);
    if (pumps_.count(id)) return Result<void>{};
    pumps_.emplace(id, std::jthread([this, id, s = std::move(*stream)](std::stop_token stop) mutable {
        pump(stop, id, std::move(s));
    }));
    return Result<void>{};
}

void LogCollector::pump(std::stop_token stop, ExecutionId id, std::unique_ptr<ILogStream> stream) {
    size_t frames = 0;

    while (!stop.stop_requested()) {
        auto read = stream->next(POLL_INTERVAL);
        if (!read) {
            logger_.warn("log stream failed", {{"execution", id}, {"error", read.error().describe()}});
            break;
        }
        if (read->status == ReadStatus::Closed) break;
        if (read->status == ReadStatus::Timeout) continue;

        auto appended = tracker_.append_log(id, read->frame.stream, std::move(read->frame.text));
        if (!appended) break;   // record evicted
        ++frames;
    }

    stream->close();
    // The record may already be gone after an explicit deletion.
    if (auto closed = tracker_.close_log(id); !closed) {
        logger_.debug("log closed after record eviction", {{"execution", id}});
    }
    logger_.debug("log pump finished", {{"execution", id}, {"frames", frames}});
}

void LogCollector::detach(const ExecutionId& id) {
    std::jthread pump;
    {
        std::lock_guard lock(mutex_);
        auto it = pumps_.find(id);
        if (it == pumps_.end()) return;
        pump = std::move(it->second);
        pumps_.erase(it);
    }
    // Join outside the lock; the pump notices within one poll interval.
    pump.request_stop();
}

void LogCollector::detach_all() {
    std::unordered_map<ExecutionId, std::jthread> pumps;
    {
        std::lock_guard lock(mutex_);
        pumps.swap(pumps_);
    }
    for (auto& [id, pump] : pumps) pump.request_stop();
    pumps.clear();
}

LogCursor LogCollector::cursor(const ExecutionId& id, uint64_t since) const {
    return LogCursor{tracker_, id, since};
}

size_t LogCollector::attached_count() const {
    std::lock_guard lock(mutex_);
    return pumps_.size();
}

}  // namespace sandbox_orchestrator
