/**
 * @file execution_tracker.cpp
 * @brief ExecutionTracker implementation.
 */

#include "tracker/execution_tracker.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace sandbox_orchestrator {

ExecutionId ExecutionTracker::generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4 layout.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

bool ExecutionTracker::is_valid_transition(ExecutionStatus from, ExecutionStatus to) noexcept {
    switch (from) {
        case ExecutionStatus::Pending:
            return to == ExecutionStatus::Running
                || to == ExecutionStatus::Failed
                || to == ExecutionStatus::Cancelled;
        case ExecutionStatus::Running:
            return is_terminal(to);
        default:
            return false;
    }
}

Error ExecutionTracker::not_found(const ExecutionId& id) {
    return Error{ErrorCode::ExecutionNotFound, "Execution not found: " + id};
}

std::shared_ptr<ExecutionTracker::Slot> ExecutionTracker::find(const ExecutionId& id) const {
    std::shared_lock lock(map_mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second;
}

// ─────────────────────────────────────────────
// Registration / State Machine
// ─────────────────────────────────────────────

Result<ExecutionId> ExecutionTracker::submit(ExecutionRecord record) {
    if (record.id.empty()) record.id = generate_id();
    record.status = ExecutionStatus::Pending;
    if (record.created_at == Timestamp{}) record.created_at = std::chrono::system_clock::now();

    auto slot = std::make_shared<Slot>();
    slot->record = std::move(record);
    ExecutionId id = slot->record.id;

    std::unique_lock lock(map_mutex_);
    auto [it, inserted] = slots_.try_emplace(id, std::move(slot));
    if (!inserted) {
        return Error{ErrorCode::DuplicateExecution, "Execution already exists: " + id};
    }
    return id;
}

Result<void> ExecutionTracker::transition(const ExecutionId& id, ExecutionStatus to,
                                          std::optional<int> exit_code, std::string error) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    ExecutionStatus from;
    {
        std::lock_guard lock(slot->mutex);
        auto& rec = slot->record;
        from = rec.status;
        if (!is_valid_transition(from, to)) {
            return Error{ErrorCode::InvalidTransition,
                         "Invalid transition for " + id + ": " + std::string{to_string(from)}
                         + " -> " + std::string{to_string(to)}};
        }

        rec.status = to;
        if (exit_code) rec.exit_code = exit_code;
        if (!error.empty()) rec.error = std::move(error);
        if (to == ExecutionStatus::Running) {
            rec.started_at = std::chrono::system_clock::now();
        }
        if (is_terminal(to)) {
            rec.finished_at = std::chrono::system_clock::now();
            rec.terminal_at = std::chrono::steady_clock::now();
        }
    }
    slot->cv.notify_all();

    TransitionObserver observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(id, from, to, exit_code);
    return Result<void>{};
}

Result<ExecutionRecord> ExecutionTracker::get(const ExecutionId& id, bool with_logs) const {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::lock_guard lock(slot->mutex);
    if (with_logs) return slot->record;

    ExecutionRecord copy;
    copy.id = slot->record.id;
    copy.project_id = slot->record.project_id;
    copy.runtime_id = slot->record.runtime_id;
    copy.container = slot->record.container;
    copy.status = slot->record.status;
    copy.created_at = slot->record.created_at;
    copy.started_at = slot->record.started_at;
    copy.finished_at = slot->record.finished_at;
    copy.deadline = slot->record.deadline;
    copy.timeout = slot->record.timeout;
    copy.exit_code = slot->record.exit_code;
    copy.error = slot->record.error;
    copy.log_closed = slot->record.log_closed;
    copy.container_removed = slot->record.container_removed;
    copy.terminal_at = slot->record.terminal_at;
    copy.workspace = slot->record.workspace;
    return copy;
}

// ─────────────────────────────────────────────
// Listings
// ─────────────────────────────────────────────

std::vector<ExecutionId> ExecutionTracker::list_active() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock lock(map_mutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) slots.push_back(slot);
    }

    std::vector<ExecutionId> ids;
    for (const auto& slot : slots) {
        std::lock_guard lock(slot->mutex);
        if (!is_terminal(slot->record.status)) ids.push_back(slot->record.id);
    }
    return ids;
}

std::vector<ExecutionId> ExecutionTracker::list_cleanup_pending() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock lock(map_mutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) slots.push_back(slot);
    }

    std::vector<ExecutionId> ids;
    for (const auto& slot : slots) {
        std::lock_guard lock(slot->mutex);
        const auto& rec = slot->record;
        if (is_terminal(rec.status) && rec.container && !rec.container_removed) {
            ids.push_back(rec.id);
        }
    }
    return ids;
}

std::vector<ExecutionId> ExecutionTracker::list_all() const {
    std::shared_lock lock(map_mutex_);
    std::vector<ExecutionId> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) ids.push_back(id);
    return ids;
}

// ─────────────────────────────────────────────
// Record Updates
// ─────────────────────────────────────────────

Result<void> ExecutionTracker::attach_container(const ExecutionId& id, ContainerHandle handle) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::lock_guard lock(slot->mutex);
    if (slot->record.container && !slot->record.container_removed) {
        return Error{ErrorCode::InvalidTransition, "Execution " + id + " already owns a container"};
    }
    slot->record.container = std::move(handle);
    slot->record.container_removed = false;
    return Result<void>{};
}

Result<void> ExecutionTracker::set_workspace(const ExecutionId& id, std::filesystem::path workspace) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::lock_guard lock(slot->mutex);
    slot->record.workspace = std::move(workspace);
    return Result<void>{};
}

Result<void> ExecutionTracker::mark_container_removed(const ExecutionId& id) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::lock_guard lock(slot->mutex);
    slot->record.container_removed = true;
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Log Buffer
// ─────────────────────────────────────────────

Result<uint64_t> ExecutionTracker::append_log(const ExecutionId& id, StreamType stream, std::string text) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    uint64_t sequence;
    {
        std::lock_guard lock(slot->mutex);
        auto& logs = slot->record.logs;
        sequence = logs.size();
        logs.push_back({stream, std::move(text), sequence});
    }
    slot->cv.notify_all();
    return sequence;
}

Result<void> ExecutionTracker::close_log(const ExecutionId& id) {
    auto slot = find(id);
    if (!slot) return not_found(id);

    {
        std::lock_guard lock(slot->mutex);
        slot->record.log_closed = true;
    }
    slot->cv.notify_all();
    return Result<void>{};
}

Result<LogSlice> ExecutionTracker::read_log(const ExecutionId& id, uint64_t since,
                                            size_t max, Duration wait) const {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::unique_lock lock(slot->mutex);
    const auto& rec = slot->record;
    if (wait > Duration::zero()) {
        slot->cv.wait_for(lock, wait, [&] {
            return rec.logs.size() > since || rec.log_closed;
        });
    }

    LogSlice slice;
    slice.status = rec.status;
    auto size = static_cast<uint64_t>(rec.logs.size());
    auto begin = std::min(since, size);
    auto end = begin + std::min<uint64_t>(size - begin, max);
    slice.chunks.assign(rec.logs.begin() + static_cast<std::ptrdiff_t>(begin),
                        rec.logs.begin() + static_cast<std::ptrdiff_t>(end));
    slice.next_sequence = std::max(since, end);
    slice.closed = rec.log_closed && end >= size;
    return slice;
}

Result<ExecutionStatus> ExecutionTracker::wait_terminal(const ExecutionId& id, Duration timeout) const {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::unique_lock lock(slot->mutex);
    slot->cv.wait_for(lock, timeout, [&] { return is_terminal(slot->record.status); });
    return slot->record.status;
}

Result<bool> ExecutionTracker::wait_log_closed(const ExecutionId& id, Duration timeout) const {
    auto slot = find(id);
    if (!slot) return not_found(id);

    std::unique_lock lock(slot->mutex);
    return slot->cv.wait_for(lock, timeout, [&] { return slot->record.log_closed; });
}

// ─────────────────────────────────────────────
// Eviction
// ─────────────────────────────────────────────

std::vector<ExecutionRecord> ExecutionTracker::evict_expired(std::chrono::seconds retention) {
    auto now = std::chrono::steady_clock::now();
    std::vector<ExecutionRecord> evicted;

    std::unique_lock map_lock(map_mutex_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        bool expired = false;
        {
            std::lock_guard lock(it->second->mutex);
            const auto& rec = it->second->record;
            expired = is_terminal(rec.status)
                && rec.terminal_at && now - *rec.terminal_at >= retention
                && (!rec.container || rec.container_removed);
            if (expired) {
                auto& moved = evicted.emplace_back(std::move(it->second->record));
                moved.logs.clear();
                moved.logs.shrink_to_fit();
                it->second->record.logs.clear();
                it->second->record.log_closed = true;
            }
        }
        if (expired) {
            // Readers still parked on this slot wake to a closed log.
            it->second->cv.notify_all();
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

Result<ExecutionRecord> ExecutionTracker::erase(const ExecutionId& id) {
    std::shared_ptr<Slot> slot;
    {
        std::unique_lock lock(map_mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) return not_found(id);
        slot = std::move(it->second);
        slots_.erase(it);
    }

    ExecutionRecord record;
    {
        std::lock_guard lock(slot->mutex);
        record = slot->record;
        slot->record.log_closed = true;
    }
    slot->cv.notify_all();
    return record;
}

void ExecutionTracker::set_transition_observer(TransitionObserver observer) {
    std::lock_guard lock(observer_mutex_);
    observer_ = std::move(observer);
}

size_t ExecutionTracker::size() const {
    std::shared_lock lock(map_mutex_);
    return slots_.size();
}

}  // namespace sandbox_orchestrator
