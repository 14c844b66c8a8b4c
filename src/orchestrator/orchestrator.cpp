/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation.
 */

#include "orchestrator/orchestrator.hpp"

#include "telemetry/json_sink.hpp"

#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <utility>

namespace sandbox_orchestrator {

namespace {

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

RuntimeCatalog catalog_or_builtin(RuntimeCatalog catalog) {
    if (catalog.size() == 0) return RuntimeCatalog::builtin();
    return catalog;
}

void delete_workspace(Logger& logger, const ExecutionId& id, const std::filesystem::path& dir) {
    if (dir.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        logger.warn("failed to delete workspace", {{"execution", id}, {"path", dir.string()}, {"error", ec.message()}});
    }
}

}  // namespace

Orchestrator::Orchestrator(IContainerRuntime& runtime, Options opts)
    : config_(std::move(opts.config))
    , catalog_(catalog_or_builtin(std::move(opts.catalog)))
    , logger_(sink_or_null(std::move(opts.log_sink)), opts.log_level)
    , metrics_(opts.metrics_sink ? std::make_unique<MetricsCollector>(std::move(opts.metrics_sink)) : nullptr)
    , limiter_(config_.orchestrator, config_.limits)
    , stager_(config_.orchestrator.projects_dir, config_.orchestrator.work_dir)
    , lifecycle_(runtime, config_.docker, logger_, metrics_.get())
    , collector_(tracker_, lifecycle_, logger_)
    , reaper_(tracker_, lifecycle_, collector_, pool_, logger_, metrics_.get(),
              Reaper::Options{
                  .interval = Duration{config_.orchestrator.reaper_interval_ms},
                  .stop_grace = std::chrono::seconds{config_.orchestrator.stop_grace_period_s},
                  .retention = std::chrono::seconds{config_.orchestrator.retention_s},
              })
    , pool_(config_.orchestrator.worker_threads) {
    tracker_.set_transition_observer(
        [this](const ExecutionId& id, ExecutionStatus from, ExecutionStatus to, std::optional<int> exit_code) {
            on_transition(id, from, to, exit_code);
        });
}

Orchestrator::~Orchestrator() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Orchestrator::start() {
    if (shut_down_.load()) {
        return Error{ErrorCode::Internal, "Orchestrator has been shut down"};
    }
    if (running_.exchange(true)) {
        return Error{ErrorCode::Internal, "Already running"};
    }

    auto ping = lifecycle_.ping();
    if (!ping) {
        running_ = false;
        return ping.error();
    }

    auto swept = sweep_orphans();
    if (!swept) {
        logger_.warn("orphan sweep failed", {{"error", swept.error().describe()}});
    }

    reaper_.start();
    logger_.info("orchestrator started", {
        {"environments", catalog_.size()},
        {"workers", pool_.thread_count()},
        {"reaper_interval_ms", config_.orchestrator.reaper_interval_ms},
    });
    return Result<void>{};
}

void Orchestrator::shutdown() {
    if (shut_down_.exchange(true)) return;
    running_ = false;

    reaper_.stop();

    for (const auto& id : tracker_.list_active()) {
        if (auto cancelled = cancel(id); !cancelled) {
            logger_.debug("execution finished during shutdown", {{"execution", id}});
        }
    }

    std::vector<std::pair<ExecutionId, std::future<bool>>> pending;
    for (const auto& id : tracker_.list_cleanup_pending()) {
        pending.emplace_back(id, pool_.submit([this, id] { return reaper_.cleanup(id); }));
    }
    for (auto& [id, removed] : pending) {
        if (!removed.get()) {
            logger_.warn("container left behind at shutdown", {{"execution", id}});
        }
    }

    collector_.detach_all();
    pool_.shutdown();

    logger_.info("orchestrator stopped", {{"tracked", tracker_.size()}});
    if (metrics_) metrics_->flush();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

Result<RuntimeEnvironment> Orchestrator::resolve_environment(const ExecutionRequest& request) {
    std::optional<std::string_view> version;
    if (request.version) version = *request.version;

    if (request.language) {
        return catalog_.resolve(*request.language, version);
    }

    if (!request.project_id.empty()) {
        if (auto language = stager_.project_language(request.project_id)) {
            auto environment = catalog_.resolve(*language, version);
            if (environment) return environment;
            logger_.debug("project language not in catalog, using default runtime",
                          {{"project", request.project_id}, {"language", *language}});
        }
    }
    return catalog_.resolve(config_.orchestrator.default_runtime, version);
}

Result<ExecutionId> Orchestrator::fail_pending(const ExecutionId& id, const Error& error) {
    auto moved = tracker_.transition(id, ExecutionStatus::Failed, std::nullopt, error.message);
    if (!moved) {
        // Cancelled while the container was being set up.
        logger_.debug("setup failure after terminal transition",
                      {{"execution", id}, {"error", moved.error().describe()}});
    }
    if (auto closed = tracker_.close_log(id); !closed) {
        logger_.debug("record deleted during setup", {{"execution", id}});
    }
    logger_.warn("execution setup failed", {{"execution", id}, {"error", error.describe()}});
    return error;
}

Result<ExecutionId> Orchestrator::execute(const ExecutionRequest& request) {
    if (shut_down_.load()) {
        return Error{ErrorCode::RuntimeUnavailable, "Orchestrator is shut down"};
    }

    auto environment = resolve_environment(request);
    if (!environment) return environment.error();

    auto limits = limiter_.derive(request, *environment);
    if (!limits) return limits.error();

    if (!request.project_id.empty()) {
        auto dir = stager_.project_dir(request.project_id);
        if (!dir) return dir.error();
    } else if (!request.source) {
        return Error{ErrorCode::ProjectNotFound, "Request names neither a project nor inline source"};
    }

    ExecutionRecord record;
    record.project_id = request.project_id;
    record.runtime_id = environment->id;
    record.created_at = std::chrono::system_clock::now();
    record.timeout = limits->timeout;
    record.deadline = std::chrono::steady_clock::now() + limits->timeout;

    auto submitted = tracker_.submit(std::move(record));
    if (!submitted) return submitted.error();
    const ExecutionId id = *submitted;

    if (metrics_) {
        metrics_->record_submitted(id, environment->id, static_cast<uint32_t>(limits->timeout.count()));
    }
    logger_.info("execution submitted", {
        {"execution", id},
        {"project", request.project_id},
        {"runtime", environment->id},
        {"timeout_s", limits->timeout.count()},
        {"memory_bytes", limits->memory_bytes},
    });

    auto staged = stager_.stage(id, request, *environment);
    if (!staged) return fail_pending(id, staged.error());
    if (staged->owned) {
        if (auto set = tracker_.set_workspace(id, staged->host_dir); !set) {
            delete_workspace(logger_, id, staged->host_dir);
            return set.error();
        }
    }

    const auto& workdir = config_.orchestrator.container_workdir;
    std::string command = request.command.value_or(std::string{});
    if (command.empty()) command = environment->command;

    CreateRequest create;
    create.name = config_.docker.container_prefix + id;
    create.image = environment->image;
    create.command = {"/bin/sh", "-c", command};
    create.workdir = workdir;
    create.volumes = {VolumeMount{staged->host_dir.string(), workdir, true}};
    create.env = request.environment_vars;
    create.limits = *limits;
    create.labels = {
        {std::string{LifecycleManager::EXECUTION_LABEL}, id},
        {std::string{LifecycleManager::PROJECT_LABEL}, request.project_id},
    };
    create.ports = environment->ports;

    auto handle = lifecycle_.create(create);
    if (!handle) return fail_pending(id, handle.error());
    handle->host_workdir = staged->host_dir.string();
    handle->workdir = workdir;

    if (auto attached = tracker_.attach_container(id, *handle); !attached) {
        // Record deleted underneath us; nothing owns the container any more.
        if (auto removed = lifecycle_.remove(*handle); !removed) {
            logger_.warn("failed to remove unowned container",
                         {{"container", handle->id}, {"error", removed.error().describe()}});
        }
        return attached.error();
    }

    // From here on the reaper owns removal of the container.
    auto current = tracker_.get(id, /*with_logs=*/false);
    if (!current) return current.error();
    if (is_terminal(current->status)) {
        logger_.info("execution cancelled during setup, container not started",
                     {{"execution", id}, {"container", handle->id}});
        if (auto closed = tracker_.close_log(id); !closed) {
            logger_.debug("record deleted during setup", {{"execution", id}});
        }
        return id;
    }

    auto started = lifecycle_.start(*handle);
    if (!started) return fail_pending(id, started.error());

    auto running = tracker_.transition(id, ExecutionStatus::Running);
    if (!running) {
        // Cancelled between the check above and the start; cancel() may
        // have stopped the container before it was running.
        logger_.debug("execution cancelled before start was confirmed", {{"execution", id}});
        auto stopped = lifecycle_.stop(*handle, std::chrono::seconds{config_.orchestrator.stop_grace_period_s});
        if (!stopped) {
            logger_.warn("stop after late cancel failed, reaper will retry",
                         {{"execution", id}, {"error", stopped.error().describe()}});
        }
        if (auto closed = tracker_.close_log(id); !closed) {
            logger_.debug("record deleted during setup", {{"execution", id}});
        }
        return id;
    }

    if (auto attached = collector_.attach(id, *handle); !attached) {
        logger_.warn("log stream unavailable, output will be missing",
                     {{"execution", id}, {"error", attached.error().describe()}});
        if (auto closed = tracker_.close_log(id); !closed) {
            logger_.debug("record deleted during setup", {{"execution", id}});
        }
    }

    logger_.debug("execution running", {{"execution", id}, {"container", handle->id}});
    return id;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<ExecutionStatusInfo> Orchestrator::status(const ExecutionId& id) const {
    return tracker_.get(id, /*with_logs=*/false).map([](const ExecutionRecord& rec) {
        return ExecutionStatusInfo{rec.id, rec.status};
    });
}

Result<ExecutionLog> Orchestrator::logs(const ExecutionId& id, std::optional<uint64_t> since) const {
    return tracker_.read_log(id, since.value_or(0)).map([&id](const LogSlice& slice) {
        return ExecutionLog{id, slice.chunks, slice.next_sequence, slice.closed};
    });
}

Result<LogCursor> Orchestrator::follow(const ExecutionId& id, uint64_t since) const {
    auto rec = tracker_.get(id, /*with_logs=*/false);
    if (!rec) return rec.error();
    return collector_.cursor(id, since);
}

Result<ExecutionResponse> Orchestrator::response(const ExecutionId& id) const {
    auto rec = tracker_.get(id);
    if (!rec) return rec.error();

    ExecutionResponse response;
    response.execution_id = rec->id;
    response.status = rec->status;
    response.start_time = rec->started_at.value_or(rec->created_at);
    response.end_time = rec->finished_at;
    response.exit_code = rec->exit_code;

    if (!rec->logs.empty()) {
        std::string output;
        for (const auto& chunk : rec->logs) output += chunk.text;
        response.output = std::move(output);
    }
    if (!rec->error.empty()) response.error = rec->error;
    return response;
}

Result<ExecutionResponse> Orchestrator::wait(const ExecutionId& id, Duration timeout) {
    auto status = tracker_.wait_terminal(id, timeout);
    if (!status) return status.error();
    if (!is_terminal(*status)) {
        return Error{ErrorCode::Timeout, "Execution " + id + " still " + std::string{to_string(*status)}
                                             + " after " + std::to_string(timeout.count()) + " ms"};
    }

    auto closed = tracker_.wait_log_closed(id, std::chrono::seconds{config_.orchestrator.stop_grace_period_s});
    if (!closed) return closed.error();
    if (!*closed) {
        logger_.debug("returning response before the log closed", {{"execution", id}});
    }
    return response(id);
}

std::vector<ContainerInfo> Orchestrator::containers(const std::optional<ProjectId>& project_id) {
    std::vector<ContainerInfo> result;
    for (const auto& id : tracker_.list_all()) {
        auto rec = tracker_.get(id, /*with_logs=*/false);
        if (!rec || !rec->container || rec->container_removed) continue;
        if (project_id && rec->project_id != *project_id) continue;
        const auto& handle = *rec->container;

        ContainerInfo info{handle.id, rec->project_id, rec->id, {}, rec->created_at, handle.ports};
        auto state = lifecycle_.inspect(handle);
        if (state) {
            info.status = state->status;
            if (!state->ports.empty()) info.ports = state->ports;
        } else if (state.error().code == ErrorCode::ContainerNotFound) {
            continue;
        } else {
            info.status = "unknown";
        }
        result.push_back(std::move(info));
    }
    return result;
}

// ─────────────────────────────────────────────
// Control
// ─────────────────────────────────────────────

Result<void> Orchestrator::cancel(const ExecutionId& id) {
    auto moved = tracker_.transition(id, ExecutionStatus::Cancelled, std::nullopt, "Execution cancelled");
    if (!moved) return moved.error();
    logger_.info("execution cancelled", {{"execution", id}});

    // A container attached after this read is stopped by the reaper instead.
    auto rec = tracker_.get(id, /*with_logs=*/false);
    if (!rec || !rec->container) return Result<void>{};

    auto stopped = lifecycle_.stop(*rec->container, std::chrono::seconds{config_.orchestrator.stop_grace_period_s});
    if (!stopped) {
        logger_.warn("stop after cancel failed, reaper will retry",
                     {{"execution", id}, {"error", stopped.error().describe()}});
    }
    return Result<void>{};
}

Result<void> Orchestrator::remove(const ExecutionId& id) {
    auto rec = tracker_.get(id, /*with_logs=*/false);
    if (!rec) return rec.error();

    if (!is_terminal(rec->status)) {
        auto cancelled = cancel(id);
        if (!cancelled && cancelled.error().code != ErrorCode::InvalidTransition) return cancelled.error();
    }

    if (!reaper_.cleanup(id)) {
        return Error{ErrorCode::RuntimeUnavailable,
                     "Container of execution " + id + " could not be removed; cleanup will be retried"};
    }

    collector_.detach(id);
    auto erased = tracker_.erase(id);
    if (!erased) return erased.error();
    delete_workspace(logger_, id, erased->workspace);
    logger_.info("execution deleted", {{"execution", id}});
    return Result<void>{};
}

Result<size_t> Orchestrator::sweep_orphans() {
    auto listed = lifecycle_.list_managed();
    if (!listed) return listed.error();

    size_t removed = 0;
    for (const auto& container : *listed) {
        auto owner = container.labels.find(std::string{LifecycleManager::EXECUTION_LABEL});
        if (owner != container.labels.end() && tracker_.get(owner->second, /*with_logs=*/false)) continue;

        auto result = lifecycle_.remove(container.id);
        if (!result) {
            logger_.warn("failed to remove orphaned container",
                         {{"container", container.id}, {"error", result.error().describe()}});
            continue;
        }
        ++removed;
        logger_.info("removed orphaned container", {{"container", container.id}, {"name", container.name}});
    }
    return removed;
}

void Orchestrator::on_transition(const ExecutionId& id, ExecutionStatus from, ExecutionStatus to,
                                 std::optional<int> exit_code) {
    if (metrics_) metrics_->record_transition(id, from, to, exit_code);
    if (!is_terminal(to)) return;

    Logger::Fields fields{{"execution", id}, {"status", std::string{to_string(to)}}};
    if (exit_code) fields["exit_code"] = *exit_code;
    logger_.info("execution finished", fields);
}

}  // namespace sandbox_orchestrator
