/**
 * @file lifecycle_manager.cpp
 * @brief LifecycleManager implementation.
 */

#include "container/lifecycle_manager.hpp"

#include <thread>

namespace sandbox_orchestrator {

namespace {

ContainerHandle make_handle(const CreateRequest& request, ContainerId id) {
    ContainerHandle handle;
    handle.id = std::move(id);
    handle.name = request.name;
    handle.image = request.image;
    handle.limits = request.limits;
    handle.workdir = request.workdir;
    for (const auto& volume : request.volumes) {
        if (volume.container_path == request.workdir) handle.host_workdir = volume.host_path;
    }
    for (auto port : request.ports) {
        handle.ports.push_back({port, 0});
    }
    return handle;
}

}  // namespace

LifecycleManager::LifecycleManager(IContainerRuntime& runtime, DockerConfig config, Logger& logger,
                                   MetricsCollector* metrics)
    : runtime_(runtime)
    , config_(std::move(config))
    , logger_(logger)
    , metrics_(metrics) {}

template <typename F>
std::invoke_result_t<F> LifecycleManager::with_retry(std::string_view operation, F&& call) {
    auto backoff = std::chrono::milliseconds{config_.retry_backoff_ms};
    uint32_t attempt = 0;

    while (true) {
        auto result = call();
        if (result || !result.error().is_transient() || attempt >= config_.max_retries) {
            return result;
        }

        ++attempt;
        logger_.warn("container runtime call failed, retrying", {
            {"operation", std::string{operation}},
            {"attempt", attempt},
            {"backoff_ms", backoff.count()},
            {"error", result.error().describe()},
        });
        if (metrics_) metrics_->record_runtime_retry(operation, attempt);

        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

Result<ContainerHandle> LifecycleManager::create(const CreateRequest& request) {
    ContainerSpec spec;
    spec.name = request.name;
    spec.image = request.image;
    spec.command = request.command;
    spec.workdir = request.workdir;
    spec.volumes = request.volumes;
    spec.env = request.env;
    spec.labels = request.labels;
    spec.labels[std::string{MANAGED_LABEL}] = "true";
    spec.exposed_ports = request.ports;
    spec.limits = request.limits;
    // Published ports need a network; everything else runs isolated.
    spec.network_mode = request.ports.empty() ? config_.network_mode : std::string{"bridge"};

    bool pulled = false;
    while (true) {
        auto id = with_retry("create", [&] { return runtime_.create(spec); });
        if (id) {
            logger_.debug("container created", {{"container", *id}, {"name", spec.name}, {"image", spec.image}});
            return make_handle(request, std::move(*id));
        }

        const auto& err = id.error();
        if (err.code == ErrorCode::ContainerConflict && !spec.name.empty()) {
            // A timed-out attempt may have created it after all.
            return adopt_existing(request);
        }

        if (err.code == ErrorCode::ImageNotFound) {
            if (!config_.pull_missing_images || pulled) {
                return Error{ErrorCode::ContainerCreateError, "image not found: " + spec.image};
            }
            logger_.info("pulling missing image", {{"image", spec.image}});
            auto pull = with_retry("pull", [&] { return runtime_.pull(spec.image); });
            if (!pull) {
                return Error{ErrorCode::ContainerCreateError,
                             "failed to pull image " + spec.image + ": " + pull.error().message};
            }
            pulled = true;
            continue;
        }

        if (err.code == ErrorCode::RuntimeUnavailable || err.code == ErrorCode::Timeout) {
            return Error{ErrorCode::ContainerCreateError, "runtime unavailable: " + err.message};
        }
        return Error{ErrorCode::ContainerCreateError, err.message};
    }
}

Result<ContainerHandle> LifecycleManager::adopt_existing(const CreateRequest& request) {
    auto existing = runtime_.inspect(request.name);
    if (!existing) {
        return Error{ErrorCode::ContainerCreateError,
                     "name conflict for " + request.name + ": " + existing.error().message};
    }
    logger_.info("adopted container from earlier create attempt",
                 {{"container", existing->id}, {"name", request.name}});
    return make_handle(request, existing->id);
}

Result<void> LifecycleManager::start(const ContainerHandle& handle) {
    auto started = with_retry("start", [&] { return runtime_.start(handle.id); });
    if (!started) {
        const auto& err = started.error();
        std::string message = err.is_transient() ? "runtime unavailable: " + err.message : err.message;
        return Error{ErrorCode::ContainerStartError, std::move(message)};
    }
    logger_.debug("container started", {{"container", handle.id}});
    return Result<void>{};
}

Result<ContainerState> LifecycleManager::inspect(const ContainerHandle& handle) {
    return runtime_.inspect(handle.id);
}

Result<void> LifecycleManager::stop(const ContainerHandle& handle, std::chrono::seconds grace) {
    auto stopped = runtime_.stop(handle.id, grace);
    if (!stopped && stopped.error().code == ErrorCode::ContainerNotFound) {
        return Result<void>{};
    }
    return stopped;
}

Result<void> LifecycleManager::remove(const ContainerId& id) {
    auto removed = runtime_.remove(id, /*force=*/true);
    if (!removed && removed.error().code == ErrorCode::ContainerNotFound) {
        return Result<void>{};
    }
    return removed;
}

Result<std::unique_ptr<ILogStream>> LifecycleManager::open_logs(const ContainerHandle& handle) {
    return runtime_.logs(handle.id, /*follow=*/true);
}

Result<std::vector<ContainerSummary>> LifecycleManager::list_managed() {
    return runtime_.list({{std::string{MANAGED_LABEL}, "true"}});
}

Result<void> LifecycleManager::ping() {
    return runtime_.ping();
}

}  // namespace sandbox_orchestrator
