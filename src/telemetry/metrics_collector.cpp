/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>

namespace sandbox_orchestrator {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_submitted(const ExecutionId& id, const RuntimeId& runtime,
                                        uint32_t timeout_s) {
    emit({
        {"event", "execution_submitted"},
        {"execution", id},
        {"runtime", runtime},
        {"timeout_s", timeout_s},
    });
}

void MetricsCollector::record_transition(const ExecutionId& id, ExecutionStatus from,
                                         ExecutionStatus to, std::optional<int> exit_code) {
    nlohmann::json event = {
        {"event", "execution_transition"},
        {"execution", id},
        {"from", std::string{to_string(from)}},
        {"to", std::string{to_string(to)}},
    };
    if (exit_code) event["exit_code"] = *exit_code;
    emit(std::move(event));
}

void MetricsCollector::record_cleanup(const ExecutionId& id, const ContainerId& container,
                                      bool removed) {
    emit({
        {"event", "container_cleanup"},
        {"execution", id},
        {"container", container},
        {"removed", removed},
    });
}

void MetricsCollector::record_runtime_retry(std::string_view operation, uint32_t attempt) {
    emit({
        {"event", "runtime_retry"},
        {"operation", std::string{operation}},
        {"attempt", attempt},
    });
}

void MetricsCollector::record_custom(std::string_view event, const nlohmann::json& payload) {
    emit({
        {"event", std::string{event}},
        {"data", payload},
    });
}

void MetricsCollector::emit(nlohmann::json event) {
    event["ts_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto line = event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(write_mutex_);
    sink_->write(line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_orchestrator
