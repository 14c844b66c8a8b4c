/**
 * @file metrics_collector.hpp
 * @brief Structured execution events for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>

namespace sandbox_orchestrator {

/**
 * @brief Collects and writes execution lifecycle events as NDJSON.
 *
 * Every line carries `"event"` and `"ts_ms"` (milliseconds since epoch).
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_submitted(const ExecutionId& id, const RuntimeId& runtime, uint32_t timeout_s);
    void record_transition(const ExecutionId& id, ExecutionStatus from, ExecutionStatus to,
                           std::optional<int> exit_code = std::nullopt);
    void record_cleanup(const ExecutionId& id, const ContainerId& container, bool removed);
    void record_runtime_retry(std::string_view operation, uint32_t attempt);
    void record_custom(std::string_view event, const nlohmann::json& payload);

    void flush();

private:
    void emit(nlohmann::json event);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace sandbox_orchestrator
