/**
 * @file records.cpp
 * @brief JSON serialization of collaborator records.
 */

#include "orchestrator/records.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandbox_orchestrator {

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    std::tm utc{};
    ::gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void to_json(nlohmann::json& j, const LogChunk& chunk) {
    j = {
        {"stream", std::string{to_string(chunk.stream)}},
        {"text", chunk.text},
        {"sequence", chunk.sequence},
    };
}

void to_json(nlohmann::json& j, const PortBinding& port) {
    j = {
        {"container_port", port.container_port},
        {"host_port", port.host_port},
    };
}

void to_json(nlohmann::json& j, const ExecutionResponse& response) {
    j = {
        {"execution_id", response.execution_id},
        {"status", std::string{to_string(response.status)}},
        {"output", response.output ? nlohmann::json(*response.output) : nlohmann::json(nullptr)},
        {"error", response.error ? nlohmann::json(*response.error) : nlohmann::json(nullptr)},
        {"start_time", format_timestamp(response.start_time)},
        {"end_time", response.end_time ? nlohmann::json(format_timestamp(*response.end_time))
                                       : nlohmann::json(nullptr)},
        {"exit_code", response.exit_code ? nlohmann::json(*response.exit_code) : nlohmann::json(nullptr)},
    };
}

void to_json(nlohmann::json& j, const ExecutionLog& log) {
    j = {
        {"execution_id", log.execution_id},
        {"logs", log.logs},
        {"next_sequence", log.next_sequence},
        {"complete", log.complete},
    };
}

void to_json(nlohmann::json& j, const ExecutionStatusInfo& info) {
    j = {
        {"execution_id", info.execution_id},
        {"status", std::string{to_string(info.status)}},
    };
}

void to_json(nlohmann::json& j, const ContainerInfo& info) {
    j = {
        {"container_id", info.container_id},
        {"project_id", info.project_id},
        {"execution_id", info.execution_id},
        {"status", info.status},
        {"created_at", format_timestamp(info.created_at)},
        {"ports", info.ports},
    };
}

}  // namespace sandbox_orchestrator
