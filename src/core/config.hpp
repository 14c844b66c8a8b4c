/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace sandbox_orchestrator {

struct OrchestratorConfig {
    std::filesystem::path projects_dir = "./projects";
    std::filesystem::path work_dir = "/tmp/sandbox_orchestrator";
    std::string container_workdir = "/app";
    std::string default_runtime = "python";
    uint32_t default_timeout_s = 30;
    uint32_t max_timeout_s = 300;
    uint32_t stop_grace_period_s = 5;
    uint32_t reaper_interval_ms = 500;
    uint32_t retention_s = 600;
    uint32_t worker_threads = 2;
};

struct DockerConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    std::string network_mode = "none";
    std::string container_prefix = "sandbox-";
    uint32_t call_timeout_ms = 10000;
    uint32_t pull_timeout_ms = 300000;
    uint32_t max_retries = 3;               ///< Extra attempts for transient failures
    uint32_t retry_backoff_ms = 200;        ///< Doubles after every failed attempt
    bool pull_missing_images = false;
};

struct LimitsConfig {
    uint64_t default_memory_bytes = 512ULL * 1024 * 1024;
    uint64_t max_memory_bytes = 2ULL * 1024 * 1024 * 1024;
    uint32_t cpu_shares = 1024;
    double cpus = 1.0;                      ///< CPU quota in cores, 0 = unlimited
    int64_t pids_limit = 256;               ///< 0 = unlimited
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics = true;
};

/**
 * @brief One `[[runtime]]` table. Missing fields fall back to the
 *        catalog's built-in entry with the same id, if any.
 */
struct RuntimeEntryConfig {
    std::string id;
    std::string name;
    std::string language;
    std::string version;
    std::string image;
    std::string command;
    std::string inline_file;
    std::vector<std::string> extensions;
    std::vector<uint16_t> ports;
    std::optional<uint32_t> timeout_s;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    DockerConfig docker;
    LimitsConfig limits;
    TelemetryConfig telemetry;
    std::vector<RuntimeEntryConfig> runtimes;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Fails with ErrorCode::ConfigError when the file is missing, malformed,
 * or holds values that cannot be used (e.g. an unparseable memory size).
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a docker-style memory size: "512m", "2g", "64k", "1024".
 *
 * Suffixes are binary (k = 1024). Returns nullopt for empty, negative or
 * malformed input.
 */
std::optional<uint64_t> parse_memory_size(std::string_view text);

}  // namespace sandbox_orchestrator
