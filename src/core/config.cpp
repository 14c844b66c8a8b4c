/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <limits>

namespace sandbox_orchestrator {

namespace {

/// Memory sizes may be written as strings ("512m") or plain byte counts.
template <typename View>
Result<uint64_t> memory_field(View node, uint64_t fallback, std::string_view key) {
    if (!node) return fallback;
    if (auto bytes = node.template value<int64_t>()) {
        if (*bytes <= 0) {
            return Error{ErrorCode::ConfigError, std::string{key} + " must be positive"};
        }
        return static_cast<uint64_t>(*bytes);
    }
    if (auto text = node.template value<std::string>()) {
        if (auto parsed = parse_memory_size(*text)) return *parsed;
        return Error{ErrorCode::ConfigError,
                     std::string{key} + ": invalid memory size '" + *text + "'"};
    }
    return Error{ErrorCode::ConfigError, std::string{key} + " must be a string or integer"};
}

template <typename View>
std::vector<std::string> string_array(View node) {
    std::vector<std::string> out;
    if (auto arr = node.as_array()) {
        for (const auto& element : *arr) {
            if (auto s = element.template value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

Result<RuntimeEntryConfig> parse_runtime(const toml::table& tbl) {
    RuntimeEntryConfig entry;
    entry.id = tbl["id"].value_or(std::string{});
    if (entry.id.empty()) {
        return Error{ErrorCode::ConfigError, "[[runtime]] entry without id"};
    }
    entry.name = tbl["name"].value_or(std::string{});
    entry.language = tbl["language"].value_or(std::string{});
    entry.version = tbl["version"].value_or(std::string{});
    entry.image = tbl["image"].value_or(std::string{});
    entry.command = tbl["command"].value_or(std::string{});
    entry.inline_file = tbl["inline_file"].value_or(std::string{});
    entry.extensions = string_array(tbl["extensions"]);

    if (auto ports = tbl["ports"].as_array()) {
        for (const auto& port : *ports) {
            auto value = port.value<int64_t>();
            if (!value || *value <= 0 || *value > std::numeric_limits<uint16_t>::max()) {
                return Error{ErrorCode::ConfigError, "runtime " + entry.id + ": invalid port"};
            }
            entry.ports.push_back(static_cast<uint16_t>(*value));
        }
    }

    if (auto timeout = tbl["timeout_s"].value<int64_t>()) {
        if (*timeout <= 0) {
            return Error{ErrorCode::ConfigError, "runtime " + entry.id + ": timeout_s must be positive"};
        }
        entry.timeout_s = static_cast<uint32_t>(*timeout);
    }
    return entry;
}

}  // namespace

std::optional<uint64_t> parse_memory_size(std::string_view text) {
    if (text.empty()) return std::nullopt;

    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0) return std::nullopt;

    uint64_t value = 0;
    for (size_t i = 0; i < digits; ++i) {
        auto digit = static_cast<uint64_t>(text[i] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }

    auto suffix = text.substr(digits);
    if (suffix.size() == 2 && (suffix[1] == 'b' || suffix[1] == 'B')) {
        suffix = suffix.substr(0, 1);
    }

    uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "b" || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "k" || suffix == "K") {
        multiplier = 1024ULL;
    } else if (suffix == "m" || suffix == "M") {
        multiplier = 1024ULL * 1024;
    } else if (suffix == "g" || suffix == "G") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        return std::nullopt;
    }

    if (value > std::numeric_limits<uint64_t>::max() / multiplier) return std::nullopt;
    return value * multiplier;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            auto& o = config.orchestrator;
            o.projects_dir = orch["projects_dir"].value_or(o.projects_dir.string());
            o.work_dir = orch["work_dir"].value_or(o.work_dir.string());
            o.container_workdir = orch["container_workdir"].value_or(o.container_workdir);
            o.default_runtime = orch["default_runtime"].value_or(o.default_runtime);
            o.default_timeout_s = static_cast<uint32_t>(
                orch["default_timeout_s"].value_or(int64_t{o.default_timeout_s}));
            o.max_timeout_s = static_cast<uint32_t>(
                orch["max_timeout_s"].value_or(int64_t{o.max_timeout_s}));
            o.stop_grace_period_s = static_cast<uint32_t>(
                orch["stop_grace_period_s"].value_or(int64_t{o.stop_grace_period_s}));
            o.reaper_interval_ms = static_cast<uint32_t>(
                orch["reaper_interval_ms"].value_or(int64_t{o.reaper_interval_ms}));
            o.retention_s = static_cast<uint32_t>(
                orch["retention_s"].value_or(int64_t{o.retention_s}));
            o.worker_threads = static_cast<uint32_t>(
                orch["worker_threads"].value_or(int64_t{o.worker_threads}));
        }

        // [docker]
        if (auto docker = tbl["docker"]; docker.is_table()) {
            auto& d = config.docker;
            d.socket_path = docker["socket_path"].value_or(d.socket_path);
            d.api_version = docker["api_version"].value_or(d.api_version);
            d.network_mode = docker["network_mode"].value_or(d.network_mode);
            d.container_prefix = docker["container_prefix"].value_or(d.container_prefix);
            d.call_timeout_ms = static_cast<uint32_t>(
                docker["call_timeout_ms"].value_or(int64_t{d.call_timeout_ms}));
            d.pull_timeout_ms = static_cast<uint32_t>(
                docker["pull_timeout_ms"].value_or(int64_t{d.pull_timeout_ms}));
            d.max_retries = static_cast<uint32_t>(
                docker["max_retries"].value_or(int64_t{d.max_retries}));
            d.retry_backoff_ms = static_cast<uint32_t>(
                docker["retry_backoff_ms"].value_or(int64_t{d.retry_backoff_ms}));
            d.pull_missing_images = docker["pull_missing_images"].value_or(d.pull_missing_images);
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto& l = config.limits;
            auto def = memory_field(limits["default_memory"], l.default_memory_bytes, "limits.default_memory");
            if (!def) return def.error();
            auto max = memory_field(limits["max_memory"], l.max_memory_bytes, "limits.max_memory");
            if (!max) return max.error();
            l.default_memory_bytes = *def;
            l.max_memory_bytes = *max;
            l.cpu_shares = static_cast<uint32_t>(limits["cpu_shares"].value_or(int64_t{l.cpu_shares}));
            l.cpus = limits["cpus"].value_or(l.cpus);
            l.pids_limit = limits["pids_limit"].value_or(l.pids_limit);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(t.log_dir.string());
            t.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{t.max_file_size_mb}));
            t.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{t.rotate_count}));
            t.log_level = telemetry["log_level"].value_or(t.log_level);
            t.metrics = telemetry["metrics"].value_or(t.metrics);
        }

        // [[runtime]]
        if (auto runtimes = tbl["runtime"].as_array()) {
            for (const auto& node : *runtimes) {
                const auto* entry_tbl = node.as_table();
                if (!entry_tbl) {
                    return Error{ErrorCode::ConfigError, "[[runtime]] must be an array of tables"};
                }
                auto entry = parse_runtime(*entry_tbl);
                if (!entry) return entry.error();
                config.runtimes.push_back(std::move(*entry));
            }
        }

        if (config.orchestrator.default_timeout_s == 0 || config.orchestrator.max_timeout_s == 0) {
            return Error{ErrorCode::ConfigError, "timeouts must be positive"};
        }
        if (config.limits.default_memory_bytes > config.limits.max_memory_bytes) {
            return Error{ErrorCode::ConfigError, "limits.default_memory exceeds limits.max_memory"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace sandbox_orchestrator
