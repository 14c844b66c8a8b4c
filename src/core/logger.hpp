/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * ILogSink is a virtual interface for runtime-configurable destinations;
 * Logger is the thread-safe front-end shared by every component. Lines are
 * single JSON objects: {"level","ts","msg", ...fields}.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 *
 * Sinks are configured once at startup; Logger serializes calls to them.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Structured fields are merged into the emitted object, e.g.
 * `logger.info("container started", {{"execution", id}})`.
 */
class Logger {
public:
    using Fields = nlohmann::json;

    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, const Fields& fields = Fields::object());
    void info(std::string_view message, const Fields& fields = Fields::object());
    void warn(std::string_view message, const Fields& fields = Fields::object());
    void error(std::string_view message, const Fields& fields = Fields::object());

    void log(LogLevel level, std::string_view message, const Fields& fields = Fields::object());
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel lvl) const noexcept { return lvl >= min_level_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex mutex_;
};

}  // namespace sandbox_orchestrator
