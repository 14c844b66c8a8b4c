/**
 * @file result.hpp
 * @brief Error taxonomy and the monadic Result type used by every component.
 *
 * Components never throw across their boundaries. Each fallible operation
 * returns Result<T>, carrying either the value or an Error with an
 * ErrorCode from the taxonomy below.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    UnsupportedRuntime,
    InvalidResourceRequest,
    ContainerCreateError,
    ContainerStartError,
    ExecutionNotFound,
    InvalidTransition,
    RuntimeUnavailable,     ///< Container daemon unreachable (transient)
    DuplicateExecution,
    ContainerNotFound,
    ContainerConflict,
    ImageNotFound,
    ProjectNotFound,
    Timeout,
    ProtocolError,
    ConfigError,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnsupportedRuntime:     return "UnsupportedRuntime";
        case ErrorCode::InvalidResourceRequest: return "InvalidResourceRequest";
        case ErrorCode::ContainerCreateError:   return "ContainerCreateError";
        case ErrorCode::ContainerStartError:    return "ContainerStartError";
        case ErrorCode::ExecutionNotFound:      return "ExecutionNotFound";
        case ErrorCode::InvalidTransition:      return "InvalidTransition";
        case ErrorCode::RuntimeUnavailable:     return "RuntimeUnavailable";
        case ErrorCode::DuplicateExecution:     return "DuplicateExecution";
        case ErrorCode::ContainerNotFound:      return "ContainerNotFound";
        case ErrorCode::ContainerConflict:      return "ContainerConflict";
        case ErrorCode::ImageNotFound:          return "ImageNotFound";
        case ErrorCode::ProjectNotFound:        return "ProjectNotFound";
        case ErrorCode::Timeout:                return "Timeout";
        case ErrorCode::ProtocolError:          return "ProtocolError";
        case ErrorCode::ConfigError:            return "ConfigError";
        case ErrorCode::Internal:               return "Internal";
    }
    return "Unknown";
}

/**
 * @brief Error carrying a taxonomy code and a human-readable message.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Transient errors may succeed when retried unchanged.
    [[nodiscard]] bool is_transient() const noexcept {
        return code == ErrorCode::RuntimeUnavailable || code == ErrorCode::Timeout;
    }

    /// "Code: message", used in log lines and CLI output.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(code)} + ": " + message;
    }
};

// ─────────────────────────────────────────────
// Result<T, E>
// ─────────────────────────────────────────────

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe_error());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe_error());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result holds an error: " + describe_error());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value");
        return std::get<E>(storage_);
    }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::logic_error("Result holds a value");
        return std::get<E>(storage_);
    }

    /// Transform the success value, propagating the error untouched.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return func(std::get<T>(storage_));
        return std::get<E>(storage_);
    }

    /// Chain with a function that itself returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) return func(std::get<T>(storage_));
        return std::get<E>(storage_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return std::get<T>(storage_);
        return fallback;
    }

private:
    std::string describe_error() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).describe();
        } else {
            return "unknown";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but produce no value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (!error_) throw std::logic_error("Result holds no error");
        return *error_;
    }

    [[nodiscard]] E& error() & {
        if (!error_) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace sandbox_orchestrator
