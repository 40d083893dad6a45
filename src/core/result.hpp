/**
 * @file result.hpp
 * @brief Monadic error handling type for SandboxHarness.
 *
 * Every fallible harness operation returns Result<T, HarnessError>. Errors
 * carry an ErrorKind so callers can tell a timeout from a launch failure
 * without parsing messages.
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

namespace sandbox_harness {

// ─────────────────────────────────────────────
// Error kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    InvalidLimits,  ///< Request rejected before anything was staged
    Staging,        ///< Payload file could not be created/written/chmod'ed
    Launch,         ///< Executor could not be started or waited on
    Timeout,        ///< Wall-clock budget exceeded, executor killed
    Config          ///< Configuration missing or malformed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidLimits: return "invalid_limits";
        case ErrorKind::Staging:       return "staging";
        case ErrorKind::Launch:        return "launch";
        case ErrorKind::Timeout:       return "timeout";
        case ErrorKind::Config:        return "config";
    }
    return "unknown";
}

/**
 * @brief Output captured before a run was aborted.
 *
 * Only populated for ErrorKind::Timeout.
 */
struct PartialOutput {
    std::string stdout_bytes;
    std::string stderr_bytes;
};

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct HarnessError {
    ErrorKind kind;
    std::string message;
    std::optional<PartialOutput> partial;

    HarnessError(ErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    HarnessError(ErrorKind k, std::string msg, PartialOutput captured)
        : kind(k), message(std::move(msg)), partial(std::move(captured)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> — holds either a success value or an error.
 */
template <typename T, typename E = HarnessError>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Chain with a function that returns a Result, forwarding errors.
    template <typename F>
    auto and_then(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (has_value()) {
            return func(std::get<T>(std::move(storage_)));
        }
        return std::get<E>(std::move(storage_));
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations with no success value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(HarnessError{kind, std::move(message)});
}

}  // namespace sandbox_harness
