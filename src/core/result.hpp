/**
 * @file result.hpp
 * @brief Monadic error handling type for ClusterGate.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism, avoiding
 * exceptions on the admission and scheduling paths. Exceptions thrown by
 * third-party parsers are caught at the boundary and turned into Error.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cluster_gate {

/**
 * @brief Error taxonomy shared by every layer.
 */
enum class ErrorCode : uint8_t {
    Internal,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    AdmissionDenied,
    MutationFailed,
    AdmissionFailed,
    UnknownPriorityClass,
    DuplicateDefaultPriorityClass,
    Unschedulable,
    AlreadyBound,
    InsufficientCapacity,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:                      return "Internal";
        case ErrorCode::InvalidArgument:               return "InvalidArgument";
        case ErrorCode::NotFound:                      return "NotFound";
        case ErrorCode::AlreadyExists:                 return "AlreadyExists";
        case ErrorCode::AdmissionDenied:               return "AdmissionDenied";
        case ErrorCode::MutationFailed:                return "MutationFailed";
        case ErrorCode::AdmissionFailed:               return "AdmissionFailed";
        case ErrorCode::UnknownPriorityClass:          return "UnknownPriorityClass";
        case ErrorCode::DuplicateDefaultPriorityClass: return "DuplicateDefaultPriorityClass";
        case ErrorCode::Unschedulable:                 return "Unschedulable";
        case ErrorCode::AlreadyBound:                  return "AlreadyBound";
        case ErrorCode::InsufficientCapacity:          return "InsufficientCapacity";
        case ErrorCode::Cancelled:                     return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Error type carrying a code, the originating stage and a message.
 */
struct Error {
    std::string message;
    ErrorCode code = ErrorCode::Internal;
    std::string stage;   ///< Admission stage that produced the error, if any

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : message(std::move(msg)), code(c) {}
    Error(ErrorCode c, std::string stage_name, std::string msg)
        : message(std::move(msg)), code(c), stage(std::move(stage_name)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "<Code>: <message>" or "<Code>(<stage>): <message>".
    [[nodiscard]] std::string describe() const {
        std::string out{to_string(code)};
        if (!stage.empty()) out += "(" + stage + ")";
        out += ": " + message;
        return out;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

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

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
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
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace cluster_gate
