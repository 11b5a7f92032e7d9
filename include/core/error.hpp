#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace callguard {

/**
 * @brief Error codes produced or propagated by the resilience layer
 */
enum class ErrorCode : uint8_t {
    NONE,
    TIMEOUT,            // Protected call exceeded its deadline
    CIRCUIT_OPEN,       // Fast-fail, fn never invoked
    BULKHEAD_REJECTED,  // Concurrency + queue exhausted, fn never invoked
    CANCELLED,          // Caller gave up (stop_token)
    OPERATION_FAILED    // Error returned (or thrown) by fn itself
};

const char* error_code_to_string(ErrorCode code);

/**
 * @brief Error value carried by Result
 *
 * source is the operation, breaker or bulkhead name. timeout is set for
 * TIMEOUT, state for CIRCUIT_OPEN.
 */
struct Error {
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    std::string source;
    std::chrono::milliseconds timeout{0};
    std::optional<CircuitState> state;

    static Error timed_out(std::string operation, std::chrono::milliseconds timeout);
    static Error circuit_open(std::string name, CircuitState state);
    static Error bulkhead_rejected(std::string name, std::string reason);
    static Error cancelled(std::string source);
    static Error operation_failed(std::string message, std::string source = {});

    /// True for the errors this layer generates on its own behalf
    [[nodiscard]] bool is_resilience_error() const {
        return code == ErrorCode::TIMEOUT || code == ErrorCode::CIRCUIT_OPEN ||
               code == ErrorCode::BULKHEAD_REJECTED || code == ErrorCode::CANCELLED;
    }
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    using value_type = T;

    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(Error err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Error err;
        err.code = code;
        err.message = std::move(message);
        return error(std::move(err));
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error_info() const { return error_; }
    ErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    Error error_;
};

template<typename R>
struct is_result : std::false_type {};

template<typename T>
struct is_result<Result<T>> : std::true_type {};

template<typename R>
inline constexpr bool is_result_v = is_result<R>::value;

} // namespace callguard
