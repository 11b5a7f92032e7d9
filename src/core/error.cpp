#include "core/error.hpp"

#include <format>

namespace callguard {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::TIMEOUT:           return "TIMEOUT";
        case ErrorCode::CIRCUIT_OPEN:      return "CIRCUIT_OPEN";
        case ErrorCode::BULKHEAD_REJECTED: return "BULKHEAD_REJECTED";
        case ErrorCode::CANCELLED:         return "CANCELLED";
        case ErrorCode::OPERATION_FAILED:  return "OPERATION_FAILED";
        default:                           return "UNKNOWN";
    }
}

Error Error::timed_out(std::string operation, std::chrono::milliseconds timeout) {
    Error err;
    err.code = ErrorCode::TIMEOUT;
    err.message = std::format("Operation '{}' timed out after {}ms", operation, timeout.count());
    err.source = std::move(operation);
    err.timeout = timeout;
    return err;
}

Error Error::circuit_open(std::string name, CircuitState state) {
    Error err;
    err.code = ErrorCode::CIRCUIT_OPEN;
    err.message = std::format("Circuit breaker '{}' is {}", name, circuit_state_to_string(state));
    err.source = std::move(name);
    err.state = state;
    return err;
}

Error Error::bulkhead_rejected(std::string name, std::string reason) {
    Error err;
    err.code = ErrorCode::BULKHEAD_REJECTED;
    err.message = std::format("Bulkhead '{}' rejected: {}", name, reason);
    err.source = std::move(name);
    return err;
}

Error Error::cancelled(std::string source) {
    Error err;
    err.code = ErrorCode::CANCELLED;
    err.message = std::format("Call to '{}' cancelled by caller", source);
    err.source = std::move(source);
    return err;
}

Error Error::operation_failed(std::string message, std::string source) {
    Error err;
    err.code = ErrorCode::OPERATION_FAILED;
    err.message = std::move(message);
    err.source = std::move(source);
    return err;
}

} // namespace callguard
