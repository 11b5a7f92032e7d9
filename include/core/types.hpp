#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callguard {

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState : uint8_t {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Testing recovery
};

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

struct CircuitBreakerStats {
    CircuitState state;
    uint64_t failure_count;         // Failures inside the current rolling window
    uint64_t success_count;         // Lifetime
    uint64_t rejection_count;       // Lifetime fast-fails while OPEN
    uint64_t times_opened;
    uint64_t times_half_opened;
    uint64_t times_closed;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::chrono::system_clock::time_point last_state_change;

    CircuitBreakerStats()
        : state(CircuitState::CLOSED), failure_count(0), success_count(0),
          rejection_count(0), times_opened(0), times_half_opened(0), times_closed(0) {}
};

// ============================================================================
// Bulkhead Types
// ============================================================================

/**
 * @brief Call-site importance label
 *
 * Only selects default capacities; a bulkhead never prioritizes one tier
 * over another.
 */
enum class BulkheadTier : uint8_t {
    OPTIONAL = 0,
    STANDARD = 1,
    CRITICAL = 2
};

inline constexpr std::string_view kTierCritical = "critical";
inline constexpr std::string_view kTierStandard = "standard";
inline constexpr std::string_view kTierOptional = "optional";

inline const char* tier_to_string(BulkheadTier tier) {
    switch (tier) {
        case BulkheadTier::CRITICAL: return "CRITICAL";
        case BulkheadTier::STANDARD: return "STANDARD";
        case BulkheadTier::OPTIONAL: return "OPTIONAL";
        default:                     return "STANDARD";
    }
}

/**
 * @brief Parse tier name (case-insensitive)
 * @return std::nullopt if unrecognized
 */
std::optional<BulkheadTier> parse_tier(std::string_view str);

struct BulkheadStats {
    BulkheadTier tier = BulkheadTier::STANDARD;
    uint32_t active = 0;
    uint32_t max_concurrent = 0;
    uint32_t queue_length = 0;
    uint32_t max_queue_size = 0;
    uint64_t total_executed = 0;
    uint64_t total_rejected = 0;
    uint64_t total_cancelled = 0;
};

// ============================================================================
// Events
// ============================================================================

enum class EventType : uint8_t {
    OPEN,
    HALF_OPEN,
    CLOSE,
    STATE_CHANGE,
    FAILURE,
    SUCCESS,
    REJECT,
    BULKHEAD_REJECT,
    RESET
};

const char* event_type_to_string(EventType type);

/**
 * @brief Notification emitted by a breaker or bulkhead
 *
 * from/to are meaningful for STATE_CHANGE only; message carries the error
 * text for FAILURE, REJECT and BULKHEAD_REJECT.
 */
struct ResilienceEvent {
    EventType type;
    std::string source;
    CircuitState from = CircuitState::CLOSED;
    CircuitState to = CircuitState::CLOSED;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Structured event recorded on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

} // namespace callguard
