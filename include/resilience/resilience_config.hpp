#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>

namespace callguard {

/**
 * @brief Fully-resolved configuration of one named ResilienceManager
 *
 * timeout applies to the protected callable itself; 0 disables it.
 */
struct ResilienceConfig {
    bool circuit_breaker_enabled = true;
    bool bulkhead_enabled = true;

    // Circuit breaker
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds window{60000};
    std::chrono::milliseconds reset_timeout{30000};
    std::chrono::milliseconds timeout{3000};
    uint32_t half_open_max_calls = 1;

    // Bulkhead
    uint32_t max_concurrent = 10;
    uint32_t max_queue_size = 20;
    BulkheadTier tier = BulkheadTier::STANDARD;
};

} // namespace callguard
