#pragma once

#include "resilience/resilience_config.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace callguard {

/**
 * @brief Downstream service classes with built-in resilience defaults
 */
enum class ServiceType : uint8_t {
    LLM,
    VECTOR,
    DATABASE,
    HTTP,
    WEBHOOK
};

inline constexpr std::string_view kServiceLlm      = "llm";
inline constexpr std::string_view kServiceVector   = "vector";
inline constexpr std::string_view kServiceDatabase = "database";
inline constexpr std::string_view kServiceHttp     = "http";
inline constexpr std::string_view kServiceWebhook  = "webhook";

const char* service_type_to_string(ServiceType type);

/**
 * @brief Parse profile name (case-insensitive)
 * @return std::nullopt if unrecognized
 */
std::optional<ServiceType> parse_service_type(std::string_view str);

/**
 * @brief Global defaults used when a name has no profile or override
 */
ResilienceConfig default_resilience_config();

/**
 * @brief Defaults for one service class (tier capacities included)
 */
ResilienceConfig profile_config(ServiceType type);

struct TierCapacity {
    uint32_t max_concurrent;
    uint32_t max_queue_size;
};

/**
 * @brief Default bulkhead capacity per tier
 *
 *   CRITICAL = 20 concurrent / 50 queued
 *   STANDARD = 10 concurrent / 20 queued
 *   OPTIONAL =  5 concurrent /  5 queued
 */
TierCapacity tier_capacity(BulkheadTier tier);

/**
 * @brief Set tier and replace both capacities with the tier defaults
 */
void apply_tier(ResilienceConfig& config, BulkheadTier tier);

/**
 * @brief Named deadlines for common downstream operations
 */
enum class OperationTimeout : uint8_t {
    LLM_INVOKE,
    LLM_STREAM,
    VECTOR_SEARCH,
    VECTOR_EMBED,
    DATABASE_QUERY,
    DATABASE_TRANSACTION,
    HTTP_REQUEST,
    WEBHOOK
};

std::chrono::milliseconds default_timeout(OperationTimeout op);

} // namespace callguard
