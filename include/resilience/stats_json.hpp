#pragma once

#include "core/types.hpp"
#include "resilience/resilience_manager.hpp"
#include "resilience/resilience_registry.hpp"

#include <string>
#include <vector>

namespace callguard {

// JSON renderings for admin/health endpoints. Compact, single line.

[[nodiscard]] std::string circuit_breaker_stats_to_json(const CircuitBreakerStats& stats);
[[nodiscard]] std::string bulkhead_stats_to_json(const BulkheadStats& stats);
[[nodiscard]] std::string recent_events_to_json(const std::vector<StateChangeEvent>& events);

/**
 * @brief {"name":..., "circuit_breaker":{...}|null, "bulkhead":{...}|null}
 */
[[nodiscard]] std::string resilience_stats_to_json(const ResilienceStats& stats);

/**
 * @brief {"healthy":bool, "open_circuits":[...], "total_circuits":n}
 */
[[nodiscard]] std::string health_to_json(const HealthReport& report);

/**
 * @brief {"health":{...}, "managers":[...]} for the whole registry
 */
[[nodiscard]] std::string registry_to_json(const ResilienceRegistry& registry);

} // namespace callguard
