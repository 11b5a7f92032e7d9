#include "resilience/stats_json.hpp"
#include "core/utils.hpp"

#include <format>

namespace callguard {

namespace {

std::string optional_time_json(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return "null";
    return std::format("\"{}\"", utils::format_timestamp(*tp));
}

} // anonymous namespace

std::string circuit_breaker_stats_to_json(const CircuitBreakerStats& stats) {
    return std::format(
        R"({{"state":"{}","failure_count":{},"success_count":{},"rejection_count":{},)"
        R"("times_opened":{},"times_half_opened":{},"times_closed":{},)"
        R"("last_failure":{},"last_state_change":"{}"}})",
        circuit_state_to_string(stats.state), stats.failure_count, stats.success_count,
        stats.rejection_count, stats.times_opened, stats.times_half_opened, stats.times_closed,
        optional_time_json(stats.last_failure), utils::format_timestamp(stats.last_state_change));
}

std::string bulkhead_stats_to_json(const BulkheadStats& stats) {
    return std::format(
        R"({{"tier":"{}","active":{},"max_concurrent":{},"queue_length":{},"max_queue_size":{},)"
        R"("total_executed":{},"total_rejected":{},"total_cancelled":{}}})",
        tier_to_string(stats.tier), stats.active, stats.max_concurrent, stats.queue_length,
        stats.max_queue_size, stats.total_executed, stats.total_rejected, stats.total_cancelled);
}

std::string recent_events_to_json(const std::vector<StateChangeEvent>& events) {
    std::string json = "[";
    for (size_t i = 0; i < events.size(); ++i) {
        if (i > 0) json += ",";
        const auto& e = events[i];
        json += std::format(R"({{"from":"{}","to":"{}","breaker":"{}","timestamp":"{}"}})",
            circuit_state_to_string(e.from), circuit_state_to_string(e.to),
            utils::escape_json(e.breaker_name), utils::format_timestamp(e.timestamp));
    }
    json += "]";
    return json;
}

std::string resilience_stats_to_json(const ResilienceStats& stats) {
    const std::string breaker = stats.circuit_breaker
        ? circuit_breaker_stats_to_json(*stats.circuit_breaker) : "null";
    const std::string bulkhead = stats.bulkhead
        ? bulkhead_stats_to_json(*stats.bulkhead) : "null";
    return std::format(R"({{"name":"{}","circuit_breaker":{},"bulkhead":{}}})",
        utils::escape_json(stats.name), breaker, bulkhead);
}

std::string health_to_json(const HealthReport& report) {
    std::string open = "[";
    for (size_t i = 0; i < report.open_circuits.size(); ++i) {
        if (i > 0) open += ",";
        open += std::format("\"{}\"", utils::escape_json(report.open_circuits[i]));
    }
    open += "]";

    return std::format(R"({{"healthy":{},"open_circuits":{},"total_circuits":{}}})",
        report.healthy, open, report.total_circuits);
}

std::string registry_to_json(const ResilienceRegistry& registry) {
    const auto all = registry.all_stats();
    std::string managers = "[";
    for (size_t i = 0; i < all.size(); ++i) {
        if (i > 0) managers += ",";
        managers += resilience_stats_to_json(all[i]);
    }
    managers += "]";

    return std::format(R"({{"health":{},"managers":{}}})",
        health_to_json(registry.health()), managers);
}

} // namespace callguard
