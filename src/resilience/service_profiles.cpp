#include "resilience/service_profiles.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace callguard {

using std::chrono::milliseconds;

const char* service_type_to_string(ServiceType type) {
    switch (type) {
        case ServiceType::LLM:      return "llm";
        case ServiceType::VECTOR:   return "vector";
        case ServiceType::DATABASE: return "database";
        case ServiceType::HTTP:     return "http";
        case ServiceType::WEBHOOK:  return "webhook";
        default:                    return "http";
    }
}

std::optional<ServiceType> parse_service_type(std::string_view str) {
    static const std::unordered_map<std::string_view, ServiceType> kMap = {
        {kServiceLlm,      ServiceType::LLM},
        {kServiceVector,   ServiceType::VECTOR},
        {kServiceDatabase, ServiceType::DATABASE},
        {kServiceHttp,     ServiceType::HTTP},
        {kServiceWebhook,  ServiceType::WEBHOOK},
    };
    const std::string lower = utils::to_lower(str);
    const auto it = kMap.find(lower);
    if (it == kMap.end()) return std::nullopt;
    return it->second;
}

ResilienceConfig default_resilience_config() {
    return ResilienceConfig{};
}

TierCapacity tier_capacity(BulkheadTier tier) {
    switch (tier) {
        case BulkheadTier::CRITICAL: return {20, 50};
        case BulkheadTier::STANDARD: return {10, 20};
        case BulkheadTier::OPTIONAL: return {5, 5};
        default:                     return {10, 20};
    }
}

void apply_tier(ResilienceConfig& config, BulkheadTier tier) {
    const TierCapacity capacity = tier_capacity(tier);
    config.tier = tier;
    config.max_concurrent = capacity.max_concurrent;
    config.max_queue_size = capacity.max_queue_size;
}

ResilienceConfig profile_config(ServiceType type) {
    ResilienceConfig cfg;
    cfg.window = milliseconds(10000);

    switch (type) {
        case ServiceType::LLM:
            // Generous timeout, moderate failure tolerance
            cfg.timeout = default_timeout(OperationTimeout::LLM_INVOKE);
            cfg.reset_timeout = milliseconds(30000);
            cfg.failure_threshold = 5;
            apply_tier(cfg, BulkheadTier::CRITICAL);
            break;
        case ServiceType::VECTOR:
            cfg.timeout = default_timeout(OperationTimeout::VECTOR_SEARCH);
            cfg.reset_timeout = milliseconds(20000);
            cfg.failure_threshold = 3;
            apply_tier(cfg, BulkheadTier::STANDARD);
            break;
        case ServiceType::DATABASE:
            cfg.timeout = default_timeout(OperationTimeout::DATABASE_QUERY);
            cfg.reset_timeout = milliseconds(15000);
            cfg.failure_threshold = 3;
            apply_tier(cfg, BulkheadTier::CRITICAL);
            break;
        case ServiceType::HTTP:
            cfg.timeout = default_timeout(OperationTimeout::HTTP_REQUEST);
            cfg.reset_timeout = milliseconds(30000);
            cfg.failure_threshold = 5;
            apply_tier(cfg, BulkheadTier::STANDARD);
            break;
        case ServiceType::WEBHOOK:
            // Fast timeout, long cool-down
            cfg.timeout = default_timeout(OperationTimeout::WEBHOOK);
            cfg.reset_timeout = milliseconds(60000);
            cfg.failure_threshold = 3;
            apply_tier(cfg, BulkheadTier::OPTIONAL);
            break;
    }
    return cfg;
}

milliseconds default_timeout(OperationTimeout op) {
    switch (op) {
        case OperationTimeout::LLM_INVOKE:           return milliseconds(30000);
        case OperationTimeout::LLM_STREAM:           return milliseconds(60000);
        case OperationTimeout::VECTOR_SEARCH:        return milliseconds(10000);
        case OperationTimeout::VECTOR_EMBED:         return milliseconds(15000);
        case OperationTimeout::DATABASE_QUERY:       return milliseconds(10000);
        case OperationTimeout::DATABASE_TRANSACTION: return milliseconds(30000);
        case OperationTimeout::HTTP_REQUEST:         return milliseconds(10000);
        case OperationTimeout::WEBHOOK:              return milliseconds(5000);
        default:                                     return milliseconds(10000);
    }
}

} // namespace callguard
