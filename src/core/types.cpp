#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace callguard {

std::optional<BulkheadTier> parse_tier(std::string_view str) {
    static const std::unordered_map<std::string_view, BulkheadTier> kMap = {
        {kTierCritical, BulkheadTier::CRITICAL},
        {kTierStandard, BulkheadTier::STANDARD},
        {kTierOptional, BulkheadTier::OPTIONAL},
    };
    const std::string lower = utils::to_lower(str);
    const auto it = kMap.find(lower);
    if (it == kMap.end()) return std::nullopt;
    return it->second;
}

const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::OPEN:            return "open";
        case EventType::HALF_OPEN:       return "halfOpen";
        case EventType::CLOSE:           return "close";
        case EventType::STATE_CHANGE:    return "stateChange";
        case EventType::FAILURE:         return "failure";
        case EventType::SUCCESS:         return "success";
        case EventType::REJECT:          return "reject";
        case EventType::BULKHEAD_REJECT: return "bulkheadReject";
        case EventType::RESET:           return "reset";
        default:                         return "unknown";
    }
}

} // namespace callguard
