#include "resilience/resilience_manager.hpp"
#include "core/utils.hpp"

#include <format>

namespace callguard {

ResilienceManager::ResilienceManager(std::string name, const ResilienceConfig& config,
                                     Listener listener)
    : name_(std::move(name)),
      config_(config),
      listener_(std::move(listener)) {

    auto forward = [this](const ResilienceEvent& event) { on_event(event); };

    if (config_.bulkhead_enabled) {
        Bulkhead::Config bh;
        bh.max_concurrent = config_.max_concurrent;
        bh.max_queue_size = config_.max_queue_size;
        bh.tier = config_.tier;
        bulkhead_ = std::make_shared<Bulkhead>(name_, bh, forward);
    }

    if (config_.circuit_breaker_enabled) {
        CircuitBreaker::Config cb;
        cb.failure_threshold = config_.failure_threshold;
        cb.window = config_.window;
        cb.reset_timeout = config_.reset_timeout;
        cb.call_timeout = config_.timeout;
        cb.half_open_max_calls = config_.half_open_max_calls;
        breaker_ = std::make_unique<CircuitBreaker>(name_, cb, forward);
    }

    utils::log::debug(std::format(
        "Resilience manager '{}' initialized (circuit_breaker={}, bulkhead={}, timeout={}ms)",
        name_, breaker_ != nullptr, bulkhead_ != nullptr, config_.timeout.count()));
}

ResilienceManager::~ResilienceManager() {
    // Stop the timer thread before on_event's target goes away
    if (breaker_) {
        breaker_->shutdown();
    }
}

ResilienceStats ResilienceManager::get_stats() const {
    ResilienceStats stats;
    stats.name = name_;
    if (breaker_) {
        stats.circuit_breaker = breaker_->get_stats();
    }
    if (bulkhead_) {
        stats.bulkhead = bulkhead_->get_stats();
    }
    return stats;
}

void ResilienceManager::reset() {
    if (breaker_) {
        breaker_->reset();
    }
    if (bulkhead_) {
        (void)bulkhead_->clear();
        bulkhead_->reset_counters();
    }
    utils::log::info(std::format("Resilience manager '{}' manually reset", name_));
}

bool ResilienceManager::shutdown(std::chrono::milliseconds drain_timeout) {
    bool drained = true;
    if (bulkhead_) {
        (void)bulkhead_->clear();
        drained = bulkhead_->drain(drain_timeout);
        if (!drained) {
            utils::log::warn(std::format(
                "Resilience manager '{}': {} calls still active after {}ms",
                name_, bulkhead_->get_stats().active, drain_timeout.count()));
        }
    }
    if (breaker_) {
        breaker_->shutdown();
    }
    return drained;
}

bool ResilienceManager::is_open() const {
    return breaker_ && breaker_->get_state() == CircuitState::OPEN;
}

void ResilienceManager::on_event(const ResilienceEvent& event) const {
    switch (event.type) {
        case EventType::OPEN:
            utils::log::error(std::format("Circuit breaker '{}' opened: {}", name_, event.message));
            break;
        case EventType::HALF_OPEN:
            utils::log::warn(std::format("Circuit breaker '{}' half-open, admitting trial call", name_));
            break;
        case EventType::CLOSE:
            utils::log::info(std::format("Circuit breaker '{}' recovered to CLOSED", name_));
            break;
        case EventType::STATE_CHANGE:
            utils::log::info(std::format("Circuit '{}' state changed: {} -> {}", name_,
                circuit_state_to_string(event.from), circuit_state_to_string(event.to)));
            break;
        case EventType::REJECT:
            utils::log::warn(std::format("Circuit breaker '{}' rejected call", name_));
            break;
        case EventType::BULKHEAD_REJECT:
            utils::log::warn(std::format("Bulkhead '{}' ({}) rejected call: {}", name_,
                tier_to_string(config_.tier), event.message));
            break;
        case EventType::FAILURE:
            utils::log::debug(std::format("Resilience '{}' failure: {}", name_, event.message));
            break;
        case EventType::SUCCESS:
        case EventType::RESET:
            break;
    }

    if (listener_) {
        listener_(event);
    }
}

} // namespace callguard
