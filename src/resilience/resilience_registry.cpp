#include "resilience/resilience_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace callguard {

ResilienceRegistry::ResilienceRegistry(ResilienceConfig default_config,
                                       ResilienceManager::Listener listener)
    : default_config_(std::move(default_config)),
      listener_(std::move(listener)) {}

std::shared_ptr<ResilienceManager> ResilienceRegistry::get_or_create(const std::string& name) {
    if (auto existing = find(name)) {
        return existing;
    }

    // Resolve config BEFORE taking managers_mutex_ (no nested locking)
    ResilienceConfig cfg = default_config_;
    {
        std::shared_lock cfg_lock(config_mutex_);
        const auto it = service_configs_.find(name);
        if (it != service_configs_.end()) {
            cfg = it->second;
        }
    }
    return get_or_create(name, cfg);
}

std::shared_ptr<ResilienceManager> ResilienceRegistry::get_or_create(
    const std::string& name, const ResilienceConfig& config) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(managers_mutex_);
        const auto it = managers_.find(name);
        if (it != managers_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock + try_emplace
    std::unique_lock lock(managers_mutex_);
    auto [it, inserted] = managers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<ResilienceManager>(name, config, listener_);
        utils::log::info(std::format("Registered resilience manager '{}' (tier {})",
            name, tier_to_string(config.tier)));
    }
    return it->second;
}

std::shared_ptr<ResilienceManager> ResilienceRegistry::find(const std::string& name) const {
    std::shared_lock lock(managers_mutex_);
    const auto it = managers_.find(name);
    return it != managers_.end() ? it->second : nullptr;
}

void ResilienceRegistry::set_service_config(const std::string& name, const ResilienceConfig& config) {
    std::unique_lock lock(config_mutex_);
    service_configs_[name] = config;
}

std::vector<ResilienceStats> ResilienceRegistry::all_stats() const {
    std::vector<ResilienceStats> result;
    for (const auto& manager : snapshot()) {
        result.push_back(manager->get_stats());
    }
    return result;
}

void ResilienceRegistry::reset_all() {
    for (const auto& manager : snapshot()) {
        manager->reset();
    }
}

HealthReport ResilienceRegistry::health() const {
    HealthReport report;
    const auto managers = snapshot();
    report.total_circuits = managers.size();
    for (const auto& manager : managers) {
        if (manager->is_open()) {
            report.open_circuits.push_back(manager->name());
        }
    }
    report.healthy = report.open_circuits.empty();
    return report;
}

bool ResilienceRegistry::shutdown(std::chrono::milliseconds drain_timeout) {
    std::unordered_map<std::string, std::shared_ptr<ResilienceManager>> managers;
    {
        std::unique_lock lock(managers_mutex_);
        managers.swap(managers_);
    }

    // Reject everything queued first so waiters stop holding up the drain
    for (const auto& [name, manager] : managers) {
        if (auto* bulkhead = manager->bulkhead()) {
            (void)bulkhead->clear();
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + drain_timeout;
    bool all_drained = true;
    for (const auto& [name, manager] : managers) {
        const auto remaining = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()),
            std::chrono::milliseconds::zero());
        if (!manager->shutdown(remaining)) {
            all_drained = false;
        }
    }

    utils::log::info(std::format("Resilience registry shut down ({} managers, drained={})",
        managers.size(), all_drained));
    return all_drained;
}

std::vector<std::string> ResilienceRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(managers_mutex_);
        result.reserve(managers_.size());
        for (const auto& [name, manager] : managers_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ResilienceRegistry::size() const {
    std::shared_lock lock(managers_mutex_);
    return managers_.size();
}

std::vector<std::shared_ptr<ResilienceManager>> ResilienceRegistry::snapshot() const {
    std::vector<std::shared_ptr<ResilienceManager>> result;
    {
        std::shared_lock lock(managers_mutex_);
        result.reserve(managers_.size());
        for (const auto& [name, manager] : managers_) {
            result.push_back(manager);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a->name() < b->name();
    });
    return result;
}

} // namespace callguard
