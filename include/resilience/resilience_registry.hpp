#pragma once

#include "resilience/resilience_config.hpp"
#include "resilience/resilience_manager.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace callguard {

/**
 * @brief Aggregate "are any circuits open" answer for liveness/readiness probes
 */
struct HealthReport {
    bool healthy = true;
    std::vector<std::string> open_circuits;     // Sorted by name
    size_t total_circuits = 0;
};

/**
 * @brief Registry of named resilience managers.
 *
 * Call sites that share a downstream (e.g. "llm", "vector-search") share one
 * manager, and therefore one breaker history and one bulkhead.
 *
 * Lazily creates managers on first access using double-checked locking with
 * a shared_mutex: shared_lock for the lookup fast path, unique_lock +
 * try_emplace for creation, so two first callers for the same name never
 * construct two managers.
 *
 * Owned by the application's composition root and passed where needed.
 */
class ResilienceRegistry {
public:
    explicit ResilienceRegistry(ResilienceConfig default_config = ResilienceConfig(),
                                ResilienceManager::Listener listener = {});

    ResilienceRegistry(const ResilienceRegistry&) = delete;
    ResilienceRegistry& operator=(const ResilienceRegistry&) = delete;

    /**
     * @brief Get or create the manager for name.
     *
     * New managers use the per-name override if one was set, otherwise the
     * registry default.
     *
     * @return Shared pointer to the manager (never null)
     */
    [[nodiscard]] std::shared_ptr<ResilienceManager> get_or_create(const std::string& name);

    /**
     * @brief Get or create the manager for name, using config on first creation.
     *
     * An existing manager is returned unchanged; config is ignored then.
     */
    [[nodiscard]] std::shared_ptr<ResilienceManager> get_or_create(
        const std::string& name, const ResilienceConfig& config);

    /**
     * @return Existing manager or nullptr
     */
    [[nodiscard]] std::shared_ptr<ResilienceManager> find(const std::string& name) const;

    /**
     * @brief Set per-name config override.
     * Affects subsequently created managers for this name only.
     */
    void set_service_config(const std::string& name, const ResilienceConfig& config);

    /**
     * @brief Get stats for all managers, sorted by name.
     */
    [[nodiscard]] std::vector<ResilienceStats> all_stats() const;

    /**
     * @brief Reset every manager (breakers closed, queues cleared, counters zeroed).
     */
    void reset_all();

    [[nodiscard]] HealthReport health() const;

    /**
     * @brief Reject queued calls everywhere, drain active calls, stop timers, forget all managers.
     *
     * The drain timeout is shared across all managers.
     *
     * @return true if every manager drained in time
     */
    [[nodiscard]] bool shutdown(std::chrono::milliseconds drain_timeout);

    /**
     * @brief Registered names, sorted.
     */
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] const ResilienceConfig& default_config() const { return default_config_; }

private:
    [[nodiscard]] std::vector<std::shared_ptr<ResilienceManager>> snapshot() const;

    const ResilienceConfig default_config_;
    const ResilienceManager::Listener listener_;

    // Manager storage (double-checked locking pattern)
    std::unordered_map<std::string, std::shared_ptr<ResilienceManager>> managers_;
    mutable std::shared_mutex managers_mutex_;

    // Per-name config overrides
    std::unordered_map<std::string, ResilienceConfig> service_configs_;
    mutable std::shared_mutex config_mutex_;
};

} // namespace callguard
