#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "resilience/bulkhead.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/resilience_config.hpp"
#include "resilience/timeout_guard.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace callguard {

/**
 * @brief Combined statistics of one manager; absent layers stay empty
 */
struct ResilienceStats {
    std::string name;
    std::optional<CircuitBreakerStats> circuit_breaker;
    std::optional<BulkheadStats> bulkhead;
};

/**
 * @brief Circuit breaker + bulkhead + timeout behind one execute()
 *
 * Composition order is fixed:
 *
 *   breaker admission → bulkhead admission → TimeoutGuard(fn) → record outcome
 *
 * The breaker fails fast without touching the bulkhead. The timeout covers
 * fn alone, never time spent queued. The bulkhead slot travels with fn:
 * after a TIMEOUT or CANCELLED the caller returns at once, but the slot
 * stays taken until fn actually returns on its worker thread, so no more
 * than max_concurrent calls ever run. BULKHEAD_REJECTED and CANCELLED are
 * not circuit failures. Either layer may be disabled; with both disabled
 * fn runs unprotected on the calling thread.
 *
 * Every breaker/bulkhead event is logged and then forwarded to the
 * optional listener supplied at construction.
 */
class ResilienceManager {
public:
    using Listener = std::function<void(const ResilienceEvent&)>;

    ResilienceManager(std::string name, const ResilienceConfig& config, Listener listener = {});
    ~ResilienceManager();

    ResilienceManager(const ResilienceManager&) = delete;
    ResilienceManager& operator=(const ResilienceManager&) = delete;

    template<typename F>
    [[nodiscard]] detail::call_result_t<std::decay_t<F>> execute(F&& fn, std::stop_token caller = {}) {
        using R = detail::call_result_t<std::decay_t<F>>;

        if (breaker_ && bulkhead_) {
            const auto permit = breaker_->try_acquire();
            if (!permit.admitted()) {
                return R::error(Error::circuit_open(name_, permit.observed));
            }
            CircuitBreaker::PermitGuard guard(*breaker_, permit);

            auto admission = bulkhead_->acquire(caller);
            if (admission.is_error()) {
                return R::error(admission.error_info());
            }

            R result = TimeoutGuard::run(
                holding_slot(std::move(admission.value()), std::forward<F>(fn)),
                config_.timeout, name_, std::move(caller));
            guard.complete(result);
            return result;
        }

        if (breaker_) {
            return breaker_->execute(std::forward<F>(fn), std::move(caller));
        }

        if (bulkhead_) {
            auto admission = bulkhead_->acquire(caller);
            if (admission.is_error()) {
                return R::error(admission.error_info());
            }
            return TimeoutGuard::run(
                holding_slot(std::move(admission.value()), std::forward<F>(fn)),
                config_.timeout, name_, std::move(caller));
        }

        std::decay_t<F> local(std::forward<F>(fn));
        return detail::invoke_guarded(local, std::move(caller), name_);
    }

    [[nodiscard]] ResilienceStats get_stats() const;

    /**
     * @brief Force-close the breaker, reject queued calls, zero counters
     *
     * Administrative; not part of normal failure handling.
     */
    void reset();

    /**
     * @brief Reject queued calls, wait for active ones, stop the reset timer
     * @return true if active calls finished within drain_timeout
     */
    [[nodiscard]] bool shutdown(std::chrono::milliseconds drain_timeout);

    /**
     * @brief true if the breaker is enabled and currently OPEN
     */
    [[nodiscard]] bool is_open() const;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const ResilienceConfig& config() const { return config_; }

    /// nullptr when the layer is disabled
    [[nodiscard]] CircuitBreaker* circuit_breaker() const { return breaker_.get(); }
    [[nodiscard]] Bulkhead* bulkhead() const { return bulkhead_.get(); }

private:
    /// Wraps fn so the slot is released when fn returns, on whatever thread runs it
    template<typename F>
    auto holding_slot(Bulkhead::Slot slot, F&& fn) const {
        // keep_alive precedes slot: the slot is released before the bulkhead can go
        return [keep_alive = bulkhead_, slot = std::move(slot),
                task = std::decay_t<F>(std::forward<F>(fn)),
                op = name_](std::stop_token token) mutable {
            auto result = detail::invoke_guarded(task, std::move(token), op);
            slot.release();
            return result;
        };
    }

    void on_event(const ResilienceEvent& event) const;

    const std::string name_;
    const ResilienceConfig config_;
    const Listener listener_;

    // Shared with workers still running fn after a TIMEOUT
    std::shared_ptr<Bulkhead> bulkhead_;
    std::unique_ptr<CircuitBreaker> breaker_;
};

} // namespace callguard
