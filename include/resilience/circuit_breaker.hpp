#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "resilience/reset_timer.hpp"
#include "resilience/timeout_guard.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace callguard {

/**
 * @brief Circuit Breaker for downstream failure isolation
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately (fn never invoked)
 * - HALF_OPEN:  Testing recovery, admit up to half_open_max_calls trials
 *
 * State transitions:
 * - CLOSED → OPEN:      failure_threshold failures inside the rolling window
 * - OPEN → HALF_OPEN:   reset_timeout elapsed (one-shot reset timer)
 * - HALF_OPEN → CLOSED: trial call succeeds
 * - HALF_OPEN → OPEN:   trial call fails (reset timer restarts in full)
 *
 * Rolling window: a failure more than `window` after the previous failure
 * restarts the count at 1, so sparse failures never accumulate.
 *
 * All state lives behind one mutex. Listener callbacks run after the lock
 * is released, on whichever thread caused the event (the reset timer
 * thread for OPEN → HALF_OPEN).
 */
class CircuitBreaker {
public:
    /**
     * @brief Configuration (immutable after construction)
     */
    struct Config {
        uint32_t failure_threshold;             // Failures to trip OPEN
        std::chrono::milliseconds window;       // Max gap between counted failures
        std::chrono::milliseconds reset_timeout; // Time in OPEN before HALF_OPEN
        std::chrono::milliseconds call_timeout;  // Deadline applied by execute(); 0 = none
        uint32_t half_open_max_calls;           // Concurrent trials in HALF_OPEN

        Config()
            : failure_threshold(5),
              window(60000),
              reset_timeout(30000),
              call_timeout(3000),
              half_open_max_calls(1) {}
    };

    /**
     * @brief Admission ticket returned by try_acquire()
     *
     * Only a TRIAL permit from the current HALF_OPEN period decides recovery.
     */
    struct Permit {
        enum class Kind : uint8_t { REJECTED, NORMAL, TRIAL };

        Kind kind = Kind::REJECTED;
        uint64_t epoch = 0;
        CircuitState observed = CircuitState::CLOSED;

        [[nodiscard]] bool admitted() const { return kind != Kind::REJECTED; }
    };

    /**
     * @brief RAII completion of an admitted permit
     *
     * complete() records the call's outcome. A guard destroyed without it
     * (early return, exception) completes the permit as neutral, so a
     * HALF_OPEN trial slot is never leaked.
     */
    class PermitGuard {
    public:
        PermitGuard(CircuitBreaker& breaker, const Permit& permit)
            : breaker_(&breaker), permit_(permit) {}
        PermitGuard(const PermitGuard&) = delete;
        PermitGuard& operator=(const PermitGuard&) = delete;
        ~PermitGuard() {
            if (breaker_) {
                breaker_->on_neutral(permit_);
            }
        }

        template<typename T>
        void complete(const Result<T>& result) {
            if (CircuitBreaker* breaker = std::exchange(breaker_, nullptr)) {
                breaker->record_outcome(permit_, result);
            }
        }

        [[nodiscard]] const Permit& permit() const { return permit_; }

    private:
        CircuitBreaker* breaker_;
        Permit permit_;
    };

    using Listener = std::function<void(const ResilienceEvent&)>;

    explicit CircuitBreaker(std::string name, const Config& config = Config(),
                            Listener listener = {});
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run fn under the breaker with the configured call timeout
     *
     * OPEN (or HALF_OPEN with all trial slots taken) returns CIRCUIT_OPEN
     * without invoking fn. CANCELLED outcomes are neutral.
     */
    template<typename F>
    [[nodiscard]] detail::call_result_t<std::decay_t<F>> execute(F&& fn, std::stop_token caller = {}) {
        using R = detail::call_result_t<std::decay_t<F>>;

        const Permit permit = try_acquire();
        if (!permit.admitted()) {
            return R::error(Error::circuit_open(name_, permit.observed));
        }
        PermitGuard guard(*this, permit);

        R result = TimeoutGuard::run(std::forward<F>(fn), config_.call_timeout, name_, std::move(caller));
        guard.complete(result);
        return result;
    }

    /**
     * @brief Admission check (performs OPEN → HALF_OPEN if the reset deadline passed)
     *
     * An admitted permit MUST be completed with exactly one of on_success(),
     * on_failure() or on_neutral().
     */
    [[nodiscard]] Permit try_acquire();

    void on_success(const Permit& permit);
    void on_failure(const Permit& permit, const Error& error);

    /**
     * @brief Complete a permit without classifying it (cancelled, bulkhead-rejected)
     */
    void on_neutral(const Permit& permit);

    /**
     * @brief Classify a Result and complete the permit accordingly
     */
    template<typename T>
    void record_outcome(const Permit& permit, const Result<T>& result) {
        if (result.is_ok()) {
            on_success(permit);
        } else if (result.error_code() == ErrorCode::CANCELLED) {
            on_neutral(permit);
        } else {
            on_failure(permit, result.error_info());
        }
    }

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force CLOSED, zero all counters, cancel the reset timer
     */
    void reset();

    /**
     * @brief Stop the reset timer thread (no further automatic transitions)
     */
    void shutdown();

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const Config& config() const { return config_; }

    void set_listener(Listener listener);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

    static constexpr size_t kMaxRecentEvents = 100;

private:
    using Events = std::vector<ResilienceEvent>;

    void on_reset_timer();
    void trip_locked(Events& out);
    void enter_half_open_locked(Events& out);
    void close_locked(Events& out);
    void transition_locked(CircuitState to, Events& out);
    bool reset_deadline_passed_locked() const;
    ResilienceEvent make_event(EventType type) const;
    void emit(Events events, Listener listener) const;

    const std::string name_;
    const Config config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint64_t failure_count_ = 0;
    uint64_t success_count_ = 0;
    uint64_t rejection_count_ = 0;
    uint64_t times_opened_ = 0;
    uint64_t times_half_opened_ = 0;
    uint64_t times_closed_ = 0;
    uint32_t half_open_in_flight_ = 0;
    uint64_t epoch_ = 0;

    std::optional<std::chrono::steady_clock::time_point> last_failure_;
    std::optional<std::chrono::system_clock::time_point> last_failure_wall_;
    std::chrono::steady_clock::time_point opened_at_;
    std::chrono::system_clock::time_point last_state_change_;

    std::deque<StateChangeEvent> recent_events_;
    Listener listener_;

    // Declared last: its thread calls on_reset_timer(), so it must be
    // joined before anything above is destroyed
    ResetTimer reset_timer_;
};

} // namespace callguard
