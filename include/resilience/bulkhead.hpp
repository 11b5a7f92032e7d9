#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "resilience/timeout_guard.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>

namespace callguard {

/**
 * @brief Concurrency limiter with a bounded FIFO admission queue
 *
 * - active < max_concurrent:          admit immediately
 * - queue_length < max_queue_size:    wait in FIFO order for a slot
 * - otherwise:                        BULKHEAD_REJECTED, no blocking
 *
 * A released slot is handed directly to the head waiter, so the number of
 * admitted calls never exceeds max_concurrent, not even transiently.
 * A queued caller whose stop_token fires leaves the queue with CANCELLED
 * and consumes no slot.
 */
class Bulkhead {
public:
    struct Config {
        uint32_t max_concurrent = 10;
        uint32_t max_queue_size = 20;
        BulkheadTier tier = BulkheadTier::STANDARD;

        Config() {}
    };

    using Listener = std::function<void(const ResilienceEvent&)>;

    /**
     * @brief RAII admission; releases its slot on destruction
     */
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { release(); }

        void release() {
            if (owner_) {
                owner_->release_slot();
                owner_ = nullptr;
            }
        }

        [[nodiscard]] bool held() const { return owner_ != nullptr; }

    private:
        friend class Bulkhead;
        explicit Slot(Bulkhead* owner) : owner_(owner) {}
        Bulkhead* owner_ = nullptr;
    };

    explicit Bulkhead(std::string name, const Config& config = Config(), Listener listener = {});

    Bulkhead(const Bulkhead&) = delete;
    Bulkhead& operator=(const Bulkhead&) = delete;

    /**
     * @brief Acquire a slot, queueing if necessary (blocks while queued)
     */
    [[nodiscard]] Result<Slot> acquire(std::stop_token caller = {});

    /**
     * @brief Run fn inside a slot on the calling thread
     */
    template<typename F>
    [[nodiscard]] detail::call_result_t<std::decay_t<F>> execute(F&& fn, std::stop_token caller = {}) {
        using R = detail::call_result_t<std::decay_t<F>>;

        auto admission = acquire(caller);
        if (admission.is_error()) {
            return R::error(admission.error_info());
        }
        Slot slot = std::move(admission.value());
        return detail::invoke_guarded(fn, std::move(caller), name_);
    }

    /**
     * @brief Reject every queued waiter; active calls are unaffected
     * @return Number of waiters rejected
     */
    size_t clear();

    /**
     * @brief Zero the executed/rejected/cancelled counters
     */
    void reset_counters();

    /**
     * @brief Block until nothing is active or queued
     * @return true if drained, false on timeout
     */
    [[nodiscard]] bool drain(std::chrono::milliseconds timeout);

    [[nodiscard]] BulkheadStats get_stats() const;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const Config& config() const { return config_; }

    void set_listener(Listener listener);

private:
    struct Waiter {
        enum class Outcome : uint8_t { PENDING, ADMITTED, REJECTED };
        Outcome outcome = Outcome::PENDING;
        std::condition_variable_any cv;
    };

    void release_slot();
    void notify_if_idle_locked();

    const std::string name_;
    const Config config_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::list<Waiter*> queue_;
    uint32_t active_ = 0;
    uint64_t total_executed_ = 0;
    uint64_t total_rejected_ = 0;
    uint64_t total_cancelled_ = 0;
    Listener listener_;
};

} // namespace callguard
