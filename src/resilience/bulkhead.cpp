#include "resilience/bulkhead.hpp"
#include "core/utils.hpp"

#include <format>

namespace callguard {

Bulkhead::Bulkhead(std::string name, const Config& config, Listener listener)
    : name_(std::move(name)),
      config_(config),
      listener_(std::move(listener)) {}

Result<Bulkhead::Slot> Bulkhead::acquire(std::stop_token caller) {
    std::unique_lock lock(mutex_);

    if (caller.stop_requested()) {
        ++total_cancelled_;
        return Result<Slot>::error(Error::cancelled(name_));
    }

    if (active_ < config_.max_concurrent) {
        ++active_;
        ++total_executed_;
        return Result<Slot>::ok(Slot(this));
    }

    if (queue_.size() >= config_.max_queue_size) {
        ++total_rejected_;
        const auto reason = std::format("queue full ({}/{}), {} active",
            queue_.size(), config_.max_queue_size, active_);
        const Listener listener = listener_;
        lock.unlock();

        if (listener) {
            ResilienceEvent event;
            event.type = EventType::BULKHEAD_REJECT;
            event.source = name_;
            event.message = reason;
            event.timestamp = std::chrono::system_clock::now();
            listener(event);
        }
        return Result<Slot>::error(Error::bulkhead_rejected(name_, reason));
    }

    Waiter waiter;
    const auto position = queue_.insert(queue_.end(), &waiter);
    utils::log::debug(std::format("Bulkhead '{}': queued (depth {}/{})",
        name_, queue_.size(), config_.max_queue_size));

    waiter.cv.wait(lock, caller, [&waiter] {
        return waiter.outcome != Waiter::Outcome::PENDING;
    });

    switch (waiter.outcome) {
        case Waiter::Outcome::ADMITTED:
            // Slot was handed over by release_slot(); active_ already counts it
            return Result<Slot>::ok(Slot(this));

        case Waiter::Outcome::REJECTED:
            return Result<Slot>::error(Error::bulkhead_rejected(name_, "queue cleared"));

        case Waiter::Outcome::PENDING:
            break;
    }

    // Stop requested while still queued
    queue_.erase(position);
    ++total_cancelled_;
    notify_if_idle_locked();
    return Result<Slot>::error(Error::cancelled(name_));
}

size_t Bulkhead::clear() {
    std::lock_guard lock(mutex_);
    const size_t cleared = queue_.size();
    for (Waiter* waiter : queue_) {
        waiter->outcome = Waiter::Outcome::REJECTED;
        waiter->cv.notify_one();
    }
    queue_.clear();
    total_rejected_ += cleared;
    notify_if_idle_locked();

    if (cleared > 0) {
        utils::log::warn(std::format("Bulkhead '{}': cleared {} pending calls", name_, cleared));
    }
    return cleared;
}

void Bulkhead::reset_counters() {
    std::lock_guard lock(mutex_);
    total_executed_ = 0;
    total_rejected_ = 0;
    total_cancelled_ = 0;
}

bool Bulkhead::drain(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return active_ == 0 && queue_.empty();
    });
}

BulkheadStats Bulkhead::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .tier = config_.tier,
        .active = active_,
        .max_concurrent = config_.max_concurrent,
        .queue_length = static_cast<uint32_t>(queue_.size()),
        .max_queue_size = config_.max_queue_size,
        .total_executed = total_executed_,
        .total_rejected = total_rejected_,
        .total_cancelled = total_cancelled_,
    };
}

void Bulkhead::set_listener(Listener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

void Bulkhead::release_slot() {
    std::lock_guard lock(mutex_);
    if (!queue_.empty()) {
        // Hand the slot straight to the oldest waiter (FIFO)
        Waiter* next = queue_.front();
        queue_.pop_front();
        next->outcome = Waiter::Outcome::ADMITTED;
        ++total_executed_;
        next->cv.notify_one();
        return;
    }

    if (active_ > 0) {
        --active_;
    }
    notify_if_idle_locked();
}

void Bulkhead::notify_if_idle_locked() {
    if (active_ == 0 && queue_.empty()) {
        idle_cv_.notify_all();
    }
}

} // namespace callguard
