#include "resilience/reset_timer.hpp"
#include "core/utils.hpp"

namespace callguard {

ResetTimer::ResetTimer(Callback on_fire)
    : on_fire_(std::move(on_fire)) {}

ResetTimer::~ResetTimer() {
    stop();
}

void ResetTimer::arm(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    if (stopped_) return;

    deadline_ = utils::deadline_after(delay);
    if (!thread_.joinable()) {
        thread_ = std::jthread([this](std::stop_token st) { run(st); });
    }
    cv_.notify_all();
}

void ResetTimer::cancel() {
    std::lock_guard lock(mutex_);
    deadline_.reset();
    cv_.notify_all();
}

bool ResetTimer::armed() const {
    std::lock_guard lock(mutex_);
    return deadline_.has_value();
}

void ResetTimer::stop() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        deadline_.reset();
    }
    if (thread_.joinable()) {
        thread_.request_stop();
        // From inside the callback: run() exits once the callback returns
        if (thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }
}

void ResetTimer::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (!deadline_) {
            cv_.wait(lock, stop, [this] { return deadline_.has_value(); });
            continue;
        }

        const auto when = *deadline_;
        const bool changed = cv_.wait_until(lock, stop, when,
            [this, when] { return !deadline_ || *deadline_ != when; });
        if (changed || stop.stop_requested()) {
            continue;  // re-armed, cancelled, or stopping
        }

        deadline_.reset();
        lock.unlock();
        on_fire_();
        lock.lock();
    }
}

} // namespace callguard
