#include "resilience/circuit_breaker.hpp"

#include <format>

namespace callguard {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config, Listener listener)
    : name_(std::move(name)),
      config_(config),
      last_state_change_(std::chrono::system_clock::now()),
      listener_(std::move(listener)),
      reset_timer_([this] { on_reset_timer(); }) {}

CircuitBreaker::~CircuitBreaker() {
    reset_timer_.stop();
}

CircuitBreaker::Permit CircuitBreaker::try_acquire() {
    Events events;
    Listener listener;
    Permit permit;
    {
        std::lock_guard lock(mutex_);

        // Timer thread may lag behind the deadline; admit on time regardless
        if (state_ == CircuitState::OPEN && reset_deadline_passed_locked()) {
            enter_half_open_locked(events);
        }

        switch (state_) {
            case CircuitState::CLOSED:
                permit.kind = Permit::Kind::NORMAL;
                break;

            case CircuitState::HALF_OPEN:
                if (half_open_in_flight_ < config_.half_open_max_calls) {
                    ++half_open_in_flight_;
                    permit.kind = Permit::Kind::TRIAL;
                    permit.epoch = epoch_;
                    break;
                }
                [[fallthrough]];

            case CircuitState::OPEN:
                ++rejection_count_;
                permit.kind = Permit::Kind::REJECTED;
                events.push_back(make_event(EventType::REJECT));
                events.back().message = std::format("Circuit breaker '{}' is {}",
                    name_, circuit_state_to_string(state_));
                break;
        }
        permit.observed = state_;
        listener = listener_;
    }
    emit(std::move(events), std::move(listener));
    return permit;
}

void CircuitBreaker::on_success(const Permit& permit) {
    if (!permit.admitted()) return;

    Events events;
    Listener listener;
    {
        std::lock_guard lock(mutex_);
        ++success_count_;
        events.push_back(make_event(EventType::SUCCESS));

        if (permit.kind == Permit::Kind::TRIAL &&
            state_ == CircuitState::HALF_OPEN && permit.epoch == epoch_) {
            close_locked(events);
        }
        listener = listener_;
    }
    emit(std::move(events), std::move(listener));
}

void CircuitBreaker::on_failure(const Permit& permit, const Error& error) {
    if (!permit.admitted()) return;

    Events events;
    Listener listener;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        last_failure_wall_ = std::chrono::system_clock::now();

        events.push_back(make_event(EventType::FAILURE));
        events.back().message = error.message;

        if (state_ == CircuitState::CLOSED) {
            // Window expired relative to the previous failure: start over
            if (last_failure_ && std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - *last_failure_) > config_.window) {
                failure_count_ = 1;
            } else {
                ++failure_count_;
            }
            last_failure_ = now;

            if (failure_count_ >= config_.failure_threshold) {
                trip_locked(events);
            }
        } else {
            ++failure_count_;
            last_failure_ = now;

            // Only the current trial decides; late failures never touch the timer
            if (permit.kind == Permit::Kind::TRIAL &&
                state_ == CircuitState::HALF_OPEN && permit.epoch == epoch_) {
                trip_locked(events);
            }
        }
        listener = listener_;
    }
    emit(std::move(events), std::move(listener));
}

void CircuitBreaker::on_neutral(const Permit& permit) {
    if (permit.kind != Permit::Kind::TRIAL) return;

    std::lock_guard lock(mutex_);
    if (state_ == CircuitState::HALF_OPEN && permit.epoch == epoch_ &&
        half_open_in_flight_ > 0) {
        --half_open_in_flight_;
    }
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_;
    stats.failure_count = failure_count_;
    stats.success_count = success_count_;
    stats.rejection_count = rejection_count_;
    stats.times_opened = times_opened_;
    stats.times_half_opened = times_half_opened_;
    stats.times_closed = times_closed_;
    stats.last_failure = last_failure_wall_;
    stats.last_state_change = last_state_change_;
    return stats;
}

void CircuitBreaker::reset() {
    Events events;
    Listener listener;
    {
        std::lock_guard lock(mutex_);
        reset_timer_.cancel();

        const CircuitState previous = state_;
        state_ = CircuitState::CLOSED;
        failure_count_ = 0;
        success_count_ = 0;
        rejection_count_ = 0;
        times_opened_ = 0;
        times_half_opened_ = 0;
        times_closed_ = 0;
        half_open_in_flight_ = 0;
        ++epoch_;   // outstanding trials no longer decide anything
        last_failure_.reset();
        last_failure_wall_.reset();
        last_state_change_ = std::chrono::system_clock::now();
        recent_events_.clear();

        events.push_back(make_event(EventType::RESET));
        if (previous != CircuitState::CLOSED) {
            auto change = make_event(EventType::STATE_CHANGE);
            change.from = previous;
            change.to = CircuitState::CLOSED;
            events.push_back(std::move(change));
        }
        listener = listener_;
    }
    emit(std::move(events), std::move(listener));
}

void CircuitBreaker::shutdown() {
    reset_timer_.stop();
}

void CircuitBreaker::set_listener(Listener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

// ---- Private ---------------------------------------------------------------

void CircuitBreaker::on_reset_timer() {
    Events events;
    Listener listener;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::OPEN || !reset_deadline_passed_locked()) {
            return;  // already handled by try_acquire(), or reset()
        }
        enter_half_open_locked(events);
        listener = listener_;
    }
    emit(std::move(events), std::move(listener));
}

void CircuitBreaker::trip_locked(Events& out) {
    transition_locked(CircuitState::OPEN, out);
    opened_at_ = std::chrono::steady_clock::now();
    half_open_in_flight_ = 0;
    ++times_opened_;

    // Replaces any pending firing: never stacked, never shortened
    reset_timer_.arm(config_.reset_timeout);

    out.push_back(make_event(EventType::OPEN));
    out.back().message = std::format("{} failures (threshold {})",
        failure_count_, config_.failure_threshold);
}

void CircuitBreaker::enter_half_open_locked(Events& out) {
    reset_timer_.cancel();
    transition_locked(CircuitState::HALF_OPEN, out);
    half_open_in_flight_ = 0;
    ++epoch_;
    ++times_half_opened_;
    out.push_back(make_event(EventType::HALF_OPEN));
}

void CircuitBreaker::close_locked(Events& out) {
    transition_locked(CircuitState::CLOSED, out);
    failure_count_ = 0;
    last_failure_.reset();
    half_open_in_flight_ = 0;
    ++times_closed_;
    out.push_back(make_event(EventType::CLOSE));
}

void CircuitBreaker::transition_locked(CircuitState to, Events& out) {
    const CircuitState from = state_;
    state_ = to;
    last_state_change_ = std::chrono::system_clock::now();

    recent_events_.push_back(StateChangeEvent{from, to, last_state_change_, name_});
    if (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }

    auto change = make_event(EventType::STATE_CHANGE);
    change.from = from;
    change.to = to;
    out.push_back(std::move(change));
}

bool CircuitBreaker::reset_deadline_passed_locked() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - opened_at_) >= config_.reset_timeout;
}

ResilienceEvent CircuitBreaker::make_event(EventType type) const {
    ResilienceEvent event;
    event.type = type;
    event.source = name_;
    event.from = state_;
    event.to = state_;
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

void CircuitBreaker::emit(Events events, Listener listener) const {
    if (!listener) return;
    for (const auto& event : events) {
        listener(event);
    }
}

} // namespace callguard
