#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace callguard {

/**
 * @brief One-shot, re-armable timer backed by a dedicated thread
 *
 * arm() replaces any pending deadline, so at most one firing is ever
 * outstanding. The callback runs on the timer thread with no timer lock
 * held and may call back into the owner. The thread is started on the
 * first arm() and joined by the destructor.
 */
class ResetTimer {
public:
    using Callback = std::function<void()>;

    explicit ResetTimer(Callback on_fire);
    ~ResetTimer();

    ResetTimer(const ResetTimer&) = delete;
    ResetTimer& operator=(const ResetTimer&) = delete;

    /**
     * @brief Schedule the callback `delay` from now, replacing any pending one
     */
    void arm(std::chrono::milliseconds delay);

    /**
     * @brief Drop the pending firing (no-op if none)
     */
    void cancel();

    [[nodiscard]] bool armed() const;

    /**
     * @brief Stop and join the timer thread; later arm() calls are ignored
     *
     * Safe to call from the callback. The thread is then only signalled
     * and is joined by the destructor.
     */
    void stop();

private:
    void run(std::stop_token stop);

    Callback on_fire_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool stopped_ = false;

    // Declared last: joined before the members above are destroyed
    std::jthread thread_;
};

} // namespace callguard
