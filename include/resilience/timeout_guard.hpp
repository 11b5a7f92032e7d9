#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>

namespace callguard {

namespace detail {

/// Result of a protected callable, which may optionally take a std::stop_token
template<typename F>
using call_result_t = typename std::conditional_t<
    std::is_invocable_v<F&, std::stop_token>,
    std::invoke_result<F&, std::stop_token>,
    std::invoke_result<F&>>::type;

/**
 * @brief Invoke fn, converting escaping exceptions into OPERATION_FAILED
 */
template<typename F>
call_result_t<F> invoke_guarded(F& fn, std::stop_token token, std::string_view source) {
    using R = call_result_t<F>;
    static_assert(is_result_v<R>, "protected callable must return Result<T>");
    try {
        if constexpr (std::is_invocable_v<F&, std::stop_token>) {
            return std::invoke(fn, std::move(token));
        } else {
            return std::invoke(fn);
        }
    } catch (const std::exception& e) {
        return R::error(Error::operation_failed(
            std::format("'{}' threw: {}", source, e.what()), std::string(source)));
    } catch (...) {
        return R::error(Error::operation_failed(
            std::format("'{}' threw a non-standard exception", source), std::string(source)));
    }
}

/// Shared between the caller and the detached worker of one race
template<typename R>
struct RaceState {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::optional<R> result;
    std::stop_source stop;
};

} // namespace detail

/**
 * @brief Races a protected call against a deadline
 *
 * The callable runs on a detached worker thread; the caller waits for
 * whichever comes first:
 * - the callable's result          -> returned unchanged
 * - the deadline                   -> TIMEOUT
 * - a stop request on `caller`     -> CANCELLED
 *
 * On TIMEOUT/CANCELLED the worker is not joined. Callables that accept a
 * std::stop_token see stop requested and should return early; others run
 * to completion and their result is discarded. Captured state must
 * therefore be owned by the callable (by value or shared_ptr).
 *
 * A non-positive timeout disables the race: fn runs inline on the calling
 * thread and receives the caller's stop_token.
 */
class TimeoutGuard {
public:
    template<typename F>
    [[nodiscard]] static detail::call_result_t<std::decay_t<F>> run(
        F&& fn,
        std::chrono::milliseconds timeout,
        std::string_view operation,
        std::stop_token caller = {}) {

        using Fn = std::decay_t<F>;
        using R = detail::call_result_t<Fn>;

        if (caller.stop_requested()) {
            return R::error(Error::cancelled(std::string(operation)));
        }

        if (timeout <= std::chrono::milliseconds::zero()) {
            Fn local(std::forward<F>(fn));
            return detail::invoke_guarded(local, std::move(caller), operation);
        }

        auto state = std::make_shared<detail::RaceState<R>>();
        try {
            std::thread worker(
                [state, op = std::string(operation), task = Fn(std::forward<F>(fn))]() mutable {
                    R r = detail::invoke_guarded(task, state->stop.get_token(), op);
                    {
                        std::lock_guard lock(state->mutex);
                        state->result.emplace(std::move(r));
                    }
                    state->cv.notify_all();
                });
            worker.detach();
        } catch (const std::system_error& e) {
            return R::error(Error::operation_failed(
                std::format("'{}' could not start worker: {}", operation, e.what()),
                std::string(operation)));
        }

        const auto deadline = utils::deadline_after(timeout);
        std::unique_lock lock(state->mutex);
        const bool completed = state->cv.wait_until(lock, caller, deadline,
            [&state] { return state->result.has_value(); });

        if (completed) {
            return std::move(*state->result);
        }
        lock.unlock();

        // Tell a cooperative callable to give up; the worker keeps `state` alive
        state->stop.request_stop();

        if (caller.stop_requested()) {
            utils::log::debug(std::format("Operation '{}' cancelled by caller", operation));
            return R::error(Error::cancelled(std::string(operation)));
        }

        utils::log::warn(std::format("Operation '{}' timed out after {}ms",
            operation, timeout.count()));
        return R::error(Error::timed_out(std::string(operation), timeout));
    }
};

} // namespace callguard
