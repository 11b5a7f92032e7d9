#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include "resilience/resilience_manager.hpp"

#include <format>
#include <functional>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace callguard {

namespace detail {

/// Turn a fallback (value, fn(), or fn(const Error&)) into the call's Result type
template<typename R, typename Fallback>
R resolve_fallback(Fallback& fallback, const Error& error) {
    using T = typename R::value_type;

    if constexpr (std::is_invocable_v<Fallback&, const Error&>) {
        using Out = std::invoke_result_t<Fallback&, const Error&>;
        if constexpr (is_result_v<Out>) {
            return std::invoke(fallback, error);
        } else {
            return R::ok(T(std::invoke(fallback, error)));
        }
    } else if constexpr (std::is_invocable_v<Fallback&>) {
        using Out = std::invoke_result_t<Fallback&>;
        if constexpr (is_result_v<Out>) {
            return std::invoke(fallback);
        } else {
            return R::ok(T(std::invoke(fallback)));
        }
    } else {
        return R::ok(T(fallback));
    }
}

} // namespace detail

/**
 * @brief Run fn through the manager; on any error return the fallback instead
 *
 * Explicit opt-in graceful degradation (cached value, default answer).
 * The fallback may be a plain value, a callable taking no arguments, or a
 * callable taking the original Error; callables may return T or Result<T>.
 * A failing callable fallback's Result is returned as is.
 *
 * The original error still counts against the breaker.
 */
template<typename F, typename Fallback>
[[nodiscard]] detail::call_result_t<std::decay_t<F>> with_fallback(
    ResilienceManager& manager, F&& fn, Fallback&& fallback, std::stop_token caller = {}) {
    using R = detail::call_result_t<std::decay_t<F>>;

    R result = manager.execute(std::forward<F>(fn), std::move(caller));
    if (result.is_ok()) {
        return result;
    }

    utils::log::warn(std::format("'{}' degraded to fallback after {}: {}",
        manager.name(), error_code_to_string(result.error_code()), result.error_message()));
    return detail::resolve_fallback<R>(fallback, result.error_info());
}

} // namespace callguard
