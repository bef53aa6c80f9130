#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Guarded Call
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine counterpart of CircuitBreaker::execute for operations returning
// asio::awaitable<T>. Admission, outcome recording and fallback rules are the
// same as the synchronous path:
//
//   auto reply = co_await async_execute(ai_breaker, [&] { return ai.complete(prompt); });
//
// The breaker never applies a timeout. If the awaiting coroutine is
// cancelled the operation completes with an exception, which is recorded
// as a failure like any other.

#include "billguard/resilience/circuit_breaker.hpp"

#include <asio/awaitable.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace billguard {

namespace detail {

template <typename T>
struct awaitable_traits {
    static constexpr bool is_awaitable = false;
};

template <typename T, typename Executor>
struct awaitable_traits<asio::awaitable<T, Executor>> {
    static constexpr bool is_awaitable = true;
    using value_type = T;
};

template <typename Op>
using awaitable_value_t =
    typename awaitable_traits<std::remove_cvref_t<std::invoke_result_t<Op&>>>::value_type;

template <typename Op>
asio::awaitable<awaitable_value_t<Op>> run_admitted_async(CircuitBreaker& breaker, Op& op) {
    using T = awaitable_value_t<Op>;

    if constexpr (std::is_void_v<T>) {
        try {
            co_await std::invoke(op);
        } catch (...) {
            breaker.record_failure();
            throw;
        }
        breaker.record_success();
    } else {
        std::optional<T> result;
        try {
            result.emplace(co_await std::invoke(op));
        } catch (...) {
            breaker.record_failure();
            throw;
        }

        if constexpr (is_expected_v<T>) {
            if (!*result) {
                breaker.record_failure();
                co_return std::move(*result);
            }
        }
        breaker.record_success();
        co_return std::move(*result);
    }
}

}  // namespace detail

/// Rejected calls throw CircuitOpenError into the awaiting coroutine.
template <typename Op>
asio::awaitable<detail::awaitable_value_t<Op>> async_execute(CircuitBreaker& breaker, Op op) {
    const auto admission = breaker.admit();
    if (!admission.admitted) {
        throw breaker.rejection(admission.retry_after);
    }
    co_return co_await detail::run_admitted_async(breaker, op);
}

/// Rejected calls resolve to the fallback. The fallback may take
/// `const CircuitOpenError&` and may return either T or asio::awaitable<T>.
template <typename Op, typename Fallback>
asio::awaitable<detail::awaitable_value_t<Op>> async_execute(
    CircuitBreaker& breaker,
    Op op,
    Fallback fallback
) {
    const auto admission = breaker.admit();
    if (!admission.admitted) {
        auto invoke_fallback = [&]() -> decltype(auto) {
            if constexpr (std::is_invocable_v<Fallback&, const CircuitOpenError&>) {
                return std::invoke(fallback, breaker.rejection(admission.retry_after));
            } else {
                (void)breaker.rejection(admission.retry_after);
                return std::invoke(fallback);
            }
        };

        using FallbackResult = std::remove_cvref_t<decltype(invoke_fallback())>;
        if constexpr (detail::awaitable_traits<FallbackResult>::is_awaitable) {
            co_return co_await invoke_fallback();
        } else {
            co_return invoke_fallback();
        }
    }
    co_return co_await detail::run_admitted_async(breaker, op);
}

}  // namespace billguard
