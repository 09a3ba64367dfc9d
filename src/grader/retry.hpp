#pragma once

#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace polygrader {

struct NoRetryCallback
{
    template <typename Result>
    void operator()(int /*attempt*/, const Result& /*result*/) const {}
};

/// Invoke ``op`` until ``retry_if`` rejects its result, at most ``max_attempts`` times in total
/// ``on_retry(attempt, result)`` is called with the 1-based number of the failed attempt before each re-attempt.
/// Returns the result of the last attempt.
template <typename Op, typename RetryPred, typename OnRetry = NoRetryCallback>
    requires(std::invocable<Op> && std::predicate<RetryPred, const std::invoke_result_t<Op>&>)
std::invoke_result_t<Op> retry(Op&& op, int max_attempts, RetryPred&& retry_if, OnRetry&& on_retry = {}) {
    DEBUG_ASSERT(max_attempts >= 1);

    for (int attempt = 1;; ++attempt) {
        auto result = std::invoke(op);

        if (attempt >= max_attempts || !std::invoke(retry_if, std::as_const(result))) {
            return result;
        }

        std::invoke(on_retry, attempt, std::as_const(result));
    }
}

} // namespace polygrader
