#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <string>

// Delay before the next try after the attempt-th failure (1-based), capped at max_backoff_ms.
int backoff_delay_ms(const RetryPolicy& policy, int attempt);

// Sleeps in short slices; throws OperationCancelled as soon as the token fires.
void sleep_with_cancel(int ms, const CancelToken* cancel);

// Calls fn until it returns, retrying only TransientError up to policy.max_attempts.
// The last transient error is rethrown unchanged once attempts are exhausted.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, const CancelToken* cancel, Fn&& fn)
    -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        if (is_cancelled(cancel)) throw OperationCancelled();
        try {
            return fn();
        } catch (const TransientError& e) {
            if (attempt >= policy.max_attempts) {
                log_line(LogLevel::Warn, "retry", what + " gave up after " + std::to_string(attempt) + " attempts: " + e.what());
                throw;
            }
            int delay = backoff_delay_ms(policy, attempt);
            log_line(LogLevel::Info, "retry", what + " attempt " + std::to_string(attempt) + " failed (" + e.what() +
                     "), retrying in " + std::to_string(delay) + " ms");
            sleep_with_cancel(delay, cancel);
        }
    }
}
