#include "../include/retry.hpp"
#include <thread>
#include <chrono>
#include <algorithm>
#include <cmath>

int backoff_delay_ms(const RetryPolicy& policy, int attempt) {
    double d = policy.initial_backoff_ms * std::pow(policy.multiplier, std::max(0, attempt - 1));
    return (int)std::min<double>(d, policy.max_backoff_ms);
}

void sleep_with_cancel(int ms, const CancelToken* cancel) {
    using clock = std::chrono::steady_clock;
    auto until = clock::now() + std::chrono::milliseconds(ms);
    while (clock::now() < until) {
        if (is_cancelled(cancel)) throw OperationCancelled();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
    }
    if (is_cancelled(cancel)) throw OperationCancelled();
}
