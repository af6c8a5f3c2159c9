#include "download/retry_policy.h"

#include <algorithm>
#include <thread>
#include <utility>

namespace chunkfetch {

RetryPolicy::RetryPolicy(int max_attempts, BackoffFn backoff)
    : max_attempts_(std::max(1, max_attempts)), backoff_(std::move(backoff)) {}

RetryPolicy RetryPolicy::linear(int max_attempts, std::chrono::milliseconds step) {
    return RetryPolicy(max_attempts, [step](int attempt) { return step * attempt; });
}

std::chrono::milliseconds RetryPolicy::delayAfter(int attempt) const {
    if (!backoff_ || attempt < 1) return std::chrono::milliseconds(0);
    return std::max(std::chrono::milliseconds(0), backoff_(attempt));
}

void sleepFor(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace chunkfetch
