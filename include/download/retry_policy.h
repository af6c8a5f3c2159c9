#pragma once

#include <chrono>
#include <functional>

namespace chunkfetch {

/// Delay to wait after the given failed attempt (1-based).
using BackoffFn = std::function<std::chrono::milliseconds(int attempt)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Attempt budget plus backoff schedule, independent of what is being retried.
class RetryPolicy {
public:
    RetryPolicy(int max_attempts, BackoffFn backoff);

    /// attempt k is followed by a k * step delay (2s, 4s, 6s for a 2s step)
    static RetryPolicy linear(int max_attempts, std::chrono::milliseconds step);

    int maxAttempts() const { return max_attempts_; }

    /// True if another attempt is allowed after `attempt` attempts have failed.
    bool shouldRetry(int attempt) const { return attempt < max_attempts_; }

    std::chrono::milliseconds delayAfter(int attempt) const;

private:
    int max_attempts_;
    BackoffFn backoff_;
};

/// std::this_thread::sleep_for
void sleepFor(std::chrono::milliseconds delay);

}  // namespace chunkfetch
