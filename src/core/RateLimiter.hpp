#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

namespace tape::core {

// Upstream view of the rate budget, as reported in response headers.
struct RateLimitHint {
    std::optional<std::int64_t> remaining;
    // Wall-clock epoch milliseconds at which the upstream budget resets.
    std::optional<std::int64_t> resetAtMs;
};

// Process-wide token bucket shared by every fetch client. acquire() blocks the
// calling thread until a request slot is available; it never fails.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(std::size_t requests, std::chrono::milliseconds interval);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    void acquire();
    bool tryAcquire();

    // Folds upstream metadata into the local budget. An exhausted upstream
    // budget blocks all callers until the reported reset.
    void observe(const RateLimitHint& hint);

    // Blocks all callers for at least `duration` (Retry-After, ban responses).
    void pauseFor(std::chrono::milliseconds duration);

    std::size_t capacity() const noexcept { return capacity_; }
    double availableTokens();

private:
    void refillLocked(Clock::time_point now);

    const std::size_t capacity_;
    const std::chrono::milliseconds interval_;
    const double tokensPerMs_;

    std::mutex mutex_;
    std::condition_variable cv_;
    double tokens_;
    Clock::time_point lastRefill_;
    Clock::time_point blockedUntil_;
};

}  // namespace tape::core
