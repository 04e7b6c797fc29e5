#include "core/RateLimiter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "common/Log.hpp"

namespace tape::core {
namespace {

std::int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

RateLimiter::RateLimiter(std::size_t requests, std::chrono::milliseconds interval)
    : capacity_(requests),
      interval_(interval),
      tokensPerMs_(interval.count() > 0 ? static_cast<double>(requests) / static_cast<double>(interval.count()) : 0.0),
      tokens_(static_cast<double>(requests)),
      lastRefill_(Clock::now()),
      blockedUntil_(Clock::time_point::min()) {
    if (requests == 0U) {
        throw std::invalid_argument("RateLimiter requires at least one request per interval");
    }
    if (interval.count() <= 0) {
        throw std::invalid_argument("RateLimiter interval must be positive");
    }
}

void RateLimiter::refillLocked(Clock::time_point now) {
    if (now <= lastRefill_) {
        return;
    }
    const auto elapsedMs = std::chrono::duration<double, std::milli>(now - lastRefill_).count();
    tokens_ = std::min(static_cast<double>(capacity_), tokens_ + elapsedMs * tokensPerMs_);
    lastRefill_ = now;
}

void RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const auto now = Clock::now();
        if (now < blockedUntil_) {
            cv_.wait_until(lock, blockedUntil_);
            continue;
        }

        refillLocked(now);
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            return;
        }

        const auto missingMs = std::ceil((1.0 - tokens_) / tokensPerMs_);
        const auto wakeAt = now + std::chrono::milliseconds(static_cast<std::int64_t>(std::max(1.0, missingMs)));
        cv_.wait_until(lock, wakeAt);
    }
}

bool RateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    if (now < blockedUntil_) {
        return false;
    }
    refillLocked(now);
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

void RateLimiter::observe(const RateLimitHint& hint) {
    if (!hint.remaining.has_value()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    refillLocked(now);

    const auto remaining = std::max<std::int64_t>(0, *hint.remaining);
    tokens_ = std::min(tokens_, static_cast<double>(remaining));

    if (remaining == 0) {
        auto waitMs = interval_.count();
        if (hint.resetAtMs.has_value()) {
            waitMs = std::clamp<std::int64_t>(*hint.resetAtMs - wallClockMs(), 0, interval_.count());
        }
        const auto until = now + std::chrono::milliseconds(waitMs);
        if (until > blockedUntil_) {
            blockedUntil_ = until;
            LOG_WARN("Upstream rate budget exhausted; pausing requests for " << waitMs << " ms");
        }
    }
}

void RateLimiter::pauseFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto until = Clock::now() + duration;
    if (until > blockedUntil_) {
        blockedUntil_ = until;
    }
}

double RateLimiter::availableTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked(Clock::now());
    return tokens_;
}

}  // namespace tape::core
