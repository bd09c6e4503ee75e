#include "feed/RetryPolicy.hpp"

#include <algorithm>

#include "common/Config.hpp"

namespace phub::feed {

std::chrono::milliseconds RetryPolicy::delayFor(std::uint32_t attempt) const noexcept {
    if (backoff == Backoff::Fixed || attempt <= 1) {
        return initialDelay;
    }
    auto delay = initialDelay;
    for (std::uint32_t i = 1; i < attempt && delay < maxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, std::max(maxDelay, initialDelay));
}

bool RetryPolicy::exhausted(std::uint32_t attempt) const noexcept {
    return maxAttempts != 0 && attempt > maxAttempts;
}

RetryPolicy RetryPolicy::fromConfig(const common::Config& config) {
    RetryPolicy policy;
    policy.initialDelay = std::chrono::milliseconds(config.retryDelayMs);
    policy.maxAttempts = config.retryMaxAttempts;
    policy.backoff = config.retryBackoff == "exponential" ? Backoff::Exponential : Backoff::Fixed;
    policy.maxDelay = std::chrono::milliseconds(config.retryMaxDelayMs);
    return policy;
}

}  // namespace phub::feed
