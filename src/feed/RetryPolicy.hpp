#pragma once

#include <chrono>
#include <cstdint>

namespace phub::common {
struct Config;
}

namespace phub::feed {

// How a connector recovers from a broken upstream link.
struct RetryPolicy {
    enum class Backoff {
        Fixed,
        Exponential,
    };

    std::chrono::milliseconds initialDelay{1000};
    std::uint32_t maxAttempts{0};  // 0 = retry forever
    Backoff backoff{Backoff::Fixed};
    std::chrono::milliseconds maxDelay{30000};

    // attempt is 1-based.
    std::chrono::milliseconds delayFor(std::uint32_t attempt) const noexcept;
    bool exhausted(std::uint32_t attempt) const noexcept;

    static RetryPolicy fromConfig(const common::Config& config);
};

}  // namespace phub::feed
