#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "domain/Types.hpp"

namespace phub::test {

inline bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}

inline domain::PriceTick makeTick(const std::string& symbol, double value, std::int64_t epochMs = 1700000000000) {
    domain::PriceTick tick;
    tick.symbol = symbol;
    tick.value = value;
    tick.observedAt = domain::fromEpochMs(epochMs);
    return tick;
}

// Frame understood by ScriptedAdapter: "tick <SYMBOL> <price> <epochMs>".
inline std::string tickFrame(const std::string& symbol, double value, std::int64_t epochMs = 1700000000000) {
    return "tick " + symbol + " " + std::to_string(value) + " " + std::to_string(epochMs);
}

}  // namespace phub::test
