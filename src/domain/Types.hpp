#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace phub::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SubscriberId = std::string;

// One normalized price observation. Produced by a feed connector only.
struct PriceTick {
    std::string symbol;
    double value{0.0};
    std::string valueText;  // price as the vendor wrote it, empty when unknown
    TimePoint observedAt{};
};

enum class ConnectorStatus {
    Disconnected,
    Connecting,
    Connected,
};

const char* toString(ConnectorStatus status) noexcept;

// Canonical form of an instrument code: upper case, no surrounding whitespace.
std::string normalizeSymbol(std::string_view symbol);

std::int64_t toEpochMs(TimePoint tp) noexcept;
TimePoint fromEpochMs(std::int64_t ms) noexcept;

}  // namespace phub::domain
