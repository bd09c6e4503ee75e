#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace phub::common {

struct Config {
    phub::log::Level logLevel = phub::log::Level::Info;

    std::vector<std::string> symbols{"BTCUSD"};
    std::size_t subscribers = 1;
    std::uint32_t durationSec = 0;  // 0 = run until SIGINT/SIGTERM
    std::string querySymbol;
    bool listInstruments = false;

    std::uint32_t coldReadTimeoutMs = 10000;

    std::uint32_t retryDelayMs = 1000;
    std::uint32_t retryMaxAttempts = 0;  // 0 = retry forever
    std::string retryBackoff = "fixed";
    std::uint32_t retryMaxDelayMs = 30000;

    std::size_t outboxMaxMessages = 500;
    std::uint32_t outboxStallTimeoutMs = 20000;
    std::size_t dispatchThreads = 2;

    std::string binanceHost = "stream.binance.com";
    std::string binancePort = "9443";

    static Config fromArgs(int argc, char** argv);
};

}  // namespace phub::common
