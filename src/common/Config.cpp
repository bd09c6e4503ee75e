#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace phub::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseCount(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("count out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parsePositiveSize(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoull(value);
        if (parsed == 0U) {
            throw std::out_of_range("must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parsePort(const std::string& value, const std::string& label) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return std::to_string(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port for " + label + ": " + value);
    }
}

std::string parseBackoff(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "fixed" || normalized == "exponential") {
        return normalized;
    }
    throw std::runtime_error("Invalid value for " + label + ": " + value);
}

std::vector<std::string> parseSymbolList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto symbol = toUpper(trim(item));
        if (!symbol.empty() && std::find(parts.begin(), parts.end(), symbol) == parts.end()) {
            parts.push_back(std::move(symbol));
        }
    }
    return parts;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = phub::log::levelFromString(toLower(envLogLevel));
    }
    if (const char* envSymbols = std::getenv("PRICEHUB_SYMBOLS")) {
        auto list = parseSymbolList(envSymbols);
        if (!list.empty()) {
            config.symbols = std::move(list);
        }
    }
    if (const char* envColdRead = std::getenv("COLD_READ_TIMEOUT_MS")) {
        config.coldReadTimeoutMs = parseDurationMs(envColdRead, "COLD_READ_TIMEOUT_MS");
    }
    if (const char* envRetryDelay = std::getenv("FEED_RETRY_DELAY_MS")) {
        config.retryDelayMs = parseDurationMs(envRetryDelay, "FEED_RETRY_DELAY_MS");
    }
    if (const char* envRetryMax = std::getenv("FEED_RETRY_MAX")) {
        config.retryMaxAttempts = parseCount(envRetryMax, "FEED_RETRY_MAX");
    }
    if (const char* envBackoff = std::getenv("FEED_RETRY_BACKOFF")) {
        config.retryBackoff = parseBackoff(envBackoff, "FEED_RETRY_BACKOFF");
    }
    if (const char* envOutboxMsgs = std::getenv("OUTBOX_MAX_MSGS")) {
        config.outboxMaxMessages = parsePositiveSize(envOutboxMsgs, "OUTBOX_MAX_MSGS");
    }
    if (const char* envStall = std::getenv("OUTBOX_STALL_TIMEOUT_MS")) {
        config.outboxStallTimeoutMs = parseDurationMs(envStall, "OUTBOX_STALL_TIMEOUT_MS");
    }
    if (const char* envHost = std::getenv("BINANCE_WS_HOST")) {
        auto host = trim(envHost);
        if (!host.empty()) {
            config.binanceHost = std::move(host);
        }
    }
    if (const char* envPort = std::getenv("BINANCE_WS_PORT")) {
        config.binancePort = parsePort(envPort, "BINANCE_WS_PORT");
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = phub::log::levelFromString(toLower(levelArg));
    }
    if (auto symbolsArg = valueFromArgs(argc, argv, "--symbols"); !symbolsArg.empty()) {
        auto list = parseSymbolList(symbolsArg);
        if (!list.empty()) {
            config.symbols = std::move(list);
        }
    }
    if (auto subscribersArg = valueFromArgs(argc, argv, "--subscribers"); !subscribersArg.empty()) {
        config.subscribers = parseCount(subscribersArg, "--subscribers");
    }
    if (auto durationArg = valueFromArgs(argc, argv, "--duration"); !durationArg.empty()) {
        config.durationSec = parseCount(durationArg, "--duration");
    }
    if (auto queryArg = valueFromArgs(argc, argv, "--query"); !queryArg.empty()) {
        config.querySymbol = toUpper(trim(queryArg));
    }
    if (hasFlag(argc, argv, "--list-instruments")) {
        config.listInstruments = true;
    }
    if (auto coldArg = valueFromArgs(argc, argv, "--cold-read-timeout-ms"); !coldArg.empty()) {
        config.coldReadTimeoutMs = parseDurationMs(coldArg, "--cold-read-timeout-ms");
    }
    if (auto delayArg = valueFromArgs(argc, argv, "--retry-delay-ms"); !delayArg.empty()) {
        config.retryDelayMs = parseDurationMs(delayArg, "--retry-delay-ms");
    }
    if (auto maxArg = valueFromArgs(argc, argv, "--retry-max"); !maxArg.empty()) {
        config.retryMaxAttempts = parseCount(maxArg, "--retry-max");
    }
    if (auto backoffArg = valueFromArgs(argc, argv, "--retry-backoff"); !backoffArg.empty()) {
        config.retryBackoff = parseBackoff(backoffArg, "--retry-backoff");
    }
    if (auto capArg = valueFromArgs(argc, argv, "--retry-max-delay-ms"); !capArg.empty()) {
        config.retryMaxDelayMs = parseDurationMs(capArg, "--retry-max-delay-ms");
    }
    if (auto outboxArg = valueFromArgs(argc, argv, "--outbox-max-msgs"); !outboxArg.empty()) {
        config.outboxMaxMessages = parsePositiveSize(outboxArg, "--outbox-max-msgs");
    }
    if (auto stallArg = valueFromArgs(argc, argv, "--outbox-stall-timeout-ms"); !stallArg.empty()) {
        config.outboxStallTimeoutMs = parseDurationMs(stallArg, "--outbox-stall-timeout-ms");
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--dispatch-threads"); !threadsArg.empty()) {
        config.dispatchThreads = parsePositiveSize(threadsArg, "--dispatch-threads");
    }
    if (auto hostArg = valueFromArgs(argc, argv, "--binance-host"); !hostArg.empty()) {
        config.binanceHost = trim(hostArg);
    }
    if (auto portArg = valueFromArgs(argc, argv, "--binance-port"); !portArg.empty()) {
        config.binancePort = parsePort(portArg, "--binance-port");
    }

    if (config.retryMaxDelayMs < config.retryDelayMs) {
        config.retryMaxDelayMs = config.retryDelayMs;
    }

    return config;
}

}  // namespace phub::common
