#pragma once

#include <stdexcept>
#include <string>

namespace phub::domain {

enum class ErrorKind {
    UnsupportedSymbol,      // permanent, never retried
    ConnectFailure,         // upstream transport could not be established
    ConnectionUnavailable,  // send attempted while not connected
    Timeout,                // no tick within the wait budget
    Cancelled,              // waiter cancelled by its owner
};

const char* toString(ErrorKind kind) noexcept;

class FeedError : public std::runtime_error {
public:
    FeedError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UnsupportedSymbolError : public FeedError {
public:
    explicit UnsupportedSymbolError(const std::string& symbol)
        : FeedError(ErrorKind::UnsupportedSymbol, "Symbol " + symbol + " is not supported"),
          symbol_(symbol) {}

    const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

class ConnectFailureError : public FeedError {
public:
    explicit ConnectFailureError(const std::string& message)
        : FeedError(ErrorKind::ConnectFailure, message) {}
};

class ConnectionUnavailableError : public FeedError {
public:
    explicit ConnectionUnavailableError(const std::string& message)
        : FeedError(ErrorKind::ConnectionUnavailable, message) {}
};

class TimeoutError : public FeedError {
public:
    explicit TimeoutError(const std::string& message)
        : FeedError(ErrorKind::Timeout, message) {}
};

class CancelledError : public FeedError {
public:
    explicit CancelledError(const std::string& message)
        : FeedError(ErrorKind::Cancelled, message) {}
};

}  // namespace phub::domain
