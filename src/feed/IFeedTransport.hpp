#pragma once

#include <string>

namespace phub::feed {

// Message-oriented connection to a market data vendor.
//
// Threading: one thread reads while other threads may write or close. close() must make a
// blocked read() return promptly. open() after close() starts a fresh connection.
class IFeedTransport {
public:
    enum class ReadResult {
        Frame,
        Closed,  // orderly close by the peer or by close()
    };

    virtual ~IFeedTransport() = default;

    // Throws on failure.
    virtual void open() = 0;
    // Blocks for the next message. Throws on a transport error.
    virtual ReadResult read(std::string& payload) = 0;
    // Throws on failure.
    virtual void write(const std::string& payload) = 0;
    virtual void close() noexcept = 0;
    virtual bool isOpen() const noexcept = 0;
};

}  // namespace phub::feed
