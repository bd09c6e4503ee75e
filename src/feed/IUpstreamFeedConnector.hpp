#pragma once

#include <functional>
#include <string>

#include "domain/Types.hpp"

namespace phub::feed {

// One upstream link for one symbol.
class IUpstreamFeedConnector {
public:
    using TickHandler = std::function<void(const domain::PriceTick&)>;

    virtual ~IUpstreamFeedConnector() = default;

    virtual const std::string& symbol() const noexcept = 0;
    // Throws domain::ConnectFailureError. No-op when already connected.
    virtual void connect() = 0;
    // Stops the receive loop and closes the link. Safe when never connected.
    virtual void disconnect() noexcept = 0;
    // Throw domain::UnsupportedSymbolError or domain::ConnectionUnavailableError.
    virtual void sendSubscribe(const std::string& symbol) = 0;
    virtual void sendUnsubscribe(const std::string& symbol) = 0;
    virtual domain::ConnectorStatus status() const noexcept = 0;
    // True once the retry policy gave up on a broken link.
    virtual bool failed() const noexcept = 0;
    virtual domain::TimePoint lastActivity() const noexcept = 0;
};

}  // namespace phub::feed
