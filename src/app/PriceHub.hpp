#pragma once

#include <functional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace phub::core {
class BroadcastDispatcher;
class SubscriptionRegistry;
}  // namespace phub::core

namespace phub::app {

// Subscriber session front end: the operations a connected client invokes, independent of the
// transport that carries them.
class PriceHub {
public:
    struct CommandResult {
        bool ok{false};
        std::string message;
    };

    struct SubscriberSink {
        // Must not block. Call `done` once the tick has been written so the next one can follow.
        std::function<void(const domain::PriceTick&, std::function<void()> done)> onPrice;
        // Called when the hub drops the subscriber on its own (backpressure).
        std::function<void(const std::string& reason)> onClosed;
    };

    PriceHub(core::SubscriptionRegistry& registry, core::BroadcastDispatcher& dispatcher);

    PriceHub(const PriceHub&) = delete;
    PriceHub& operator=(const PriceHub&) = delete;

    void connect(const domain::SubscriberId& subscriber, SubscriberSink sink);
    CommandResult subscribe(const domain::SubscriberId& subscriber, const std::string& symbol);
    CommandResult unsubscribe(const domain::SubscriberId& subscriber, const std::string& symbol);
    std::vector<std::string> subscriptions(const domain::SubscriberId& subscriber) const;
    // Detaches the sink, then drops every subscription before returning.
    void disconnect(const domain::SubscriberId& subscriber);

private:
    core::SubscriptionRegistry& registry_;
    core::BroadcastDispatcher& dispatcher_;
};

}  // namespace phub::app
