#include "app/PriceHub.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "core/BroadcastDispatcher.hpp"
#include "core/SubscriptionRegistry.hpp"
#include "domain/Errors.hpp"

namespace phub::app {

PriceHub::PriceHub(core::SubscriptionRegistry& registry, core::BroadcastDispatcher& dispatcher)
    : registry_(registry), dispatcher_(dispatcher) {}

void PriceHub::connect(const domain::SubscriberId& subscriber, SubscriberSink sink) {
    auto onClosed = std::move(sink.onClosed);
    dispatcher_.attach(subscriber, std::move(sink.onPrice),
                       [this, onClosed = std::move(onClosed)](const domain::SubscriberId& id, const std::string& reason) {
                           if (onClosed) {
                               try {
                                   onClosed(reason);
                               } catch (const std::exception& ex) {
                                   LOG_WARN("onClosed handler of " << id << " failed: " << ex.what());
                               }
                           }
                           disconnect(id);
                       });
    LOG_INFO("Subscriber connected: " << subscriber);
}

PriceHub::CommandResult PriceHub::subscribe(const domain::SubscriberId& subscriber, const std::string& symbol) {
    const auto normalized = domain::normalizeSymbol(symbol);
    if (normalized.empty()) {
        return {false, "Symbol is required"};
    }

    try {
        registry_.subscribe(subscriber, normalized);
    } catch (const domain::UnsupportedSymbolError& ex) {
        LOG_WARN("Subscriber " << subscriber << " asked for unsupported symbol " << normalized);
        return {false, ex.what()};
    } catch (const std::exception& ex) {
        LOG_WARN("Subscribe of " << subscriber << " to " << normalized << " failed: " << ex.what());
        return {false, "Error subscribing to " + normalized + ": " + ex.what()};
    }

    LOG_INFO("Subscriber " << subscriber << " subscribed to " << normalized);
    return {true, "Subscribed to " + normalized};
}

PriceHub::CommandResult PriceHub::unsubscribe(const domain::SubscriberId& subscriber, const std::string& symbol) {
    const auto normalized = domain::normalizeSymbol(symbol);
    if (normalized.empty()) {
        return {false, "Symbol is required"};
    }
    if (!registry_.unsubscribe(subscriber, normalized)) {
        return {false, "Not subscribed to " + normalized};
    }
    LOG_INFO("Subscriber " << subscriber << " unsubscribed from " << normalized);
    return {true, "Unsubscribed from " + normalized};
}

std::vector<std::string> PriceHub::subscriptions(const domain::SubscriberId& subscriber) const {
    return registry_.symbolsOf(subscriber);
}

void PriceHub::disconnect(const domain::SubscriberId& subscriber) {
    dispatcher_.detach(subscriber);
    const auto dropped = registry_.unsubscribeAll(subscriber);
    LOG_INFO("Subscriber disconnected: " << subscriber << " (dropped " << dropped.size() << " subscription(s))");
}

}  // namespace phub::app
