#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "core/SubscriberOutbox.hpp"
#include "core/TickBus.hpp"
#include "domain/Types.hpp"

namespace phub::core {

class SubscriptionRegistry;

// Fans every tick out to the subscribers registered for its symbol at the time of the tick.
// Each subscriber owns an outbox; delivery starts on the dispatcher's thread pool and stall
// timers run on the supplied timer context.
class BroadcastDispatcher {
public:
    using Completion = SubscriberOutbox::Completion;
    // Must not block; call `done` once the tick has been handed off.
    using DeliverFn = SubscriberOutbox::DeliverFn;
    using ClosedFn = std::function<void(const domain::SubscriberId&, const std::string& reason)>;

    struct Options {
        std::size_t threads = 2;
        SubscriberOutbox::Config outbox{};
    };

    BroadcastDispatcher(const SubscriptionRegistry& registry,
                        TickBus& bus,
                        boost::asio::io_context& timers,
                        Options options);
    ~BroadcastDispatcher();

    BroadcastDispatcher(const BroadcastDispatcher&) = delete;
    BroadcastDispatcher& operator=(const BroadcastDispatcher&) = delete;

    // Replaces any sink already attached for the subscriber. onClosed runs on a pool thread
    // when the outbox is closed for backpressure.
    void attach(const domain::SubscriberId& subscriber, DeliverFn deliver, ClosedFn onClosed = {});
    bool detach(const domain::SubscriberId& subscriber);

    void dispatch(const domain::PriceTick& tick);

    // Detaches every subscriber and joins the pool. Idempotent.
    void stop();

    std::size_t attachedCount() const;

private:
    void closeForBackpressure_(const domain::SubscriberId& subscriber,
                               const std::weak_ptr<SubscriberOutbox>& outbox,
                               const ClosedFn& onClosed);

    const SubscriptionRegistry& registry_;
    const Options options_;
    boost::asio::io_context& timers_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex mutex_;
    std::unordered_map<domain::SubscriberId, std::shared_ptr<SubscriberOutbox>> outboxes_;

    TickBus::Subscription busSubscription_;
};

}  // namespace phub::core
