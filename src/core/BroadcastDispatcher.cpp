#include "core/BroadcastDispatcher.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "core/SubscriptionRegistry.hpp"

namespace phub::core {

BroadcastDispatcher::BroadcastDispatcher(const SubscriptionRegistry& registry,
                                         TickBus& bus,
                                         boost::asio::io_context& timers,
                                         Options options)
    : registry_(registry),
      options_(options),
      timers_(timers),
      pool_(std::max<std::size_t>(1, options.threads)) {
    busSubscription_ = bus.subscribeAll([this](const domain::PriceTick& tick) { dispatch(tick); });
}

BroadcastDispatcher::~BroadcastDispatcher() { stop(); }

void BroadcastDispatcher::attach(const domain::SubscriberId& subscriber, DeliverFn deliver, ClosedFn onClosed) {
    if (stopped_.load()) {
        LOG_WARN("attach of " << subscriber << " after dispatcher stop; ignored");
        return;
    }

    // Filled once the outbox exists; identifies it when it reports a stall.
    auto self = std::make_shared<std::weak_ptr<SubscriberOutbox>>();

    SubscriberOutbox::Callbacks callbacks;
    callbacks.deliver = std::move(deliver);
    callbacks.closeForBackpressure = [this, subscriber, self, onClosed = std::move(onClosed)]() {
        closeForBackpressure_(subscriber, *self, onClosed);
    };
    auto outbox = std::make_shared<SubscriberOutbox>(subscriber, options_.outbox, std::move(callbacks),
                                                     pool_.get_executor(), timers_);
    *self = outbox;

    std::shared_ptr<SubscriberOutbox> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = outboxes_[subscriber];
        previous = std::move(slot);
        slot = std::move(outbox);
    }
    if (previous) {
        previous->shutdown();
    }
    LOG_DEBUG("dispatcher attached " << subscriber);
}

bool BroadcastDispatcher::detach(const domain::SubscriberId& subscriber) {
    std::shared_ptr<SubscriberOutbox> outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = outboxes_.find(subscriber);
        if (it == outboxes_.end()) {
            return false;
        }
        outbox = std::move(it->second);
        outboxes_.erase(it);
    }
    outbox->shutdown();
    LOG_DEBUG("dispatcher detached " << subscriber);
    return true;
}

void BroadcastDispatcher::dispatch(const domain::PriceTick& tick) {
    const auto subscribers = registry_.subscribersOf(tick.symbol);
    if (subscribers->empty()) {
        return;
    }

    std::vector<std::shared_ptr<SubscriberOutbox>> targets;
    targets.reserve(subscribers->size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& subscriber : *subscribers) {
            const auto it = outboxes_.find(subscriber);
            if (it != outboxes_.end()) {
                targets.push_back(it->second);
            }
        }
    }
    if (targets.size() != subscribers->size()) {
        LOG_DEBUG(subscribers->size() - targets.size() << " subscriber(s) of " << tick.symbol
                                                       << " have no attached sink");
    }

    for (const auto& outbox : targets) {
        outbox->enqueue(tick);
    }
}

void BroadcastDispatcher::closeForBackpressure_(const domain::SubscriberId& subscriber,
                                                const std::weak_ptr<SubscriberOutbox>& outbox,
                                                const ClosedFn& onClosed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = outboxes_.find(subscriber);
        const auto current = outbox.lock();
        if (it == outboxes_.end() || it->second != current) {
            return;
        }
        outboxes_.erase(it);
    }
    LOG_WARN("Subscriber " << subscriber << " closed for backpressure");
    if (onClosed) {
        onClosed(subscriber, "backpressure");
    }
}

void BroadcastDispatcher::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    busSubscription_.reset();

    std::unordered_map<domain::SubscriberId, std::shared_ptr<SubscriberOutbox>> outboxes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outboxes.swap(outboxes_);
    }
    for (auto& entry : outboxes) {
        entry.second->shutdown();
    }
    pool_.join();
}

std::size_t BroadcastDispatcher::attachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outboxes_.size();
}

}  // namespace phub::core
