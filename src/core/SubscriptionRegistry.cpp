#include "core/SubscriptionRegistry.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/Log.hpp"
#include "feed/FeedConnectionPool.hpp"

namespace phub::core {
namespace {
const SubscriptionRegistry::SubscriberSnapshot& emptySnapshot() {
    static const SubscriptionRegistry::SubscriberSnapshot empty =
        std::make_shared<const SubscriptionRegistry::SubscriberSet>();
    return empty;
}
}  // namespace

SubscriptionRegistry::SubscriptionRegistry(feed::FeedConnectionPool& pool) : pool_(pool) {}

void SubscriptionRegistry::subscribe(const domain::SubscriberId& subscriber, const std::string& symbol) {
    const auto key = domain::normalizeSymbol(symbol);
    if (subscriber.empty()) {
        throw std::invalid_argument("SubscriptionRegistry: subscriber id is empty");
    }
    if (key.empty()) {
        throw std::invalid_argument("SubscriptionRegistry: symbol is empty");
    }

    subscribers_.withSlot(subscriber, [&](SubscriberEntry& owner) {
        if (owner.symbols.count(key) != 0U) {
            return;
        }
        symbols_.withSlot(key, [&](SymbolEntry& entry) {
            const auto current = std::atomic_load(&entry.subscribers);
            if (current->empty()) {
                pool_.acquire(key);
            }
            auto next = std::make_shared<SubscriberSet>(*current);
            next->insert(subscriber);
            std::atomic_store(&entry.subscribers, SubscriberSnapshot(std::move(next)));
        });
        owner.symbols.insert(key);
        LOG_DEBUG("subscriber " << subscriber << " subscribed to " << key);
    });
}

bool SubscriptionRegistry::unsubscribe(const domain::SubscriberId& subscriber, const std::string& symbol) {
    const auto key = domain::normalizeSymbol(symbol);
    bool removed = false;
    subscribers_.withExisting(subscriber, [&](SubscriberEntry& owner) {
        if (owner.symbols.erase(key) == 0U) {
            return;
        }
        removeFromSymbol_(subscriber, key);
        removed = true;
        LOG_DEBUG("subscriber " << subscriber << " unsubscribed from " << key);
    });
    return removed;
}

std::vector<std::string> SubscriptionRegistry::unsubscribeAll(const domain::SubscriberId& subscriber) {
    std::vector<std::string> removed;
    subscribers_.withExisting(subscriber, [&](SubscriberEntry& owner) {
        removed.assign(owner.symbols.begin(), owner.symbols.end());
        std::sort(removed.begin(), removed.end());
        owner.symbols.clear();
        for (const auto& key : removed) {
            removeFromSymbol_(subscriber, key);
        }
    });
    if (!removed.empty()) {
        LOG_DEBUG("subscriber " << subscriber << " unsubscribed from " << removed.size() << " symbol(s)");
    }
    return removed;
}

void SubscriptionRegistry::removeFromSymbol_(const domain::SubscriberId& subscriber, const std::string& symbol) {
    const bool found = symbols_.withExisting(symbol, [&](SymbolEntry& entry) {
        const auto current = std::atomic_load(&entry.subscribers);
        if (current->count(subscriber) == 0U) {
            LOG_WARN("registry index mismatch: " << subscriber << " missing from " << symbol);
            return;
        }
        auto next = std::make_shared<SubscriberSet>(*current);
        next->erase(subscriber);
        const bool becameEmpty = next->empty();
        std::atomic_store(&entry.subscribers, SubscriberSnapshot(std::move(next)));
        if (becameEmpty) {
            pool_.release(symbol);
        }
    });
    if (!found) {
        LOG_WARN("registry index mismatch: no subscriber set for " << symbol);
    }
}

SubscriptionRegistry::SubscriberSnapshot SubscriptionRegistry::subscribersOf(const std::string& symbol) const {
    const auto entry = symbols_.find(domain::normalizeSymbol(symbol));
    if (!entry) {
        return emptySnapshot();
    }
    return std::atomic_load(&entry->subscribers);
}

std::vector<std::string> SubscriptionRegistry::symbolsOf(const domain::SubscriberId& subscriber) const {
    std::vector<std::string> result;
    subscribers_.withExisting(subscriber, [&](SubscriberEntry& owner) {
        result.assign(owner.symbols.begin(), owner.symbols.end());
    });
    std::sort(result.begin(), result.end());
    return result;
}

bool SubscriptionRegistry::isSubscribed(const domain::SubscriberId& subscriber, const std::string& symbol) const {
    const auto key = domain::normalizeSymbol(symbol);
    bool subscribed = false;
    subscribers_.withExisting(subscriber, [&](SubscriberEntry& owner) {
        subscribed = owner.symbols.count(key) != 0U;
    });
    return subscribed;
}

}  // namespace phub::core
