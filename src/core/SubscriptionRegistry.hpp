#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/KeyedSlots.hpp"
#include "domain/Types.hpp"

namespace phub::feed {
class FeedConnectionPool;
}

namespace phub::core {

// Subscriber <-> symbol relation, indexed both ways. The pool holds one reference per symbol
// while that symbol has at least one subscriber.
//
// Lock order: subscriber entry, then symbol entry. Readers of subscribersOf() take neither.
class SubscriptionRegistry {
public:
    using SubscriberSet = std::unordered_set<domain::SubscriberId>;
    // Copy on write: each subscribe/unsubscribe copies the symbol's set (O(n) in its subscribers)
    // so the per-tick read is a lock-free pointer load. Sized for subscriber churn that is rare
    // next to tick rate and sets in the thousands; a hot symbol with heavy churn would want a
    // sharded or persistent set instead.
    using SubscriberSnapshot = std::shared_ptr<const SubscriberSet>;

    explicit SubscriptionRegistry(feed::FeedConnectionPool& pool);

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    // No-op for an existing relation. Pool failures propagate with nothing recorded.
    void subscribe(const domain::SubscriberId& subscriber, const std::string& symbol);
    // Returns false when the relation did not exist.
    bool unsubscribe(const domain::SubscriberId& subscriber, const std::string& symbol);
    // Returns the symbols that were removed.
    std::vector<std::string> unsubscribeAll(const domain::SubscriberId& subscriber);

    // Point-in-time view; never null.
    SubscriberSnapshot subscribersOf(const std::string& symbol) const;
    std::vector<std::string> symbolsOf(const domain::SubscriberId& subscriber) const;

    bool isSubscribed(const domain::SubscriberId& subscriber, const std::string& symbol) const;

private:
    struct SubscriberEntry {
        std::mutex mutex;
        bool retired{false};
        std::unordered_set<std::string> symbols;

        bool idle() const { return symbols.empty(); }
    };

    struct SymbolEntry {
        std::mutex mutex;
        bool retired{false};
        // Replaced, never mutated; read with std::atomic_load.
        SubscriberSnapshot subscribers{std::make_shared<const SubscriberSet>()};

        bool idle() const { return std::atomic_load(&subscribers)->empty(); }
    };

    // Caller holds the subscriber entry lock.
    void removeFromSymbol_(const domain::SubscriberId& subscriber, const std::string& symbol);

    feed::FeedConnectionPool& pool_;
    mutable KeyedSlots<SubscriberEntry> subscribers_;
    mutable KeyedSlots<SymbolEntry> symbols_;
};

}  // namespace phub::core
