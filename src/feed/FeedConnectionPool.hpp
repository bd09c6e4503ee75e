#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/KeyedSlots.hpp"
#include "domain/Types.hpp"
#include "feed/ConnectorFactory.hpp"

namespace phub::feed {

// Reference-counted owner of the upstream connectors: at most one live connector per symbol,
// alive exactly while its reference count is positive.
class FeedConnectionPool {
public:
    using TickHandler = IUpstreamFeedConnector::TickHandler;

    FeedConnectionPool(std::shared_ptr<IConnectorFactory> factory, TickHandler onTick);
    ~FeedConnectionPool();

    FeedConnectionPool(const FeedConnectionPool&) = delete;
    FeedConnectionPool& operator=(const FeedConnectionPool&) = delete;

    // Takes one reference. The 0 -> 1 transition connects and subscribes upstream.
    // Throws domain::UnsupportedSymbolError (count untouched) or domain::ConnectFailureError
    // (count rolled back).
    void acquire(const std::string& symbol);
    // Drops one reference. The 1 -> 0 transition tears the connector down.
    void release(const std::string& symbol);

    std::uint32_t refCount(const std::string& symbol) const;
    domain::ConnectorStatus status(const std::string& symbol) const;
    std::vector<std::string> activeSymbols() const;

    // Tears down every connector regardless of its count.
    void shutdown();

private:
    struct Entry {
        std::mutex mutex;
        bool retired{false};
        std::atomic<std::uint32_t> refCount{0};
        std::unique_ptr<IUpstreamFeedConnector> connector;

        bool idle() const { return refCount.load() == 0 && !connector; }
    };

    void start_(const std::string& symbol, Entry& entry);
    static void stop_(const std::string& symbol, Entry& entry);

    std::shared_ptr<IConnectorFactory> factory_;
    TickHandler onTick_;
    mutable core::KeyedSlots<Entry> entries_;
};

}  // namespace phub::feed
