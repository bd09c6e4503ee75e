#pragma once

#include <memory>

#include "app/PriceHub.hpp"
#include "app/PriceQueryService.hpp"
#include "common/Config.hpp"
#include "core/BroadcastDispatcher.hpp"
#include "core/PriceCache.hpp"
#include "core/SubscriptionRegistry.hpp"
#include "core/TickBus.hpp"
#include "core/TimerService.hpp"
#include "domain/InstrumentCatalog.hpp"
#include "feed/ConnectorFactory.hpp"
#include "feed/FeedConnectionPool.hpp"

namespace phub::app {

// Owns and wires the whole pipeline:
// connectors -> pool -> tick bus -> (price cache, broadcast dispatcher) -> subscribers.
class FeedRuntime {
public:
    // Without a factory the Binance adapter is used, configured from `config`.
    explicit FeedRuntime(const common::Config& config,
                         std::shared_ptr<const domain::InstrumentCatalog> catalog = nullptr,
                         std::shared_ptr<feed::IConnectorFactory> factory = nullptr);
    ~FeedRuntime();

    FeedRuntime(const FeedRuntime&) = delete;
    FeedRuntime& operator=(const FeedRuntime&) = delete;

    const domain::InstrumentCatalog& catalog() const noexcept { return *catalog_; }
    core::TickBus& bus() noexcept { return bus_; }
    core::PriceCache& cache() noexcept { return *cache_; }
    feed::FeedConnectionPool& pool() noexcept { return *pool_; }
    core::SubscriptionRegistry& registry() noexcept { return *registry_; }
    core::BroadcastDispatcher& dispatcher() noexcept { return *dispatcher_; }
    PriceHub& hub() noexcept { return *hub_; }
    PriceQueryService& query() noexcept { return *query_; }

    // Stops deliveries and tears down every upstream connection. Idempotent.
    void shutdown();

private:
    std::shared_ptr<const domain::InstrumentCatalog> catalog_;
    core::TimerService timers_;
    core::TickBus bus_;
    std::unique_ptr<core::PriceCache> cache_;
    core::TickBus::Subscription cacheSubscription_;
    std::unique_ptr<feed::FeedConnectionPool> pool_;
    std::unique_ptr<core::SubscriptionRegistry> registry_;
    std::unique_ptr<core::BroadcastDispatcher> dispatcher_;
    std::unique_ptr<PriceHub> hub_;
    std::unique_ptr<PriceQueryService> query_;
    bool shutDown_{false};
};

}  // namespace phub::app
