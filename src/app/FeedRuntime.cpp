#include "app/FeedRuntime.hpp"

#include <utility>
#include <vector>

#include "adapters/binance/BinanceAdapter.hpp"
#include "common/Log.hpp"
#include "feed/RetryPolicy.hpp"

namespace phub::app {
namespace {

std::shared_ptr<feed::IConnectorFactory> makeDefaultFactory(
    const common::Config& config, const std::shared_ptr<const domain::InstrumentCatalog>& catalog) {
    adapters::binance::BinanceWsTransport::Endpoint endpoint;
    endpoint.host = config.binanceHost;
    endpoint.port = config.binancePort;

    std::vector<std::shared_ptr<feed::IVendorAdapter>> adapters{
        std::make_shared<adapters::binance::BinanceAdapter>(catalog, endpoint)};
    return std::make_shared<feed::AdapterConnectorFactory>(std::move(adapters),
                                                           feed::RetryPolicy::fromConfig(config));
}

}  // namespace

FeedRuntime::FeedRuntime(const common::Config& config,
                         std::shared_ptr<const domain::InstrumentCatalog> catalog,
                         std::shared_ptr<feed::IConnectorFactory> factory)
    : catalog_(catalog ? std::move(catalog)
                       : std::make_shared<const domain::InstrumentCatalog>(domain::InstrumentCatalog::defaults())) {
    if (!factory) {
        factory = makeDefaultFactory(config, catalog_);
    }

    cache_ = std::make_unique<core::PriceCache>(timers_.context());
    // The cache listens first so a subscriber never sees a tick the cache does not hold yet.
    cacheSubscription_ = bus_.subscribeAll([cache = cache_.get()](const domain::PriceTick& tick) { cache->onTick(tick); });

    pool_ = std::make_unique<feed::FeedConnectionPool>(
        std::move(factory), [bus = &bus_](const domain::PriceTick& tick) { bus->publish(tick); });
    registry_ = std::make_unique<core::SubscriptionRegistry>(*pool_);

    core::BroadcastDispatcher::Options options;
    options.threads = config.dispatchThreads;
    options.outbox.maxMessages = config.outboxMaxMessages;
    options.outbox.stallTimeout = std::chrono::milliseconds(config.outboxStallTimeoutMs);
    dispatcher_ = std::make_unique<core::BroadcastDispatcher>(*registry_, bus_, timers_.context(), options);

    hub_ = std::make_unique<PriceHub>(*registry_, *dispatcher_);
    query_ = std::make_unique<PriceQueryService>(catalog_, *cache_, *pool_,
                                                 std::chrono::milliseconds(config.coldReadTimeoutMs));
    LOG_DEBUG("FeedRuntime wired with " << catalog_->all().size() << " instrument(s)");
}

FeedRuntime::~FeedRuntime() { shutdown(); }

void FeedRuntime::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    cache_->cancelAll();
    query_->releaseAll();
    dispatcher_->stop();
    pool_->shutdown();
    cacheSubscription_.reset();
    timers_.stop();
    LOG_INFO("Feed runtime stopped");
}

}  // namespace phub::app
