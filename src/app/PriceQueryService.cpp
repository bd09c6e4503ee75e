#include "app/PriceQueryService.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/PriceCache.hpp"
#include "domain/Errors.hpp"
#include "feed/FeedConnectionPool.hpp"

namespace phub::app {

const char* toString(QueryStatus status) noexcept {
    switch (status) {
        case QueryStatus::Ok:
            return "Ok";
        case QueryStatus::BadRequest:
            return "BadRequest";
        case QueryStatus::NotSupported:
            return "NotSupported";
        case QueryStatus::NotFound:
            return "NotFound";
        case QueryStatus::Unavailable:
            return "Unavailable";
    }
    return "Unknown";
}

PriceQueryService::PriceQueryService(std::shared_ptr<const domain::InstrumentCatalog> catalog,
                                     core::PriceCache& cache,
                                     feed::FeedConnectionPool& pool,
                                     std::chrono::milliseconds coldReadTimeout)
    : catalog_(std::move(catalog)), cache_(cache), pool_(pool), coldReadTimeout_(coldReadTimeout) {
    if (!catalog_) {
        throw std::invalid_argument("PriceQueryService requires an instrument catalog");
    }
}

PriceQueryService::~PriceQueryService() { releaseAll(); }

QueryResult PriceQueryService::currentPrice(const std::string& symbol) {
    const auto key = domain::normalizeSymbol(symbol);
    if (key.empty()) {
        return {QueryStatus::BadRequest, std::nullopt, "Symbol is required"};
    }

    if (auto cached = cache_.get(key)) {
        return {QueryStatus::Ok, std::move(cached), {}};
    }

    common::metrics::Registry::ScopedTimer timer("cold_read");
    try {
        warm_.withSlot(key, [&](WarmEntry& entry) {
            if (!entry.held) {
                pool_.acquire(key);
                entry.held = true;
                LOG_DEBUG("cold read holds a reference on " << key);
            }
        });
    } catch (const domain::UnsupportedSymbolError& ex) {
        return {QueryStatus::NotSupported, std::nullopt, ex.what()};
    } catch (const domain::ConnectFailureError& ex) {
        LOG_WARN("Cold read of " << key << " could not start its feed: " << ex.what());
        return {QueryStatus::Unavailable, std::nullopt, ex.what()};
    }

    auto pending = cache_.awaitNext(key, coldReadTimeout_);
    try {
        return {QueryStatus::Ok, pending.get(), {}};
    } catch (const domain::TimeoutError&) {
        if (auto cached = cache_.get(key)) {
            return {QueryStatus::Ok, std::move(cached), {}};
        }
        LOG_INFO("No price for " << key << " within " << coldReadTimeout_.count() << " ms");
        return {QueryStatus::NotFound, std::nullopt, "Price for " + key + " not found"};
    } catch (const domain::CancelledError& ex) {
        return {QueryStatus::Unavailable, std::nullopt, ex.what()};
    }
}

std::vector<std::string> PriceQueryService::warmSymbols() const {
    auto symbols = warm_.keys();
    std::sort(symbols.begin(), symbols.end());
    return symbols;
}

void PriceQueryService::releaseAll() {
    for (const auto& key : warm_.keys()) {
        warm_.withExisting(key, [&](WarmEntry& entry) {
            if (entry.held) {
                entry.held = false;
                pool_.release(key);
            }
        });
    }
}

}  // namespace phub::app
