#include "feed/FeedConnectionPool.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace phub::feed {
namespace {
using Metrics = common::metrics::Registry;
}  // namespace

FeedConnectionPool::FeedConnectionPool(std::shared_ptr<IConnectorFactory> factory, TickHandler onTick)
    : factory_(std::move(factory)), onTick_(std::move(onTick)) {
    if (!factory_) {
        throw std::invalid_argument("FeedConnectionPool requires a connector factory");
    }
}

FeedConnectionPool::~FeedConnectionPool() { shutdown(); }

void FeedConnectionPool::acquire(const std::string& symbol) {
    const auto key = domain::normalizeSymbol(symbol);
    if (key.empty()) {
        throw std::invalid_argument("FeedConnectionPool::acquire: symbol is empty");
    }
    if (!factory_->supports(key)) {
        throw domain::UnsupportedSymbolError(key);
    }

    entries_.withSlot(key, [&](Entry& entry) {
        auto previous = entry.refCount.load();
        while (!entry.refCount.compare_exchange_weak(previous, previous + 1)) {
        }

        try {
            if (previous == 0) {
                start_(key, entry);
            } else if (entry.connector && entry.connector->status() == domain::ConnectorStatus::Disconnected) {
                // Exhausted retries or a close the connector did not recover from.
                LOG_INFO("Restarting upstream feed for " << key
                                                         << (entry.connector->failed() ? " after exhausted retries"
                                                                                       : " after it closed"));
                entry.connector->connect();
                entry.connector->sendSubscribe(key);
            }
        } catch (const domain::ConnectionUnavailableError& ex) {
            entry.refCount.fetch_sub(1);
            throw domain::ConnectFailureError("Upstream feed for " + key + " dropped during subscribe: " + ex.what());
        } catch (const std::exception&) {
            entry.refCount.fetch_sub(1);
            throw;
        }
        LOG_DEBUG("acquire " << key << " refCount=" << previous + 1);
    });
}

void FeedConnectionPool::release(const std::string& symbol) {
    const auto key = domain::normalizeSymbol(symbol);
    const bool found = entries_.withExisting(key, [&](Entry& entry) {
        auto current = entry.refCount.load();
        do {
            if (current == 0) {
                LOG_WARN("release of " << key << " would drive its reference count below zero; ignored");
                return;
            }
        } while (!entry.refCount.compare_exchange_weak(current, current - 1));

        LOG_DEBUG("release " << key << " refCount=" << current - 1);
        if (current == 1) {
            stop_(key, entry);
        }
    });
    if (!found) {
        LOG_WARN("release of " << key << " without a matching acquire; ignored");
    }
}

void FeedConnectionPool::start_(const std::string& symbol, Entry& entry) {
    auto connector = factory_->create(symbol, onTick_);
    connector->connect();
    try {
        connector->sendSubscribe(symbol);
    } catch (const domain::FeedError&) {
        connector->disconnect();
        throw;
    }
    entry.connector = std::move(connector);
    Metrics::instance().addGauge("connectors_active", 1.0);
    LOG_INFO("Upstream feed started for " << symbol);
}

void FeedConnectionPool::stop_(const std::string& symbol, Entry& entry) {
    if (!entry.connector) {
        return;
    }
    try {
        entry.connector->sendUnsubscribe(symbol);
    } catch (const domain::FeedError& ex) {
        LOG_DEBUG("Skipping upstream unsubscribe for " << symbol << ": " << ex.what());
    }
    entry.connector->disconnect();
    entry.connector.reset();
    Metrics::instance().addGauge("connectors_active", -1.0);
    LOG_INFO("Upstream feed stopped for " << symbol);
}

std::uint32_t FeedConnectionPool::refCount(const std::string& symbol) const {
    const auto entry = entries_.find(domain::normalizeSymbol(symbol));
    return entry ? entry->refCount.load() : 0U;
}

domain::ConnectorStatus FeedConnectionPool::status(const std::string& symbol) const {
    auto result = domain::ConnectorStatus::Disconnected;
    entries_.withExisting(domain::normalizeSymbol(symbol), [&](Entry& entry) {
        if (entry.connector) {
            result = entry.connector->status();
        }
    });
    return result;
}

std::vector<std::string> FeedConnectionPool::activeSymbols() const {
    auto symbols = entries_.keys();
    symbols.erase(std::remove_if(symbols.begin(), symbols.end(),
                                 [this](const std::string& symbol) { return refCount(symbol) == 0U; }),
                  symbols.end());
    std::sort(symbols.begin(), symbols.end());
    return symbols;
}

void FeedConnectionPool::shutdown() {
    for (const auto& key : entries_.keys()) {
        entries_.withExisting(key, [&](Entry& entry) {
            if (entry.refCount.load() != 0U) {
                LOG_WARN("Shutting down upstream feed for " << key << " with " << entry.refCount.load()
                                                            << " outstanding reference(s)");
            }
            entry.refCount.store(0);
            stop_(key, entry);
        });
    }
}

}  // namespace phub::feed
