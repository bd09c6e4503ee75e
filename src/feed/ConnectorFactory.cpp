#include "feed/ConnectorFactory.hpp"

#include <utility>

#include "domain/Errors.hpp"
#include "feed/UpstreamFeedConnector.hpp"

namespace phub::feed {

AdapterConnectorFactory::AdapterConnectorFactory(std::vector<std::shared_ptr<IVendorAdapter>> adapters,
                                                 RetryPolicy policy)
    : adapters_(std::move(adapters)), policy_(policy) {}

bool AdapterConnectorFactory::supports(const std::string& symbol) const {
    return adapterFor_(symbol) != nullptr;
}

std::unique_ptr<IUpstreamFeedConnector> AdapterConnectorFactory::create(
    const std::string& symbol, IUpstreamFeedConnector::TickHandler onTick) {
    const auto normalized = domain::normalizeSymbol(symbol);
    auto adapter = adapterFor_(normalized);
    if (!adapter) {
        throw domain::UnsupportedSymbolError(normalized);
    }
    auto transport = adapter->makeTransport();
    return std::make_unique<UpstreamFeedConnector>(normalized, std::move(adapter), std::move(transport),
                                                   std::move(onTick), policy_);
}

std::shared_ptr<IVendorAdapter> AdapterConnectorFactory::adapterFor_(const std::string& symbol) const {
    const auto normalized = domain::normalizeSymbol(symbol);
    for (const auto& adapter : adapters_) {
        if (adapter && adapter->supports(normalized)) {
            return adapter;
        }
    }
    return nullptr;
}

}  // namespace phub::feed
