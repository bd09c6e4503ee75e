#pragma once

#include <memory>
#include <string>
#include <vector>

#include "feed/IUpstreamFeedConnector.hpp"
#include "feed/IVendorAdapter.hpp"
#include "feed/RetryPolicy.hpp"

namespace phub::feed {

class IConnectorFactory {
public:
    virtual ~IConnectorFactory() = default;

    virtual bool supports(const std::string& symbol) const = 0;
    // Throws domain::UnsupportedSymbolError. The connector is returned unconnected.
    virtual std::unique_ptr<IUpstreamFeedConnector> create(const std::string& symbol,
                                                           IUpstreamFeedConnector::TickHandler onTick) = 0;
};

// Picks the first adapter that maps the symbol and builds an UpstreamFeedConnector on it.
class AdapterConnectorFactory : public IConnectorFactory {
public:
    AdapterConnectorFactory(std::vector<std::shared_ptr<IVendorAdapter>> adapters, RetryPolicy policy = {});

    bool supports(const std::string& symbol) const override;
    std::unique_ptr<IUpstreamFeedConnector> create(const std::string& symbol,
                                                   IUpstreamFeedConnector::TickHandler onTick) override;

private:
    std::shared_ptr<IVendorAdapter> adapterFor_(const std::string& symbol) const;

    std::vector<std::shared_ptr<IVendorAdapter>> adapters_;
    RetryPolicy policy_;
};

}  // namespace phub::feed
