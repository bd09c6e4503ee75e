#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/json/value.hpp>

#include "adapters/binance/BinanceWsTransport.hpp"
#include "domain/InstrumentCatalog.hpp"
#include "feed/IVendorAdapter.hpp"

namespace phub::adapters::binance {

// Binance spot aggregate-trade streams. Symbols map to stream tokens through the catalog
// ("BTCUSD" -> "btcusdt"); one connection carries "<token>@aggTrade".
class BinanceAdapter : public feed::IVendorAdapter {
public:
    static constexpr const char* kVendor = "binance";

    BinanceAdapter(std::shared_ptr<const domain::InstrumentCatalog> catalog,
                   BinanceWsTransport::Endpoint endpoint = {});

    const std::string& name() const noexcept override { return name_; }
    bool supports(const std::string& symbol) const override;
    std::string subscriptionToken(const std::string& symbol) const override;
    std::string subscribeMessage(const std::string& symbol) override;
    std::string unsubscribeMessage(const std::string& symbol) override;
    feed::DecodedFrame decode(const std::string& payload) const override;
    std::unique_ptr<feed::IFeedTransport> makeTransport() override;

private:
    std::string controlMessage_(const char* method, const std::string& symbol);
    feed::DecodedFrame decodeTrade_(const boost::json::object& trade, const std::string& token) const;
    static double parseJsonNumber_(const boost::json::value& value);
    static std::int64_t parseJsonInt_(const boost::json::value& value);

    const std::string name_{kVendor};
    std::shared_ptr<const domain::InstrumentCatalog> catalog_;
    BinanceWsTransport::Endpoint endpoint_;
    std::atomic<std::uint64_t> nextRequestId_{1};
};

}  // namespace phub::adapters::binance
