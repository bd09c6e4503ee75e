#include "adapters/binance/BinanceAdapter.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "domain/Errors.hpp"

namespace phub::adapters::binance {
namespace {
constexpr const char* kStreamSuffix = "@aggTrade";

std::runtime_error makeError(const std::string& message) {
    return std::runtime_error("BinanceAdapter: " + message);
}

std::string asString(const boost::json::value& value) {
    return std::string(value.as_string().c_str());
}

}  // namespace

BinanceAdapter::BinanceAdapter(std::shared_ptr<const domain::InstrumentCatalog> catalog,
                               BinanceWsTransport::Endpoint endpoint)
    : catalog_(std::move(catalog)), endpoint_(std::move(endpoint)) {
    if (!catalog_) {
        throw std::invalid_argument("BinanceAdapter requires an instrument catalog");
    }
}

bool BinanceAdapter::supports(const std::string& symbol) const {
    return catalog_->vendorToken(kVendor, symbol).has_value();
}

std::string BinanceAdapter::subscriptionToken(const std::string& symbol) const {
    auto token = catalog_->vendorToken(kVendor, symbol);
    if (!token) {
        throw domain::UnsupportedSymbolError(domain::normalizeSymbol(symbol));
    }
    return *token + kStreamSuffix;
}

std::string BinanceAdapter::subscribeMessage(const std::string& symbol) {
    return controlMessage_("SUBSCRIBE", symbol);
}

std::string BinanceAdapter::unsubscribeMessage(const std::string& symbol) {
    return controlMessage_("UNSUBSCRIBE", symbol);
}

std::string BinanceAdapter::controlMessage_(const char* method, const std::string& symbol) {
    boost::json::object message;
    message["method"] = method;
    message["params"] = boost::json::array{boost::json::value(subscriptionToken(symbol))};
    message["id"] = nextRequestId_.fetch_add(1);
    return boost::json::serialize(message);
}

feed::DecodedFrame BinanceAdapter::decode(const std::string& payload) const {
    boost::json::error_code ec;
    const auto json = boost::json::parse(payload, ec);
    if (ec || !json.is_object()) {
        return feed::DecodedFrame::makeMalformed("invalid JSON payload");
    }

    const auto& root = json.as_object();
    if (root.contains("result") || (root.contains("id") && !root.contains("data"))) {
        const auto* id = root.if_contains("id");
        return feed::DecodedFrame::makeControl("ack id=" + (id != nullptr ? boost::json::serialize(*id) : std::string("?")));
    }

    try {
        if (const auto* stream = root.if_contains("stream")) {
            const auto* data = root.if_contains("data");
            if (!stream->is_string() || data == nullptr || !data->is_object()) {
                return feed::DecodedFrame::makeMalformed("combined frame without data object");
            }
            const auto name = asString(*stream);
            return decodeTrade_(data->as_object(), name.substr(0, name.find('@')));
        }

        if (const auto* vendorSymbol = root.if_contains("s")) {
            if (!vendorSymbol->is_string()) {
                return feed::DecodedFrame::makeMalformed("symbol is not a string");
            }
            return decodeTrade_(root, asString(*vendorSymbol));
        }
    } catch (const std::exception& ex) {
        return feed::DecodedFrame::makeMalformed(ex.what());
    }

    return feed::DecodedFrame::makeMalformed("unrecognized frame");
}

feed::DecodedFrame BinanceAdapter::decodeTrade_(const boost::json::object& trade, const std::string& token) const {
    auto symbol = catalog_->symbolForToken(kVendor, token);
    if (!symbol) {
        return feed::DecodedFrame::makeMalformed("unknown vendor symbol '" + token + "'");
    }

    const auto* price = trade.if_contains("p");
    const auto* eventTime = trade.if_contains("E");
    if (price == nullptr || eventTime == nullptr) {
        return feed::DecodedFrame::makeMalformed("trade missing price or event time");
    }

    domain::PriceTick tick;
    tick.symbol = std::move(*symbol);
    tick.value = parseJsonNumber_(*price);
    if (!std::isfinite(tick.value)) {
        return feed::DecodedFrame::makeMalformed("price is not finite");
    }
    if (price->is_string()) {
        tick.valueText = asString(*price);
    }
    tick.observedAt = domain::fromEpochMs(parseJsonInt_(*eventTime));
    return feed::DecodedFrame::makeTick(std::move(tick));
}

std::unique_ptr<feed::IFeedTransport> BinanceAdapter::makeTransport() {
    return std::make_unique<BinanceWsTransport>(endpoint_);
}

double BinanceAdapter::parseJsonNumber_(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const double parsed = std::stod(str, &consumed);
            if (consumed != str.size()) {
                throw makeError("trailing characters in price '" + str + "'");
            }
            return parsed;
        } catch (const std::invalid_argument&) {
            throw makeError("failed to parse price '" + str + "'");
        } catch (const std::out_of_range&) {
            throw makeError("price out of range '" + str + "'");
        }
    }
    throw makeError("unsupported JSON type for price");
}

std::int64_t BinanceAdapter::parseJsonInt_(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw makeError("failed to parse integer value: " + std::string(ex.what()));
        }
    }
    throw makeError("unsupported JSON type for integer");
}

}  // namespace phub::adapters::binance
