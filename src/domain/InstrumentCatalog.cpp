#include "domain/InstrumentCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "domain/Types.hpp"

namespace phub::domain {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

const char* toString(InstrumentType type) noexcept {
    switch (type) {
        case InstrumentType::Forex:
            return "Forex";
        case InstrumentType::Crypto:
            return "Crypto";
    }
    return "Unknown";
}

InstrumentCatalog::InstrumentCatalog(std::vector<Instrument> instruments) {
    instruments_.reserve(instruments.size());
    for (auto& instrument : instruments) {
        instrument.symbol = normalizeSymbol(instrument.symbol);
        if (instrument.symbol.empty()) {
            throw std::invalid_argument("InstrumentCatalog: instrument symbol cannot be empty");
        }
        if (bySymbol_.count(instrument.symbol) != 0U) {
            throw std::invalid_argument("InstrumentCatalog: duplicate symbol " + instrument.symbol);
        }
        bySymbol_.emplace(instrument.symbol, instruments_.size());
        instruments_.push_back(std::move(instrument));
    }
}

InstrumentCatalog InstrumentCatalog::defaults() {
    return InstrumentCatalog({
        Instrument{"EURUSD", "Euro/US Dollar", InstrumentType::Forex, {}},
        Instrument{"USDJPY", "US Dollar/Japanese Yen", InstrumentType::Forex, {}},
        Instrument{"BTCUSD", "Bitcoin/US Dollar", InstrumentType::Crypto, {{"binance", "btcusdt"}}},
    });
}

const Instrument* InstrumentCatalog::find(const std::string& symbol) const {
    const auto it = bySymbol_.find(normalizeSymbol(symbol));
    if (it == bySymbol_.end()) {
        return nullptr;
    }
    return &instruments_[it->second];
}

std::optional<std::string> InstrumentCatalog::vendorToken(const std::string& vendor,
                                                          const std::string& symbol) const {
    const auto* instrument = find(symbol);
    if (instrument == nullptr) {
        return std::nullopt;
    }
    const auto it = instrument->vendorTokens.find(vendor);
    if (it == instrument->vendorTokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> InstrumentCatalog::symbolForToken(const std::string& vendor,
                                                             const std::string& token) const {
    const auto wanted = toLower(token);
    for (const auto& instrument : instruments_) {
        const auto it = instrument.vendorTokens.find(vendor);
        if (it != instrument.vendorTokens.end() && toLower(it->second) == wanted) {
            return instrument.symbol;
        }
    }
    return std::nullopt;
}

}  // namespace phub::domain
