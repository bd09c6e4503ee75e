#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace phub::domain {

enum class InstrumentType {
    Forex,
    Crypto,
};

const char* toString(InstrumentType type) noexcept;

struct Instrument {
    std::string symbol;
    std::string name;
    InstrumentType type{InstrumentType::Crypto};
    // vendor name -> vendor subscription token, e.g. "binance" -> "btcusdt"
    std::unordered_map<std::string, std::string> vendorTokens;
};

// Read-only instrument table. Built once and handed to the components that need it.
class InstrumentCatalog {
public:
    InstrumentCatalog() = default;
    explicit InstrumentCatalog(std::vector<Instrument> instruments);

    static InstrumentCatalog defaults();

    const std::vector<Instrument>& all() const noexcept { return instruments_; }
    const Instrument* find(const std::string& symbol) const;
    bool contains(const std::string& symbol) const { return find(symbol) != nullptr; }

    std::optional<std::string> vendorToken(const std::string& vendor, const std::string& symbol) const;
    // Reverse lookup; the token comparison ignores case.
    std::optional<std::string> symbolForToken(const std::string& vendor, const std::string& token) const;

private:
    std::vector<Instrument> instruments_;
    std::unordered_map<std::string, std::size_t> bySymbol_;
};

}  // namespace phub::domain
