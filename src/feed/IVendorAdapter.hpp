#pragma once

#include <memory>
#include <optional>
#include <string>

#include "domain/Types.hpp"
#include "feed/IFeedTransport.hpp"

namespace phub::feed {

struct DecodedFrame {
    enum class Kind {
        Tick,
        Control,    // acknowledgement or other vendor bookkeeping
        Malformed,
    };

    Kind kind{Kind::Malformed};
    std::optional<domain::PriceTick> tick;
    std::string reason;

    static DecodedFrame makeTick(domain::PriceTick tick) {
        DecodedFrame frame;
        frame.kind = Kind::Tick;
        frame.tick = std::move(tick);
        return frame;
    }

    static DecodedFrame makeControl(std::string reason) {
        DecodedFrame frame;
        frame.kind = Kind::Control;
        frame.reason = std::move(reason);
        return frame;
    }

    static DecodedFrame makeMalformed(std::string reason) {
        DecodedFrame frame;
        frame.kind = Kind::Malformed;
        frame.reason = std::move(reason);
        return frame;
    }
};

// Everything vendor specific: symbol mapping, control messages, frame decoding and the
// transport to reach the vendor.
class IVendorAdapter {
public:
    virtual ~IVendorAdapter() = default;

    virtual const std::string& name() const noexcept = 0;
    virtual bool supports(const std::string& symbol) const = 0;
    // Throws domain::UnsupportedSymbolError.
    virtual std::string subscriptionToken(const std::string& symbol) const = 0;
    virtual std::string subscribeMessage(const std::string& symbol) = 0;
    virtual std::string unsubscribeMessage(const std::string& symbol) = 0;
    virtual DecodedFrame decode(const std::string& payload) const = 0;
    virtual std::unique_ptr<IFeedTransport> makeTransport() = 0;
};

}  // namespace phub::feed
