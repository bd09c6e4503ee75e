#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/TickBus.hpp"
#include "support/TestUtil.hpp"

using phub::core::TickBus;
using phub::test::makeTick;

int main() {
    {
        TickBus bus;
        std::vector<std::string> calls;
        auto first = bus.subscribeAll([&](const phub::domain::PriceTick&) { calls.push_back("first"); });
        auto btcOnly = bus.subscribe("btcusd", [&](const phub::domain::PriceTick&) { calls.push_back("btc"); });
        auto second = bus.subscribeAll([&](const phub::domain::PriceTick&) { calls.push_back("second"); });

        bus.publish(makeTick("BTCUSD", 1.0));
        const std::vector<std::string> expected{"first", "second", "btc"};
        if (calls != expected) {
            std::cerr << "Handlers should run all-symbol handlers first, in subscription order\n";
            return 1;
        }

        calls.clear();
        bus.publish(makeTick("ETHUSD", 1.0));
        if (calls.size() != 2U) {
            std::cerr << "Symbol handler must only see its own symbol\n";
            return 1;
        }
    }

    {
        TickBus bus;
        int delivered = 0;
        {
            auto subscription = bus.subscribeAll([&](const phub::domain::PriceTick&) { ++delivered; });
            bus.publish(makeTick("BTCUSD", 1.0));
        }
        bus.publish(makeTick("BTCUSD", 2.0));
        if (delivered != 1 || bus.handlerCount() != 0U) {
            std::cerr << "Destroying the subscription should unsubscribe\n";
            return 1;
        }
    }

    {
        TickBus bus;
        int delivered = 0;
        auto failing = bus.subscribeAll([](const phub::domain::PriceTick&) { throw std::runtime_error("boom"); });
        auto counting = bus.subscribeAll([&](const phub::domain::PriceTick&) { ++delivered; });
        bus.publish(makeTick("BTCUSD", 1.0));
        if (delivered != 1) {
            std::cerr << "A throwing handler must not stop the others\n";
            return 1;
        }

        TickBus::Subscription moved = std::move(counting);
        if (counting.active() || !moved.active()) {
            std::cerr << "Moving a subscription should transfer ownership\n";
            return 1;
        }
        moved.reset();
        bus.publish(makeTick("BTCUSD", 2.0));
        if (delivered != 1) {
            std::cerr << "reset() should unsubscribe\n";
            return 1;
        }
    }

    return 0;
}
