#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "core/SubscriptionRegistry.hpp"
#include "domain/Errors.hpp"
#include "feed/ConnectorFactory.hpp"
#include "feed/FeedConnectionPool.hpp"
#include "support/ScriptedFeed.hpp"

using phub::core::SubscriptionRegistry;
using phub::feed::FeedConnectionPool;
using phub::test::ScriptedAdapter;

namespace {

struct Fixture {
    std::shared_ptr<ScriptedAdapter> adapter =
        std::make_shared<ScriptedAdapter>(std::set<std::string>{"BTCUSD", "ETHUSD", "SOLUSD"});
    FeedConnectionPool pool{std::make_shared<phub::feed::AdapterConnectorFactory>(
                                std::vector<std::shared_ptr<phub::feed::IVendorAdapter>>{adapter}),
                            [](const phub::domain::PriceTick&) {}};
    SubscriptionRegistry registry{pool};
};

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

int main() {
    {
        Fixture f;
        f.registry.subscribe("alice", "BTCUSD");
        f.registry.subscribe("bob", "btcusd");
        f.registry.subscribe("alice", "BTCUSD");

        if (f.pool.refCount("BTCUSD") != 1U || f.adapter->transportsCreated() != 1U) {
            std::cerr << "Two subscribers of one symbol should share one pool reference and one connection\n";
            return 1;
        }
        if (f.registry.subscribersOf("BTCUSD")->size() != 2U) {
            std::cerr << "Expected two subscribers of BTCUSD\n";
            return 1;
        }
        if (f.registry.symbolsOf("alice") != std::vector<std::string>{"BTCUSD"}) {
            std::cerr << "Duplicate subscribe should be a no-op\n";
            return 1;
        }

        f.registry.subscribe("alice", "ETHUSD");
        if (f.pool.refCount("ETHUSD") != 1U) {
            std::cerr << "First ETHUSD subscriber should acquire the feed\n";
            return 1;
        }

        if (!f.registry.unsubscribe("alice", "BTCUSD") || f.pool.refCount("BTCUSD") != 1U) {
            std::cerr << "BTCUSD must stay acquired while bob is subscribed\n";
            return 1;
        }
        if (f.registry.unsubscribe("alice", "BTCUSD")) {
            std::cerr << "Removing a missing relation should report false\n";
            return 1;
        }
        f.registry.unsubscribe("bob", "BTCUSD");
        if (f.pool.refCount("BTCUSD") != 0U || f.adapter->transport(0)->isOpen()) {
            std::cerr << "Last unsubscribe should release and close the BTCUSD feed\n";
            return 1;
        }

        const auto removed = f.registry.unsubscribeAll("alice");
        if (removed != std::vector<std::string>{"ETHUSD"} || !f.pool.activeSymbols().empty()) {
            std::cerr << "unsubscribeAll should drop every relation and release the feed\n";
            return 1;
        }
        if (!f.registry.symbolsOf("alice").empty() || !f.registry.subscribersOf("ETHUSD")->empty()) {
            std::cerr << "Indices should be empty after unsubscribeAll\n";
            return 1;
        }
    }

    {
        Fixture f;
        bool unsupported = false;
        try {
            f.registry.subscribe("alice", "EURUSD");
        } catch (const phub::domain::UnsupportedSymbolError&) {
            unsupported = true;
        }
        if (!unsupported || !f.registry.symbolsOf("alice").empty() || !f.registry.subscribersOf("EURUSD")->empty()) {
            std::cerr << "Unsupported subscribe should fail and leave no relation\n";
            return 1;
        }
        if (f.adapter->transportsCreated() != 0U) {
            std::cerr << "No connection may be opened for an unsupported symbol\n";
            return 1;
        }

        f.adapter->failOpens(1);
        bool connectFailed = false;
        try {
            f.registry.subscribe("alice", "BTCUSD");
        } catch (const phub::domain::ConnectFailureError&) {
            connectFailed = true;
        }
        if (!connectFailed || f.registry.isSubscribed("alice", "BTCUSD") || f.pool.refCount("BTCUSD") != 0U) {
            std::cerr << "Connect failure should roll back the relation and the reference\n";
            return 1;
        }

        f.registry.subscribe("alice", "BTCUSD");
        if (!f.registry.isSubscribed("alice", "BTCUSD") || f.pool.refCount("BTCUSD") != 1U) {
            std::cerr << "Subscribe after a failed attempt should succeed\n";
            return 1;
        }
        f.registry.unsubscribeAll("alice");
    }

    {
        Fixture f;
        const std::vector<std::string> symbols{"BTCUSD", "ETHUSD", "SOLUSD"};
        std::vector<std::thread> workers;
        for (int t = 0; t < 8; ++t) {
            workers.emplace_back([&, t]() {
                std::mt19937 rng(static_cast<unsigned>(t * 7919 + 1));
                std::uniform_int_distribution<int> pickSubscriber(0, 19);
                std::uniform_int_distribution<int> pickSymbol(0, 2);
                std::uniform_int_distribution<int> pickOp(0, 9);
                for (int i = 0; i < 300; ++i) {
                    const auto subscriber = "s" + std::to_string(pickSubscriber(rng));
                    const auto& symbol = symbols[static_cast<std::size_t>(pickSymbol(rng))];
                    const int op = pickOp(rng);
                    if (op < 5) {
                        f.registry.subscribe(subscriber, symbol);
                    } else if (op < 9) {
                        f.registry.unsubscribe(subscriber, symbol);
                    } else {
                        f.registry.unsubscribeAll(subscriber);
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (int s = 0; s < 20; ++s) {
            const auto subscriber = "s" + std::to_string(s);
            const auto owned = f.registry.symbolsOf(subscriber);
            for (const auto& symbol : symbols) {
                const bool inSubscriberIndex = contains(owned, symbol);
                const bool inSymbolIndex = f.registry.subscribersOf(symbol)->count(subscriber) != 0U;
                if (inSubscriberIndex != inSymbolIndex) {
                    std::cerr << "Index mismatch for " << subscriber << "/" << symbol << "\n";
                    return 1;
                }
            }
        }
        for (const auto& symbol : symbols) {
            const auto expected = f.registry.subscribersOf(symbol)->empty() ? 0U : 1U;
            if (f.pool.refCount(symbol) != expected) {
                std::cerr << "Pool reference for " << symbol << " is " << f.pool.refCount(symbol) << ", expected "
                          << expected << "\n";
                return 1;
            }
        }

        for (int s = 0; s < 20; ++s) {
            f.registry.unsubscribeAll("s" + std::to_string(s));
        }
        if (!f.pool.activeSymbols().empty()) {
            std::cerr << "All feeds should be released once every subscriber left\n";
            return 1;
        }
    }

    return 0;
}
