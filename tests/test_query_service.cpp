#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/FeedRuntime.hpp"
#include "common/Config.hpp"
#include "support/ScriptedFeed.hpp"
#include "support/TestUtil.hpp"

using phub::app::QueryStatus;
using phub::test::ScriptedAdapter;
using phub::test::tickFrame;
using phub::test::waitForCondition;

namespace {
using namespace std::chrono_literals;

bool subscribedOn(const std::shared_ptr<ScriptedAdapter>& adapter, std::size_t index, const std::string& message) {
    const auto state = adapter->transport(index);
    if (!state) {
        return false;
    }
    const auto writes = state->writes();
    return std::find(writes.begin(), writes.end(), message) != writes.end();
}

}  // namespace

int main() {
    phub::common::Config config;
    config.coldReadTimeoutMs = 200;

    auto adapter = std::make_shared<ScriptedAdapter>(std::set<std::string>{"BTCUSD", "ETHUSD", "SOLUSD"});
    auto factory = std::make_shared<phub::feed::AdapterConnectorFactory>(
        std::vector<std::shared_ptr<phub::feed::IVendorAdapter>>{adapter});
    phub::app::FeedRuntime runtime(config, nullptr, factory);
    auto& query = runtime.query();

    if (query.instruments().size() != runtime.catalog().all().size() || query.instruments().empty()) {
        std::cerr << "instruments() should list the catalog\n";
        return 1;
    }

    for (const auto* blank : {"", "   "}) {
        const auto result = query.currentPrice(blank);
        if (result.status != QueryStatus::BadRequest || result.message != "Symbol is required") {
            std::cerr << "Blank symbol should be a bad request\n";
            return 1;
        }
    }

    {
        const auto result = query.currentPrice("EURUSD");
        if (result.status != QueryStatus::NotSupported || adapter->transportsCreated() != 0U) {
            std::cerr << "Unsupported symbol should be reported without opening a feed\n";
            return 1;
        }
    }

    {
        const auto started = std::chrono::steady_clock::now();
        const auto result = query.currentPrice("ETHUSD");
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (result.status != QueryStatus::NotFound || result.price) {
            std::cerr << "Silent feed should yield NotFound, got " << phub::app::toString(result.status) << "\n";
            return 1;
        }
        if (elapsed < 200ms) {
            std::cerr << "NotFound returned before the cold read timeout\n";
            return 1;
        }
        if (query.warmSymbols() != std::vector<std::string>{"ETHUSD"} || runtime.pool().refCount("ETHUSD") != 1U) {
            std::cerr << "Cold read should keep the ETHUSD feed warm\n";
            return 1;
        }
    }

    {
        auto pending = std::async(std::launch::async, [&]() { return query.currentPrice("btcusd"); });
        if (!waitForCondition([&]() { return subscribedOn(adapter, 1, "SUB btcusd"); }, 1s)) {
            std::cerr << "Cold read should start the BTCUSD feed\n";
            return 1;
        }
        adapter->transport(1)->pushFrame(tickFrame("BTCUSD", 43000.25, 1700000001000));
        if (pending.wait_for(1s) != std::future_status::ready) {
            std::cerr << "Cold read should complete on the first tick\n";
            return 1;
        }
        const auto result = pending.get();
        if (result.status != QueryStatus::Ok || !result.price || result.price->value != 43000.25 ||
            result.price->symbol != "BTCUSD") {
            std::cerr << "Cold read returned the wrong price\n";
            return 1;
        }

        const auto cached = query.currentPrice("BTCUSD");
        if (cached.status != QueryStatus::Ok || cached.price->value != 43000.25 || adapter->transportsCreated() != 2U) {
            std::cerr << "Second read should be served from the cache\n";
            return 1;
        }
    }

    {
        adapter->failOpens(1);
        const auto result = query.currentPrice("SOLUSD");
        if (result.status != QueryStatus::Unavailable || runtime.pool().refCount("SOLUSD") != 0U) {
            std::cerr << "Connect failure should yield Unavailable without a reference\n";
            return 1;
        }
        const auto warm = query.warmSymbols();
        if (std::find(warm.begin(), warm.end(), "SOLUSD") != warm.end()) {
            std::cerr << "Failed cold read must not stay warm\n";
            return 1;
        }
    }

    query.releaseAll();
    if (!runtime.pool().activeSymbols().empty() || !query.warmSymbols().empty()) {
        std::cerr << "releaseAll should drop every warm feed\n";
        return 1;
    }

    runtime.shutdown();
    runtime.shutdown();
    return 0;
}
