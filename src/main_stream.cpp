#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "app/FeedRuntime.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

std::string formatPrice(const phub::domain::PriceTick& tick) {
    if (!tick.valueText.empty()) {
        return tick.valueText;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(8) << tick.value;
    return oss.str();
}

void printInstruments(const phub::app::PriceQueryService& query) {
    for (const auto& instrument : query.instruments()) {
        std::printf("%-8s %-8s %s\n", instrument.symbol.c_str(), phub::domain::toString(instrument.type),
                    instrument.name.c_str());
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = phub::common::Config::fromArgs(argc, argv);
        phub::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << phub::log::levelToString(config.logLevel));
        LOG_INFO("  Symbols: " << joinList(config.symbols));
        LOG_INFO("  Subscribers per symbol: " << config.subscribers);
        LOG_INFO("  Cold read timeout: " << config.coldReadTimeoutMs << " ms");
        LOG_INFO("  Retry: " << config.retryBackoff << " delay=" << config.retryDelayMs
                 << " ms max_attempts=" << config.retryMaxAttempts);
        LOG_INFO("  Outbox max msgs: " << config.outboxMaxMessages
                 << " stall timeout: " << config.outboxStallTimeoutMs << " ms");
        LOG_INFO("  Binance endpoint: " << config.binanceHost << ":" << config.binancePort);

        phub::app::FeedRuntime runtime(config);

        if (config.listInstruments) {
            printInstruments(runtime.query());
        }

        if (!config.querySymbol.empty()) {
            const auto result = runtime.query().currentPrice(config.querySymbol);
            if (result.status == phub::app::QueryStatus::Ok && result.price) {
                LOG_INFO("Current price " << result.price->symbol << " = " << formatPrice(*result.price)
                         << " (observed " << phub::domain::toEpochMs(result.price->observedAt) << ")");
            } else {
                LOG_WARN("Query " << config.querySymbol << ": " << phub::app::toString(result.status)
                         << (result.message.empty() ? "" : " - " + result.message));
            }
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::atomic<std::uint64_t> delivered{0};
        std::vector<std::string> subscribers;
        for (std::size_t i = 0; i < config.subscribers; ++i) {
            const auto id = "console-" + std::to_string(i + 1);
            phub::app::PriceHub::SubscriberSink sink;
            sink.onPrice = [id, &delivered](const phub::domain::PriceTick& tick, std::function<void()> done) {
                delivered.fetch_add(1);
                LOG_INFO("[" << id << "] " << tick.symbol << " " << formatPrice(tick));
                done();
            };
            sink.onClosed = [id](const std::string& reason) { LOG_WARN("[" << id << "] closed: " << reason); };
            runtime.hub().connect(id, std::move(sink));
            subscribers.push_back(id);

            for (const auto& symbol : config.symbols) {
                const auto reply = runtime.hub().subscribe(id, symbol);
                if (!reply.ok) {
                    LOG_WARN("[" << id << "] " << reply.message);
                }
            }
        }

        LOG_INFO("Streaming. Press Ctrl+C to stop.");
        const auto started = std::chrono::steady_clock::now();
        const auto duration = std::chrono::seconds(config.durationSec);
        while (gSignalStatus == 0) {
            if (config.durationSec > 0 && std::chrono::steady_clock::now() - started >= duration) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (gSignalStatus != 0) {
            LOG_INFO("Signal " << gSignalStatus << " received, stopping");
        }
        LOG_INFO("Starting graceful shutdown");

        for (const auto& id : subscribers) {
            runtime.hub().disconnect(id);
        }
        runtime.query().releaseAll();

        const auto leftover = runtime.pool().activeSymbols();
        if (!leftover.empty()) {
            LOG_ERR("Upstream feeds still referenced after shutdown: " << joinList(leftover));
        }
        runtime.shutdown();

        const auto snapshot = phub::common::metrics::Registry::instance().snapshot();
        LOG_INFO("Delivered " << delivered.load() << " tick(s); upstream connects="
                 << snapshot.counter("upstream_connects_total")
                 << " ticks_received=" << snapshot.counter("ticks_received_total")
                 << " frames_dropped=" << snapshot.counter("frames_dropped_total"));
        return leftover.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}
