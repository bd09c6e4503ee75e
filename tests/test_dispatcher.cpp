#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/BroadcastDispatcher.hpp"
#include "core/SubscriptionRegistry.hpp"
#include "core/TickBus.hpp"
#include "core/TimerService.hpp"
#include "feed/ConnectorFactory.hpp"
#include "feed/FeedConnectionPool.hpp"
#include "support/ScriptedFeed.hpp"
#include "support/TestUtil.hpp"

using phub::core::BroadcastDispatcher;
using phub::test::makeTick;
using phub::test::waitForCondition;

namespace {
using namespace std::chrono_literals;

class Recorder {
public:
    BroadcastDispatcher::DeliverFn sink() {
        return [this](const phub::domain::PriceTick& tick, BroadcastDispatcher::Completion done) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                values_.push_back(tick.value);
            }
            done();
        };
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

    std::vector<double> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> values_;
};

// Sink that accepts ticks but never reports completion until released.
class Stalled {
public:
    BroadcastDispatcher::DeliverFn sink() {
        return [this](const phub::domain::PriceTick&, BroadcastDispatcher::Completion done) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++started_;
            held_.push_back(std::move(done));
        };
    }

    std::size_t started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    void release() {
        std::vector<BroadcastDispatcher::Completion> held;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held.swap(held_);
        }
        for (auto& done : held) {
            done();
        }
    }

private:
    mutable std::mutex mutex_;
    std::size_t started_ = 0;
    std::vector<BroadcastDispatcher::Completion> held_;
};

class CloseLog {
public:
    BroadcastDispatcher::ClosedFn callback() {
        return [this](const phub::domain::SubscriberId& id, const std::string& reason) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(id + ":" + reason);
        };
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

struct Fixture {
    explicit Fixture(BroadcastDispatcher::Options options) : dispatcher(registry, bus, timers.context(), options) {}

    phub::core::TimerService timers;
    std::shared_ptr<phub::test::ScriptedAdapter> adapter =
        std::make_shared<phub::test::ScriptedAdapter>(std::set<std::string>{"BTCUSD", "ETHUSD"});
    phub::feed::FeedConnectionPool pool{std::make_shared<phub::feed::AdapterConnectorFactory>(
                                            std::vector<std::shared_ptr<phub::feed::IVendorAdapter>>{adapter}),
                                        [](const phub::domain::PriceTick&) {}};
    phub::core::SubscriptionRegistry registry{pool};
    phub::core::TickBus bus;
    BroadcastDispatcher dispatcher;
};

BroadcastDispatcher::Options options(std::size_t threads) {
    BroadcastDispatcher::Options result;
    result.threads = threads;
    return result;
}

}  // namespace

int main() {
    {
        Fixture f(options(4));
        Recorder alice;
        Recorder bob;
        Recorder carol;
        f.dispatcher.attach("alice", alice.sink());
        f.dispatcher.attach("bob", bob.sink());
        f.dispatcher.attach("carol", carol.sink());
        f.dispatcher.attach("broken", [](const phub::domain::PriceTick&, BroadcastDispatcher::Completion) {
            throw std::runtime_error("sink gone");
        });
        f.registry.subscribe("alice", "BTCUSD");
        f.registry.subscribe("bob", "BTCUSD");
        f.registry.subscribe("broken", "BTCUSD");
        f.registry.subscribe("carol", "ETHUSD");

        f.bus.publish(makeTick("BTCUSD", 1.0));
        f.bus.publish(makeTick("BTCUSD", 2.0));
        if (!waitForCondition([&]() { return alice.count() == 2U && bob.count() == 2U; }, 1s)) {
            std::cerr << "BTCUSD subscribers should receive both ticks despite a failing peer\n";
            return 1;
        }
        if (alice.values() != std::vector<double>{1.0, 2.0}) {
            std::cerr << "Ticks should arrive in publish order\n";
            return 1;
        }
        if (carol.count() != 0U) {
            std::cerr << "ETHUSD subscriber must not receive BTCUSD ticks\n";
            return 1;
        }

        f.registry.unsubscribe("bob", "BTCUSD");
        f.dispatcher.detach("alice");
        f.bus.publish(makeTick("BTCUSD", 3.0));
        f.bus.publish(makeTick("ETHUSD", 4.0));
        if (!waitForCondition([&]() { return carol.count() == 1U; }, 1s)) {
            std::cerr << "ETHUSD subscriber should receive its tick\n";
            return 1;
        }
        std::this_thread::sleep_for(50ms);
        if (alice.count() != 2U || bob.count() != 2U) {
            std::cerr << "No delivery after detach or unsubscribe\n";
            return 1;
        }

        f.dispatcher.stop();
        f.registry.unsubscribeAll("alice");
        f.registry.unsubscribeAll("broken");
        f.registry.unsubscribeAll("carol");
    }

    {
        Fixture f(options(2));
        Stalled slow;
        Recorder fast;
        f.dispatcher.attach("slow", slow.sink());
        f.dispatcher.attach("fast", fast.sink());
        f.registry.subscribe("slow", "BTCUSD");
        f.registry.subscribe("fast", "BTCUSD");

        for (int i = 0; i < 5; ++i) {
            f.bus.publish(makeTick("BTCUSD", static_cast<double>(i)));
        }
        if (!waitForCondition([&]() { return fast.count() == 5U; }, 1s)) {
            std::cerr << "A slow subscriber must not hold up the others\n";
            return 1;
        }
        for (std::size_t expected = 1; expected <= 5; ++expected) {
            if (!waitForCondition([&]() { return slow.started() == expected; }, 1s)) {
                std::cerr << "Slow subscriber should get tick " << expected << " once the previous completes\n";
                return 1;
            }
            slow.release();
        }

        f.dispatcher.stop();
        f.registry.unsubscribeAll("slow");
        f.registry.unsubscribeAll("fast");
    }

    {
        auto opts = options(2);
        opts.outbox.maxMessages = 2;
        opts.outbox.stallTimeout = 50ms;
        Fixture f(opts);

        Stalled stuck;
        CloseLog closes;
        f.dispatcher.attach("stuck", stuck.sink(), closes.callback());
        f.registry.subscribe("stuck", "BTCUSD");

        for (int i = 0; i < 10; ++i) {
            f.bus.publish(makeTick("BTCUSD", static_cast<double>(i)));
        }
        if (!waitForCondition([&]() { return !closes.entries().empty(); }, 2s)) {
            std::cerr << "Stalled subscriber should be closed for backpressure\n";
            return 1;
        }
        if (closes.entries() != std::vector<std::string>{"stuck:backpressure"}) {
            std::cerr << "Expected a single backpressure close\n";
            return 1;
        }
        if (f.dispatcher.attachedCount() != 0U) {
            std::cerr << "Closed subscriber should be detached\n";
            return 1;
        }

        stuck.release();
        f.dispatcher.stop();
        f.registry.unsubscribeAll("stuck");
    }

    {
        // As many stalled subscribers as dispatch threads, plus one healthy one.
        auto opts = options(2);
        opts.outbox.maxMessages = 2;
        opts.outbox.stallTimeout = 50ms;
        Fixture f(opts);

        Stalled first;
        Stalled second;
        Recorder healthy;
        CloseLog closes;
        f.dispatcher.attach("stalled-1", first.sink(), closes.callback());
        f.dispatcher.attach("stalled-2", second.sink(), closes.callback());
        f.dispatcher.attach("healthy", healthy.sink(), closes.callback());
        f.registry.subscribe("stalled-1", "BTCUSD");
        f.registry.subscribe("stalled-2", "BTCUSD");
        f.registry.subscribe("healthy", "BTCUSD");

        for (int i = 0; i < 10; ++i) {
            f.bus.publish(makeTick("BTCUSD", static_cast<double>(i)));
        }
        if (!waitForCondition([&]() { return healthy.count() == 10U; }, 1s)) {
            std::cerr << "Healthy subscriber received " << healthy.count() << "/10 ticks\n";
            return 1;
        }
        if (!waitForCondition([&]() { return closes.entries().size() == 2U; }, 2s)) {
            std::cerr << "Both stalled subscribers should be closed for backpressure\n";
            return 1;
        }
        auto entries = closes.entries();
        std::sort(entries.begin(), entries.end());
        if (entries != std::vector<std::string>{"stalled-1:backpressure", "stalled-2:backpressure"}) {
            std::cerr << "Healthy subscriber must stay attached\n";
            return 1;
        }
        if (f.dispatcher.attachedCount() != 1U) {
            std::cerr << "Only the healthy subscriber should remain attached\n";
            return 1;
        }

        first.release();
        second.release();
        f.dispatcher.stop();
        f.registry.unsubscribeAll("stalled-1");
        f.registry.unsubscribeAll("stalled-2");
        f.registry.unsubscribeAll("healthy");
    }

    {
        // Ticks published before a subscription are not replayed to it.
        Fixture f(options(2));
        Recorder early;
        f.dispatcher.attach("early", early.sink());
        f.registry.subscribe("early", "BTCUSD");
        f.bus.publish(makeTick("BTCUSD", 1.0));
        if (!waitForCondition([&]() { return early.count() == 1U; }, 1s)) {
            std::cerr << "Existing subscriber should receive the first tick\n";
            return 1;
        }

        Recorder late;
        f.registry.subscribe("late", "BTCUSD");
        f.dispatcher.attach("late", late.sink());
        std::this_thread::sleep_for(50ms);
        if (late.count() != 0U) {
            std::cerr << "Late subscriber must not receive earlier ticks\n";
            return 1;
        }

        f.bus.publish(makeTick("BTCUSD", 2.0));
        if (!waitForCondition([&]() { return late.count() == 1U && early.count() == 2U; }, 1s)) {
            std::cerr << "Late subscriber should receive ticks published after it joined\n";
            return 1;
        }
        std::this_thread::sleep_for(20ms);
        if (late.values() != std::vector<double>{2.0}) {
            std::cerr << "Late subscriber should receive exactly the second tick\n";
            return 1;
        }

        f.dispatcher.stop();
        f.registry.unsubscribeAll("early");
        f.registry.unsubscribeAll("late");
    }

    return 0;
}
