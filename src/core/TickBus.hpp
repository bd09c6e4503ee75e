#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Types.hpp"

namespace phub::core {

// In-process fan-in point for normalized ticks. Connectors publish; the cache and the
// broadcast dispatcher listen. Handlers run on the publishing thread, in subscription order,
// after every "all symbols" handler.
class TickBus {
public:
    using Handler = std::function<void(const domain::PriceTick&)>;

    class Subscription {
    public:
        Subscription() = default;
        Subscription(TickBus* bus, std::string topic, std::size_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const noexcept { return bus_ != nullptr; }

    private:
        TickBus* bus_{nullptr};
        std::string topic_;
        std::size_t id_{0};
    };

    TickBus() = default;
    TickBus(const TickBus&) = delete;
    TickBus& operator=(const TickBus&) = delete;

    Subscription subscribeAll(Handler handler);
    Subscription subscribe(const std::string& symbol, Handler handler);

    // A throwing handler is logged and skipped; the remaining handlers still run.
    void publish(const domain::PriceTick& tick) const;

    std::size_t handlerCount() const;

private:
    struct HandlerData {
        std::size_t id{};
        std::shared_ptr<const Handler> handler;
    };

    void unsubscribe_(const std::string& topic, std::size_t id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<HandlerData>> topics_;
    std::size_t nextId_{1};
};

}  // namespace phub::core
