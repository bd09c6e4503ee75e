#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "domain/Types.hpp"

namespace phub::core {

class PriceCache;

// Handle to a one-shot wait for the next tick of a symbol. The wait completes exactly once:
// with a tick, with TimeoutError, or with CancelledError.
class PendingPrice {
public:
    PendingPrice() = default;
    ~PendingPrice();

    PendingPrice(PendingPrice&&) noexcept = default;
    PendingPrice& operator=(PendingPrice&& other) noexcept;
    PendingPrice(const PendingPrice&) = delete;
    PendingPrice& operator=(const PendingPrice&) = delete;

    // Blocks until the wait completes. Throws domain::TimeoutError or domain::CancelledError.
    domain::PriceTick get();
    bool ready() const;
    bool valid() const noexcept { return future_.valid(); }
    // No-op once the wait completed.
    void cancel();

private:
    friend class PriceCache;

    struct Waiter;

    PendingPrice(PriceCache* cache, std::shared_ptr<Waiter> waiter, std::future<domain::PriceTick> future);

    PriceCache* cache_{nullptr};
    std::shared_ptr<Waiter> waiter_;
    std::future<domain::PriceTick> future_;
};

// Latest tick per symbol, last write wins.
class PriceCache {
public:
    explicit PriceCache(boost::asio::io_context& timers);
    ~PriceCache();

    PriceCache(const PriceCache&) = delete;
    PriceCache& operator=(const PriceCache&) = delete;

    std::optional<domain::PriceTick> get(const std::string& symbol) const;

    // Stores the tick and completes every waiter registered for its symbol.
    void onTick(const domain::PriceTick& tick);

    // Registers a waiter and checks the cache under the same lock: when a tick is already
    // cached the returned handle is complete. The timeout runs on the timer context.
    PendingPrice awaitNext(const std::string& symbol, std::chrono::milliseconds timeout);

    std::size_t pendingWaiters(const std::string& symbol) const;

    // Completes every outstanding waiter with CancelledError.
    void cancelAll();

private:
    friend class PendingPrice;

    using Waiter = PendingPrice::Waiter;

    void deregister_(const std::shared_ptr<Waiter>& waiter);
    void armTimer_(const std::shared_ptr<Waiter>& waiter);

    boost::asio::io_context& timers_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::PriceTick> prices_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<Waiter>>> waiters_;
};

struct PendingPrice::Waiter {
    explicit Waiter(boost::asio::io_context& ioc) : timer(ioc) {}

    // Returns false when the waiter already completed.
    bool complete(const domain::PriceTick& tick);
    bool fail(std::exception_ptr error);

    std::string symbol;
    std::chrono::steady_clock::time_point deadline{};
    std::promise<domain::PriceTick> promise;
    std::atomic<bool> done{false};
    // Touched only on the timer context.
    boost::asio::steady_timer timer;
};

}  // namespace phub::core
