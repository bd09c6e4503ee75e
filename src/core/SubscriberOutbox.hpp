#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "domain/Types.hpp"

namespace phub::core {

// Per-subscriber delivery queue. Ticks are handed to the sink in order, one at a time; the next
// tick is started only once the sink reports completion. A queue that stays above its threshold
// for longer than the stall timeout is closed and reported through closeForBackpressure.
//
// Threads: deliver() starts on the dispatch pool and must not block; a sink that finishes later
// calls `done` from any thread. Stall timers run on the timer context, so sinks that never
// complete cannot hold them up.
class SubscriberOutbox : public std::enable_shared_from_this<SubscriberOutbox> {
public:
    using Clock = std::chrono::steady_clock;
    using Executor = boost::asio::thread_pool::executor_type;
    // Call exactly once per delivery; later calls are ignored.
    using Completion = std::function<void()>;
    using DeliverFn = std::function<void(const domain::PriceTick&, Completion done)>;

    struct Config {
        std::size_t maxMessages = 500;
        std::chrono::milliseconds stallTimeout{20000};
    };

    struct Callbacks {
        DeliverFn deliver;
        // Runs on the dispatch pool.
        std::function<void()> closeForBackpressure;
    };

    SubscriberOutbox(domain::SubscriberId id,
                     const Config& config,
                     Callbacks callbacks,
                     Executor executor,
                     boost::asio::io_context& timers);

    SubscriberOutbox(const SubscriberOutbox&) = delete;
    SubscriberOutbox& operator=(const SubscriberOutbox&) = delete;

    void enqueue(const domain::PriceTick& tick);
    // Drops pending ticks and stops delivery. Idempotent.
    void shutdown();

    const domain::SubscriberId& id() const noexcept { return id_; }
    std::size_t queuedMessages() const;
    bool closed() const;

private:
    struct Delivery;

    void startWrite_();
    void onWriteComplete_();
    void armStallTimer_(std::uint64_t generation, Clock::time_point deadline);
    void onStallTimer_(std::uint64_t generation);
    bool aboveThresholdLocked_() const;
    // Returns true when the stall timer was armed by this call.
    bool updateStallTimerLocked_(const Clock::time_point& now);
    void logQueueLocked_(const char* reason, const Clock::time_point& now);

    const domain::SubscriberId id_;
    const Config config_;
    Callbacks callbacks_;
    Executor executor_;
    boost::asio::io_context& timers_;
    // Touched only on the timer context.
    boost::asio::steady_timer stallTimer_;

    mutable std::mutex mutex_;
    std::deque<domain::PriceTick> queue_;
    bool writeInProgress_ = false;
    bool closed_ = false;

    // Stall timer state
    bool stallArmed_ = false;
    std::uint64_t stallGeneration_ = 0;
    Clock::time_point stallDeadline_{};

    // Logging throttling
    Clock::time_point lastLogTime_{};
    std::size_t lastLoggedMessages_ = 0;
};

}  // namespace phub::core
