#include "core/SubscriberOutbox.hpp"

#include <atomic>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace phub::core {
namespace {
constexpr std::chrono::seconds kLogInterval{1};
// Synchronously completed deliveries per pool task before yielding to other subscribers.
constexpr std::size_t kDrainBatch = 64;
// Beyond maxMessages * kHardLimitFactor the oldest tick is dropped.
constexpr std::size_t kHardLimitFactor = 4;

using Metrics = common::metrics::Registry;
}  // namespace

// Tells a completion that fired inside deliver() apart from one that fired after it returned.
struct SubscriberOutbox::Delivery {
    enum State : int {
        InCall = 0,
        DoneInCall = 1,
        Returned = 2,
        DoneAfterReturn = 3,
    };

    std::atomic<int> state{InCall};
};

SubscriberOutbox::SubscriberOutbox(domain::SubscriberId id,
                                   const Config& config,
                                   Callbacks callbacks,
                                   Executor executor,
                                   boost::asio::io_context& timers)
    : id_(std::move(id)),
      config_(config),
      callbacks_(std::move(callbacks)),
      executor_(executor),
      timers_(timers),
      stallTimer_(timers) {}

void SubscriberOutbox::enqueue(const domain::PriceTick& tick) {
    const auto now = Clock::now();
    bool startWrite = false;
    bool armTimer = false;
    std::uint64_t generation = 0;
    Clock::time_point deadline{};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        if (config_.maxMessages > 0 && queue_.size() >= config_.maxMessages * kHardLimitFactor) {
            queue_.pop_front();
            Metrics::instance().incrementCounter("deliveries_dropped_total");
        }
        queue_.push_back(tick);

        armTimer = updateStallTimerLocked_(now);
        generation = stallGeneration_;
        deadline = stallDeadline_;
        logQueueLocked_("enqueue", now);

        if (!writeInProgress_) {
            writeInProgress_ = true;
            startWrite = true;
        }
    }

    if (armTimer) {
        armStallTimer_(generation, deadline);
    }
    if (startWrite) {
        boost::asio::post(executor_, [self = shared_from_this()]() { self->startWrite_(); });
    }
}

void SubscriberOutbox::startWrite_() {
    for (std::size_t started = 0; started < kDrainBatch; ++started) {
        domain::PriceTick tick;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.empty()) {
                writeInProgress_ = false;
                return;
            }
            tick = std::move(queue_.front());
            queue_.pop_front();
            updateStallTimerLocked_(Clock::now());
        }

        auto delivery = std::make_shared<Delivery>();
        Completion done = [self = shared_from_this(), delivery]() {
            int expected = Delivery::InCall;
            if (delivery->state.compare_exchange_strong(expected, Delivery::DoneInCall)) {
                return;
            }
            if (expected == Delivery::Returned &&
                delivery->state.compare_exchange_strong(expected, Delivery::DoneAfterReturn)) {
                self->onWriteComplete_();
            }
        };

        try {
            if (callbacks_.deliver) {
                callbacks_.deliver(tick, done);
            } else {
                done();
            }
        } catch (const std::exception& ex) {
            Metrics::instance().incrementCounter("delivery_failures_total");
            LOG_WARN("Delivery of " << tick.symbol << " to " << id_ << " failed: " << ex.what());
            done();
        }

        int expected = Delivery::InCall;
        if (delivery->state.compare_exchange_strong(expected, Delivery::Returned)) {
            // The sink completes later; onWriteComplete_ resumes the queue.
            return;
        }
        Metrics::instance().incrementCounter("ticks_dispatched_total");
    }

    boost::asio::post(executor_, [self = shared_from_this()]() { self->startWrite_(); });
}

void SubscriberOutbox::onWriteComplete_() {
    Metrics::instance().incrementCounter("ticks_dispatched_total");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            writeInProgress_ = false;
            return;
        }
        logQueueLocked_("drain", Clock::now());
    }
    boost::asio::post(executor_, [self = shared_from_this()]() { self->startWrite_(); });
}

void SubscriberOutbox::armStallTimer_(std::uint64_t generation, Clock::time_point deadline) {
    boost::asio::post(timers_, [self = shared_from_this(), generation, deadline]() {
        self->stallTimer_.expires_at(deadline);
        self->stallTimer_.async_wait([self, generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            self->onStallTimer_(generation);
        });
    });
}

void SubscriberOutbox::onStallTimer_(std::uint64_t generation) {
    std::function<void()> closeCb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !stallArmed_ || generation != stallGeneration_) {
            return;
        }
        stallArmed_ = false;
        if (!aboveThresholdLocked_()) {
            return;
        }

        closed_ = true;
        Metrics::instance().incrementCounter("deliveries_dropped_total", queue_.size());
        queue_.clear();
        LOG_WARN("Subscriber " << id_ << " outbox stalled for " << config_.stallTimeout.count()
                               << " ms; closing for backpressure");
        closeCb = callbacks_.closeForBackpressure;
    }
    if (closeCb) {
        // The close cascade may tear down upstream feeds; keep it off the timer thread.
        boost::asio::post(executor_, std::move(closeCb));
    }
}

void SubscriberOutbox::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        stallArmed_ = false;
        ++stallGeneration_;
        queue_.clear();
    }
    boost::asio::post(timers_, [self = shared_from_this()]() { self->stallTimer_.cancel(); });
}

std::size_t SubscriberOutbox::queuedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SubscriberOutbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool SubscriberOutbox::aboveThresholdLocked_() const {
    return config_.maxMessages > 0 && queue_.size() > config_.maxMessages;
}

bool SubscriberOutbox::updateStallTimerLocked_(const Clock::time_point& now) {
    if (aboveThresholdLocked_()) {
        if (!stallArmed_) {
            stallArmed_ = true;
            ++stallGeneration_;
            stallDeadline_ = now + config_.stallTimeout;
            return true;
        }
    } else if (stallArmed_) {
        stallArmed_ = false;
        ++stallGeneration_;
    }
    return false;
}

void SubscriberOutbox::logQueueLocked_(const char* reason, const Clock::time_point& now) {
    if (now - lastLogTime_ < kLogInterval && queue_.size() == lastLoggedMessages_) {
        return;
    }
    lastLogTime_ = now;
    lastLoggedMessages_ = queue_.size();
    LOG_DEBUG("outbox subscriber=" << id_ << " reason=" << reason << " queued_msgs=" << lastLoggedMessages_
                                   << " write_in_progress=" << (writeInProgress_ ? 1 : 0));
}

}  // namespace phub::core
