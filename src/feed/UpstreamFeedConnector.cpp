#include "feed/UpstreamFeedConnector.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace phub::feed {
namespace {
using domain::ConnectorStatus;
using Metrics = common::metrics::Registry;

std::int64_t nowMs() { return domain::toEpochMs(domain::Clock::now()); }
}  // namespace

UpstreamFeedConnector::UpstreamFeedConnector(std::string symbol,
                                             std::shared_ptr<IVendorAdapter> adapter,
                                             std::unique_ptr<IFeedTransport> transport,
                                             TickHandler onTick,
                                             RetryPolicy policy)
    : symbol_(domain::normalizeSymbol(symbol)),
      adapter_(std::move(adapter)),
      transport_(std::move(transport)),
      onTick_(std::move(onTick)),
      policy_(policy) {
    if (!adapter_ || !transport_) {
        throw std::invalid_argument("UpstreamFeedConnector requires an adapter and a transport");
    }
}

UpstreamFeedConnector::~UpstreamFeedConnector() { disconnect(); }

void UpstreamFeedConnector::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (status_.load() != ConnectorStatus::Disconnected) {
        return;
    }

    // A loop that ended on its own (close frame, exhausted retries) is still joinable.
    stopReceiver_();
    stopRequested_.store(false);
    failed_.store(false);
    setStatus_(ConnectorStatus::Connecting);

    try {
        Metrics::ScopedTimer timer("upstream_connect");
        std::lock_guard<std::mutex> io(ioMutex_);
        transport_->open();
    } catch (const std::exception& ex) {
        setStatus_(ConnectorStatus::Disconnected);
        Metrics::instance().incrementCounter("upstream_connect_failures_total");
        LOG_WARN("Upstream connect failed for " << symbol_ << " via " << adapter_->name() << ": " << ex.what());
        throw domain::ConnectFailureError("Failed to connect upstream feed for " + symbol_ + ": " + ex.what());
    }

    Metrics::instance().incrementCounter("upstream_connects_total");
    lastActivityMs_.store(nowMs());
    setStatus_(ConnectorStatus::Connected);
    receiver_ = std::thread(&UpstreamFeedConnector::receiveLoop_, this);
    LOG_INFO("Upstream feed connected for " << symbol_ << " via " << adapter_->name());
}

void UpstreamFeedConnector::disconnect() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    stopReceiver_();
    const auto previous = setStatus_(ConnectorStatus::Disconnected);
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        subscriptions_.clear();
    }
    if (previous != ConnectorStatus::Disconnected) {
        LOG_INFO("Upstream feed disconnected for " << symbol_);
    }
}

void UpstreamFeedConnector::stopReceiver_() noexcept {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_.store(true);
    }
    stopCv_.notify_all();
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        transport_->close();
    }
    if (receiver_.joinable()) {
        receiver_.join();
    }
}

void UpstreamFeedConnector::sendSubscribe(const std::string& symbol) {
    const auto normalized = domain::normalizeSymbol(symbol);
    if (!adapter_->supports(normalized)) {
        throw domain::UnsupportedSymbolError(normalized);
    }

    std::lock_guard<std::mutex> io(ioMutex_);
    if (status_.load() != ConnectorStatus::Connected || !transport_->isOpen()) {
        throw domain::ConnectionUnavailableError("Upstream feed for " + symbol_ + " is not connected");
    }
    try {
        transport_->write(adapter_->subscribeMessage(normalized));
    } catch (const domain::FeedError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::ConnectionUnavailableError("Failed to send subscribe for " + normalized + ": " + ex.what());
    }
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        subscriptions_.insert(normalized);
    }
    LOG_INFO("Subscribed upstream " << adapter_->name() << " stream for " << normalized);
}

void UpstreamFeedConnector::sendUnsubscribe(const std::string& symbol) {
    const auto normalized = domain::normalizeSymbol(symbol);
    if (!adapter_->supports(normalized)) {
        throw domain::UnsupportedSymbolError(normalized);
    }

    std::lock_guard<std::mutex> io(ioMutex_);
    {
        std::lock_guard<std::mutex> lock(subscriptionsMutex_);
        subscriptions_.erase(normalized);
    }
    if (status_.load() != ConnectorStatus::Connected || !transport_->isOpen()) {
        throw domain::ConnectionUnavailableError("Upstream feed for " + symbol_ + " is not connected");
    }
    try {
        transport_->write(adapter_->unsubscribeMessage(normalized));
    } catch (const domain::FeedError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::ConnectionUnavailableError("Failed to send unsubscribe for " + normalized + ": " + ex.what());
    }
    LOG_INFO("Unsubscribed upstream " << adapter_->name() << " stream for " << normalized);
}

domain::TimePoint UpstreamFeedConnector::lastActivity() const noexcept {
    return domain::fromEpochMs(lastActivityMs_.load());
}

void UpstreamFeedConnector::receiveLoop_() {
    LOG_DEBUG("Receive loop started for " << symbol_);
    std::string payload;
    while (!stopRequested_.load()) {
        IFeedTransport::ReadResult result = IFeedTransport::ReadResult::Closed;
        try {
            result = transport_->read(payload);
        } catch (const std::exception& ex) {
            if (stopRequested_.load()) {
                break;
            }
            LOG_WARN("Upstream read failed for " << symbol_ << ": " << ex.what());
            setStatus_(ConnectorStatus::Connecting);
            if (!recover_()) {
                break;
            }
            continue;
        }

        if (stopRequested_.load()) {
            break;
        }
        if (result == IFeedTransport::ReadResult::Closed) {
            // Terminal for this session; the pool restarts it on the next acquire.
            LOG_WARN("Upstream feed for " << symbol_ << " closed by " << adapter_->name());
            setStatus_(ConnectorStatus::Disconnected);
            std::lock_guard<std::mutex> io(ioMutex_);
            transport_->close();
            break;
        }

        lastActivityMs_.store(nowMs());
        handleFrame_(payload);
    }
    LOG_DEBUG("Receive loop stopped for " << symbol_);
}

void UpstreamFeedConnector::handleFrame_(const std::string& payload) {
    DecodedFrame frame;
    try {
        frame = adapter_->decode(payload);
    } catch (const std::exception& ex) {
        frame = DecodedFrame::makeMalformed(ex.what());
    }

    switch (frame.kind) {
        case DecodedFrame::Kind::Control:
            LOG_DEBUG("Control frame on " << symbol_ << ": " << frame.reason);
            return;
        case DecodedFrame::Kind::Malformed:
            Metrics::instance().incrementCounter("frames_dropped_total");
            LOG_WARN("Dropped frame on " << symbol_ << " (" << frame.reason << "): " << payload.substr(0, 256));
            return;
        case DecodedFrame::Kind::Tick:
            break;
    }

    if (!frame.tick || !isSubscribed_(frame.tick->symbol)) {
        Metrics::instance().incrementCounter("frames_dropped_total");
        LOG_DEBUG("Dropped tick for unsubscribed symbol on " << symbol_);
        return;
    }

    Metrics::instance().incrementCounter("ticks_received_total");
    if (!onTick_) {
        return;
    }
    try {
        onTick_(*frame.tick);
    } catch (const std::exception& ex) {
        LOG_WARN("Tick handler failed for " << frame.tick->symbol << ": " << ex.what());
    }
}

bool UpstreamFeedConnector::recover_() {
    for (std::uint32_t attempt = 1;; ++attempt) {
        if (policy_.exhausted(attempt)) {
            LOG_ERR("Upstream feed for " << symbol_ << " gave up after " << policy_.maxAttempts
                                         << " reconnect attempts");
            failed_.store(true);
            setStatus_(ConnectorStatus::Disconnected);
            std::lock_guard<std::mutex> io(ioMutex_);
            transport_->close();
            return false;
        }

        const auto delay = policy_.delayFor(attempt);
        Metrics::instance().incrementCounter("reconnect_attempts_total");
        LOG_INFO("Reconnecting upstream feed for " << symbol_ << " in " << delay.count()
                                                   << " ms (attempt " << attempt << ")");
        {
            std::unique_lock<std::mutex> lock(stopMutex_);
            if (stopCv_.wait_for(lock, delay, [this]() { return stopRequested_.load(); })) {
                return false;
            }
        }

        try {
            std::lock_guard<std::mutex> io(ioMutex_);
            if (stopRequested_.load()) {
                return false;
            }
            transport_->close();
            transport_->open();
            std::vector<std::string> active;
            {
                std::lock_guard<std::mutex> lock(subscriptionsMutex_);
                active.assign(subscriptions_.begin(), subscriptions_.end());
            }
            for (const auto& subscribed : active) {
                transport_->write(adapter_->subscribeMessage(subscribed));
            }
        } catch (const std::exception& ex) {
            LOG_WARN("Reconnect attempt " << attempt << " for " << symbol_ << " failed: " << ex.what());
            continue;
        }

        Metrics::instance().incrementCounter("upstream_connects_total");
        lastActivityMs_.store(nowMs());
        setStatus_(ConnectorStatus::Connected);
        LOG_INFO("Upstream feed for " << symbol_ << " recovered after " << attempt << " attempt(s)");
        return true;
    }
}

ConnectorStatus UpstreamFeedConnector::setStatus_(ConnectorStatus next) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    const auto previous = status_.exchange(next);
    if (previous != next) {
        LOG_DEBUG("Upstream feed " << symbol_ << " status " << domain::toString(previous) << " -> "
                                   << domain::toString(next));
    }
    return previous;
}

bool UpstreamFeedConnector::isSubscribed_(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(subscriptionsMutex_);
    return subscriptions_.count(symbol) != 0U;
}

}  // namespace phub::feed
