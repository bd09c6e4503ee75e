#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "feed/IFeedTransport.hpp"
#include "feed/IUpstreamFeedConnector.hpp"
#include "feed/IVendorAdapter.hpp"
#include "feed/RetryPolicy.hpp"

namespace phub::feed {

// Vendor independent connector: drives an IFeedTransport from a dedicated receive thread,
// decodes frames through the adapter and hands ticks to the handler. Recovers a broken link
// according to the retry policy, re-sending the active vendor subscriptions. A close from the
// peer ends the loop and leaves the connector Disconnected without marking it failed.
//
// Status writes go through setStatus_. connect() and disconnect() write it only while the
// receive thread is not running; while it runs, that thread is the only writer.
class UpstreamFeedConnector : public IUpstreamFeedConnector {
public:
    UpstreamFeedConnector(std::string symbol,
                          std::shared_ptr<IVendorAdapter> adapter,
                          std::unique_ptr<IFeedTransport> transport,
                          TickHandler onTick,
                          RetryPolicy policy = {});
    ~UpstreamFeedConnector() override;

    UpstreamFeedConnector(const UpstreamFeedConnector&) = delete;
    UpstreamFeedConnector& operator=(const UpstreamFeedConnector&) = delete;

    const std::string& symbol() const noexcept override { return symbol_; }
    void connect() override;
    void disconnect() noexcept override;
    void sendSubscribe(const std::string& symbol) override;
    void sendUnsubscribe(const std::string& symbol) override;
    domain::ConnectorStatus status() const noexcept override { return status_.load(); }
    bool failed() const noexcept override { return failed_.load(); }
    domain::TimePoint lastActivity() const noexcept override;

private:
    void receiveLoop_();
    void handleFrame_(const std::string& payload);
    // Returns false when the loop must end: stop requested or the retry policy is exhausted.
    bool recover_();
    // Returns the previous status.
    domain::ConnectorStatus setStatus_(domain::ConnectorStatus next);
    void stopReceiver_() noexcept;
    bool isSubscribed_(const std::string& symbol) const;

    const std::string symbol_;
    const std::shared_ptr<IVendorAdapter> adapter_;
    const std::unique_ptr<IFeedTransport> transport_;
    const TickHandler onTick_;
    const RetryPolicy policy_;

    // Serializes connect/disconnect.
    std::mutex lifecycleMutex_;
    // Serializes open/write/close on the transport. read() runs without it.
    std::mutex ioMutex_;

    // Guards status transitions; status() reads the atomic without it.
    std::mutex statusMutex_;
    std::atomic<domain::ConnectorStatus> status_{domain::ConnectorStatus::Disconnected};
    std::atomic<bool> failed_{false};
    std::atomic<std::int64_t> lastActivityMs_{0};

    std::atomic<bool> stopRequested_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCv_;
    std::thread receiver_;

    mutable std::mutex subscriptionsMutex_;
    std::set<std::string> subscriptions_;
};

}  // namespace phub::feed
