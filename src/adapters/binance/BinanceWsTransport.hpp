#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "feed/IFeedTransport.hpp"

namespace phub::adapters::binance {

// TLS WebSocket connection to the Binance stream endpoint. Socket operations run on a private
// io_context thread; read() and write() block the caller until their operation completes.
class BinanceWsTransport : public feed::IFeedTransport {
public:
    struct Endpoint {
        std::string host{"stream.binance.com"};
        std::string port{"9443"};
        std::string target{"/stream"};
        // No frame for this long closes the socket so the reader sees an error.
        std::chrono::seconds silenceTimeout{30};
    };

    explicit BinanceWsTransport(Endpoint endpoint);
    ~BinanceWsTransport() override;

    BinanceWsTransport(const BinanceWsTransport&) = delete;
    BinanceWsTransport& operator=(const BinanceWsTransport&) = delete;

    void open() override;
    ReadResult read(std::string& payload) override;
    void write(const std::string& payload) override;
    void close() noexcept override;
    bool isOpen() const noexcept override;

private:
    struct Session;

    std::shared_ptr<Session> current_() const;
    void startSilenceWatchdog_(const std::shared_ptr<Session>& session);
    static void shutdownSession_(Session& session) noexcept;

    const Endpoint endpoint_;
    mutable std::mutex mutex_;
    std::shared_ptr<Session> session_;
};

}  // namespace phub::adapters::binance
