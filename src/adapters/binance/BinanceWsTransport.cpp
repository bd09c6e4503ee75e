#include "adapters/binance/BinanceWsTransport.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "common/Log.hpp"

namespace phub::adapters::binance {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {
constexpr std::chrono::seconds kCloseTimeout{5};
constexpr const char* kUserAgent = "pricehub-BinanceWsTransport";

using WsStream = websocket::stream<ssl::stream<beast::tcp_stream>>;
using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

std::runtime_error makeError(const std::string& message) {
    return std::runtime_error("BinanceWsTransport: " + message);
}

std::int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

// One-shot completion shared between the io thread and the blocked reader.
struct PendingRead {
    std::promise<std::pair<beast::error_code, std::string>> promise;
    std::atomic<bool> done{false};

    void complete(beast::error_code ec, std::string payload) {
        if (!done.exchange(true)) {
            promise.set_value({ec, std::move(payload)});
        }
    }
};

void forceClose(WsStream& ws) {
    beast::error_code ec;
    ws.next_layer().shutdown(ec);
    beast::get_lowest_layer(ws).socket().close(ec);
}

}  // namespace

struct BinanceWsTransport::Session {
    std::shared_ptr<net::io_context> ioc = std::make_shared<net::io_context>();
    std::shared_ptr<ssl::context> sslCtx = std::make_shared<ssl::context>(ssl::context::tls_client);
    std::shared_ptr<WsStream> ws;
    std::shared_ptr<net::steady_timer> silenceTimer;
    std::shared_ptr<std::atomic<std::int64_t>> lastMessageMs = std::make_shared<std::atomic<std::int64_t>>(0);
    std::unique_ptr<WorkGuard> work;
    std::thread ioThread;

    std::mutex readMutex;
    bool closed = false;
    std::shared_ptr<PendingRead> pendingRead;
};

BinanceWsTransport::BinanceWsTransport(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

BinanceWsTransport::~BinanceWsTransport() { close(); }

void BinanceWsTransport::open() {
    close();

    auto session = std::make_shared<Session>();
    session->sslCtx->set_default_verify_paths();
    session->sslCtx->set_verify_mode(ssl::verify_peer);
    session->ws = std::make_shared<WsStream>(*session->ioc, *session->sslCtx);
    session->silenceTimer = std::make_shared<net::steady_timer>(*session->ioc);
    auto& ws = *session->ws;

    ws.next_layer().set_verify_mode(ssl::verify_peer);
    ws.next_layer().set_verify_callback(ssl::rfc2818_verification(endpoint_.host));

    if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << endpoint_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(oss.str());
    }

    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, kUserAgent);
    }));

    beast::error_code ec;
    net::ip::tcp::resolver resolver(*session->ioc);
    LOG_DEBUG("BinanceWsTransport resolving host=" << endpoint_.host << " port=" << endpoint_.port);
    const auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        throw makeError("DNS resolve failed: " + ec.message());
    }

    beast::get_lowest_layer(ws).connect(results, ec);
    if (ec) {
        throw makeError("connect failed: " + ec.message());
    }

    ws.next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError("TLS handshake failed: " + ec.message());
    }

    ws.handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target, ec);
    if (ec) {
        throw makeError("WebSocket handshake failed: " + ec.message());
    }

    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.text(true);
    session->lastMessageMs->store(steadyNowMs());

    session->work = std::make_unique<WorkGuard>(net::make_work_guard(*session->ioc));
    session->ioThread = std::thread([ioc = session->ioc]() {
        try {
            ioc->run();
        } catch (const std::exception& ex) {
            LOG_ERR("BinanceWsTransport io thread crashed: " << ex.what());
        }
    });
    startSilenceWatchdog_(session);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(session);
    }
    LOG_INFO("BinanceWsTransport connected to " << endpoint_.host << ":" << endpoint_.port << endpoint_.target);
}

feed::IFeedTransport::ReadResult BinanceWsTransport::read(std::string& payload) {
    auto session = current_();
    if (!session) {
        throw makeError("read on a closed transport");
    }

    auto pending = std::make_shared<PendingRead>();
    auto future = pending->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(session->readMutex);
        if (session->closed) {
            return ReadResult::Closed;
        }
        session->pendingRead = pending;
    }

    auto buffer = std::make_shared<beast::flat_buffer>();
    net::post(*session->ioc, [ws = session->ws, lastMessage = session->lastMessageMs, pending, buffer]() {
        ws->async_read(*buffer, [lastMessage, pending, buffer](const beast::error_code& ec, std::size_t) {
            if (ec) {
                pending->complete(ec, {});
                return;
            }
            lastMessage->store(steadyNowMs());
            pending->complete(ec, beast::buffers_to_string(buffer->cdata()));
        });
    });

    auto outcome = future.get();
    if (outcome.first == websocket::error::closed) {
        return ReadResult::Closed;
    }
    if (outcome.first) {
        {
            std::lock_guard<std::mutex> lock(session->readMutex);
            if (session->closed) {
                return ReadResult::Closed;
            }
        }
        throw makeError("read failed: " + outcome.first.message());
    }
    payload = std::move(outcome.second);
    return ReadResult::Frame;
}

void BinanceWsTransport::write(const std::string& payload) {
    auto session = current_();
    if (!session) {
        throw makeError("write on a closed transport");
    }

    auto message = std::make_shared<const std::string>(payload);
    auto promise = std::make_shared<std::promise<beast::error_code>>();
    auto future = promise->get_future();
    net::post(*session->ioc, [ws = session->ws, message, promise]() {
        ws->async_write(net::buffer(*message), [message, promise](const beast::error_code& ec, std::size_t) {
            promise->set_value(ec);
        });
    });

    const auto ec = future.get();
    if (ec) {
        throw makeError("write failed: " + ec.message());
    }
    LOG_DEBUG("BinanceWsTransport sent " << *message);
}

void BinanceWsTransport::close() noexcept {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_);
    }
    if (session) {
        shutdownSession_(*session);
    }
}

bool BinanceWsTransport::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

std::shared_ptr<BinanceWsTransport::Session> BinanceWsTransport::current_() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void BinanceWsTransport::startSilenceWatchdog_(const std::shared_ptr<Session>& session) {
    const auto threshold = std::chrono::duration_cast<std::chrono::milliseconds>(endpoint_.silenceTimeout);
    const auto interval = std::max(threshold / 4, std::chrono::milliseconds(250));

    auto scheduler = std::make_shared<std::function<void()>>();
    std::weak_ptr<WsStream> wsWeak = session->ws;
    std::weak_ptr<net::steady_timer> timerWeak = session->silenceTimer;
    std::weak_ptr<std::function<void()>> schedulerWeak = scheduler;
    *scheduler = [wsWeak, timerWeak, schedulerWeak, lastMessage = session->lastMessageMs, threshold, interval]() {
        auto timer = timerWeak.lock();
        auto self = schedulerWeak.lock();
        if (!timer || !self) {
            return;
        }
        timer->expires_after(interval);
        timer->async_wait([wsWeak, self, lastMessage, threshold](const beast::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            auto ws = wsWeak.lock();
            if (!ws || !ws->is_open()) {
                return;
            }
            if (steadyNowMs() - lastMessage->load() > threshold.count()) {
                LOG_WARN("BinanceWsTransport silence watchdog triggered after " << threshold.count() << " ms");
                forceClose(*ws);
                return;
            }
            (*self)();
        });
    };
    // The pending wait owns the scheduler; the scheduler only observes itself.
    net::post(*session->ioc, [scheduler]() { (*scheduler)(); });
}

void BinanceWsTransport::shutdownSession_(Session& session) noexcept {
    std::shared_ptr<PendingRead> pendingRead;
    {
        std::lock_guard<std::mutex> lock(session.readMutex);
        session.closed = true;
        pendingRead = session.pendingRead;
    }

    if (session.ioThread.joinable()) {
        try {
            auto promisePtr = std::make_shared<std::promise<void>>();
            auto future = promisePtr->get_future();
            auto completion = std::make_shared<std::atomic<bool>>(false);
            auto closeTimer = std::make_shared<net::steady_timer>(*session.ioc);

            net::post(*session.ioc, [w = session.ws, silenceTimer = session.silenceTimer, promisePtr, completion,
                                     closeTimer]() {
                silenceTimer->cancel();
                closeTimer->expires_after(kCloseTimeout);
                closeTimer->async_wait([w, promisePtr, completion](const beast::error_code& ec) {
                    if (!ec) {
                        forceClose(*w);
                    }
                    if (!completion->exchange(true)) {
                        promisePtr->set_value();
                    }
                });

                if (!w->is_open()) {
                    closeTimer->cancel();
                    if (!completion->exchange(true)) {
                        promisePtr->set_value();
                    }
                    return;
                }
                w->async_close(websocket::close_code::normal,
                               [w, closeTimer, promisePtr, completion](const beast::error_code&) {
                                   closeTimer->cancel();
                                   forceClose(*w);
                                   if (!completion->exchange(true)) {
                                       promisePtr->set_value();
                                   }
                               });
            });

            future.wait();
        } catch (const std::exception& ex) {
            LOG_WARN("BinanceWsTransport graceful close failed: " << ex.what());
            forceClose(*session.ws);
        }

        if (session.work) {
            session.work->reset();
        }
        session.ioc->stop();
        session.ioThread.join();
    } else if (session.ws) {
        forceClose(*session.ws);
    }

    if (pendingRead) {
        try {
            pendingRead->complete(net::error::operation_aborted, {});
        } catch (const std::exception& ex) {
            LOG_WARN("BinanceWsTransport failed to release pending read: " << ex.what());
        }
    }
    LOG_DEBUG("BinanceWsTransport session closed");
}

}  // namespace phub::adapters::binance
