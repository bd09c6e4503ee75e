#include "core/PriceCache.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace phub::core {

bool PendingPrice::Waiter::complete(const domain::PriceTick& tick) {
    if (done.exchange(true)) {
        return false;
    }
    promise.set_value(tick);
    return true;
}

bool PendingPrice::Waiter::fail(std::exception_ptr error) {
    if (done.exchange(true)) {
        return false;
    }
    promise.set_exception(std::move(error));
    return true;
}

PendingPrice::PendingPrice(PriceCache* cache, std::shared_ptr<Waiter> waiter,
                           std::future<domain::PriceTick> future)
    : cache_(cache), waiter_(std::move(waiter)), future_(std::move(future)) {}

PendingPrice::~PendingPrice() { cancel(); }

PendingPrice& PendingPrice::operator=(PendingPrice&& other) noexcept {
    if (this != &other) {
        cancel();
        cache_ = other.cache_;
        waiter_ = std::move(other.waiter_);
        future_ = std::move(other.future_);
        other.cache_ = nullptr;
    }
    return *this;
}

domain::PriceTick PendingPrice::get() {
    if (!future_.valid()) {
        throw std::logic_error("PendingPrice::get called on an empty or consumed handle");
    }
    return future_.get();
}

bool PendingPrice::ready() const {
    return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PendingPrice::cancel() {
    if (!waiter_ || cache_ == nullptr) {
        return;
    }
    if (waiter_->fail(std::make_exception_ptr(domain::CancelledError("Wait for " + waiter_->symbol + " cancelled")))) {
        cache_->deregister_(waiter_);
    }
}

PriceCache::PriceCache(boost::asio::io_context& timers) : timers_(timers) {}

PriceCache::~PriceCache() { cancelAll(); }

std::optional<domain::PriceTick> PriceCache::get(const std::string& symbol) const {
    const auto key = domain::normalizeSymbol(symbol);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = prices_.find(key);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PriceCache::onTick(const domain::PriceTick& tick) {
    std::vector<std::shared_ptr<Waiter>> resolved;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_[tick.symbol] = tick;
        const auto it = waiters_.find(tick.symbol);
        if (it != waiters_.end()) {
            resolved.swap(it->second);
            waiters_.erase(it);
        }
    }

    for (const auto& waiter : resolved) {
        if (waiter->complete(tick)) {
            boost::asio::post(timers_, [waiter]() { waiter->timer.cancel(); });
        }
    }
}

PendingPrice PriceCache::awaitNext(const std::string& symbol, std::chrono::milliseconds timeout) {
    auto waiter = std::make_shared<Waiter>(timers_);
    waiter->symbol = domain::normalizeSymbol(symbol);
    waiter->deadline = std::chrono::steady_clock::now() + timeout;
    auto future = waiter->promise.get_future();

    bool resolvedFromCache = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = prices_.find(waiter->symbol);
        if (it != prices_.end()) {
            waiter->complete(it->second);
            resolvedFromCache = true;
        } else {
            waiters_[waiter->symbol].push_back(waiter);
        }
    }

    if (!resolvedFromCache) {
        armTimer_(waiter);
    }
    return PendingPrice(this, std::move(waiter), std::move(future));
}

void PriceCache::armTimer_(const std::shared_ptr<Waiter>& waiter) {
    boost::asio::post(timers_, [this, waiter]() {
        if (waiter->done.load()) {
            return;
        }
        waiter->timer.expires_at(waiter->deadline);
        waiter->timer.async_wait([this, waiter](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (waiter->fail(std::make_exception_ptr(
                    domain::TimeoutError("No price for " + waiter->symbol + " within the wait budget")))) {
                LOG_DEBUG("PriceCache wait for " << waiter->symbol << " timed out");
                deregister_(waiter);
            }
        });
    });
}

void PriceCache::deregister_(const std::shared_ptr<Waiter>& waiter) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = waiters_.find(waiter->symbol);
        if (it != waiters_.end()) {
            auto& list = it->second;
            list.erase(std::remove(list.begin(), list.end(), waiter), list.end());
            if (list.empty()) {
                waiters_.erase(it);
            }
        }
    }
    boost::asio::post(timers_, [waiter]() { waiter->timer.cancel(); });
}

std::size_t PriceCache::pendingWaiters(const std::string& symbol) const {
    const auto key = domain::normalizeSymbol(symbol);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = waiters_.find(key);
    return it == waiters_.end() ? 0U : it->second.size();
}

void PriceCache::cancelAll() {
    std::unordered_map<std::string, std::vector<std::shared_ptr<Waiter>>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(waiters_);
    }
    for (auto& entry : pending) {
        for (const auto& waiter : entry.second) {
            if (waiter->fail(std::make_exception_ptr(domain::CancelledError("Price cache shut down")))) {
                boost::asio::post(timers_, [waiter]() { waiter->timer.cancel(); });
            }
        }
    }
}

}  // namespace phub::core
