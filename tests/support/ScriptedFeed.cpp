#include "support/ScriptedFeed.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "domain/Errors.hpp"
#include "domain/Types.hpp"

namespace phub::test {
namespace {
std::string toLower(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}
}  // namespace

void ScriptedTransportState::pushFrame(const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(Event{Event::Kind::Frame, payload});
    cv_.notify_all();
}

void ScriptedTransportState::pushError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(Event{Event::Kind::Error, message});
    cv_.notify_all();
}

void ScriptedTransportState::pushClose() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(Event{Event::Kind::Close, {}});
    cv_.notify_all();
}

void ScriptedTransportState::failNextOpens(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failOpens_ = count;
}

void ScriptedTransportState::setOpenDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    openDelay_ = delay;
}

void ScriptedTransportState::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

int ScriptedTransportState::opens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opens_;
}

int ScriptedTransportState::closes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closes_;
}

bool ScriptedTransportState::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::vector<std::string> ScriptedTransportState::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

std::size_t ScriptedTransportState::pendingEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

ScriptedTransport::ScriptedTransport(std::shared_ptr<ScriptedTransportState> state) : state_(std::move(state)) {}

void ScriptedTransport::open() {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(state_->mutex_);
        delay = state_->openDelay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(state_->mutex_);
    ++state_->opens_;
    if (state_->failOpens_ > 0) {
        --state_->failOpens_;
        throw std::runtime_error("scripted open failure");
    }
    state_->open_ = true;
    state_->cv_.notify_all();
}

feed::IFeedTransport::ReadResult ScriptedTransport::read(std::string& payload) {
    std::unique_lock<std::mutex> lock(state_->mutex_);
    state_->cv_.wait(lock, [this]() { return !state_->open_ || !state_->events_.empty(); });
    if (!state_->open_) {
        return ReadResult::Closed;
    }

    auto event = std::move(state_->events_.front());
    state_->events_.pop_front();
    switch (event.kind) {
        case ScriptedTransportState::Event::Kind::Frame:
            payload = std::move(event.payload);
            return ReadResult::Frame;
        case ScriptedTransportState::Event::Kind::Close:
            state_->open_ = false;
            return ReadResult::Closed;
        case ScriptedTransportState::Event::Kind::Error:
            break;
    }
    throw std::runtime_error(event.payload);
}

void ScriptedTransport::write(const std::string& payload) {
    std::lock_guard<std::mutex> lock(state_->mutex_);
    if (!state_->open_) {
        throw std::runtime_error("scripted write on closed transport");
    }
    if (state_->failWrites_) {
        throw std::runtime_error("scripted write failure");
    }
    state_->writes_.push_back(payload);
}

void ScriptedTransport::close() noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex_);
    if (state_->open_) {
        ++state_->closes_;
    }
    state_->open_ = false;
    state_->cv_.notify_all();
}

bool ScriptedTransport::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex_);
    return state_->open_;
}

ScriptedAdapter::ScriptedAdapter(std::set<std::string> symbols) : symbols_(std::move(symbols)) {}

bool ScriptedAdapter::supports(const std::string& symbol) const {
    return symbols_.count(domain::normalizeSymbol(symbol)) != 0U;
}

std::string ScriptedAdapter::subscriptionToken(const std::string& symbol) const {
    const auto normalized = domain::normalizeSymbol(symbol);
    if (symbols_.count(normalized) == 0U) {
        throw domain::UnsupportedSymbolError(normalized);
    }
    return toLower(normalized);
}

std::string ScriptedAdapter::subscribeMessage(const std::string& symbol) {
    return "SUB " + subscriptionToken(symbol);
}

std::string ScriptedAdapter::unsubscribeMessage(const std::string& symbol) {
    return "UNSUB " + subscriptionToken(symbol);
}

feed::DecodedFrame ScriptedAdapter::decode(const std::string& payload) const {
    std::istringstream in(payload);
    std::string kind;
    in >> kind;
    if (kind == "ack") {
        return feed::DecodedFrame::makeControl(payload);
    }
    if (kind != "tick") {
        return feed::DecodedFrame::makeMalformed("unknown frame");
    }

    domain::PriceTick tick;
    std::string priceText;
    long long epochMs = 0;
    if (!(in >> tick.symbol >> priceText >> epochMs)) {
        return feed::DecodedFrame::makeMalformed("truncated tick");
    }
    tick.symbol = domain::normalizeSymbol(tick.symbol);
    tick.value = std::stod(priceText);
    tick.valueText = priceText;
    tick.observedAt = domain::fromEpochMs(epochMs);
    return feed::DecodedFrame::makeTick(std::move(tick));
}

std::unique_ptr<feed::IFeedTransport> ScriptedAdapter::makeTransport() {
    auto state = std::make_shared<ScriptedTransportState>();
    state->failNextOpens(failOpens_.exchange(0));
    state->setOpenDelay(std::chrono::milliseconds(openDelayMs_.load()));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transports_.push_back(state);
    }
    return std::make_unique<ScriptedTransport>(std::move(state));
}

std::size_t ScriptedAdapter::transportsCreated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.size();
}

std::shared_ptr<ScriptedTransportState> ScriptedAdapter::transport(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < transports_.size() ? transports_[index] : nullptr;
}

std::shared_ptr<ScriptedTransportState> ScriptedAdapter::lastTransport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.empty() ? nullptr : transports_.back();
}

}  // namespace phub::test
