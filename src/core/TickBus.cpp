#include "core/TickBus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/Log.hpp"

namespace phub::core {
namespace {
// Topic key of handlers that receive every symbol. Never a valid normalized symbol.
const std::string kAllTopic{"*"};
}  // namespace

TickBus::Subscription::Subscription(TickBus* bus, std::string topic, std::size_t id)
    : bus_(bus), topic_(std::move(topic)), id_(id) {}

TickBus::Subscription::~Subscription() { reset(); }

TickBus::Subscription::Subscription(Subscription&& other) noexcept { *this = std::move(other); }

TickBus::Subscription& TickBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        topic_ = std::move(other.topic_);
        id_ = other.id_;
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void TickBus::Subscription::reset() {
    if (bus_ == nullptr) {
        return;
    }
    bus_->unsubscribe_(topic_, id_);
    bus_ = nullptr;
    id_ = 0;
}

TickBus::Subscription TickBus::subscribeAll(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = nextId_++;
    topics_[kAllTopic].push_back(HandlerData{id, std::make_shared<const Handler>(std::move(handler))});
    return Subscription(this, kAllTopic, id);
}

TickBus::Subscription TickBus::subscribe(const std::string& symbol, Handler handler) {
    auto topic = domain::normalizeSymbol(symbol);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = nextId_++;
    topics_[topic].push_back(HandlerData{id, std::make_shared<const Handler>(std::move(handler))});
    return Subscription(this, std::move(topic), id);
}

void TickBus::unsubscribe_(const std::string& topic, std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return;
    }
    auto& handlers = it->second;
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                  [id](const HandlerData& data) { return data.id == id; }),
                   handlers.end());
    if (handlers.empty()) {
        topics_.erase(it);
    }
}

void TickBus::publish(const domain::PriceTick& tick) const {
    std::vector<std::shared_ptr<const Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto* topic : {&kAllTopic, &tick.symbol}) {
            const auto it = topics_.find(*topic);
            if (it == topics_.end()) {
                continue;
            }
            for (const auto& data : it->second) {
                handlers.push_back(data.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(tick);
        } catch (const std::exception& ex) {
            LOG_WARN("TickBus handler failed for " << tick.symbol << ": " << ex.what());
        }
    }
}

std::size_t TickBus::handlerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : topics_) {
        count += entry.second.size();
    }
    return count;
}

}  // namespace phub::core
