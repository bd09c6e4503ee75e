#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace phub::core {

// Map of independently lockable per-key entries.
//
// The map mutex is held only to find, insert or erase an entry; work on an entry happens
// under that entry's own mutex, so callers operating on different keys never wait for each
// other. An entry that becomes idle while locked is retired: flagged and erased from the map.
// A caller that locked a retired entry retries with a fresh one.
//
// Slot requirements: `std::mutex mutex`, `bool retired`, `bool idle() const`.
template <typename Slot>
class KeyedSlots {
public:
    KeyedSlots() = default;
    KeyedSlots(const KeyedSlots&) = delete;
    KeyedSlots& operator=(const KeyedSlots&) = delete;

    // Runs fn(slot) with the slot for `key` locked, creating the slot if needed.
    template <typename Fn>
    decltype(auto) withSlot(const std::string& key, Fn&& fn) {
        for (;;) {
            auto slot = getOrCreate_(key);
            std::unique_lock<std::mutex> lock(slot->mutex);
            if (slot->retired) {
                continue;
            }
            RetireOnIdle guard{*this, key, slot};
            return fn(*slot);
        }
    }

    // Runs fn(slot) only when a slot for `key` exists. Returns false otherwise.
    template <typename Fn>
    bool withExisting(const std::string& key, Fn&& fn) {
        for (;;) {
            auto slot = find(key);
            if (!slot) {
                return false;
            }
            std::unique_lock<std::mutex> lock(slot->mutex);
            if (slot->retired) {
                continue;
            }
            RetireOnIdle guard{*this, key, slot};
            fn(*slot);
            return true;
        }
    }

    std::shared_ptr<Slot> find(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = slots_.find(key);
        return it == slots_.end() ? nullptr : it->second;
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(slots_.size());
        for (const auto& entry : slots_) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

private:
    struct RetireOnIdle {
        KeyedSlots& owner;
        const std::string& key;
        const std::shared_ptr<Slot>& slot;

        ~RetireOnIdle() {
            if (slot->idle()) {
                slot->retired = true;
                owner.erase_(key, slot);
            }
        }
    };

    std::shared_ptr<Slot> getOrCreate_(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = slots_[key];
        if (!slot) {
            slot = std::make_shared<Slot>();
        }
        return slot;
    }

    void erase_(const std::string& key, const std::shared_ptr<Slot>& slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = slots_.find(key);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace phub::core
