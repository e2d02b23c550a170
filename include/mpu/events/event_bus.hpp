/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe for upload lifecycle events
 *
 * The relay emits events without knowing who consumes them; logging and
 * metrics subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) { ... });
 * bus.emit(UploadCompletedEvent{...});
 * // handler detaches when `sub` goes out of scope
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mpu::events {

using SubscriptionId = std::uint64_t;

class EventBus;

/**
 * @brief Owns one handler registration; unsubscribes on destruction
 *
 * The bus must outlive every Subscription taken from it.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus& bus, SubscriptionId id) : bus_(&bus), id_(id) {}

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { reset(); }

    /// Detach now instead of at destruction
    void reset();

    bool active() const noexcept { return bus_ != nullptr; }
    SubscriptionId id() const noexcept { return id_; }

private:
    EventBus* bus_ = nullptr;
    SubscriptionId id_ = 0;
};

/**
 * @brief Routes each event to the handlers registered for its type
 *
 * Event types expose `static constexpr const char* kName`, used when a
 * handler failure is logged.
 *
 * THREAD SAFETY:
 * - emit() may run on several io_context threads at once
 * - Handlers are called synchronously in the emitting thread, in
 *   subscription order, without the bus lock held
 * - A handler that throws is logged and skipped; the emitter never sees it
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename Event>
    [[nodiscard]] Subscription subscribe(std::function<void(const Event&)> handler) {
        auto shared = std::make_shared<std::function<void(const Event&)>>(std::move(handler));

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        channels_[std::type_index(typeid(Event))].push_back(Subscriber{id, std::move(shared)});
        return Subscription(*this, id);
    }

    template<typename Event>
    void emit(const Event& event) {
        std::vector<std::shared_ptr<void>> handlers;
        {
            std::shared_lock lock(mutex_);
            auto channel = channels_.find(std::type_index(typeid(Event)));
            if (channel == channels_.end()) {
                return;
            }
            handlers.reserve(channel->second.size());
            for (const auto& subscriber : channel->second) {
                handlers.push_back(subscriber.handler);
            }
        }

        for (const auto& erased : handlers) {
            const auto& handler = *std::static_pointer_cast<std::function<void(const Event&)>>(erased);
            try {
                handler(event);
            } catch (const std::exception& e) {
                spdlog::error("{} handler failed: {}", Event::kName, e.what());
            } catch (...) {
                spdlog::error("{} handler failed with a non-standard exception", Event::kName);
            }
        }
    }

    template<typename Event>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(Event)));
        return channel == channels_.end() ? 0 : channel->second.size();
    }

private:
    friend class Subscription;

    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<void> handler;   // std::function<void(const Event&)>
    };

    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        for (auto channel = channels_.begin(); channel != channels_.end(); ++channel) {
            auto& subscribers = channel->second;
            for (auto it = subscribers.begin(); it != subscribers.end(); ++it) {
                if (it->id == id) {
                    subscribers.erase(it);
                    if (subscribers.empty()) {
                        channels_.erase(channel);
                    }
                    return;
                }
            }
        }
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Subscriber>> channels_;
    SubscriptionId last_id_ = 0;
};

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace mpu::events
