#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event stream for decoupled communication between the transfer
 * engine and its front ends. Every subscriber receives every event, in
 * subscription order, as (event name, JSON payload).
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flux::core {

using json = nlohmann::json;
using EventHandler = std::function<void(const std::string& event, const json& payload)>;

/**
 * Event subscription handle
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - ordered publish/subscribe
 *
 * Handlers are invoked on the publishing thread, outside the bus lock.
 * A handler that throws is logged and skipped; delivery to the remaining
 * handlers continues.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to all events
     * @param handler Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(EventHandler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto subscription = std::make_shared<Subscription>(m_nextId++);
        m_subscribers.push_back({std::move(handler), subscription});
        return subscription;
    }

    /**
     * Unsubscribe a handler
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                [id = subscription->getId()](const SubscriberEntry& entry) {
                    return entry.subscription->getId() == id;
                }),
            m_subscribers.end()
        );
    }

    /**
     * Emit an event to every active subscriber
     * @param event Event name
     * @param payload Event data
     */
    void emit(const std::string& event, const json& payload = json::object()) const {
        std::vector<SubscriberEntry> targets;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            targets = m_subscribers;
        }

        for (const auto& entry : targets) {
            if (!entry.subscription->isActive()) {
                continue;
            }
            try {
                entry.handler(event, payload);
            } catch (const std::exception& e) {
                FLUX_LOG_WARN("Event handler failed on '{}': {}", event, e.what());
            } catch (...) {
                FLUX_LOG_WARN("Event handler failed on '{}' with a non-standard exception", event);
            }
        }
    }

    size_t getSubscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_subscribers) {
            entry.subscription->cancel();
        }
        m_subscribers.clear();
    }

private:
    struct SubscriberEntry {
        EventHandler handler;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::vector<SubscriberEntry> m_subscribers;
    uint64_t m_nextId{0};
};

} // namespace flux::core
