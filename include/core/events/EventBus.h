#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "common/WorkerPool.h"

namespace gridpilot {
namespace core {

enum class EventType {
    ORDER_COMPLETED,
    ORDER_CANCELLED,
    START_BOT,
    STOP_BOT
};

inline const char* eventTypeToString(EventType type) {
    switch (type) {
        case EventType::ORDER_COMPLETED: return "order_completed";
        case EventType::ORDER_CANCELLED: return "order_cancelled";
        case EventType::START_BOT: return "start_bot";
        case EventType::STOP_BOT: return "stop_bot";
    }
    return "unknown";
}

struct EventPayload {
    std::optional<Order> order;
    std::string message;

    static EventPayload forOrder(const Order& order) {
        EventPayload payload;
        payload.order = order;
        return payload;
    }

    static EventPayload withMessage(std::string message) {
        EventPayload payload;
        payload.message = std::move(message);
        return payload;
    }
};

enum class HandlerKind {
    SYNC,   // runs inline on publishSync
    ASYNC   // always runs on the worker pool
};

using EventCallback = std::function<void(const EventPayload&)>;
using SubscriptionId = std::uint64_t;

class EventBus {
public:
    explicit EventBus(WorkerPool& pool);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventType type, EventCallback callback,
                             HandlerKind kind = HandlerKind::SYNC);
    SubscriptionId subscribeAsync(EventType type, EventCallback callback) {
        return subscribe(type, std::move(callback), HandlerKind::ASYNC);
    }

    bool unsubscribe(SubscriptionId id);
    void clear(EventType type);
    void clearAll();

    // Fan out to every subscriber on the pool and wait for all of them.
    // Subscriber failures are logged, never rethrown.
    void publish(EventType type, const EventPayload& payload);

    // Sync subscribers inline, async subscribers scheduled without waiting
    void publishSync(EventType type, const EventPayload& payload);

    // Wait for async deliveries scheduled by publishSync
    void drain();

    std::size_t subscriberCount(EventType type) const;

private:
    struct Subscriber {
        SubscriptionId id;
        HandlerKind kind;
        EventCallback callback;
    };

    std::vector<Subscriber> snapshot(EventType type) const;
    static void safeInvoke(EventType type, const Subscriber& subscriber, const EventPayload& payload);
    void pruneFinished();

    WorkerPool& pool_;
    mutable std::mutex mutex_;
    std::map<EventType, std::vector<Subscriber>> subscribers_;
    SubscriptionId next_id_ = 1;

    std::mutex pending_mutex_;
    std::vector<std::future<void>> pending_;
};

} // namespace core
} // namespace gridpilot
