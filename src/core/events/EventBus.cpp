#include "core/events/EventBus.h"

#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <exception>

namespace gridpilot {
namespace core {

EventBus::EventBus(WorkerPool& pool)
    : pool_(pool) {
}

EventBus::~EventBus() {
    drain();
}

SubscriptionId EventBus::subscribe(EventType type, EventCallback callback, HandlerKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    subscribers_[type].push_back(Subscriber{id, kind, std::move(callback)});
    LOG_INFO("Callback subscribed to event: {} ({})",
             eventTypeToString(type), kind == HandlerKind::ASYNC ? "async" : "sync");
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        auto& list = it->second;
        auto found = std::find_if(list.begin(), list.end(),
                                  [id](const Subscriber& s) { return s.id == id; });
        if (found != list.end()) {
            list.erase(found);
            LOG_INFO("Callback unsubscribed from event: {}", eventTypeToString(it->first));
            if (list.empty()) {
                subscribers_.erase(it);
            }
            return true;
        }
    }
    LOG_WARN("Attempted to unsubscribe non-existing subscription: {}", id);
    return false;
}

void EventBus::clear(EventType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribers_.erase(type) > 0) {
        LOG_INFO("Cleared all subscribers for event: {}", eventTypeToString(type));
    } else {
        LOG_WARN("Attempted to clear event without subscribers: {}", eventTypeToString(type));
    }
}

void EventBus::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.clear();
    LOG_INFO("Cleared all subscribers for all events");
}

std::vector<EventBus::Subscriber> EventBus::snapshot(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    if (it == subscribers_.end()) {
        return {};
    }
    return it->second;
}

void EventBus::safeInvoke(EventType type, const Subscriber& subscriber, const EventPayload& payload) {
    try {
        subscriber.callback(payload);
    } catch (const std::exception& e) {
        LOG_ERROR("Error in {} subscriber callback for {}: {}",
                  subscriber.kind == HandlerKind::ASYNC ? "async" : "sync",
                  eventTypeToString(type), e.what());
    } catch (...) {
        LOG_ERROR("Unknown error in subscriber callback for {}", eventTypeToString(type));
    }
}

void EventBus::publish(EventType type, const EventPayload& payload) {
    const auto subscribers = snapshot(type);
    if (subscribers.empty()) {
        return;
    }

    LOG_INFO("Publishing event: {} to {} subscriber(s)", eventTypeToString(type), subscribers.size());

    std::vector<std::future<void>> running;
    running.reserve(subscribers.size());
    for (const auto& subscriber : subscribers) {
        try {
            running.push_back(pool_.submit([type, subscriber, payload]() {
                safeInvoke(type, subscriber, payload);
            }));
        } catch (const std::exception& e) {
            // Pool already shut down: deliver on the caller thread instead
            LOG_WARN("Worker pool unavailable ({}), delivering {} inline", e.what(), eventTypeToString(type));
            safeInvoke(type, subscriber, payload);
        }
    }

    for (auto& f : running) {
        f.wait();
    }
}

void EventBus::publishSync(EventType type, const EventPayload& payload) {
    const auto subscribers = snapshot(type);
    if (subscribers.empty()) {
        return;
    }

    LOG_INFO("Publishing sync event: {} to {} subscriber(s)", eventTypeToString(type), subscribers.size());

    for (const auto& subscriber : subscribers) {
        if (subscriber.kind == HandlerKind::SYNC) {
            safeInvoke(type, subscriber, payload);
            continue;
        }

        try {
            auto future = pool_.submit([type, subscriber, payload]() {
                safeInvoke(type, subscriber, payload);
            });
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.push_back(std::move(future));
        } catch (const std::exception& e) {
            LOG_WARN("Worker pool unavailable ({}), delivering {} inline", e.what(), eventTypeToString(type));
            safeInvoke(type, subscriber, payload);
        }
    }

    pruneFinished();
}

void EventBus::pruneFinished() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(
        std::remove_if(pending_.begin(), pending_.end(), [](std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        pending_.end());
}

void EventBus::drain() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& f : pending) {
        f.wait();
    }
}

std::size_t EventBus::subscriberCount(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return (it == subscribers_.end()) ? 0 : it->second.size();
}

} // namespace core
} // namespace gridpilot
