#include "notify/NotificationHandler.h"

#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace gridpilot;
using gridpilot::notify::INotificationChannel;
using gridpilot::notify::NotificationHandler;
using gridpilot::notify::NotificationType;

namespace {
class RecordingChannel : public INotificationChannel {
public:
    std::string name() const override { return "recording"; }

    void deliver(const std::string& title, const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        titles_.push_back(title);
        bodies_.push_back(body);
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return titles_.size();
    }

    std::string lastTitle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return titles_.empty() ? "" : titles_.back();
    }

    std::string lastBody() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bodies_.empty() ? "" : bodies_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> titles_;
    std::vector<std::string> bodies_;
};

class BrokenChannel : public INotificationChannel {
public:
    std::string name() const override { return "broken"; }
    void deliver(const std::string&, const std::string&) override {
        throw std::runtime_error("webhook unreachable");
    }
};
} // namespace

int main() {
    WorkerPool pool(2);
    core::EventBus bus(pool);

    {
        assert(NotificationHandler::formatMessage("a {x} b {y}", {{"x", "1"}}) == "a 1 b N/A");
        assert(NotificationHandler::formatMessage("plain", {}) == "plain");
        assert(NotificationHandler::formatMessage("open {brace", {}) == "open {brace");
    }

    {
        auto channel = std::make_shared<RecordingChannel>();
        auto broken = std::make_shared<BrokenChannel>();
        NotificationHandler handler(bus, pool, {broken, channel}, true);
        assert(handler.isEnabled());

        handler.sendNotification(NotificationType::ORDER_PLACED, {{"order_details", "Order(id=1)"}});
        assert(channel->count() == 1);
        assert(channel->lastTitle() == "Order Placed");
        assert(channel->lastBody() == "New order placed successfully:\nOrder(id=1)");

        handler.asyncSendNotification(NotificationType::ORDER_FAILED, {{"error_details", "rejected"}});
        assert(channel->count() == 2);
        assert(channel->lastTitle() == "Order Placement Failed");

        handler.sendNotification("free text");
        assert(channel->lastBody() == "free text");

        // filled orders are announced from the event bus
        Order order;
        order.identifier = "filled-7";
        order.status = OrderStatus::CLOSED;
        bus.publishSync(core::EventType::ORDER_COMPLETED, core::EventPayload::forOrder(order));
        bus.drain();
        assert(channel->count() == 4);
        assert(channel->lastTitle() == "Order Filled");
        assert(channel->lastBody().find("filled-7") != std::string::npos);
    }
    assert(bus.subscriberCount(core::EventType::ORDER_COMPLETED) == 0);

    {
        auto channel = std::make_shared<RecordingChannel>();
        NotificationHandler disabled(bus, pool, {channel}, false);
        assert(!disabled.isEnabled());
        disabled.asyncSendNotification(NotificationType::ERROR_OCCURRED, {{"error_details", "x"}});
        disabled.sendNotification(NotificationType::ORDER_PLACED, {});
        assert(channel->count() == 0);
        assert(bus.subscriberCount(core::EventType::ORDER_COMPLETED) == 0);

        NotificationHandler no_channels(bus, pool, {}, true);
        assert(!no_channels.isEnabled());
    }

    {
        const auto channels = NotificationHandler::createChannels({"log", "carrier-pigeon"});
        assert(channels.size() == 1);
        assert(channels[0]->name() == "log");
    }

    std::cout << "[TEST] NotificationHandler PASSED\n";
    return 0;
}
