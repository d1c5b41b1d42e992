#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/WorkerPool.h"
#include "core/events/EventBus.h"
#include "notify/INotificationSink.h"

namespace gridpilot {
namespace notify {

// Formats templated notifications and hands them to the delivery channels
// on the injected worker pool. Disabled handlers drop everything.
class NotificationHandler : public INotificationSink {
public:
    NotificationHandler(core::EventBus& event_bus,
                        WorkerPool& pool,
                        std::vector<std::shared_ptr<INotificationChannel>> channels,
                        bool enabled,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    ~NotificationHandler() override;

    NotificationHandler(const NotificationHandler&) = delete;
    NotificationHandler& operator=(const NotificationHandler&) = delete;

    // Delivers on the caller thread
    void sendNotification(NotificationType type, const NotificationFields& fields);
    void sendNotification(const std::string& message);

    // Delivers on the pool, waiting at most the configured timeout
    void asyncSendNotification(NotificationType type, const NotificationFields& fields) override;

    bool isEnabled() const { return enabled_; }

    // Missing placeholders render as N/A
    static std::string formatMessage(const std::string& message_template, const NotificationFields& fields);

    // Channel names from configuration; unknown names are skipped with a warning
    static std::vector<std::shared_ptr<INotificationChannel>> createChannels(const std::vector<std::string>& names);

private:
    void deliverAll(const std::string& title, const std::string& body);

    core::EventBus& event_bus_;
    WorkerPool& pool_;
    std::vector<std::shared_ptr<INotificationChannel>> channels_;
    bool enabled_;
    std::chrono::milliseconds timeout_;
    core::SubscriptionId completed_subscription_ = 0;
    std::mutex send_mutex_;
};

} // namespace notify
} // namespace gridpilot
