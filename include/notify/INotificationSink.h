#pragma once

#include "notify/NotificationTypes.h"

namespace gridpilot {
namespace notify {

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    // Never throws; delivery problems are logged by the sink
    virtual void asyncSendNotification(NotificationType type, const NotificationFields& fields) = 0;
};

// Delivery endpoint (log file, chat webhook, ...)
class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    virtual std::string name() const = 0;
    virtual void deliver(const std::string& title, const std::string& body) = 0;
};

} // namespace notify
} // namespace gridpilot
