#pragma once

#include "notify/INotificationSink.h"

namespace gridpilot {
namespace notify {

// Writes notifications to the daily notifications.log
class LogNotificationChannel : public INotificationChannel {
public:
    std::string name() const override { return "log"; }
    void deliver(const std::string& title, const std::string& body) override;
};

} // namespace notify
} // namespace gridpilot
