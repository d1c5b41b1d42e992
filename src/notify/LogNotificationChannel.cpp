#include "notify/LogNotificationChannel.h"

#include "common/Logger.h"

namespace gridpilot {
namespace notify {

void LogNotificationChannel::deliver(const std::string& title, const std::string& body) {
    Logger::getInstance().logNotification(title, body);
}

} // namespace notify
} // namespace gridpilot
