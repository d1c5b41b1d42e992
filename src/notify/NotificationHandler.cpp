#include "notify/NotificationHandler.h"

#include "common/Logger.h"
#include "core/execution/OrderSchema.h"
#include "notify/LogNotificationChannel.h"

#include <set>

namespace gridpilot {
namespace notify {

NotificationHandler::NotificationHandler(core::EventBus& event_bus,
                                         WorkerPool& pool,
                                         std::vector<std::shared_ptr<INotificationChannel>> channels,
                                         bool enabled,
                                         std::chrono::milliseconds timeout)
    : event_bus_(event_bus)
    , pool_(pool)
    , channels_(std::move(channels))
    , enabled_(enabled && !channels_.empty())
    , timeout_(timeout) {
    if (enabled_) {
        completed_subscription_ = event_bus_.subscribeAsync(
            core::EventType::ORDER_COMPLETED,
            [this](const core::EventPayload& payload) {
                // already on a pool thread
                if (payload.order) {
                    sendNotification(NotificationType::ORDER_FILLED,
                                     {{"order_details", core::execution::describeOrder(*payload.order)}});
                }
            });
        LOG_INFO("Notifications enabled on {} channel(s)", channels_.size());
    }
}

NotificationHandler::~NotificationHandler() {
    if (completed_subscription_ != 0) {
        event_bus_.unsubscribe(completed_subscription_);
    }
}

std::string NotificationHandler::formatMessage(const std::string& message_template,
                                               const NotificationFields& fields) {
    std::string out;
    std::set<std::string> missing;
    std::size_t pos = 0;

    while (pos < message_template.size()) {
        const auto open = message_template.find('{', pos);
        if (open == std::string::npos) {
            out.append(message_template, pos, std::string::npos);
            break;
        }
        const auto close = message_template.find('}', open);
        if (close == std::string::npos) {
            out.append(message_template, pos, std::string::npos);
            break;
        }
        out.append(message_template, pos, open - pos);

        const std::string key = message_template.substr(open + 1, close - open - 1);
        auto it = fields.find(key);
        if (it != fields.end()) {
            out += it->second;
        } else {
            out += "N/A";
            missing.insert(key);
        }
        pos = close + 1;
    }

    for (const auto& key : missing) {
        LOG_WARN("Missing placeholder for notification: {}. Defaulting to N/A", key);
    }
    return out;
}

std::vector<std::shared_ptr<INotificationChannel>> NotificationHandler::createChannels(
    const std::vector<std::string>& names) {
    std::vector<std::shared_ptr<INotificationChannel>> channels;
    for (const auto& name : names) {
        if (name == "log") {
            channels.push_back(std::make_shared<LogNotificationChannel>());
        } else {
            LOG_WARN("Unsupported notification channel '{}' skipped", name);
        }
    }
    return channels;
}

void NotificationHandler::deliverAll(const std::string& title, const std::string& body) {
    for (const auto& channel : channels_) {
        try {
            channel->deliver(title, body);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification channel {} failed: {}", channel->name(), e.what());
        }
    }
}

void NotificationHandler::sendNotification(NotificationType type, const NotificationFields& fields) {
    if (!enabled_) {
        return;
    }
    const auto tmpl = notificationTemplate(type);
    deliverAll(tmpl.title, formatMessage(tmpl.message, fields));
}

void NotificationHandler::sendNotification(const std::string& message) {
    if (!enabled_) {
        return;
    }
    deliverAll("Notification", message);
}

void NotificationHandler::asyncSendNotification(NotificationType type, const NotificationFields& fields) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    try {
        auto future = pool_.submit([this, type, fields]() { sendNotification(type, fields); });
        if (future.wait_for(timeout_) != std::future_status::ready) {
            LOG_ERROR("Failed to send notification {}: timed out after {} ms",
                      notificationTypeToString(type), timeout_.count());
            return;
        }
        future.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send notification {}: {}", notificationTypeToString(type), e.what());
    }
}

} // namespace notify
} // namespace gridpilot
