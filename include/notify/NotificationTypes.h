#pragma once

#include <map>
#include <string>

namespace gridpilot {
namespace notify {

enum class NotificationType {
    ORDER_PLACED,
    ORDER_FILLED,
    ORDER_FAILED,
    ORDER_CANCELLED,
    ERROR_OCCURRED,
    TAKE_PROFIT_TRIGGERED,
    STOP_LOSS_TRIGGERED
};

// {placeholder} -> value
using NotificationFields = std::map<std::string, std::string>;

struct NotificationTemplate {
    const char* title;
    const char* message;
};

inline NotificationTemplate notificationTemplate(NotificationType type) {
    switch (type) {
        case NotificationType::ORDER_PLACED:
            return {"Order Placed", "New order placed successfully:\n{order_details}"};
        case NotificationType::ORDER_FILLED:
            return {"Order Filled", "Order has been filled successfully:\n{order_details}"};
        case NotificationType::ORDER_FAILED:
            return {"Order Placement Failed", "Failed to place order:\n{error_details}"};
        case NotificationType::ORDER_CANCELLED:
            return {"Order Cancelled", "Order has been cancelled:\n{order_details}"};
        case NotificationType::ERROR_OCCURRED:
            return {"Error Occurred", "An error occurred in the trading bot:\n{error_details}"};
        case NotificationType::TAKE_PROFIT_TRIGGERED:
            return {"Take Profit Triggered", "Take profit triggered with order details:\n{order_details}"};
        case NotificationType::STOP_LOSS_TRIGGERED:
            return {"Stop Loss Triggered", "Stop loss triggered with order details:\n{order_details}"};
    }
    return {"Notification", ""};
}

inline const char* notificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::ORDER_PLACED: return "order_placed";
        case NotificationType::ORDER_FILLED: return "order_filled";
        case NotificationType::ORDER_FAILED: return "order_failed";
        case NotificationType::ORDER_CANCELLED: return "order_cancelled";
        case NotificationType::ERROR_OCCURRED: return "error_occurred";
        case NotificationType::TAKE_PROFIT_TRIGGERED: return "take_profit_triggered";
        case NotificationType::STOP_LOSS_TRIGGERED: return "stop_loss_triggered";
    }
    return "unknown";
}

} // namespace notify
} // namespace gridpilot
