#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace gridpilot {

using Timestamp = long long;  // unix milliseconds
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class OrderStatus { OPEN, CLOSED, CANCELED, UNKNOWN };

struct Order {
    std::string identifier;
    OrderStatus status = OrderStatus::UNKNOWN;
    OrderType type = OrderType::LIMIT;
    OrderSide side = OrderSide::BUY;
    Price price = 0.0;
    Volume amount = 0.0;
    Volume filled = 0.0;
    Volume remaining = 0.0;
    Timestamp timestamp = 0;
    std::string symbol;

    // Exchange specific fields, present only when the exchange reports them
    std::optional<Price> average;
    std::optional<std::string> datetime;
    std::optional<Timestamp> last_trade_timestamp;
    std::optional<std::string> time_in_force;
    std::optional<Amount> cost;
    std::optional<Amount> fee_cost;
    std::optional<std::string> fee_currency;

    // Status string exactly as the exchange sent it (empty when missing)
    std::string raw_status;

    bool isOpen() const { return status == OrderStatus::OPEN; }
    bool isFilled() const { return status == OrderStatus::CLOSED; }
    bool isCanceled() const { return status == OrderStatus::CANCELED; }

    // Price the fill actually happened at
    Price fillPrice() const {
        return (average && *average > 0.0) ? *average : price;
    }
};

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType type) {
    return (type == OrderType::MARKET) ? "MARKET" : "LIMIT";
}

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::OPEN: return "OPEN";
        case OrderStatus::CLOSED: return "CLOSED";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline bool isTerminalStatus(OrderStatus status) {
    return status == OrderStatus::CLOSED || status == OrderStatus::CANCELED;
}

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace gridpilot
