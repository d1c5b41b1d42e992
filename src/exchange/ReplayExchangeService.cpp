#include "exchange/ReplayExchangeService.h"

#include "common/Exceptions.h"
#include "common/Logger.h"
#include "core/execution/OrderSchema.h"

#include <stdexcept>

namespace gridpilot {
namespace exchange {

ReplayExchangeService::ReplayExchangeService(std::vector<Candle> candles,
                                             std::string pair,
                                             double initial_fiat,
                                             double initial_crypto,
                                             double trading_fee)
    : candles_(std::move(candles))
    , pair_(std::move(pair))
    , trading_fee_(trading_fee)
    , fiat_balance_(initial_fiat)
    , crypto_balance_(initial_crypto) {
    const auto slash = pair_.find('/');
    if (slash == std::string::npos) {
        throw std::invalid_argument("ReplayExchangeService: pair must look like BASE/QUOTE, got " + pair_);
    }
    base_currency_ = pair_.substr(0, slash);
    quote_currency_ = pair_.substr(slash + 1);
    LOG_INFO("Replay exchange ready: {} candles for {}", candles_.size(), pair_);
}

void ReplayExchangeService::checkPair(const std::string& pair) const {
    if (pair != pair_) {
        throw DataFetchError("Replay exchange only serves " + pair_ + ", requested " + pair);
    }
}

void ReplayExchangeService::fill(Order& order, double price, Timestamp timestamp) {
    const double cost = order.amount * price;
    const double fee = cost * trading_fee_;

    order.status = OrderStatus::CLOSED;
    order.raw_status = "closed";
    order.filled = order.amount;
    order.remaining = 0.0;
    order.average = price;
    order.cost = cost;
    order.fee_cost = fee;
    order.fee_currency = quote_currency_;
    order.last_trade_timestamp = timestamp;

    if (order.side == OrderSide::BUY) {
        fiat_balance_ -= cost + fee;
        crypto_balance_ += order.amount;
    } else {
        crypto_balance_ -= order.amount;
        fiat_balance_ += cost - fee;
    }
}

nlohmann::json ReplayExchangeService::placeOrder(const std::string& pair,
                                                 OrderSide side,
                                                 OrderType type,
                                                 double amount,
                                                 std::optional<double> price) {
    checkPair(pair);
    std::lock_guard<std::mutex> lock(mutex_);

    if (cursor_ >= candles_.size()) {
        throw DataFetchError("Replay exchange has no market data left");
    }
    if (amount <= 0.0) {
        throw DataFetchError("Replay exchange rejected order with non-positive amount");
    }
    if (type == OrderType::LIMIT && (!price || *price <= 0.0)) {
        throw DataFetchError("Replay exchange rejected limit order without price");
    }

    const auto& candle = candles_[cursor_];
    Order order;
    order.identifier = "replay-" + std::to_string(next_order_id_++);
    order.status = OrderStatus::OPEN;
    order.raw_status = "open";
    order.type = type;
    order.side = side;
    order.price = (type == OrderType::MARKET) ? candle.close : *price;
    order.amount = amount;
    order.remaining = amount;
    order.timestamp = candle.timestamp;
    order.symbol = pair_;

    if (type == OrderType::MARKET) {
        fill(order, candle.close, candle.timestamp);
    }

    orders_[order.identifier] = order;
    return core::execution::toJson(order);
}

nlohmann::json ReplayExchangeService::cancelOrder(const std::string& order_id, const std::string& pair) {
    checkPair(pair);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw OrderCancellationError("Unknown order " + order_id);
    }
    auto& order = it->second;
    if (!order.isOpen()) {
        throw OrderCancellationError("Order " + order_id + " is already " + order.raw_status);
    }
    order.status = OrderStatus::CANCELED;
    order.raw_status = "canceled";
    return core::execution::toJson(order);
}

nlohmann::json ReplayExchangeService::fetchOrder(const std::string& order_id, const std::string& pair) {
    checkPair(pair);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw DataFetchError("Order " + order_id + " not found");
    }
    return core::execution::toJson(it->second);
}

nlohmann::json ReplayExchangeService::getBalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json balance;
    balance["free"][quote_currency_] = fiat_balance_;
    balance["free"][base_currency_] = crypto_balance_;
    balance["total"] = balance["free"];
    return balance;
}

double ReplayExchangeService::getCurrentPrice(const std::string& pair) {
    checkPair(pair);
    std::lock_guard<std::mutex> lock(mutex_);
    if (cursor_ >= candles_.size()) {
        throw DataFetchError("Replay exchange has no market data left");
    }
    return candles_[cursor_].close;
}

bool ReplayExchangeService::advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cursor_ + 1 >= candles_.size()) {
        cursor_ = candles_.size();
        return false;
    }
    ++cursor_;

    const auto& candle = candles_[cursor_];
    for (auto& entry : orders_) {
        auto& order = entry.second;
        if (!order.isOpen() || order.type != OrderType::LIMIT) {
            continue;
        }
        const bool crossed = (order.side == OrderSide::BUY)
            ? candle.low <= order.price
            : candle.high >= order.price;
        if (crossed) {
            fill(order, order.price, candle.timestamp);
            LOG_DEBUG("Replay fill: {}", core::execution::describeOrder(order));
        }
    }
    return true;
}

bool ReplayExchangeService::hasCandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_ < candles_.size();
}

Candle ReplayExchangeService::currentCandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cursor_ >= candles_.size()) {
        throw DataFetchError("Replay exchange has no market data left");
    }
    return candles_[cursor_];
}

} // namespace exchange
} // namespace gridpilot
