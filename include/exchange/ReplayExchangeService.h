#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "exchange/IExchangeService.h"

namespace gridpilot {
namespace exchange {

// Exchange simulator over a candle series. The cursor starts on the first
// candle; market orders fill at the current close, limit orders rest until a
// later candle trades through their price.
class ReplayExchangeService : public IExchangeService {
public:
    ReplayExchangeService(std::vector<Candle> candles,
                          std::string pair,
                          double initial_fiat,
                          double initial_crypto = 0.0,
                          double trading_fee = 0.0);

    nlohmann::json placeOrder(
        const std::string& pair,
        OrderSide side,
        OrderType type,
        double amount,
        std::optional<double> price = std::nullopt
    ) override;
    nlohmann::json cancelOrder(const std::string& order_id, const std::string& pair) override;
    nlohmann::json fetchOrder(const std::string& order_id, const std::string& pair) override;
    nlohmann::json getBalance() override;
    double getCurrentPrice(const std::string& pair) override;

    // Move to the next candle and fill resting limits it crosses.
    // false once the series is exhausted.
    bool advance();

    bool hasCandle() const;
    Candle currentCandle() const;
    std::size_t candleCount() const { return candles_.size(); }

private:
    void checkPair(const std::string& pair) const;
    void fill(Order& order, double price, Timestamp timestamp);   // callers hold mutex_

    std::vector<Candle> candles_;
    std::string pair_;
    std::string base_currency_;
    std::string quote_currency_;
    double trading_fee_;

    mutable std::mutex mutex_;
    std::size_t cursor_ = 0;
    double fiat_balance_;
    double crypto_balance_;
    std::map<std::string, Order> orders_;
    std::uint64_t next_order_id_ = 1;
};

} // namespace exchange
} // namespace gridpilot
