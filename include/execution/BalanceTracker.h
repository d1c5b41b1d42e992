#pragma once

#include <mutex>

#include "common/Types.h"
#include "core/events/EventBus.h"
#include "execution/FeeCalculator.h"

namespace gridpilot {
namespace execution {

enum class ReservationResult {
    OK,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_CRYPTO_BALANCE
};

inline const char* reservationResultToString(ReservationResult result) {
    switch (result) {
        case ReservationResult::OK: return "ok";
        case ReservationResult::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case ReservationResult::INSUFFICIENT_CRYPTO_BALANCE: return "insufficient_crypto_balance";
    }
    return "unknown";
}

// Fiat / crypto ledger. Funds are reserved when an order is placed and
// settled when the order completes or is cancelled.
class BalanceTracker {
public:
    BalanceTracker(core::EventBus& event_bus,
                   FeeCalculator fee_calculator,
                   double initial_balance,
                   double initial_crypto_balance = 0.0);
    ~BalanceTracker();

    BalanceTracker(const BalanceTracker&) = delete;
    BalanceTracker& operator=(const BalanceTracker&) = delete;

    // One-time seeding from the exchange (paper / live)
    void setupBalances(double balance, double crypto_balance);

    ReservationResult reserveFundsForBuy(double amount);
    ReservationResult reserveFundsForSell(double quantity);

    // Roll back a reservation whose order never reached the exchange
    void releaseReservedFiat(double amount);
    void releaseReservedCrypto(double quantity);

    double getBalance() const;
    double getCryptoBalance() const;
    double getReservedFiat() const;
    double getReservedCrypto() const;
    double getTotalFees() const;
    double getAdjustedFiatBalance() const;
    double getAdjustedCryptoBalance() const;
    double getTotalBalanceValue(double price) const;

private:
    void onOrderCompleted(const core::EventPayload& payload);
    void onOrderCancelled(const core::EventPayload& payload);

    // Callers hold mutex_
    void settleBuyFill(double quantity, double price);
    void settleSellFill(double quantity, double price);

    core::EventBus& event_bus_;
    FeeCalculator fee_calculator_;
    core::SubscriptionId completed_subscription_ = 0;
    core::SubscriptionId cancelled_subscription_ = 0;

    mutable std::mutex mutex_;
    double balance_;
    double crypto_balance_;
    double reserved_fiat_ = 0.0;
    double reserved_crypto_ = 0.0;
    double total_fees_ = 0.0;
};

} // namespace execution
} // namespace gridpilot
