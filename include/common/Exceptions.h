#pragma once

#include <stdexcept>
#include <string>

#include "common/Types.h"

namespace gridpilot {

// ===== Exchange boundary =====

class DataFetchError : public std::runtime_error {
public:
    explicit DataFetchError(const std::string& message) : std::runtime_error(message) {}
};

class OrderCancellationError : public std::runtime_error {
public:
    explicit OrderCancellationError(const std::string& message) : std::runtime_error(message) {}
};

class UnsupportedExchange : public std::runtime_error {
public:
    explicit UnsupportedExchange(const std::string& message) : std::runtime_error(message) {}
};

class MissingEnvironmentVariable : public std::runtime_error {
public:
    explicit MissingEnvironmentVariable(const std::string& message) : std::runtime_error(message) {}
};

// ===== Execution =====

class OrderExecutionFailed : public std::runtime_error {
public:
    OrderExecutionFailed(const std::string& message,
                         OrderSide side,
                         OrderType type,
                         std::string pair,
                         double quantity,
                         double price)
        : std::runtime_error(message)
        , side_(side)
        , type_(type)
        , pair_(std::move(pair))
        , quantity_(quantity)
        , price_(price) {}

    OrderSide side() const { return side_; }
    OrderType type() const { return type_; }
    const std::string& pair() const { return pair_; }
    double quantity() const { return quantity_; }
    double price() const { return price_; }

private:
    OrderSide side_;
    OrderType type_;
    std::string pair_;
    double quantity_;
    double price_;
};

// Remote order data that breaks an invariant (e.g. no status at all)
class MalformedOrderData : public std::runtime_error {
public:
    explicit MalformedOrderData(const std::string& message) : std::runtime_error(message) {}
};

// ===== Configuration =====

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace gridpilot
