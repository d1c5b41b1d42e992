#pragma once

#include "common/Types.h"

namespace gridpilot {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::OPEN;
    double filled_volume = 0.0;
    bool terminal = false;
    bool changed = false;    // status or fill moved forward
};

// OPEN -> {CLOSED, CANCELED}; terminal states never move again.
// UNKNOWN from the exchange leaves the local state untouched.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        OrderStatus current_status,
        double current_filled_volume,
        double order_volume,
        OrderStatus remote_status,
        double remote_filled_volume
    );
};

} // namespace execution
} // namespace core
} // namespace gridpilot
