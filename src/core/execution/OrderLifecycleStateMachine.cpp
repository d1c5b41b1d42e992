#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>

namespace gridpilot {
namespace core {
namespace execution {

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    OrderStatus current_status,
    double current_filled_volume,
    double order_volume,
    OrderStatus remote_status,
    double remote_filled_volume
) {
    OrderLifecycleTransitionResult result;
    result.status = current_status;
    result.filled_volume = current_filled_volume;
    result.terminal = isTerminalStatus(current_status);

    if (result.terminal || remote_status == OrderStatus::UNKNOWN) {
        return result;
    }

    // Fills only grow
    if (remote_filled_volume > result.filled_volume) {
        result.filled_volume = remote_filled_volume;
        result.changed = true;
    }

    switch (remote_status) {
        case OrderStatus::CLOSED:
            result.status = OrderStatus::CLOSED;
            if (result.filled_volume <= 0.0) {
                result.filled_volume = order_volume;
            }
            result.terminal = true;
            result.changed = true;
            break;
        case OrderStatus::CANCELED:
            result.status = OrderStatus::CANCELED;
            result.terminal = true;
            result.changed = true;
            break;
        case OrderStatus::OPEN:
        case OrderStatus::UNKNOWN:
            result.status = OrderStatus::OPEN;
            break;
    }

    if (order_volume > 0.0) {
        result.filled_volume = std::min(result.filled_volume, order_volume);
    }
    return result;
}

} // namespace execution
} // namespace core
} // namespace gridpilot
