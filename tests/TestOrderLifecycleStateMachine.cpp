#include "core/execution/OrderLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using gridpilot::OrderStatus;
using gridpilot::core::execution::OrderLifecycleStateMachine;

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 0.0, 10.0, OrderStatus::CLOSED, 0.0);
        assert(r.status == OrderStatus::CLOSED);
        assert(r.terminal);
        assert(r.changed);
        assert(r.filled_volume == 10.0);   // closed without fill report means fully filled
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 2.0, 10.0, OrderStatus::OPEN, 5.0);
        assert(r.status == OrderStatus::OPEN);
        assert(!r.terminal);
        assert(r.changed);
        assert(r.filled_volume == 5.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 5.0, 10.0, OrderStatus::OPEN, 3.0);
        assert(!r.changed);
        assert(r.filled_volume == 5.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 0.0, 10.0, OrderStatus::OPEN, 12.0);
        assert(r.filled_volume == 10.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 4.0, 10.0, OrderStatus::CANCELED, 4.0);
        assert(r.status == OrderStatus::CANCELED);
        assert(r.terminal);
        assert(r.filled_volume == 4.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::CLOSED, 10.0, 10.0, OrderStatus::CANCELED, 0.0);
        assert(r.status == OrderStatus::CLOSED);
        assert(!r.changed);
        assert(r.filled_volume == 10.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, 1.0, 10.0, OrderStatus::UNKNOWN, 8.0);
        assert(r.status == OrderStatus::OPEN);
        assert(!r.changed);
        assert(r.filled_volume == 1.0);
    }

    std::cout << "[TEST] OrderLifecycleStateMachine PASSED\n";
    return 0;
}
