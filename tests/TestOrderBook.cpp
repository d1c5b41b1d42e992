#include "execution/OrderBook.h"

#include "TestSupport.h"

#include <cassert>
#include <iostream>

using gridpilot::OrderSide;
using gridpilot::OrderStatus;
using gridpilot::execution::OrderBook;
using gridpilot::test::makeOrder;

int main() {
    OrderBook book;

    assert(book.addOrder(makeOrder("b-1", OrderSide::BUY, OrderStatus::OPEN, 100.0, 2.0, 0.0), 100.0));
    assert(book.addOrder(makeOrder("s-1", OrderSide::SELL, OrderStatus::OPEN, 110.0, 2.0, 0.0), 110.0));
    assert(book.addOrder(makeOrder("tp-1", OrderSide::SELL, OrderStatus::OPEN, 120.0, 1.0, 0.0)));

    {
        assert(!book.addOrder(makeOrder("b-1", OrderSide::BUY, OrderStatus::OPEN, 90.0, 1.0, 0.0), 90.0));
        assert(!book.addOrder(makeOrder("", OrderSide::BUY, OrderStatus::OPEN, 90.0, 1.0, 0.0), 90.0));
        assert(book.size() == 3);
    }

    {
        assert(book.getAllBuyOrders().size() == 1);
        assert(book.getAllSellOrders().size() == 1);
        assert(book.getNonGridOrders().size() == 1);
        assert(*book.getGridLevelPrice("s-1") == 110.0);
        assert(!book.getGridLevelPrice("tp-1"));

        const auto buys = book.getBuyOrdersWithGrid();
        assert(buys.size() == 1);
        assert(buys[0].first.identifier == "b-1");
        assert(buys[0].second && *buys[0].second == 100.0);

        // open orders come back in placement order
        const auto open = book.getOpenOrders();
        assert(open.size() == 3);
        assert(open[0].identifier == "b-1");
        assert(open[2].identifier == "tp-1");
    }

    {
        auto partial = makeOrder("b-1", OrderSide::BUY, OrderStatus::OPEN, 100.0, 2.0, 0.5);
        auto r = book.updateOrderFromRemote(partial);
        assert(r.found && r.changed && !r.became_terminal);
        assert(r.order.filled == 0.5);
        assert(r.order.remaining == 1.5);

        auto done = makeOrder("b-1", OrderSide::BUY, OrderStatus::CLOSED, 100.0, 2.0, 2.0);
        done.average = 99.9;
        r = book.updateOrderFromRemote(done);
        assert(r.became_terminal);
        assert(r.order.isFilled());
        assert(*r.order.average == 99.9);

        // a terminal order never changes again
        r = book.updateOrderFromRemote(makeOrder("b-1", OrderSide::BUY, OrderStatus::CANCELED, 100.0, 2.0, 0.0));
        assert(r.found && !r.changed && !r.became_terminal);
        assert(book.getOrder("b-1")->isFilled());
    }

    {
        auto r = book.updateOrderFromRemote(makeOrder("missing", OrderSide::BUY, OrderStatus::CLOSED, 1.0, 1.0, 1.0));
        assert(!r.found);
        assert(!book.getOrder("missing"));
    }

    assert(book.getOpenOrders().size() == 2);
    assert(book.getCompletedOrders().size() == 1);

    std::cout << "[TEST] OrderBook PASSED\n";
    return 0;
}
