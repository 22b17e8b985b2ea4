#include <gtest/gtest.h>

#include "conditional_order_manager.hpp"
#include "test_helpers.hpp"

using namespace backtester;
using test_support::day;
using test_support::makeBar;
using test_support::FakeMarketPrices;

namespace {

    core::ConditionalOrder promise(const std::string& asset, core::TradeAction action, double trigger,
                                   const std::string& expiry, double quantity) {
        core::ConditionalOrder order;
        order.asset = asset;
        order.action = action;
        order.trigger_price = trigger;
        order.expiry_date = day(expiry);
        order.quantity = quantity;
        return order;
    }

} // namespace

TEST(ConditionalOrderManagerTest, BuyFiresWhenCloseFallsToTrigger) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 105.0));
    prices.setBar("A", makeBar("2024-01-03", 95.0));
    ConditionalOrderManager manager(prices);
    ASSERT_TRUE(manager.add(promise("A", core::TradeAction::Buy, 95.0, "2024-02-01", 100)));

    EXPECT_TRUE(manager.evaluate(day("2024-01-02")).empty());
    EXPECT_EQ(manager.pending().size(), 1u);

    auto fired = manager.evaluate(day("2024-01-03"));
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0].asset, "A");
    EXPECT_EQ(fired[0].action, core::TradeAction::Buy);
    EXPECT_DOUBLE_EQ(fired[0].quantity, 100.0);
    EXPECT_TRUE(manager.pending().empty());
}

TEST(ConditionalOrderManagerTest, SellFiresWhenCloseRisesToTrigger) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 99.0));
    prices.setBar("A", makeBar("2024-01-03", 111.0));
    ConditionalOrderManager manager(prices);
    manager.add(promise("A", core::TradeAction::Sell, 110.0, "2024-02-01", 50));

    EXPECT_TRUE(manager.evaluate(day("2024-01-02")).empty());
    auto fired = manager.evaluate(day("2024-01-03"));
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0].action, core::TradeAction::Sell);
}

TEST(ConditionalOrderManagerTest, ExpiredOrderIsForcedRegardlessOfPrice) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-10", 150.0));
    prices.setBar("A", makeBar("2024-01-11", 150.0));
    ConditionalOrderManager manager(prices);
    manager.add(promise("A", core::TradeAction::Buy, 100.0, "2024-01-10", 10));

    // Expiry day itself is not past the expiry
    EXPECT_TRUE(manager.evaluate(day("2024-01-10")).empty());
    auto fired = manager.evaluate(day("2024-01-11"));
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_DOUBLE_EQ(fired[0].quantity, 10.0);
}

TEST(ConditionalOrderManagerTest, OrderWithoutPriceStaysPendingPastExpiry) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-20", 150.0));
    ConditionalOrderManager manager(prices);
    manager.add(promise("A", core::TradeAction::Sell, 200.0, "2024-01-10", 10));

    EXPECT_TRUE(manager.evaluate(day("2024-01-15")).empty());
    EXPECT_EQ(manager.pending().size(), 1u);

    EXPECT_EQ(manager.evaluate(day("2024-01-20")).size(), 1u);
    EXPECT_TRUE(manager.pending().empty());
}

TEST(ConditionalOrderManagerTest, FiredOrdersKeepInsertionOrder) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 50.0));
    prices.setBar("B", makeBar("2024-01-02", 50.0));
    ConditionalOrderManager manager(prices);
    manager.add(promise("B", core::TradeAction::Buy, 60.0, "2024-02-01", 1));
    manager.add(promise("A", core::TradeAction::Sell, 70.0, "2024-02-01", 2)); // Not triggered
    manager.add(promise("A", core::TradeAction::Buy, 55.0, "2024-02-01", 3));

    auto fired = manager.evaluate(day("2024-01-02"));
    ASSERT_EQ(fired.size(), 2u);
    EXPECT_EQ(fired[0].asset, "B");
    EXPECT_EQ(fired[1].asset, "A");
    EXPECT_DOUBLE_EQ(fired[1].quantity, 3.0);
    ASSERT_EQ(manager.pending().size(), 1u);
    EXPECT_EQ(manager.pending()[0].action, core::TradeAction::Sell);
}

TEST(ConditionalOrderManagerTest, RejectsMalformedOrders) {
    FakeMarketPrices prices;
    ConditionalOrderManager manager(prices);
    EXPECT_FALSE(manager.add(promise("", core::TradeAction::Buy, 10.0, "2024-02-01", 1)));
    EXPECT_FALSE(manager.add(promise("A", core::TradeAction::Buy, 10.0, "2024-02-01", 0)));
    EXPECT_TRUE(manager.pending().empty());

    EXPECT_TRUE(manager.add(promise("A", core::TradeAction::Buy, 10.0, "2024-02-01", 1)));
    manager.clear();
    EXPECT_TRUE(manager.pending().empty());
}
