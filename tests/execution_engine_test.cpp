#include <gtest/gtest.h>

#include <stdexcept>

#include "execution_engine.hpp"
#include "test_helpers.hpp"

using namespace backtester;
using test_support::day;
using test_support::makeBar;
using test_support::FakeMarketPrices;

namespace {

    core::MarketConfig cnScenarioConfig() {
        core::MarketConfig config = core::MarketConfig::cnMarket();
        config.volume_limit_fraction = 1.0;
        return config;
    }

    core::MarketConfig frictionless() {
        core::MarketConfig config;
        config.volume_limit_fraction = 1.0;
        return config;
    }

    core::OrderIntent buy(const std::string& asset, double quantity) {
        return core::OrderIntent{asset, core::TradeAction::Buy, quantity};
    }

    core::OrderIntent sell(const std::string& asset, double quantity) {
        return core::OrderIntent{asset, core::TradeAction::Sell, quantity};
    }

} // namespace

TEST(ExecutionEngineTest, NextDaySettlementScenario) {
    FakeMarketPrices prices;
    prices.setBar("600519", makeBar("2024-01-02", 100.0));
    prices.setBar("600519", makeBar("2024-01-03", 110.0));
    ExecutionEngine engine(cnScenarioConfig(), 1000000.0, prices);

    auto fills = engine.submit({buy("600519", 1000)}, day("2024-01-02"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_NEAR(fills[0].executed_price, 100.1, 1e-9);
    EXPECT_NEAR(fills[0].gross_value, 100100.0, 1e-6);
    EXPECT_NEAR(fills[0].commission, 25.03, 1e-9);
    EXPECT_DOUBLE_EQ(fills[0].tax, 0.0);
    EXPECT_NEAR(engine.account().cash_available, 899874.97, 1e-6);
    EXPECT_DOUBLE_EQ(engine.account().holdingOf("600519"), 1000.0);
    EXPECT_DOUBLE_EQ(engine.account().frozenOf("600519"), 1000.0);

    // Same-day sell of freshly bought shares is refused
    auto refused = engine.submit({sell("600519", 500)}, day("2024-01-02"));
    EXPECT_TRUE(refused.empty());
    EXPECT_EQ(engine.tradeLog().size(), 1u);
    EXPECT_NEAR(engine.account().cash_available, 899874.97, 1e-6);

    engine.clearSettlement();
    EXPECT_DOUBLE_EQ(engine.account().frozenOf("600519"), 0.0);

    auto sold = engine.submit({sell("600519", 500)}, day("2024-01-03"));
    ASSERT_EQ(sold.size(), 1u);
    EXPECT_NEAR(sold[0].executed_price, 109.89, 1e-9);
    EXPECT_NEAR(sold[0].commission, 13.74, 1e-9);
    EXPECT_NEAR(sold[0].tax, 27.47, 1e-9);
    EXPECT_NEAR(sold[0].net_cash_delta, 54903.79, 1e-6);
    EXPECT_NEAR(engine.account().cash_available, 899874.97 + 54903.79, 1e-6);
    EXPECT_DOUBLE_EQ(engine.account().holdingOf("600519"), 500.0);
}

TEST(ExecutionEngineTest, PartialSellClippedToSettledQuantity) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    prices.setBar("A", makeBar("2024-01-03", 10.0));
    ExecutionEngine engine(cnScenarioConfig(), 100000.0, prices);

    ASSERT_EQ(engine.submit({buy("A", 300)}, day("2024-01-02")).size(), 1u);
    engine.clearSettlement();
    ASSERT_EQ(engine.submit({buy("A", 200)}, day("2024-01-03")).size(), 1u);
    EXPECT_DOUBLE_EQ(engine.account().sellableOf("A"), 300.0);

    auto fills = engine.submit({sell("A", 500)}, day("2024-01-03"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].quantity, 300.0);
    EXPECT_DOUBLE_EQ(engine.account().holdingOf("A"), 200.0);
    EXPECT_DOUBLE_EQ(engine.account().frozenOf("A"), 200.0);
}

TEST(ExecutionEngineTest, ImmediateSettlementAllowsSameDayRoundTrip) {
    FakeMarketPrices prices;
    prices.setBar("AAPL", makeBar("2024-01-02", 50.0));
    core::MarketConfig config = frictionless();
    config.commission_rate = 0.001;
    config.min_commission = 1.0;
    config.tax_rate = 0.001;
    config.slippage_rate = 0.002;
    ExecutionEngine engine(config, 100000.0, prices);

    auto bought = engine.submit({buy("AAPL", 100)}, day("2024-01-02"));
    auto sold = engine.submit({sell("AAPL", 100)}, day("2024-01-02"));
    ASSERT_EQ(bought.size(), 1u);
    ASSERT_EQ(sold.size(), 1u);
    EXPECT_TRUE(engine.account().holdings.empty());
    EXPECT_TRUE(engine.account().frozen.empty());

    const auto& log = engine.tradeLog();
    double expected_loss = log[0].commission + log[1].commission + log[1].tax +
                           log[0].slippage_cost + log[1].slippage_cost;
    double actual_loss = engine.initialCash() - engine.account().cash_available;
    EXPECT_GT(actual_loss, 0.0);
    EXPECT_NEAR(actual_loss, expected_loss, 1e-6);
}

TEST(ExecutionEngineTest, LiquidityCapLimitsQuantityToVolumeFraction) {
    FakeMarketPrices prices;
    prices.setBar("AAPL", makeBar("2024-01-02", 10.0, 500000));
    core::MarketConfig config = frictionless();
    config.volume_limit_fraction = 0.1;
    ExecutionEngine engine(config, 1e12, prices);

    auto fills = engine.submit({buy("AAPL", 1000000)}, day("2024-01-02"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].quantity, 50000.0);
}

TEST(ExecutionEngineTest, ZeroVolumeSkipsLiquidityCap) {
    FakeMarketPrices prices;
    prices.setBar("FUND", makeBar("2024-01-02", 10.0, 0));
    core::MarketConfig config = frictionless();
    config.volume_limit_fraction = 0.1;
    ExecutionEngine engine(config, 100000.0, prices);

    auto fills = engine.submit({buy("FUND", 1000)}, day("2024-01-02"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].quantity, 1000.0);
}

TEST(ExecutionEngineTest, InsufficientCashClipsBuyIncludingMinimumCommission) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    core::MarketConfig config = frictionless();
    config.commission_rate = 0.00025;
    config.min_commission = 5.0;
    ExecutionEngine engine(config, 1000.0, prices);

    auto fills = engine.submit({buy("A", 1000)}, day("2024-01-02"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_NEAR(fills[0].quantity, 99.5, 1e-9);
    EXPECT_DOUBLE_EQ(fills[0].commission, 5.0);
    EXPECT_GE(engine.account().cash_available, 0.0);
    EXPECT_NEAR(engine.account().cash_available, 0.0, 1e-6);
}

TEST(ExecutionEngineTest, SellThatCannotCoverMinimumCommissionIsRefused) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    core::MarketConfig config = frictionless();
    config.commission_rate = 0.00025;
    config.min_commission = 5.0;
    ExecutionEngine engine(config, 1000.0, prices);

    ASSERT_EQ(engine.submit({buy("A", 1000)}, day("2024-01-02")).size(), 1u);
    ASSERT_NEAR(engine.account().cash_available, 0.0, 1e-6);

    auto fills = engine.submit({sell("A", 0.1)}, day("2024-01-02"));
    EXPECT_TRUE(fills.empty());
    EXPECT_GE(engine.account().cash_available, 0.0);
    EXPECT_EQ(engine.tradeLog().size(), 1u);
}

TEST(ExecutionEngineTest, CashNeverNegativeAcrossRepeatedBuys) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 7.77));
    prices.setBar("B", makeBar("2024-01-02", 123.45));
    ExecutionEngine engine(cnScenarioConfig(), 25000.0, prices);

    for (int i = 0; i < 10; ++i) {
        engine.submit({buy("A", 1000), buy("B", 100)}, day("2024-01-02"));
        EXPECT_GE(engine.account().cash_available, 0.0);
    }
}

TEST(ExecutionEngineTest, MissingPriceSkipsOrderWithoutSideEffects) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    ExecutionEngine engine(frictionless(), 1000.0, prices);

    EXPECT_TRUE(engine.submit({buy("A", 10)}, day("2024-01-03")).empty());
    EXPECT_TRUE(engine.submit({buy("UNKNOWN", 10)}, day("2024-01-02")).empty());
    EXPECT_TRUE(engine.tradeLog().empty());
    EXPECT_DOUBLE_EQ(engine.account().cash_available, 1000.0);
}

TEST(ExecutionEngineTest, SellWithoutHoldingIsRefused) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    ExecutionEngine engine(frictionless(), 1000.0, prices);

    EXPECT_TRUE(engine.submit({sell("A", 10)}, day("2024-01-02")).empty());
    EXPECT_TRUE(engine.account().holdings.empty());
}

TEST(ExecutionEngineTest, InvalidIntentsAreIgnored) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    ExecutionEngine engine(frictionless(), 1000.0, prices);

    auto fills = engine.submit({buy("", 10), buy("A", 0), buy("A", -5)}, day("2024-01-02"));
    EXPECT_TRUE(fills.empty());
    EXPECT_DOUBLE_EQ(engine.account().cash_available, 1000.0);
}

TEST(ExecutionEngineTest, SubmitAtOpenUsesOpeningPrice) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 12.0, 1000000, 11.0));
    ExecutionEngine engine(frictionless(), 1000.0, prices);

    auto fills = engine.submitAtOpen({buy("A", 10)}, day("2024-01-02"));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].raw_price, 11.0);
    EXPECT_DOUBLE_EQ(engine.account().cash_available, 890.0);
}

TEST(ExecutionEngineTest, TradeLogQuantityDeltasMatchHoldings) {
    FakeMarketPrices prices;
    prices.setBar("A", makeBar("2024-01-02", 10.0));
    prices.setBar("B", makeBar("2024-01-02", 20.0));
    ExecutionEngine engine(frictionless(), 10000.0, prices);

    engine.submit({buy("A", 100), buy("B", 50), sell("A", 40), sell("B", 80)}, day("2024-01-02"));

    std::map<std::string, double> replayed;
    for (const auto& trade : engine.tradeLog()) {
        replayed[trade.asset] += trade.signedQuantity();
    }
    EXPECT_DOUBLE_EQ(replayed["A"], engine.account().holdingOf("A"));
    EXPECT_DOUBLE_EQ(replayed["B"], engine.account().holdingOf("B"));
    EXPECT_EQ(engine.account().holdings.count("B"), 0u);
}

TEST(ExecutionEngineTest, CostForAppliesMinimumAndSellTax) {
    FakeMarketPrices prices;
    ExecutionEngine engine(cnScenarioConfig(), 1000.0, prices);

    EXPECT_DOUBLE_EQ(engine.costFor(core::TradeAction::Buy, 1000.0), 5.0);
    EXPECT_NEAR(engine.costFor(core::TradeAction::Sell, 1000.0), 5.5, 1e-9);
    EXPECT_NEAR(engine.costFor(core::TradeAction::Buy, 100100.0), 25.03, 1e-9);
}

TEST(ExecutionEngineTest, ConstructorRejectsInvalidSetup) {
    FakeMarketPrices prices;
    EXPECT_THROW(ExecutionEngine(frictionless(), 0.0, prices), std::invalid_argument);

    core::MarketConfig bad_slippage = frictionless();
    bad_slippage.slippage_rate = 1.0;
    EXPECT_THROW(ExecutionEngine(bad_slippage, 1000.0, prices), std::invalid_argument);

    core::MarketConfig bad_volume = frictionless();
    bad_volume.volume_limit_fraction = 0.0;
    EXPECT_THROW(ExecutionEngine(bad_volume, 1000.0, prices), std::invalid_argument);
}
