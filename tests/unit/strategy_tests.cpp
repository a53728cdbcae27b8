#include <gtest/gtest.h>
#include "trader/strategy/band_strategy.hpp"
#include "trader/strategy/strategy_factory.hpp"
#include "trader/strategy/threshold_strategy.hpp"

using namespace BeanTrader;
using BeanTrader::Core::BandStrategy;
using BeanTrader::Core::DecisionContext;
using BeanTrader::Core::MarketSnapshot;
using BeanTrader::Core::MarketSummaries;
using BeanTrader::Core::ThresholdStrategy;
using BeanTrader::Core::TradeAction;
using BeanTrader::Core::TradeDecision;

namespace {

// Daily window with mean 60 and std dev 5: buy below 55, sell above 65
MarketSummaries daily_summaries(long long entries, double mean_price = 60.0, double std_dev = 5.0) {
    MarketSummaries summaries;
    summaries.last_1d.entry_count = entries;
    summaries.last_1d.mean_price = mean_price;
    summaries.last_1d.sample_std_dev = std_dev;
    return summaries;
}

DecisionContext context_for(long long price, long long owned_units, long long balance,
                            const MarketSummaries& summaries = MarketSummaries()) {
    return DecisionContext(MarketSnapshot(1000, price, owned_units, balance), summaries);
}

} // namespace

TEST(MakeTradeDecisionTest, FloorsAndClampsQuantity) {
    TradeDecision clamped = Core::make_trade_decision(TradeAction::Buy, 15.2, 10);
    EXPECT_EQ(clamped.action, TradeAction::Buy);
    EXPECT_EQ(clamped.quantity, 10);

    TradeDecision floored = Core::make_trade_decision(TradeAction::Sell, 3.9, 10);
    EXPECT_EQ(floored.action, TradeAction::Sell);
    EXPECT_EQ(floored.quantity, 3);
}

TEST(MakeTradeDecisionTest, NonPositiveResultsBecomeHold) {
    EXPECT_TRUE(Core::make_trade_decision(TradeAction::Buy, 0.7, 10).is_hold());
    EXPECT_TRUE(Core::make_trade_decision(TradeAction::Sell, -2.0, 10).is_hold());
    EXPECT_TRUE(Core::make_trade_decision(TradeAction::Buy, 5.0, 0).is_hold());
    EXPECT_EQ(Core::make_trade_decision(TradeAction::Buy, 0.7, 10).quantity, 0);
}

class ThresholdStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy_config.policy = "threshold";
        strategy_config.lookback_window = "1d";
        strategy_config.min_data_points = 12;
        strategy_config.k_factor = 1.0;
        strategy_config.fallback_spread = 5;
        strategy_config.min_balance_reserve = 300;
        strategy_config.min_units_reserve = 10;
        strategy_config.trade_fraction = 0.15;
    }

    Config::StrategyConfig strategy_config;
};

TEST_F(ThresholdStrategyTest, BuysFractionOfAffordableUnitsBelowBuyThreshold) {
    ThresholdStrategy strategy(strategy_config);

    // affordable = floor((1000 - 300) / 50) = 14, floor(14 * 0.15) = 2
    TradeDecision decision = strategy.decide(context_for(50, 0, 1000, daily_summaries(20)));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 2);
}

TEST_F(ThresholdStrategyTest, SmallFractionStillBuysOneUnit) {
    ThresholdStrategy strategy(strategy_config);

    TradeDecision decision = strategy.decide(context_for(50, 0, 400, daily_summaries(20)));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 1);
}

TEST_F(ThresholdStrategyTest, HoldsWhenBalanceIsAtReserve) {
    ThresholdStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(50, 0, 320, daily_summaries(20))).is_hold());
}

TEST_F(ThresholdStrategyTest, SellsFractionOfHoldingsAboveReserve) {
    ThresholdStrategy strategy(strategy_config);

    // sellable = 50 - 10 = 40, floor(40 * 0.15) = 6
    TradeDecision decision = strategy.decide(context_for(70, 50, 0, daily_summaries(20)));
    EXPECT_EQ(decision.action, TradeAction::Sell);
    EXPECT_EQ(decision.quantity, 6);
}

TEST_F(ThresholdStrategyTest, HoldsWhenHoldingsAreAtReserve) {
    ThresholdStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(70, 10, 5000, daily_summaries(20))).is_hold());
}

TEST_F(ThresholdStrategyTest, HoldsInsideThresholds) {
    ThresholdStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(60, 50, 5000, daily_summaries(20))).is_hold());
    EXPECT_TRUE(strategy.decide(context_for(55, 50, 5000, daily_summaries(20))).is_hold());
    EXPECT_TRUE(strategy.decide(context_for(65, 50, 5000, daily_summaries(20))).is_hold());
}

TEST_F(ThresholdStrategyTest, HoldsWithInsufficientData) {
    ThresholdStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(10, 0, 100000, daily_summaries(11))).is_hold());
}

TEST_F(ThresholdStrategyTest, HoldsWhenThresholdsAreInvalid) {
    strategy_config.fallback_spread = 0;
    ThresholdStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(10, 100, 100000, daily_summaries(20, 50.0, 0.0))).is_hold());
}

TEST_F(ThresholdStrategyTest, UsesConfiguredLookbackWindow) {
    strategy_config.lookback_window = "1h";
    ThresholdStrategy strategy(strategy_config);

    // Plenty of daily data but nothing in the last hour
    EXPECT_TRUE(strategy.decide(context_for(50, 0, 1000, daily_summaries(20))).is_hold());
}

TEST_F(ThresholdStrategyTest, QuantityStaysWithinAvailableBounds) {
    strategy_config.trade_fraction = 1.0;
    ThresholdStrategy strategy(strategy_config);

    for (long long price = 1; price <= 120; price += 7) {
        for (long long balance = 0; balance <= 3000; balance += 250) {
            for (long long owned_units = 0; owned_units <= 60; owned_units += 15) {
                TradeDecision decision = strategy.decide(context_for(price, owned_units, balance, daily_summaries(20)));
                if (decision.is_hold()) {
                    EXPECT_EQ(decision.quantity, 0);
                } else if (decision.action == TradeAction::Buy) {
                    EXPECT_GE(decision.quantity, 1);
                    EXPECT_LE(decision.quantity, (balance - 300) / price);
                } else {
                    EXPECT_GE(decision.quantity, 1);
                    EXPECT_LE(decision.quantity, owned_units - 10);
                }
            }
        }
    }
}

class BandStrategyTest : public ::testing::Test {
protected:
    Config::StrategyConfig strategy_config;
};

TEST_F(BandStrategyTest, CheapPriceBuysLargestFraction) {
    BandStrategy strategy(strategy_config);

    // max buy = 1000 / 40 = 25, 25 * 0.95 = 23.75
    TradeDecision decision = strategy.decide(context_for(40, 0, 1000));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 23);
}

TEST_F(BandStrategyTest, FirstMatchingBuyBandWins) {
    BandStrategy strategy(strategy_config);

    // 70 is above 65, so the <=80 band (0.50) applies: 1400 / 70 = 20 -> 10
    TradeDecision decision = strategy.decide(context_for(70, 0, 1400));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 10);
}

TEST_F(BandStrategyTest, AffordableBuyTakesPrecedenceOverSell) {
    BandStrategy strategy(strategy_config);

    // Price 100 matches both the <=100 buy band and the >=100 sell band
    TradeDecision decision = strategy.decide(context_for(100, 50, 10000));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 5);
}

TEST_F(BandStrategyTest, UnaffordablePriceFallsThroughToSellBands) {
    BandStrategy strategy(strategy_config);

    TradeDecision decision = strategy.decide(context_for(100, 50, 50));
    EXPECT_EQ(decision.action, TradeAction::Sell);
    EXPECT_EQ(decision.quantity, 5);
}

TEST_F(BandStrategyTest, HighPriceSellsLargestFraction) {
    BandStrategy strategy(strategy_config);

    TradeDecision decision = strategy.decide(context_for(150, 20, 100));
    EXPECT_EQ(decision.action, TradeAction::Sell);
    EXPECT_EQ(decision.quantity, 19);
}

TEST_F(BandStrategyTest, HoldsWithoutHoldingsOrMatchingBand) {
    BandStrategy strategy(strategy_config);

    EXPECT_TRUE(strategy.decide(context_for(120, 0, 0)).is_hold());
    EXPECT_TRUE(strategy.decide(context_for(105, 0, 10000)).is_hold());
}

TEST_F(BandStrategyTest, UnsortedBandsAreOrderedOnConstruction) {
    strategy_config.buy_bands = {{100, 0.1}, {50, 0.9}};
    BandStrategy strategy(strategy_config);

    TradeDecision decision = strategy.decide(context_for(45, 0, 450));
    EXPECT_EQ(decision.action, TradeAction::Buy);
    EXPECT_EQ(decision.quantity, 9);
}

TEST(StrategyFactoryTest, CreatesConfiguredPolicy) {
    Config::StrategyConfig strategy_config;

    strategy_config.policy = "threshold";
    EXPECT_EQ(Core::create_decision_strategy(strategy_config)->get_strategy_name(), "threshold");

    strategy_config.policy = "band";
    EXPECT_EQ(Core::create_decision_strategy(strategy_config)->get_strategy_name(), "band");

    strategy_config.policy = "random";
    EXPECT_THROW(Core::create_decision_strategy(strategy_config), std::runtime_error);
}
