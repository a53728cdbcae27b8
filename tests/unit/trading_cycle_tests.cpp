#include <gtest/gtest.h>
#include "trader/trading_cycle.hpp"
#include "trader/strategy/band_strategy.hpp"
#include "trader/strategy/threshold_strategy.hpp"
#include "system/trading_loop.hpp"
#include "test_support.hpp"

#include <atomic>

using namespace BeanTrader;
using BeanTrader::Core::CycleStatus;
using BeanTrader::Testing::FakeMarketApi;
using BeanTrader::Testing::InMemoryHistoryStore;
using BeanTrader::Testing::ManualClock;
using BeanTrader::Testing::ScriptedOutcome;

class TradingCycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_api.price = 105;
        market_api.owned_units = 0;
        market_api.balance = 10000;

        timing_config.cycle_interval_sec = 600;
        timing_config.min_cycle_sleep_ms = 100;
    }

    ManualClock clock;
    FakeMarketApi market_api;
    API::RateTracker rate_tracker{clock};
    Core::MarketStateCache state_cache{market_api, clock};
    InMemoryHistoryStore history_store;
    Core::MarketHistory market_history{history_store};
    Config::StrategyConfig strategy_config;
    Core::BandStrategy band_strategy{strategy_config};
    Config::ExchangeConfig exchange_config;
    Config::ExecutionConfig execution_config;
    Config::TimingConfig timing_config;
    Core::TradeExecutor trade_executor{
        Core::TradeExecutor::Dependencies{market_api, state_cache, history_store, rate_tracker, clock},
        exchange_config, execution_config};
    Core::TradingCycle trading_cycle{
        Core::TradingCycle::Dependencies{state_cache, market_history, history_store, band_strategy, trade_executor, clock}};
};

TEST_F(TradingCycleTest, HoldsWhenPriceIsOutsideEveryBand) {
    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::Held);

    EXPECT_EQ(trading_cycle.get_cycle_count(), 1u);
    EXPECT_FALSE(trading_cycle.get_last_trade_result().has_value());
    EXPECT_EQ(market_api.submit_attempts, 0);
    ASSERT_EQ(history_store.snapshots.size(), 1u);
    EXPECT_EQ(history_store.snapshots[0].price, 105);
    EXPECT_EQ(history_store.snapshots[0].balance, 10000);
}

TEST_F(TradingCycleTest, UnchangedPriceIsNotRecordedTwice) {
    trading_cycle.perform_cycle();
    clock.advance(60000);
    trading_cycle.perform_cycle();
    EXPECT_EQ(history_store.snapshots.size(), 1u);

    market_api.price = 106;
    clock.advance(60000);
    trading_cycle.perform_cycle();
    EXPECT_EQ(history_store.snapshots.size(), 2u);
}

TEST_F(TradingCycleTest, ClockSteppingBackDoesNotEndTheCycle) {
    trading_cycle.perform_cycle();
    const long long first_timestamp = history_store.snapshots[0].timestamp;

    market_api.price = 106;
    clock.advance(-5000);
    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::Held);

    ASSERT_EQ(history_store.snapshots.size(), 2u);
    EXPECT_EQ(history_store.snapshots[1].price, 106);
    EXPECT_EQ(history_store.snapshots[1].timestamp, first_timestamp);
}

TEST_F(TradingCycleTest, ThresholdStrategyBuysBelowTheLookbackBand) {
    Core::ThresholdStrategy threshold_strategy(strategy_config);
    Core::TradingCycle threshold_cycle(
        Core::TradingCycle::Dependencies{state_cache, market_history, history_store, threshold_strategy, trade_executor, clock});

    // Twelve hourly snapshots alternating 95 and 105 over the last half day
    const long long hour_ms = 3600000;
    for (int index = 0; index < 12; index++) {
        const long long price = index % 2 == 0 ? 95 : 105;
        history_store.append_snapshot(Core::MarketSnapshot(clock.now_milliseconds() - (12 - index) * hour_ms, price, 0, 10000));
    }
    market_api.price = 80;

    EXPECT_EQ(threshold_cycle.perform_cycle(), CycleStatus::Traded);

    ASSERT_TRUE(threshold_cycle.get_last_trade_result().has_value());
    const Core::TradeResult& result = *threshold_cycle.get_last_trade_result();
    EXPECT_EQ(result.action, Core::TradeAction::Buy);
    // floor(floor((10000 - 300) / 80) * 0.15)
    EXPECT_EQ(result.total_quantity, 18);
    EXPECT_EQ(market_api.buy_submissions, (std::vector<long long>{18}));
    EXPECT_EQ(history_store.snapshots.size(), 13u);
    EXPECT_EQ(history_store.trades.size(), 1u);
}

TEST_F(TradingCycleTest, ThresholdStrategyHoldsWithTooFewDataPoints) {
    Core::ThresholdStrategy threshold_strategy(strategy_config);
    Core::TradingCycle threshold_cycle(
        Core::TradingCycle::Dependencies{state_cache, market_history, history_store, threshold_strategy, trade_executor, clock});
    market_api.price = 80;

    EXPECT_EQ(threshold_cycle.perform_cycle(), CycleStatus::Held);

    EXPECT_EQ(market_api.submit_attempts, 0);
    EXPECT_EQ(history_store.snapshots.size(), 1u);
}

TEST_F(TradingCycleTest, BuysThroughTheExecutorWhenBandMatches) {
    market_api.price = 40;

    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::Traded);

    ASSERT_TRUE(trading_cycle.get_last_trade_result().has_value());
    const Core::TradeResult& result = *trading_cycle.get_last_trade_result();
    EXPECT_EQ(result.action, Core::TradeAction::Buy);
    EXPECT_EQ(result.total_quantity, 237);
    EXPECT_EQ(result.reference_price, 40);
    EXPECT_EQ(market_api.buy_submissions, (std::vector<long long>{200, 37}));
    EXPECT_EQ(history_store.trades.size(), 2u);
    EXPECT_EQ(market_api.owned_units, 237);
}

TEST_F(TradingCycleTest, AbortedOrderReportsTradeIncomplete) {
    market_api.price = 40;
    market_api.submit_outcomes = {ScriptedOutcome::RateLimited};
    market_api.price_after_failed_submit = {42};

    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::TradeIncomplete);

    ASSERT_TRUE(trading_cycle.get_last_trade_result().has_value());
    EXPECT_EQ(trading_cycle.get_last_trade_result()->termination, Core::TradeTermination::PriceMoved);
    EXPECT_TRUE(history_store.trades.empty());
}

TEST_F(TradingCycleTest, LastTradeResultClearsOnNextHold) {
    market_api.price = 40;
    trading_cycle.perform_cycle();
    ASSERT_TRUE(trading_cycle.get_last_trade_result().has_value());

    market_api.price = 105;
    market_api.owned_units = 0;
    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::Held);
    EXPECT_FALSE(trading_cycle.get_last_trade_result().has_value());
}

TEST_F(TradingCycleTest, RateLimitedSynchronizationSkipsCycle) {
    market_api.price_outcomes = {ScriptedOutcome::RateLimited};

    EXPECT_EQ(trading_cycle.perform_cycle(), CycleStatus::SkippedRateLimited);

    EXPECT_TRUE(history_store.snapshots.empty());
    EXPECT_EQ(market_api.submit_attempts, 0);
}

TEST_F(TradingCycleTest, FailedSynchronizationIsRethrown) {
    market_api.balance_outcomes = {ScriptedOutcome::RequestFailed};

    EXPECT_THROW(trading_cycle.perform_cycle(), API::RequestError);

    EXPECT_TRUE(history_store.snapshots.empty());
    EXPECT_FALSE(state_cache.state().price.has_value());
}

TEST_F(TradingCycleTest, LoopSleepHonoursIntervalAndFloor) {
    std::atomic<bool> running(true);
    System::TradingLoop trading_loop(trading_cycle, clock, timing_config, running);

    EXPECT_EQ(trading_loop.compute_sleep_milliseconds(0), 600000);
    EXPECT_EQ(trading_loop.compute_sleep_milliseconds(1000), 599000);
    EXPECT_EQ(trading_loop.compute_sleep_milliseconds(599950), 100);
    EXPECT_EQ(trading_loop.compute_sleep_milliseconds(900000), 100);
}

TEST_F(TradingCycleTest, LoopRunsRequestedCyclesAndSleepsBetweenThem) {
    std::atomic<bool> running(true);
    System::TradingLoop trading_loop(trading_cycle, clock, timing_config, running);

    EXPECT_EQ(trading_loop.run(3), 0);

    EXPECT_EQ(trading_cycle.get_cycle_count(), 3u);
    EXPECT_EQ(clock.total_slept(), 2 * 600000);
    for (long long sleep_ms : clock.recorded_sleeps) {
        EXPECT_LE(sleep_ms, System::TradingLoop::STOP_CHECK_INTERVAL_MS);
    }
}

TEST_F(TradingCycleTest, LoopSkipsCycleAfterRequestFailure) {
    std::atomic<bool> running(true);
    market_api.balance_outcomes = {ScriptedOutcome::RequestFailed};
    System::TradingLoop trading_loop(trading_cycle, clock, timing_config, running);

    EXPECT_EQ(trading_loop.run(2), 0);

    EXPECT_EQ(trading_cycle.get_cycle_count(), 2u);
    EXPECT_EQ(history_store.snapshots.size(), 1u);
}

TEST_F(TradingCycleTest, LoopExitsWithErrorOnUnexpectedFailure) {
    std::atomic<bool> running(true);
    market_api.price_outcomes = {ScriptedOutcome::Fatal};
    System::TradingLoop trading_loop(trading_cycle, clock, timing_config, running);

    EXPECT_EQ(trading_loop.run(5), 1);

    EXPECT_EQ(trading_cycle.get_cycle_count(), 1u);
}

TEST_F(TradingCycleTest, LoopStopsPromptlyWhenRunningFlagClears) {
    std::atomic<bool> running(true);
    clock.on_sleep = [&running](long long) { running.store(false); };
    System::TradingLoop trading_loop(trading_cycle, clock, timing_config, running);

    EXPECT_EQ(trading_loop.run(), 0);

    EXPECT_EQ(trading_cycle.get_cycle_count(), 1u);
    EXPECT_EQ(clock.recorded_sleeps.size(), 1u);
}
