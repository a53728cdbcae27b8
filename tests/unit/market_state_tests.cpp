#include <gtest/gtest.h>
#include "trader/market_state/market_history.hpp"
#include "trader/market_state/market_state_cache.hpp"
#include "test_support.hpp"

using namespace BeanTrader;
using BeanTrader::Core::MarketHistory;
using BeanTrader::Core::MarketSnapshot;
using BeanTrader::Core::MarketStateCache;
using BeanTrader::Core::TradeAction;
using BeanTrader::Testing::FakeMarketApi;
using BeanTrader::Testing::InMemoryHistoryStore;
using BeanTrader::Testing::ManualClock;
using BeanTrader::Testing::ScriptedOutcome;

class MarketStateCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        market_api.price = 64;
        market_api.owned_units = 12;
        market_api.balance = 900;
    }

    ManualClock clock;
    FakeMarketApi market_api;
    MarketStateCache cache{market_api, clock};
};

TEST_F(MarketStateCacheTest, GettersFetchOnlyWhenSlotIsEmpty) {
    EXPECT_EQ(cache.get_price(), 64);
    EXPECT_EQ(cache.get_price(), 64);
    EXPECT_EQ(cache.get_owned_units(), 12);
    EXPECT_EQ(cache.get_owned_units(), 12);
    EXPECT_EQ(cache.get_balance(), 900);
    EXPECT_EQ(cache.get_balance(), 900);

    EXPECT_EQ(market_api.price_fetches, 1);
    EXPECT_EQ(market_api.owned_fetches, 1);
    EXPECT_EQ(market_api.balance_fetches, 1);
}

TEST_F(MarketStateCacheTest, SynchronizeAlwaysFetchesAllSlots) {
    cache.get_price();
    MarketSnapshot snapshot = cache.synchronize();

    EXPECT_EQ(market_api.price_fetches, 2);
    EXPECT_EQ(market_api.owned_fetches, 1);
    EXPECT_EQ(market_api.balance_fetches, 1);
    EXPECT_EQ(snapshot.timestamp, clock.now_milliseconds());
    EXPECT_EQ(snapshot.price, 64);
    EXPECT_EQ(snapshot.owned_units, 12);
    EXPECT_EQ(snapshot.balance, 900);
    ASSERT_TRUE(cache.state().last_sync_timestamp.has_value());
    EXPECT_EQ(*cache.state().last_sync_timestamp, clock.now_milliseconds());
}

TEST_F(MarketStateCacheTest, FailedSynchronizeLeavesPreviousSlots) {
    cache.synchronize();
    market_api.price = 70;
    market_api.balance_outcomes.push_back(ScriptedOutcome::RateLimited);

    EXPECT_THROW(cache.synchronize(), API::RateLimitError);
    EXPECT_EQ(*cache.state().price, 64);
}

TEST_F(MarketStateCacheTest, ApplyFillUpdatesBalanceAndHoldingsWithoutFetching) {
    cache.synchronize();
    int fetches_before = market_api.total_fetches();

    cache.apply_fill(TradeAction::Buy, 5, 64);
    EXPECT_EQ(cache.get_owned_units(), 17);
    EXPECT_EQ(cache.get_balance(), 900 - 5 * 64);

    cache.apply_fill(TradeAction::Sell, 7, 70);
    EXPECT_EQ(cache.get_owned_units(), 10);
    EXPECT_EQ(cache.get_balance(), 900 - 5 * 64 + 7 * 70);

    EXPECT_EQ(market_api.total_fetches(), fetches_before);
}

TEST_F(MarketStateCacheTest, RefreshPriceOverwritesCachedPrice) {
    cache.synchronize();
    market_api.price = 99;

    EXPECT_EQ(cache.get_price(), 64);
    EXPECT_EQ(cache.refresh_price(), 99);
    EXPECT_EQ(cache.get_price(), 99);
}

TEST_F(MarketStateCacheTest, InvalidateForcesRefetch) {
    cache.synchronize();
    cache.invalidate();

    EXPECT_FALSE(cache.state().price.has_value());
    EXPECT_FALSE(cache.state().last_sync_timestamp.has_value());
    cache.get_balance();
    EXPECT_EQ(market_api.balance_fetches, 2);
}

class MarketHistoryTest : public ::testing::Test {
protected:
    InMemoryHistoryStore store;
    MarketHistory history{store};
};

TEST_F(MarketHistoryTest, FirstSnapshotIsAlwaysAppended) {
    Core::RecordedSnapshot recorded = history.record_if_changed(MarketSnapshot(1000, 50, 0, 1000));

    EXPECT_TRUE(recorded.appended);
    EXPECT_EQ(store.snapshot_count(), 1u);
}

TEST_F(MarketHistoryTest, IdenticalPriceAppendsOnlyOnce) {
    history.record_if_changed(MarketSnapshot(1000, 50, 0, 1000));
    Core::RecordedSnapshot recorded = history.record_if_changed(MarketSnapshot(2000, 50, 3, 850));

    EXPECT_FALSE(recorded.appended);
    EXPECT_EQ(recorded.snapshot.timestamp, 1000);
    EXPECT_EQ(store.snapshot_count(), 1u);
}

TEST_F(MarketHistoryTest, PriceChangeAppends) {
    history.record_if_changed(MarketSnapshot(1000, 50, 0, 1000));
    Core::RecordedSnapshot recorded = history.record_if_changed(MarketSnapshot(2000, 51, 0, 1000));

    EXPECT_TRUE(recorded.appended);
    EXPECT_EQ(recorded.snapshot.price, 51);
    EXPECT_EQ(store.snapshot_count(), 2u);
}

TEST_F(MarketHistoryTest, ClockSteppingBackRecordsAtLatestTimestamp) {
    history.record_if_changed(MarketSnapshot(5000, 50, 0, 1000));
    Core::RecordedSnapshot recorded = history.record_if_changed(MarketSnapshot(3000, 52, 0, 1000));

    EXPECT_TRUE(recorded.appended);
    EXPECT_EQ(recorded.snapshot.timestamp, 5000);
    EXPECT_EQ(recorded.snapshot.price, 52);
    ASSERT_EQ(store.snapshots.size(), 2u);
    EXPECT_EQ(store.snapshots[1].timestamp, 5000);
    EXPECT_EQ(store.snapshots[1].price, 52);
}
