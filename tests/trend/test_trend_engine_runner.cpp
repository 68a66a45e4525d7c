#include <gtest/gtest.h>
#include "lifecycle_ngin/position/in_memory_position_store.hpp"
#include "lifecycle_ngin/trend/trend_engine_runner.hpp"
#include "test_utils.hpp"

using namespace lifecycle_ngin;
using namespace lifecycle_ngin::testing;

class TrendEngineRunnerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<InMemoryPositionStore>();
        market_data = std::make_shared<MockMarketData>();
    }

    Position add_position(const std::string& instrument, PositionStatus status,
                          std::optional<TrendState> state = std::nullopt) {
        Position position;
        position.key = PositionKey{instrument, "orca", Timeframe::HOUR_1};
        position.status = status;
        position.allocation_cap = 1000.0;
        if (state) {
            position.features.trend = make_output(*state);
        }
        EXPECT_TRUE(store->create_position(position).is_ok());
        return position;
    }

    IndicatorSnapshot s1_cross() {
        auto s = make_snapshot(105.0, 104.0, 100.0, 110.0, 120.0, 130.0, 101.0);
        s.ema60_slope = 0.001;
        s.rsi_slope10 = 3.0;
        s.adx_slope10 = 1.0;
        return s;
    }

    std::shared_ptr<InMemoryPositionStore> store;
    std::shared_ptr<MockMarketData> market_data;
    TrendEngineConfig config;
};

TEST_F(TrendEngineRunnerTest, EvaluatesEligiblePositionAndCachesOutput) {
    auto position = add_position("JUP", PositionStatus::WATCHLIST, TrendState::S0);
    market_data->set_bars_count(position.key, 400);
    market_data->push_snapshot(position.key, s1_cross());

    TrendEngineRunner runner(store, market_data, config);
    auto summary = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().evaluated, 1u);
    EXPECT_EQ(summary.value().state_changes, 1u);
    EXPECT_EQ(summary.value().skipped, 0u);

    auto stored = store->get_position(position.key);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().bars_count, 400);
    ASSERT_TRUE(stored.value().features.trend.has_value());
    EXPECT_EQ(stored.value().features.trend->state, TrendState::S1);
    EXPECT_TRUE(stored.value().features.trend->flags.buy_signal);
    ASSERT_TRUE(stored.value().features.indicators.has_value());
    EXPECT_DOUBLE_EQ(stored.value().features.indicators->close, 101.0);
}

TEST_F(TrendEngineRunnerTest, SkipsPositionWithoutEnoughBars) {
    auto position = add_position("JUP", PositionStatus::WATCHLIST, TrendState::S0);
    market_data->set_bars_count(position.key, 100);
    market_data->push_snapshot(position.key, s1_cross());

    TrendEngineRunner runner(store, market_data, config);
    auto summary = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().evaluated, 0u);
    EXPECT_EQ(summary.value().skipped, 1u);

    auto stored = store->get_position(position.key);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().bars_count, 100);
    EXPECT_EQ(stored.value().features.trend->state, TrendState::S0);
}

TEST_F(TrendEngineRunnerTest, MissingIndicatorsSkipOnlyThatPosition) {
    auto missing = add_position("BONK", PositionStatus::WATCHLIST, TrendState::S0);
    auto present = add_position("JUP", PositionStatus::WATCHLIST, TrendState::S0);
    market_data->set_bars_count(missing.key, 400);
    market_data->set_bars_count(present.key, 400);
    market_data->push_snapshot(present.key, s1_cross());

    TrendEngineRunner runner(store, market_data, config);
    auto summary = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().evaluated, 1u);
    EXPECT_EQ(summary.value().skipped, 1u);
    EXPECT_EQ(summary.value().failed, 0u);
}

TEST_F(TrendEngineRunnerTest, OtherTimeframesAreIgnored) {
    Position other;
    other.key = PositionKey{"JUP", "orca", Timeframe::HOUR_4};
    other.status = PositionStatus::WATCHLIST;
    ASSERT_TRUE(store->create_position(other).is_ok());
    market_data->set_bars_count(other.key, 400);
    market_data->push_snapshot(other.key, s1_cross());

    TrendEngineRunner runner(store, market_data, config);
    auto summary = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().evaluated, 0u);
    EXPECT_FALSE(store->get_position(other.key).value().features.trend.has_value());
}

TEST_F(TrendEngineRunnerTest, DormantPositionReplayedThenStepped) {
    auto position = add_position("WIF", PositionStatus::DORMANT);
    market_data->set_bars_count(position.key, 120);
    market_data->push_snapshot(position.key, make_s3_snapshot(150.0));
    market_data->push_snapshot(position.key, make_s3_snapshot(151.0));

    TrendEngineRunner runner(store, market_data, config);
    auto first = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().bootstrapped, 1u);
    EXPECT_EQ(market_data->history_requests(), 1u);

    auto replayed = store->get_position(position.key);
    ASSERT_TRUE(replayed.is_ok());
    ASSERT_TRUE(replayed.value().features.trend.has_value());
    EXPECT_EQ(replayed.value().features.trend->state, TrendState::S3);
    EXPECT_EQ(replayed.value().features.trend->memory.bars_in_s3, 2);
    EXPECT_EQ(replayed.value().bars_count, 120);
    EXPECT_EQ(replayed.value().status, PositionStatus::DORMANT);

    // Below EMA333 would be an emergency exit for a live position
    market_data->push_snapshot(position.key, make_s3_snapshot(105.0));
    auto second = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().bootstrapped, 1u);
    EXPECT_EQ(market_data->history_requests(), 1u);

    auto stepped = store->get_position(position.key);
    ASSERT_TRUE(stepped.is_ok());
    EXPECT_EQ(stepped.value().features.trend->state, TrendState::S3);
    EXPECT_EQ(stepped.value().features.trend->memory.bars_in_s3, 3);
    EXPECT_FALSE(stepped.value().features.trend->flags.any());
}

TEST_F(TrendEngineRunnerTest, DormantWithoutHistoryIsSkipped) {
    add_position("WIF", PositionStatus::DORMANT);

    TrendEngineRunner runner(store, market_data, config);
    auto summary = runner.run(Timeframe::HOUR_1);
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().bootstrapped, 0u);
    EXPECT_EQ(summary.value().skipped, 1u);
}

TEST_F(TrendEngineRunnerTest, PublishesStateAndMetrics) {
    auto position = add_position("JUP", PositionStatus::WATCHLIST, TrendState::S0);
    market_data->set_bars_count(position.key, 400);
    market_data->push_snapshot(position.key, s1_cross());

    TrendEngineRunner runner(store, market_data, config);
    auto registered = StateManager::instance().get_state(runner.component_id());
    ASSERT_TRUE(registered.is_ok());
    EXPECT_EQ(registered.value().state, ComponentState::INITIALIZED);

    ASSERT_TRUE(runner.run(Timeframe::HOUR_1).is_ok());

    auto info = StateManager::instance().get_state(runner.component_id());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().state, ComponentState::RUNNING);
    EXPECT_DOUBLE_EQ(info.value().metrics.at("positions_processed"), 1.0);
    EXPECT_DOUBLE_EQ(info.value().metrics.at("state_changes"), 1.0);
}
