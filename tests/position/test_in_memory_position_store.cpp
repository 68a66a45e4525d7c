#include <gtest/gtest.h>
#include "lifecycle_ngin/position/in_memory_position_store.hpp"

using namespace lifecycle_ngin;

class InMemoryPositionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<InMemoryPositionStore>();
    }

    Position make_position(const std::string& instrument, Timeframe timeframe,
                           PositionStatus status, Quantity quantity = 0.0) {
        Position position;
        position.key = PositionKey{instrument, "orca", timeframe};
        position.status = status;
        position.allocation_cap = 500.0;
        position.holdings.quantity = quantity;
        position.holdings.invested = quantity * 10.0;
        return position;
    }

    std::unique_ptr<InMemoryPositionStore> store;
};

TEST_F(InMemoryPositionStoreTest, CreateAndGet) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::WATCHLIST);
    ASSERT_TRUE(store->create_position(position).is_ok());

    auto loaded = store->get_position(position.key);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().key, position.key);
    EXPECT_EQ(loaded.value().status, PositionStatus::WATCHLIST);
    EXPECT_NE(loaded.value().created_at, Timestamp{});
}

TEST_F(InMemoryPositionStoreTest, DuplicateKeyRejected) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::WATCHLIST);
    ASSERT_TRUE(store->create_position(position).is_ok());

    auto duplicate = store->create_position(position);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::DUPLICATE_POSITION);

    // Same instrument on another timeframe is a separate position
    auto other_tf = make_position("JUP", Timeframe::HOUR_4, PositionStatus::WATCHLIST);
    EXPECT_TRUE(store->create_position(other_tf).is_ok());
    EXPECT_EQ(store->size(), 2u);
}

TEST_F(InMemoryPositionStoreTest, CreateRejectsInvariantViolation) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::ACTIVE, 0.0);
    auto result = store->create_position(position);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVARIANT_VIOLATION);
}

TEST_F(InMemoryPositionStoreTest, MissingPositionNotFound) {
    auto result = store->get_position(PositionKey{"NOPE", "orca", Timeframe::HOUR_1});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::POSITION_NOT_FOUND);
}

TEST_F(InMemoryPositionStoreTest, SelectionByTimeframeAndStatus) {
    ASSERT_TRUE(
        store->create_position(make_position("A", Timeframe::HOUR_1, PositionStatus::WATCHLIST))
            .is_ok());
    ASSERT_TRUE(
        store->create_position(make_position("B", Timeframe::HOUR_1, PositionStatus::ACTIVE, 1.0))
            .is_ok());
    ASSERT_TRUE(
        store->create_position(make_position("C", Timeframe::HOUR_1, PositionStatus::DORMANT))
            .is_ok());
    ASSERT_TRUE(
        store->create_position(make_position("D", Timeframe::HOUR_1, PositionStatus::PAUSED))
            .is_ok());
    ASSERT_TRUE(
        store->create_position(make_position("E", Timeframe::HOUR_4, PositionStatus::WATCHLIST))
            .is_ok());

    auto eligible = store->get_eligible_positions(Timeframe::HOUR_1);
    ASSERT_TRUE(eligible.is_ok());
    ASSERT_EQ(eligible.value().size(), 2u);
    EXPECT_EQ(eligible.value()[0].key.instrument, "A");
    EXPECT_EQ(eligible.value()[1].key.instrument, "B");

    auto dormant = store->get_bootstrap_positions(Timeframe::HOUR_1);
    ASSERT_TRUE(dormant.is_ok());
    ASSERT_EQ(dormant.value().size(), 1u);
    EXPECT_EQ(dormant.value()[0].key.instrument, "C");
}

TEST_F(InMemoryPositionStoreTest, RecordExecutionUpdatesHoldingsAndStatus) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::WATCHLIST);
    ASSERT_TRUE(store->create_position(position).is_ok());

    Fill buy;
    buy.side = Side::BUY;
    buy.quantity = 20.0;
    buy.notional = 150.0;
    buy.price = 7.5;
    buy.executed_at = std::chrono::system_clock::now();

    auto after_buy = store->record_execution(position.key, buy);
    ASSERT_TRUE(after_buy.is_ok());
    EXPECT_EQ(after_buy.value().status, PositionStatus::ACTIVE);
    EXPECT_DOUBLE_EQ(after_buy.value().holdings.quantity, 20.0);

    Fill sell = buy;
    sell.side = Side::SELL;
    sell.notional = 180.0;
    auto after_sell = store->record_execution(position.key, sell);
    ASSERT_TRUE(after_sell.is_ok());
    EXPECT_EQ(after_sell.value().status, PositionStatus::WATCHLIST);
    EXPECT_DOUBLE_EQ(after_sell.value().holdings.extracted, 180.0);

    auto stored = store->get_position(position.key);
    EXPECT_EQ(stored.value().status, PositionStatus::WATCHLIST);
}

TEST_F(InMemoryPositionStoreTest, RecordExecutionOnDormantFails) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::DORMANT);
    ASSERT_TRUE(store->create_position(position).is_ok());

    Fill buy;
    buy.side = Side::BUY;
    buy.quantity = 1.0;
    buy.notional = 10.0;
    auto result = store->record_execution(position.key, buy);
    EXPECT_TRUE(result.is_error());
    EXPECT_DOUBLE_EQ(store->get_position(position.key).value().holdings.quantity, 0.0);
}

TEST_F(InMemoryPositionStoreTest, UpdateStatusValidatesTransitionAndInvariants) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::DORMANT);
    ASSERT_TRUE(store->create_position(position).is_ok());

    auto promoted =
        store->update_status(position.key, PositionStatus::WATCHLIST, TransitionOrigin::AUTOMATIC);
    ASSERT_TRUE(promoted.is_ok());
    EXPECT_EQ(promoted.value().status, PositionStatus::WATCHLIST);

    // Flat position can never become active by status change alone
    auto activated =
        store->update_status(position.key, PositionStatus::ACTIVE, TransitionOrigin::AUTOMATIC);
    ASSERT_TRUE(activated.is_error());
    EXPECT_EQ(activated.error()->code(), ErrorCode::INVARIANT_VIOLATION);

    auto paused =
        store->update_status(position.key, PositionStatus::PAUSED, TransitionOrigin::AUTOMATIC);
    ASSERT_TRUE(paused.is_error());
    EXPECT_EQ(paused.error()->code(), ErrorCode::INVALID_STATUS_TRANSITION);

    EXPECT_TRUE(
        store->update_status(position.key, PositionStatus::PAUSED, TransitionOrigin::MANUAL)
            .is_ok());
}

TEST_F(InMemoryPositionStoreTest, FeatureRefreshes) {
    auto position = make_position("JUP", Timeframe::HOUR_1, PositionStatus::WATCHLIST);
    ASSERT_TRUE(store->create_position(position).is_ok());

    TrendOutput output;
    output.state = TrendState::S1;
    output.price = 12.5;
    ASSERT_TRUE(store->refresh_trend_output(position.key, output).is_ok());

    ScoreSnapshot scores;
    scores.a = 0.8;
    scores.e = 0.2;
    ASSERT_TRUE(store->refresh_scores(position.key, scores).is_ok());
    ASSERT_TRUE(store->update_bars_count(position.key, 420).is_ok());
    EXPECT_TRUE(store->update_bars_count(position.key, -1).is_error());

    auto loaded = store->get_position(position.key).value();
    ASSERT_TRUE(loaded.features.trend.has_value());
    EXPECT_EQ(loaded.features.trend->state, TrendState::S1);
    EXPECT_DOUBLE_EQ(loaded.last_price, 12.5);
    ASSERT_TRUE(loaded.features.scores.has_value());
    EXPECT_DOUBLE_EQ(loaded.features.scores->a, 0.8);
    EXPECT_EQ(loaded.bars_count, 420);

    PositionKey missing{"NOPE", "orca", Timeframe::HOUR_1};
    EXPECT_TRUE(store->refresh_trend_output(missing, output).is_error());
}
