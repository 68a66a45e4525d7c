#include <gtest/gtest.h>
#include "lifecycle_ngin/position/position.hpp"

using namespace lifecycle_ngin;

namespace {

Position make_position(PositionStatus status, Quantity quantity, double cap = 1000.0) {
    Position position;
    position.key = PositionKey{"SOL", "raydium", Timeframe::HOUR_1};
    position.status = status;
    position.allocation_cap = cap;
    position.holdings.quantity = quantity;
    return position;
}

Fill make_fill(Side side, Quantity quantity, double notional) {
    Fill fill;
    fill.side = side;
    fill.quantity = quantity;
    fill.notional = notional;
    fill.price = quantity > 0.0 ? notional / quantity : 0.0;
    fill.tx_reference = "tx";
    fill.executed_at = std::chrono::system_clock::now();
    return fill;
}

}  // namespace

class PositionTest : public ::testing::Test {};

TEST_F(PositionTest, KeyIdentityAndHash) {
    PositionKey a{"SOL", "raydium", Timeframe::HOUR_1};
    PositionKey b{"SOL", "raydium", Timeframe::HOUR_1};
    PositionKey c{"SOL", "raydium", Timeframe::HOUR_4};

    EXPECT_EQ(a.id(), "SOL_raydium_1h");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<PositionKey>()(a), std::hash<PositionKey>()(b));
}

TEST_F(PositionTest, StatusStringsRoundTrip) {
    for (auto status : {PositionStatus::DORMANT, PositionStatus::WATCHLIST, PositionStatus::ACTIVE,
                        PositionStatus::PAUSED, PositionStatus::ARCHIVED}) {
        auto parsed = position_status_from_string(position_status_to_string(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(position_status_from_string("closed").has_value());
}

TEST_F(PositionTest, InvariantsTieStatusToHoldings) {
    EXPECT_TRUE(check_invariants(make_position(PositionStatus::ACTIVE, 2.0)).is_ok());
    EXPECT_TRUE(check_invariants(make_position(PositionStatus::WATCHLIST, 0.0)).is_ok());
    EXPECT_TRUE(check_invariants(make_position(PositionStatus::DORMANT, 0.0)).is_ok());

    auto active_flat = check_invariants(make_position(PositionStatus::ACTIVE, 0.0));
    ASSERT_TRUE(active_flat.is_error());
    EXPECT_EQ(active_flat.error()->code(), ErrorCode::INVARIANT_VIOLATION);

    EXPECT_TRUE(check_invariants(make_position(PositionStatus::WATCHLIST, 1.0)).is_error());
    EXPECT_TRUE(check_invariants(make_position(PositionStatus::DORMANT, -1.0)).is_error());
}

TEST_F(PositionTest, AutomaticTransitionsFollowLifecycle) {
    auto automatic = TransitionOrigin::AUTOMATIC;
    EXPECT_TRUE(validate_status_transition(PositionStatus::DORMANT, PositionStatus::WATCHLIST,
                                           automatic)
                    .is_ok());
    EXPECT_TRUE(validate_status_transition(PositionStatus::WATCHLIST, PositionStatus::ACTIVE,
                                           automatic)
                    .is_ok());
    EXPECT_TRUE(validate_status_transition(PositionStatus::ACTIVE, PositionStatus::WATCHLIST,
                                           automatic)
                    .is_ok());
    EXPECT_TRUE(validate_status_transition(PositionStatus::WATCHLIST, PositionStatus::DORMANT,
                                           automatic)
                    .is_ok());

    auto skip = validate_status_transition(PositionStatus::DORMANT, PositionStatus::ACTIVE,
                                           automatic);
    ASSERT_TRUE(skip.is_error());
    EXPECT_EQ(skip.error()->code(), ErrorCode::INVALID_STATUS_TRANSITION);

    EXPECT_TRUE(validate_status_transition(PositionStatus::ACTIVE, PositionStatus::PAUSED,
                                           automatic)
                    .is_error());
    EXPECT_TRUE(validate_status_transition(PositionStatus::PAUSED, PositionStatus::ACTIVE,
                                           automatic)
                    .is_error());
}

TEST_F(PositionTest, ManualTransitionsReachPausedAndArchived) {
    auto manual = TransitionOrigin::MANUAL;
    EXPECT_TRUE(
        validate_status_transition(PositionStatus::ACTIVE, PositionStatus::PAUSED, manual).is_ok());
    EXPECT_TRUE(
        validate_status_transition(PositionStatus::PAUSED, PositionStatus::ACTIVE, manual).is_ok());
    EXPECT_TRUE(validate_status_transition(PositionStatus::WATCHLIST, PositionStatus::ARCHIVED,
                                           manual)
                    .is_ok());
    EXPECT_TRUE(validate_status_transition(PositionStatus::ARCHIVED, PositionStatus::ACTIVE,
                                           manual)
                    .is_error());
}

TEST_F(PositionTest, StatusForQuantityOnlyMovesBetweenWatchlistAndActive) {
    EXPECT_EQ(status_for_quantity(PositionStatus::WATCHLIST, 1.0), PositionStatus::ACTIVE);
    EXPECT_EQ(status_for_quantity(PositionStatus::ACTIVE, 0.0), PositionStatus::WATCHLIST);
    EXPECT_EQ(status_for_quantity(PositionStatus::ACTIVE, 0.5), PositionStatus::ACTIVE);
    EXPECT_EQ(status_for_quantity(PositionStatus::DORMANT, 1.0), PositionStatus::DORMANT);
    EXPECT_EQ(status_for_quantity(PositionStatus::PAUSED, 0.0), PositionStatus::PAUSED);
}

TEST_F(PositionTest, BuyFillActivatesWatchlistPosition) {
    auto position = make_position(PositionStatus::WATCHLIST, 0.0);
    auto fill = make_fill(Side::BUY, 3.0, 300.0);

    auto result = apply_fill(position, fill);
    ASSERT_TRUE(result.is_ok());

    const auto& updated = result.value();
    EXPECT_EQ(updated.status, PositionStatus::ACTIVE);
    EXPECT_DOUBLE_EQ(updated.holdings.quantity, 3.0);
    EXPECT_DOUBLE_EQ(updated.holdings.invested, 300.0);
    EXPECT_DOUBLE_EQ(updated.last_price, 100.0);
    ASSERT_TRUE(updated.last_execution_at.has_value());
    EXPECT_EQ(*updated.last_execution_at, fill.executed_at);
}

TEST_F(PositionTest, FullSellReturnsToWatchlist) {
    auto position = make_position(PositionStatus::ACTIVE, 3.0);
    position.holdings.invested = 300.0;

    auto result = apply_fill(position, make_fill(Side::SELL, 3.0, 450.0));
    ASSERT_TRUE(result.is_ok());

    const auto& updated = result.value();
    EXPECT_EQ(updated.status, PositionStatus::WATCHLIST);
    EXPECT_DOUBLE_EQ(updated.holdings.quantity, 0.0);
    EXPECT_DOUBLE_EQ(updated.holdings.extracted, 450.0);
    EXPECT_TRUE(check_invariants(updated).is_ok());
}

TEST_F(PositionTest, SellResidueBelowEpsilonIsFlat) {
    auto position = make_position(PositionStatus::ACTIVE, 1.0);
    auto result = apply_fill(position, make_fill(Side::SELL, 1.0 - 1e-14, 10.0));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().holdings.quantity, 0.0);
    EXPECT_EQ(result.value().status, PositionStatus::WATCHLIST);
}

TEST_F(PositionTest, FillRejectedOutsideTradableStatuses) {
    auto dormant = make_position(PositionStatus::DORMANT, 0.0);
    auto result = apply_fill(dormant, make_fill(Side::BUY, 1.0, 10.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_STATUS_TRANSITION);

    auto watchlist = make_position(PositionStatus::WATCHLIST, 0.0);
    EXPECT_TRUE(apply_fill(watchlist, make_fill(Side::BUY, 0.0, 0.0)).is_error());
    EXPECT_TRUE(apply_fill(watchlist, make_fill(Side::NONE, 1.0, 10.0)).is_error());
}

TEST_F(PositionTest, RecentExecutionOrClaimBlocks) {
    auto position = make_position(PositionStatus::WATCHLIST, 0.0);
    auto now = std::chrono::system_clock::now();
    const std::chrono::seconds window(180);
    EXPECT_FALSE(execution_blocked(position, now, window));

    position.execution_claimed_at = now - std::chrono::seconds(100);
    EXPECT_TRUE(execution_blocked(position, now, window));
    EXPECT_FALSE(execution_blocked(position, now + std::chrono::seconds(80), window));

    position.execution_claimed_at.reset();
    position.last_execution_at = now + std::chrono::seconds(10);
    EXPECT_TRUE(execution_blocked(position, now, window));
}

TEST_F(PositionTest, HoldingsFractions) {
    Holdings holdings;
    holdings.quantity = 2.0;
    holdings.invested = 400.0;
    holdings.extracted = 100.0;

    EXPECT_DOUBLE_EQ(holdings.net_deployed(), 300.0);
    EXPECT_DOUBLE_EQ(holdings.deployed_fraction(1000.0), 0.3);
    EXPECT_DOUBLE_EQ(holdings.remaining_allocation(1000.0), 700.0);
    EXPECT_DOUBLE_EQ(holdings.realized_profit_fraction(1000.0), 0.0);
    ASSERT_TRUE(holdings.average_entry_price().has_value());
    EXPECT_DOUBLE_EQ(*holdings.average_entry_price(), 150.0);
    EXPECT_DOUBLE_EQ(holdings.unrealised_return(120.0), -0.2);

    holdings.extracted = 600.0;
    EXPECT_DOUBLE_EQ(holdings.net_deployed(), 0.0);
    EXPECT_DOUBLE_EQ(holdings.realized_profit_fraction(1000.0), 0.2);
    EXPECT_DOUBLE_EQ(holdings.remaining_allocation(1000.0), 1000.0);
    EXPECT_FALSE(holdings.average_entry_price().has_value());
    EXPECT_DOUBLE_EQ(holdings.deployed_fraction(0.0), 0.0);
}

TEST_F(PositionTest, DefaultSplitsAllocateAcrossTimeframes) {
    auto caps = split_allocation(10000.0);
    ASSERT_TRUE(caps.is_ok());
    EXPECT_DOUBLE_EQ(caps.value().at(Timeframe::MINUTE_1), 500.0);
    EXPECT_DOUBLE_EQ(caps.value().at(Timeframe::MINUTE_15), 1250.0);
    EXPECT_DOUBLE_EQ(caps.value().at(Timeframe::HOUR_1), 7000.0);
    EXPECT_DOUBLE_EQ(caps.value().at(Timeframe::HOUR_4), 1250.0);
}

TEST_F(PositionTest, SplitsRejectInvalidInput) {
    EXPECT_TRUE(split_allocation(-1.0).is_error());
    EXPECT_TRUE(split_allocation(100.0, {{Timeframe::HOUR_1, 0.8}, {Timeframe::HOUR_4, 0.3}})
                    .is_error());
    EXPECT_TRUE(split_allocation(100.0, {{Timeframe::HOUR_1, -0.1}}).is_error());
}

TEST_F(PositionTest, FeaturesJsonKeepsSections) {
    Features features;
    TrendOutput trend;
    trend.state = TrendState::S2;
    trend.flags.trim_flag = true;
    features.trend = trend;

    Features loaded;
    loaded.from_json(features.to_json());
    ASSERT_TRUE(loaded.trend.has_value());
    EXPECT_EQ(loaded.trend->state, TrendState::S2);
    EXPECT_TRUE(loaded.trend->flags.trim_flag);
    EXPECT_FALSE(loaded.scores.has_value());
    EXPECT_FALSE(loaded.indicators.has_value());
}
