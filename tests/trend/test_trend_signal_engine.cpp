#include <gtest/gtest.h>
#include "lifecycle_ngin/trend/signal_precedence.hpp"
#include "lifecycle_ngin/trend/trend_signal_engine.hpp"
#include "test_utils.hpp"

using namespace lifecycle_ngin;
using namespace lifecycle_ngin::testing;

class TrendSignalEngineTest : public ::testing::Test {
protected:
    // Fast averages just crossed above EMA60, slow stack still bearish
    IndicatorSnapshot fresh_s1_snapshot() {
        auto s = make_snapshot(105.0, 104.0, 100.0, 110.0, 120.0, 130.0, 101.0, 2.0);
        s.ema60_slope = 0.001;
        s.rsi_slope10 = 3.0;
        s.adx_slope10 = 1.0;
        return s;
    }

    IndicatorSnapshot strong_momentum(IndicatorSnapshot s) {
        s.rsi_slope10 = 3.0;
        s.adx_slope10 = 1.0;
        return s;
    }

    TrendOutput s3_output(int bars_in_s3, bool first_dip_taken = false) {
        auto output = make_output(TrendState::S3);
        output.memory.bars_in_s3 = bars_in_s3;
        output.memory.first_dip_buy_taken = first_dip_taken;
        return output;
    }

    TrendEngineConfig config;
};

TEST_F(TrendSignalEngineTest, FreshS1CrossRaisesBuySignal) {
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(fresh_s1_snapshot(), {}, make_output(TrendState::S0));
    ASSERT_TRUE(result.is_ok());

    const auto& out = result.value();
    EXPECT_EQ(out.state, TrendState::S1);
    EXPECT_EQ(out.previous_state, TrendState::S0);
    EXPECT_TRUE(out.state_changed());
    EXPECT_TRUE(out.flags.buy_signal);
    EXPECT_TRUE(out.memory.s1_buy_taken);
    EXPECT_NEAR(out.scores.trend_strength, 0.775, 1e-12);
    EXPECT_EQ(select_signal(out.flags), TrendSignal::ENTRY_S1);
}

TEST_F(TrendSignalEngineTest, S1BuySignalFiresOnce) {
    TrendSignalEngine engine(config);
    auto first = engine.evaluate(fresh_s1_snapshot(), {}, make_output(TrendState::S0));
    ASSERT_TRUE(first.is_ok());

    auto second = engine.evaluate(fresh_s1_snapshot(), {}, first.value());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().state, TrendState::S1);
    EXPECT_FALSE(second.value().flags.buy_signal);
}

TEST_F(TrendSignalEngineTest, WeakMomentumBlocksEntryButNotState) {
    auto s = fresh_s1_snapshot();
    s.rsi_slope10 = -5.0;
    s.adx_slope10 = -2.0;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S0));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S1);
    EXPECT_FALSE(result.value().flags.buy_signal);
    EXPECT_FALSE(result.value().memory.s1_buy_taken);

    auto check = engine.check_buy_at_ema60(s);
    EXPECT_TRUE(check.entry_zone_ok);
    EXPECT_TRUE(check.slope_ok);
    EXPECT_FALSE(check.ts_ok);
}

TEST_F(TrendSignalEngineTest, SupportLevelBoostsTrendStrength) {
    auto s = fresh_s1_snapshot();
    s.rsi_slope10 = 0.0;
    s.adx_slope10 = 0.0;

    TrendSignalEngine engine(config);
    auto without = engine.check_buy_at_ema60(s);
    EXPECT_NEAR(without.trend_strength, 0.5, 1e-12);
    EXPECT_FALSE(without.passed());

    s.sr_levels.push_back(SrLevel{100.0, 1.0});
    auto with = engine.check_buy_at_ema60(s);
    EXPECT_NEAR(with.sr_boost, config.sr_boost_max, 1e-12);
    EXPECT_TRUE(with.passed());
}

TEST_F(TrendSignalEngineTest, PriceOutsideEntryZoneBlocksEntry) {
    auto s = fresh_s1_snapshot();
    s.close = 104.5;  // 2.25 ATR above EMA60

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S0));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S1);
    EXPECT_FALSE(result.value().flags.buy_signal);
}

TEST_F(TrendSignalEngineTest, S0HoldsWhileFastBandBelowEma60) {
    auto s = make_snapshot(99.0, 101.0, 100.0, 110.0, 120.0, 130.0, 101.0);
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S0));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S0);
    EXPECT_FALSE(result.value().flags.any());
}

TEST_F(TrendSignalEngineTest, S1MovesToS2AbovePriceEma333) {
    auto s = make_snapshot(125.0, 124.0, 120.0, 118.0, 122.0, 128.0, 131.0);
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S1));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S2);
}

TEST_F(TrendSignalEngineTest, S2FallsBackToS1BelowEma333) {
    auto s = make_snapshot(125.0, 124.0, 120.0, 118.0, 122.0, 128.0, 126.0);
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S2));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S1);
    EXPECT_FALSE(result.value().flags.any());
}

TEST_F(TrendSignalEngineTest, S2EntersS3OnBullishOrder) {
    auto previous = make_output(TrendState::S2);
    previous.memory.first_dip_buy_taken = true;
    previous.memory.bars_in_s3 = 7;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(make_s3_snapshot(152.0), {}, previous);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S3);
    EXPECT_EQ(result.value().memory.bars_in_s3, 0);
    EXPECT_FALSE(result.value().memory.first_dip_buy_taken);
}

TEST_F(TrendSignalEngineTest, LifetimePolicyKeepsFirstDipTakenAcrossEpisodes) {
    config.first_dip_reset = FirstDipResetPolicy::PER_POSITION_LIFETIME;
    auto previous = make_output(TrendState::S2);
    previous.memory.first_dip_buy_taken = true;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(make_s3_snapshot(152.0), {}, previous);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S3);
    EXPECT_TRUE(result.value().memory.first_dip_buy_taken);
}

TEST_F(TrendSignalEngineTest, S2RetestOfEma333RaisesBuyFlag) {
    // Price back at EMA333 from above, band not yet in S3 order
    auto s = strong_momentum(make_snapshot(125.0, 124.0, 118.0, 120.0, 119.0, 116.0, 116.5));
    s.ema333_slope = 0.0005;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, make_output(TrendState::S2));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S2);
    EXPECT_TRUE(result.value().flags.buy_flag);
    EXPECT_EQ(select_signal(result.value().flags), TrendSignal::ENTRY_DIP);
}

TEST_F(TrendSignalEngineTest, FastBandAtBottomExitsFromAnyState) {
    auto s = make_snapshot(95.0, 96.0, 100.0, 110.0, 120.0, 130.0, 94.0);
    TrendSignalEngine engine(config);

    for (auto state : {TrendState::S1, TrendState::S2, TrendState::S3}) {
        auto result = engine.evaluate(s, {}, make_output(state));
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().state, TrendState::S0);
        EXPECT_TRUE(result.value().flags.exit_position);
        EXPECT_EQ(result.value().reason, "fast_band_at_bottom");
        EXPECT_EQ(select_signal(result.value().flags), TrendSignal::EXIT_POSITION);
    }
}

TEST_F(TrendSignalEngineTest, S3ExitsWhenEveryAverageBelowEma333) {
    auto s = make_snapshot(100.0, 99.0, 95.0, 96.0, 97.0, 120.0, 101.0);
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, s3_output(10));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S0);
    EXPECT_TRUE(result.value().flags.exit_position);
    EXPECT_EQ(result.value().reason, "all_emas_below_333");
}

TEST_F(TrendSignalEngineTest, S3EmergencyExitBelowEma333) {
    TrendSignalEngine engine(config);
    auto result = engine.evaluate(make_s3_snapshot(105.0), {}, s3_output(5));
    ASSERT_TRUE(result.is_ok());

    const auto& out = result.value();
    EXPECT_EQ(out.state, TrendState::S3);
    EXPECT_TRUE(out.flags.emergency_exit);
    EXPECT_FALSE(out.flags.exit_position);
    EXPECT_FALSE(out.flags.buy_flag);
    EXPECT_FALSE(out.flags.first_dip_buy_flag);
    EXPECT_EQ(out.memory.bars_in_s3, 6);
    EXPECT_EQ(select_signal(out.flags), TrendSignal::EMERGENCY_EXIT);
}

TEST_F(TrendSignalEngineTest, ReclaimAfterEmergencyExit) {
    auto previous = s3_output(8, true);
    previous.flags.emergency_exit = true;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(make_s3_snapshot(115.0), {}, previous);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().flags.reclaimed_ema333);
    EXPECT_FALSE(result.value().flags.emergency_exit);
    // Default policy resets only on a new S3 episode
    EXPECT_TRUE(result.value().memory.first_dip_buy_taken);
    EXPECT_EQ(result.value().memory.bars_in_s3, 9);
}

TEST_F(TrendSignalEngineTest, ReentryPolicyResetsFirstDipOnReclaim) {
    config.first_dip_reset = FirstDipResetPolicy::ON_REENTRY;
    auto previous = s3_output(8, true);
    previous.flags.emergency_exit = true;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(make_s3_snapshot(115.0), {}, previous);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().flags.reclaimed_ema333);
    EXPECT_FALSE(result.value().memory.first_dip_buy_taken);
    EXPECT_EQ(result.value().memory.bars_in_s3, 1);
}

TEST_F(TrendSignalEngineTest, OverextensionTrimsOnlyNearSupportResistance) {
    TrendSignalEngine engine(config);

    auto bare = make_s3_snapshot(170.0);
    auto trimmed = engine.evaluate(bare, {}, s3_output(30));
    ASSERT_TRUE(trimmed.is_ok());
    EXPECT_GE(trimmed.value().scores.ox, config.ox_trim_threshold);
    EXPECT_TRUE(trimmed.value().flags.trim_flag);
    EXPECT_EQ(select_signal(trimmed.value().flags), TrendSignal::TRIM);

    auto far_level = bare;
    far_level.sr_levels.push_back(SrLevel{200.0, 0.9});
    auto held = engine.evaluate(far_level, {}, s3_output(30));
    ASSERT_TRUE(held.is_ok());
    EXPECT_FALSE(held.value().flags.trim_flag);

    auto near_level = bare;
    near_level.sr_levels.push_back(SrLevel{171.0, 0.9});
    auto at_level = engine.evaluate(near_level, {}, s3_output(30));
    ASSERT_TRUE(at_level.is_ok());
    EXPECT_TRUE(at_level.value().flags.trim_flag);
}

TEST_F(TrendSignalEngineTest, FirstDipFiresOncePerEpisode) {
    auto s = strong_momentum(make_s3_snapshot(149.5));
    // Distant resistance keeps the trim gate closed
    s.sr_levels.push_back(SrLevel{200.0, 0.9});

    TrendSignalEngine engine(config);
    auto first = engine.evaluate(s, {}, s3_output(2));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().flags.first_dip_buy_flag);
    EXPECT_TRUE(first.value().memory.first_dip_buy_taken);
    EXPECT_EQ(select_signal(first.value().flags), TrendSignal::ENTRY_FIRST_DIP);

    auto second = engine.evaluate(s, {}, first.value());
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value().flags.first_dip_buy_flag);
}

TEST_F(TrendSignalEngineTest, FirstDipExpiresAfterMaxBars) {
    auto s = strong_momentum(make_s3_snapshot(149.5));

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, s3_output(config.first_dip_max_bars));
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().flags.first_dip_buy_flag);
}

TEST_F(TrendSignalEngineTest, DiscountZoneRaisesDxBuy) {
    auto s = strong_momentum(make_s3_snapshot(112.0));
    s.volume_z = -2.0;
    s.atr_mean20 = 2.2;
    s.adx = 25.0;
    s.d_ema144_slope = 0.0001;

    TrendSignalEngine engine(config);
    auto result = engine.evaluate(s, {}, s3_output(40));
    ASSERT_TRUE(result.is_ok());

    const auto& out = result.value();
    EXPECT_FALSE(out.flags.emergency_exit);
    EXPECT_GE(out.scores.dx, out.scores.dx_threshold);
    EXPECT_TRUE(out.flags.buy_flag);
    EXPECT_EQ(select_signal(out.flags), TrendSignal::ENTRY_DIP);
}

TEST_F(TrendSignalEngineTest, NoPreviousStateUsesBandOrder) {
    TrendSignalEngine engine(config);

    auto mixed = engine.evaluate(make_snapshot(105.0, 104.0, 100.0, 110.0, 120.0, 130.0, 101.0),
                                 {}, std::nullopt);
    ASSERT_TRUE(mixed.is_ok());
    EXPECT_EQ(mixed.value().state, TrendState::NONE);
    EXPECT_EQ(mixed.value().reason, "no_clear_state");
    EXPECT_FALSE(mixed.value().flags.any());

    auto bullish = engine.evaluate(make_s3_snapshot(152.0), {}, std::nullopt);
    ASSERT_TRUE(bullish.is_ok());
    EXPECT_EQ(bullish.value().state, TrendState::S3);
    EXPECT_EQ(bullish.value().memory.bars_in_s3, 1);
}

TEST_F(TrendSignalEngineTest, MissingDataIsInsufficient) {
    TrendSignalEngine engine(config);

    auto no_price = make_s3_snapshot(0.0);
    auto result = engine.evaluate(no_price, {}, std::nullopt);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    auto no_ema = make_s3_snapshot(150.0);
    no_ema.ema333 = 0.0;
    EXPECT_TRUE(engine.evaluate(no_ema, {}, std::nullopt).is_error());
}

TEST_F(TrendSignalEngineTest, BootstrapReplaysHistoryAndSuppressesFlags) {
    auto now = std::chrono::system_clock::now();
    std::vector<IndicatorSnapshot> history;

    IndicatorSnapshot warmup;
    warmup.close = 90.0;
    warmup.timestamp = now - std::chrono::hours(3);
    history.push_back(warmup);

    auto bearish = make_snapshot(95.0, 96.0, 100.0, 110.0, 120.0, 130.0, 94.0);
    bearish.timestamp = now - std::chrono::hours(2);
    history.push_back(bearish);

    auto cross = fresh_s1_snapshot();
    cross.timestamp = now - std::chrono::hours(1);
    history.push_back(cross);

    auto hold = fresh_s1_snapshot();
    hold.timestamp = now;
    history.push_back(hold);

    auto bars = make_bars(80, now, std::chrono::hours(1));

    TrendSignalEngine engine(config);
    auto result = engine.bootstrap(history, bars);
    ASSERT_TRUE(result.is_ok());

    const auto& out = result.value();
    EXPECT_EQ(out.state, TrendState::S1);
    EXPECT_TRUE(out.provisional);
    EXPECT_FALSE(out.flags.any());
    EXPECT_TRUE(out.memory.s1_buy_taken);
}

TEST_F(TrendSignalEngineTest, BootstrapIntoS3IsNotProvisional) {
    std::vector<IndicatorSnapshot> history{make_s3_snapshot(150.0), make_s3_snapshot(151.0)};

    TrendSignalEngine engine(config);
    auto result = engine.bootstrap(history, {});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().state, TrendState::S3);
    EXPECT_FALSE(result.value().provisional);
    EXPECT_EQ(result.value().memory.bars_in_s3, 2);
}

TEST_F(TrendSignalEngineTest, BootstrapWithoutUsableRowsFails) {
    TrendSignalEngine engine(config);
    EXPECT_TRUE(engine.bootstrap({}, {}).is_error());

    IndicatorSnapshot warmup;
    warmup.close = 10.0;
    auto result = engine.bootstrap({warmup}, {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}
