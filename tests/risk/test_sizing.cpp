#include <gtest/gtest.h>
#include "lifecycle_ngin/risk/sizing.hpp"

using namespace lifecycle_ngin;

class PositionSizerTest : public ::testing::Test {
protected:
    Position make_position(double invested, double extracted, Quantity quantity) {
        Position position;
        position.key = PositionKey{"JUP", "orca", Timeframe::HOUR_1};
        position.status = quantity > 0.0 ? PositionStatus::ACTIVE : PositionStatus::WATCHLIST;
        position.allocation_cap = 1000.0;
        position.holdings.invested = invested;
        position.holdings.extracted = extracted;
        position.holdings.quantity = quantity;
        return position;
    }

    SizingConfig config;
};

TEST_F(PositionSizerTest, EntryTablesByTier) {
    PositionSizer sizer(config);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::S1, Tier::AGGRESSIVE, 1.0), 0.50);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::S1, Tier::NORMAL, 1.0), 0.30);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::S1, Tier::PATIENT, 1.0), 0.10);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::LATER_STAGE, Tier::NORMAL, 1.0), 0.15);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::FIRST_DIP, Tier::NORMAL, 1.0), 0.25);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::REENTRY, Tier::AGGRESSIVE, 1.0), 0.25);
}

TEST_F(PositionSizerTest, SizesMonotonicInTier) {
    PositionSizer sizer(config);
    for (auto kind : {EntryKind::S1, EntryKind::LATER_STAGE, EntryKind::FIRST_DIP,
                      EntryKind::REENTRY}) {
        double patient = sizer.entry_size(kind, Tier::PATIENT, 1.0);
        double normal = sizer.entry_size(kind, Tier::NORMAL, 1.0);
        double aggressive = sizer.entry_size(kind, Tier::AGGRESSIVE, 1.0);
        EXPECT_LT(patient, normal) << entry_kind_to_string(kind);
        EXPECT_LT(normal, aggressive) << entry_kind_to_string(kind);
    }
    for (auto tier : {Tier::PATIENT, Tier::NORMAL, Tier::AGGRESSIVE}) {
        EXPECT_GT(sizer.entry_size(EntryKind::S1, tier, 1.0),
                  sizer.entry_size(EntryKind::LATER_STAGE, tier, 1.0));
    }
}

TEST_F(PositionSizerTest, TrimTableByExitPressure) {
    PositionSizer sizer(config);
    EXPECT_DOUBLE_EQ(sizer.trim_size(Tier::AGGRESSIVE, 1.0), 0.50);
    EXPECT_DOUBLE_EQ(sizer.trim_size(Tier::NORMAL, 1.0), 0.10);
    EXPECT_DOUBLE_EQ(sizer.trim_size(Tier::PATIENT, 1.0), 0.03);
}

TEST_F(PositionSizerTest, FractionsClampedToUnitInterval) {
    PositionSizer sizer(config);
    EXPECT_DOUBLE_EQ(sizer.trim_size(Tier::AGGRESSIVE, 3.0), 1.0);
    EXPECT_DOUBLE_EQ(sizer.entry_size(EntryKind::S1, Tier::AGGRESSIVE, 2.5), 1.0);
    EXPECT_GT(sizer.entry_size(EntryKind::S1, Tier::PATIENT, 0.0), 0.0);
}

TEST_F(PositionSizerTest, EntryMultiplierShrinksWithRealizedProfit) {
    PositionSizer sizer(config);
    EXPECT_DOUBLE_EQ(sizer.entry_multiplier(make_position(0.0, 0.0, 0.0), 10.0), 1.0);
    EXPECT_NEAR(sizer.entry_multiplier(make_position(1000.0, 1500.0, 0.0), 10.0), 0.65, 1e-12);
    EXPECT_DOUBLE_EQ(sizer.entry_multiplier(make_position(1000.0, 2200.0, 0.0), 10.0),
                     config.min_multiplier);
}

TEST_F(PositionSizerTest, EntryMultiplierGrowsWhenUnderwater) {
    PositionSizer sizer(config);
    auto holding = make_position(500.0, 0.0, 50.0);  // average entry 10
    EXPECT_DOUBLE_EQ(sizer.entry_multiplier(holding, 12.0), 1.0);
    EXPECT_NEAR(sizer.entry_multiplier(holding, 8.0), 1.2, 1e-12);
    EXPECT_NEAR(sizer.entry_multiplier(holding, 2.0), 1.0 + config.max_underwater_boost, 1e-12);
}

TEST_F(PositionSizerTest, TrimMultiplierRampsWithDeployment) {
    PositionSizer sizer(config);
    EXPECT_DOUBLE_EQ(sizer.trim_multiplier(make_position(250.0, 0.0, 25.0)), 1.0);
    EXPECT_DOUBLE_EQ(sizer.trim_multiplier(make_position(750.0, 0.0, 75.0)), 2.0);
    EXPECT_DOUBLE_EQ(sizer.trim_multiplier(make_position(1000.0, 0.0, 100.0)), 3.0);
    EXPECT_DOUBLE_EQ(sizer.trim_multiplier(make_position(1000.0, 2000.0, 10.0)),
                     config.min_multiplier);
}

TEST_F(PositionSizerTest, FractionsUseScoreTiers) {
    PositionSizer sizer(config);
    ScoreSnapshot scores;
    scores.a_tier = Tier::AGGRESSIVE;
    scores.e_tier = Tier::PATIENT;

    auto flat = make_position(0.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(sizer.entry_fraction(EntryKind::S1, scores, flat, 10.0), 0.50);

    auto half = make_position(250.0, 0.0, 25.0);
    EXPECT_DOUBLE_EQ(sizer.trim_fraction(scores, half), 0.03);
}

TEST_F(PositionSizerTest, ConfigValidation) {
    EXPECT_TRUE(config.validate().is_ok());

    SizingConfig inverted = config;
    inverted.later_entry.aggressive = 0.6;
    EXPECT_TRUE(inverted.validate().is_error());

    SizingConfig flat_trim = config;
    flat_trim.trim.normal = flat_trim.trim.aggressive;
    EXPECT_TRUE(flat_trim.validate().is_error());

    SizingConfig bad_knee = config;
    bad_knee.trim_deploy_knee = 1.0;
    EXPECT_TRUE(bad_knee.validate().is_error());
}
