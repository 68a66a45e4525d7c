// include/lifecycle_ngin/trend/s3_scores.hpp
#pragma once

#include <vector>
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/data/indicator_snapshot.hpp"
#include "lifecycle_ngin/trend/trend_config.hpp"

namespace lifecycle_ngin {

/**
 * @brief Logistic squash of x with scale k, in (0, 1)
 */
double sigmoid(double x, double k = 1.0);

double clamp01(double x);

/**
 * @brief Extension/discount scores used by S2 and S3, with their components
 */
struct S3Scores {
    double ox{0.0};   // overextension, drives trims
    double dx{0.0};   // discount, drives dip buys
    double edx{0.0};  // trend decay, raises the trim bias and lowers the buy bias

    // EDX components
    double slow_down{0.0};
    double structure{0.0};
    double participation_decay{0.0};
    double volatility_asymmetry{0.0};
    double geometry_rollover{0.0};

    // OX components
    double rail_fast{0.0};
    double rail_mid{0.0};
    double rail_144{0.0};
    double rail_250{0.0};
    double expansion_fast{0.0};
    double expansion_mid{0.0};
    double atr_surge{0.0};
    double fragility{0.0};

    // DX components
    double location{0.0};
    double exhaustion{0.0};
    double relief{0.0};
    double curl{0.0};
};

/**
 * @brief Compute EDX, then OX and DX adjusted by it
 * @param snapshot Latest indicators
 * @param recent_bars Up to structure_lookback bars, oldest first
 * @param config Sigmoid scales and thresholds
 */
S3Scores compute_s3_scores(const IndicatorSnapshot& snapshot, const std::vector<Bar>& recent_bars,
                           const TrendEngineConfig& config);

double compute_edx(const IndicatorSnapshot& snapshot, const std::vector<Bar>& recent_bars,
                   const TrendEngineConfig& config, S3Scores* components = nullptr);

/**
 * @brief DX buy threshold after EDX suppression and the discount-zone position boost
 */
double dx_buy_threshold(const IndicatorSnapshot& snapshot, double edx,
                        const TrendEngineConfig& config);

}  // namespace lifecycle_ngin
