// include/lifecycle_ngin/data/indicator_snapshot.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Support/resistance level with a strength in [0, 1]
 */
struct SrLevel {
    Price price{0.0};
    double strength{0.0};
};

/**
 * @brief Latest precomputed technical indicators for one (instrument, timeframe)
 *
 * Slopes are normalised per bar (fraction of price per bar), as delivered by
 * the indicator job.
 */
struct IndicatorSnapshot {
    Timestamp timestamp;
    Price close{0.0};

    // Moving averages
    double ema20{0.0};
    double ema30{0.0};
    double ema60{0.0};
    double ema144{0.0};
    double ema250{0.0};
    double ema333{0.0};

    // Moving average slopes
    double ema20_slope{0.0};
    double ema60_slope{0.0};
    double ema144_slope{0.0};
    double ema250_slope{0.0};
    double ema333_slope{0.0};
    double d_ema144_slope{0.0};  // change of the EMA144 slope

    // Volatility
    double atr{0.0};
    double atr_mean20{0.0};

    // Momentum and trend strength
    double rsi_slope10{0.0};
    double adx{0.0};
    double adx_slope10{0.0};

    // EMA separation deltas (fast = 20/60, mid = 60/144)
    double dsep_fast{0.0};
    double dsep_mid{0.0};

    // Volume deviation z-score
    double volume_z{0.0};

    std::vector<SrLevel> sr_levels;

    bool has_emas() const {
        return ema20 > 0.0 && ema30 > 0.0 && ema60 > 0.0 && ema144 > 0.0 && ema250 > 0.0 &&
               ema333 > 0.0;
    }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

}  // namespace lifecycle_ngin
