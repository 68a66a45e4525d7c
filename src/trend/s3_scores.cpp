// src/trend/s3_scores.cpp

#include "lifecycle_ngin/trend/s3_scores.hpp"
#include <algorithm>
#include <cmath>

namespace lifecycle_ngin {

namespace {

constexpr double MIN_SCALE = 1e-9;

double rail(double price, double ema, double atr, double k) {
    if (atr <= 0.0) {
        return 0.0;
    }
    return sigmoid((price - ema) / (atr * k));
}

// Share of lower lows and of closes below EMA60 over the window
double structure_score(const std::vector<Bar>& bars, double ema60, size_t lookback) {
    if (bars.size() < 2) {
        return 0.5;
    }
    size_t start = bars.size() > lookback ? bars.size() - lookback : 0;
    size_t lower_lows = 0;
    size_t steps = 0;
    size_t below_mid = 0;
    size_t counted = 0;
    for (size_t i = start; i < bars.size(); ++i) {
        if (i > start) {
            ++steps;
            if (bars[i].low < bars[i - 1].low) {
                ++lower_lows;
            }
        }
        ++counted;
        if (bars[i].close < ema60) {
            ++below_mid;
        }
    }
    double ll_ratio = steps > 0 ? static_cast<double>(lower_lows) / steps : 0.0;
    double below_ratio = counted > 0 ? static_cast<double>(below_mid) / counted : 0.0;
    return 0.5 * sigmoid((ll_ratio - 0.5) / 0.2) + 0.5 * sigmoid((below_ratio - 0.4) / 0.2);
}

// True range of down bars against up bars
double asymmetry_score(const std::vector<Bar>& bars, size_t lookback) {
    if (bars.size() < 2) {
        return 0.5;
    }
    size_t start = bars.size() > lookback ? bars.size() - lookback : 0;
    double up_sum = 0.0;
    double down_sum = 0.0;
    size_t up_count = 0;
    size_t down_count = 0;
    for (size_t i = std::max<size_t>(start, 1); i < bars.size(); ++i) {
        double prev_close = bars[i - 1].close;
        double true_range = std::max({bars[i].high - bars[i].low,
                                      std::abs(bars[i].high - prev_close),
                                      std::abs(bars[i].low - prev_close)});
        if (bars[i].close >= bars[i].open) {
            up_sum += true_range;
            ++up_count;
        } else {
            down_sum += true_range;
            ++down_count;
        }
    }
    if (up_count == 0 || down_count == 0 || up_sum <= 0.0) {
        return 0.5;
    }
    double ratio = (down_sum / down_count) / (up_sum / up_count);
    return sigmoid((ratio - 1.0) / 0.2);
}

}  // namespace

double sigmoid(double x, double k) {
    return 1.0 / (1.0 + std::exp(-x / std::max(k, MIN_SCALE)));
}

double clamp01(double x) {
    return std::min(1.0, std::max(0.0, x));
}

double compute_edx(const IndicatorSnapshot& s, const std::vector<Bar>& recent_bars,
                   const TrendEngineConfig& config, S3Scores* components) {
    double slow_down = 0.5 * sigmoid(-s.ema250_slope, config.edx_slow_k) +
                       0.5 * sigmoid(-s.ema333_slope, config.edx_slow_333_k);
    double structure = structure_score(recent_bars, s.ema60, config.structure_lookback);
    double participation_decay = sigmoid(-s.volume_z);
    double asymmetry = asymmetry_score(recent_bars, config.structure_lookback);
    double geometry = 0.6 * sigmoid(-s.dsep_mid, config.exp_mid_k) +
                      0.4 * sigmoid(-s.dsep_fast, config.exp_fast_k);

    if (components) {
        components->slow_down = slow_down;
        components->structure = structure;
        components->participation_decay = participation_decay;
        components->volatility_asymmetry = asymmetry;
        components->geometry_rollover = geometry;
    }

    return clamp01(0.30 * slow_down + 0.25 * structure + 0.20 * participation_decay +
                   0.15 * asymmetry + 0.10 * geometry);
}

double dx_buy_threshold(const IndicatorSnapshot& s, double edx, const TrendEngineConfig& config) {
    double suppression = 0.0;
    if (edx >= 0.7) {
        suppression = 0.15;
    } else if (edx >= 0.5) {
        suppression = (edx - 0.5) * 0.5;
    }

    // 0 at EMA144, 1 at EMA333
    double position_boost = 0.0;
    if (s.ema144 > s.ema333) {
        double pos = clamp01((s.ema144 - s.close) / (s.ema144 - s.ema333));
        position_boost = pos * 0.10 - (1.0 - pos) * 0.05;
    }

    return std::max(0.0, config.dx_buy_threshold + suppression - position_boost);
}

S3Scores compute_s3_scores(const IndicatorSnapshot& s, const std::vector<Bar>& recent_bars,
                           const TrendEngineConfig& config) {
    S3Scores scores;
    scores.edx = compute_edx(s, recent_bars, config, &scores);

    // OX
    scores.rail_fast = rail(s.close, s.ema20, s.atr, config.rail_fast_k);
    scores.rail_mid = rail(s.close, s.ema60, s.atr, config.rail_mid_k);
    scores.rail_144 = rail(s.close, s.ema144, s.atr, config.rail_144_k);
    scores.rail_250 = rail(s.close, s.ema250, s.atr, config.rail_250_k);
    scores.expansion_fast = sigmoid(s.dsep_fast, config.exp_fast_k);
    scores.expansion_mid = sigmoid(s.dsep_mid, config.exp_mid_k);
    scores.atr_surge = s.atr_mean20 > 0.0 ? sigmoid(s.atr / s.atr_mean20 - 1.0) : 0.5;
    scores.fragility = sigmoid(-s.ema20_slope, config.curvature_k);

    double ox_base = 0.35 * scores.rail_fast + 0.20 * scores.rail_mid + 0.10 * scores.rail_144 +
                     0.10 * scores.rail_250 + 0.10 * scores.expansion_fast +
                     0.05 * scores.expansion_mid + 0.05 * scores.atr_surge +
                     0.05 * scores.fragility;
    double ox_bias = 1.0 + 0.33 * std::min(0.5, std::max(0.0, scores.edx - 0.5));
    scores.ox = clamp01(ox_base * ox_bias);

    // DX
    double x = 0.0;
    if (s.ema144 > s.ema333) {
        x = clamp01((s.close - s.ema333) / (s.ema144 - s.ema333));
    }
    double band_width = std::abs(s.ema144 - s.ema333);
    double compression = s.close > 0.0 ? sigmoid((0.03 - band_width / s.close) / 0.02) : 0.0;
    scores.location = std::exp(-3.0 * x) * (1.0 + 0.3 * compression);
    scores.exhaustion = sigmoid(-s.volume_z);

    double atr_relief = s.atr_mean20 > 0.0 ? sigmoid((s.atr / s.atr_mean20 - 0.9) / 0.05) : 0.0;
    double rsi_relief = sigmoid(s.rsi_slope10, config.rsi_k);
    double adx_relief = s.adx >= config.adx_floor ? sigmoid(s.adx_slope10, config.adx_k) : 0.0;
    scores.relief = 0.5 * atr_relief + 0.5 * (0.5 * rsi_relief + 0.5 * adx_relief);
    scores.curl = s.d_ema144_slope > 0.0 ? 1.0 : 0.0;

    double dx_base = 0.45 * scores.location + 0.25 * scores.exhaustion + 0.25 * scores.relief +
                     0.05 * scores.curl;
    double dx_damp = 1.0 - 0.5 * std::min(0.4, std::max(0.0, scores.edx - 0.6));
    scores.dx = clamp01(dx_base * dx_damp);

    return scores;
}

}  // namespace lifecycle_ngin
