// src/trend/trend_signal_engine.cpp

#include "lifecycle_ngin/trend/trend_signal_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace lifecycle_ngin {

namespace {

bool fast_band_at_bottom(const IndicatorSnapshot& s) {
    double floor = std::min({s.ema60, s.ema144, s.ema250, s.ema333});
    return s.ema20 < floor && s.ema30 < floor;
}

bool all_below_ema333(const IndicatorSnapshot& s) {
    return s.ema20 < s.ema333 && s.ema30 < s.ema333 && s.ema60 < s.ema333 &&
           s.ema144 < s.ema333 && s.ema250 < s.ema333;
}

void record_check(TrendOutput& out, const BuyCheck& check) {
    out.scores.trend_strength = check.trend_strength;
    out.scores.sr_boost = check.sr_boost;
}

}  // namespace

TrendSignalEngine::TrendSignalEngine(TrendEngineConfig config) : config_(std::move(config)) {}

bool TrendSignalEngine::is_s0_order(const IndicatorSnapshot& s) {
    return s.ema20 < s.ema60 && s.ema30 < s.ema60 && s.ema60 < s.ema144 && s.ema144 < s.ema250 &&
           s.ema250 < s.ema333;
}

bool TrendSignalEngine::is_s3_order(const IndicatorSnapshot& s) {
    return s.ema20 > s.ema60 && s.ema30 > s.ema60 && s.ema60 > s.ema144 && s.ema144 > s.ema250 &&
           s.ema250 > s.ema333;
}

double TrendSignalEngine::trend_strength(const IndicatorSnapshot& s) const {
    double rsi_part = clamp01((s.rsi_slope10 + 5.0) / 10.0);
    double adx_part = clamp01((s.adx_slope10 + 2.0) / 4.0);
    return 0.5 * (rsi_part + adx_part);
}

double TrendSignalEngine::sr_boost(const IndicatorSnapshot& s, double anchor,
                                   double halo_atr) const {
    if (s.sr_levels.empty() || s.atr <= 0.0) {
        return 0.0;
    }
    double halo = halo_atr * s.atr;
    double best = 0.0;
    for (const auto& level : s.sr_levels) {
        double distance = std::abs(level.price - anchor);
        if (distance > halo) {
            continue;
        }
        double boost = clamp01(level.strength) * (1.0 - distance / halo) * config_.sr_boost_max;
        best = std::max(best, boost);
    }
    return std::min(best, config_.sr_boost_max);
}

BuyCheck TrendSignalEngine::check_buy(const IndicatorSnapshot& s, double anchor, double halo_atr,
                                      bool slope_ok) const {
    BuyCheck check;
    check.entry_zone_ok = s.atr > 0.0 && std::abs(s.close - anchor) <= halo_atr * s.atr;
    check.slope_ok = slope_ok;
    check.trend_strength = trend_strength(s);
    check.sr_boost = sr_boost(s, anchor, halo_atr);
    check.ts_ok = check.trend_strength + check.sr_boost >= config_.ts_threshold;
    return check;
}

BuyCheck TrendSignalEngine::check_buy_at_ema60(const IndicatorSnapshot& s) const {
    bool slope_ok = s.ema60_slope > 0.0 || s.ema144_slope >= 0.0;
    return check_buy(s, s.ema60, config_.entry_halo_atr, slope_ok);
}

BuyCheck TrendSignalEngine::check_buy_at_ema333(const IndicatorSnapshot& s) const {
    bool slope_ok = s.ema250_slope > 0.0 || s.ema333_slope >= 0.0;
    return check_buy(s, s.ema333, config_.retest_halo_atr, slope_ok);
}

bool TrendSignalEngine::near_sr_level(const IndicatorSnapshot& s) const {
    if (s.sr_levels.empty()) {
        return true;
    }
    if (s.atr <= 0.0) {
        return false;
    }
    double halo = config_.trim_sr_proximity_atr * s.atr;
    return std::any_of(s.sr_levels.begin(), s.sr_levels.end(), [&](const SrLevel& level) {
        return std::abs(s.close - level.price) <= halo;
    });
}

bool TrendSignalEngine::first_dip_zone(const IndicatorSnapshot& s) const {
    if (s.atr <= 0.0) {
        return false;
    }
    double fast_halo = config_.first_dip_fast_halo_atr * s.atr;
    double mid_halo = config_.first_dip_mid_halo_atr * s.atr;
    return std::abs(s.close - s.ema20) <= fast_halo || std::abs(s.close - s.ema30) <= fast_halo ||
           std::abs(s.close - s.ema60) <= mid_halo;
}

void TrendSignalEngine::enter_s3(TrendOutput& out) const {
    out.state = TrendState::S3;
    out.memory.bars_in_s3 = 0;
    if (config_.first_dip_reset != FirstDipResetPolicy::PER_POSITION_LIFETIME) {
        out.memory.first_dip_buy_taken = false;
    }
}

void TrendSignalEngine::evaluate_s2(const IndicatorSnapshot& s,
                                    const std::vector<Bar>& recent_bars,
                                    TrendOutput& out) const {
    if (s.close < s.ema333) {
        out.state = TrendState::S1;
        return;
    }
    if (is_s3_order(s)) {
        enter_s3(out);
        return;
    }

    out.state = TrendState::S2;
    S3Scores scores = compute_s3_scores(s, recent_bars, config_);
    out.scores.ox = scores.ox;
    out.scores.dx = scores.dx;
    out.scores.edx = scores.edx;
    out.flags.trim_flag = scores.ox >= config_.ox_trim_threshold;

    BuyCheck retest = check_buy_at_ema333(s);
    record_check(out, retest);
    out.flags.buy_flag = retest.passed();
}

void TrendSignalEngine::evaluate_s3(const IndicatorSnapshot& s,
                                    const std::vector<Bar>& recent_bars,
                                    const std::optional<TrendOutput>& previous,
                                    TrendOutput& out) const {
    if (all_below_ema333(s)) {
        out.state = TrendState::S0;
        out.flags.exit_position = true;
        out.reason = "all_emas_below_333";
        out.memory.bars_in_s3 = 0;
        out.memory.s1_buy_taken = false;
        return;
    }

    out.state = TrendState::S3;
    out.memory.bars_in_s3 += 1;

    S3Scores scores = compute_s3_scores(s, recent_bars, config_);
    out.scores.ox = scores.ox;
    out.scores.dx = scores.dx;
    out.scores.edx = scores.edx;

    out.flags.emergency_exit = s.close < s.ema333;
    bool was_emergency = previous && previous->state == TrendState::S3 &&
                         previous->flags.emergency_exit;
    out.flags.reclaimed_ema333 = was_emergency && s.close >= s.ema333;
    if (out.flags.reclaimed_ema333 && config_.first_dip_reset == FirstDipResetPolicy::ON_REENTRY) {
        out.memory.first_dip_buy_taken = false;
        out.memory.bars_in_s3 = 1;
    }

    out.flags.trim_flag = scores.ox >= config_.ox_trim_threshold && near_sr_level(s);

    // DX buy in the discount zone between EMA144 and EMA333
    double threshold = dx_buy_threshold(s, scores.edx, config_);
    out.scores.dx_threshold = threshold;
    BuyCheck discount = check_buy_at_ema333(s);
    record_check(out, discount);
    out.flags.buy_flag = !out.flags.emergency_exit && scores.dx >= threshold &&
                         s.close <= s.ema144 && discount.slope_ok && discount.ts_ok;

    if (!out.memory.first_dip_buy_taken && !out.flags.emergency_exit &&
        out.memory.bars_in_s3 <= config_.first_dip_max_bars && first_dip_zone(s)) {
        BuyCheck dip = check_buy_at_ema60(s);
        if (dip.ts_ok) {
            out.flags.first_dip_buy_flag = true;
            out.memory.first_dip_buy_taken = true;
        }
    }
}

Result<TrendOutput> TrendSignalEngine::evaluate(const IndicatorSnapshot& s,
                                                const std::vector<Bar>& recent_bars,
                                                const std::optional<TrendOutput>& previous) const {
    if (s.close <= 0.0 || !s.has_emas()) {
        return make_error<TrendOutput>(ErrorCode::INSUFFICIENT_DATA,
                                       "Snapshot is missing price or moving averages",
                                       "TrendSignalEngine");
    }

    TrendOutput out;
    out.price = s.close;
    out.bar_time = s.timestamp;
    out.computed_at = std::chrono::system_clock::now();

    TrendState state = TrendState::NONE;
    if (previous) {
        out.previous_state = previous->state;
        out.memory = previous->memory;
        state = previous->state;
    }

    // Establish a starting state from the band order alone
    if (state == TrendState::NONE) {
        if (is_s3_order(s)) {
            enter_s3(out);
            state = TrendState::S3;
        } else if (is_s0_order(s)) {
            state = TrendState::S0;
        } else {
            out.state = TrendState::NONE;
            out.reason = "no_clear_state";
            return out;
        }
    }

    if (fast_band_at_bottom(s)) {
        out.state = TrendState::S0;
        out.flags.exit_position = true;
        out.reason = "fast_band_at_bottom";
        out.memory.bars_in_s3 = 0;
        out.memory.s1_buy_taken = false;
        return out;
    }

    switch (state) {
        case TrendState::S0: {
            if (s.ema20 > s.ema60 && s.ema30 > s.ema60 && s.close > s.ema60) {
                out.state = TrendState::S1;
                out.memory.s1_buy_taken = false;
                BuyCheck entry = check_buy_at_ema60(s);
                record_check(out, entry);
                if (entry.passed()) {
                    out.flags.buy_signal = true;
                    out.memory.s1_buy_taken = true;
                }
            } else {
                out.state = TrendState::S0;
            }
            break;
        }
        case TrendState::S1: {
            if (s.close > s.ema333) {
                out.state = TrendState::S2;
                break;
            }
            out.state = TrendState::S1;
            BuyCheck entry = check_buy_at_ema60(s);
            record_check(out, entry);
            if (entry.passed() && !out.memory.s1_buy_taken) {
                out.flags.buy_signal = true;
                out.memory.s1_buy_taken = true;
            }
            break;
        }
        case TrendState::S2:
            evaluate_s2(s, recent_bars, out);
            break;
        case TrendState::S3:
            evaluate_s3(s, recent_bars, previous, out);
            break;
        case TrendState::NONE:
            break;
    }

    return out;
}

void TrendSignalEngine::mark_bootstrap(TrendOutput& output) {
    output.flags.clear();
    output.provisional = output.state == TrendState::S1 || output.state == TrendState::S2;
}

Result<TrendOutput> TrendSignalEngine::bootstrap(const std::vector<IndicatorSnapshot>& history,
                                                 const std::vector<Bar>& bars) const {
    if (history.empty()) {
        return make_error<TrendOutput>(ErrorCode::INSUFFICIENT_DATA,
                                       "No indicator history to replay", "TrendSignalEngine");
    }

    std::optional<TrendOutput> current;
    size_t bar_end = 0;
    std::vector<Bar> window;

    for (const auto& snapshot : history) {
        while (bar_end < bars.size() && bars[bar_end].timestamp <= snapshot.timestamp) {
            ++bar_end;
        }
        size_t bar_start =
            bar_end > config_.structure_lookback ? bar_end - config_.structure_lookback : 0;
        window.assign(bars.begin() + bar_start, bars.begin() + bar_end);

        auto result = evaluate(snapshot, window, current);
        if (result.is_error()) {
            // Warm-up rows without complete averages
            continue;
        }
        current = result.take_value();
    }

    if (!current) {
        return make_error<TrendOutput>(ErrorCode::INSUFFICIENT_DATA,
                                       "No usable snapshot in history", "TrendSignalEngine");
    }

    mark_bootstrap(*current);
    return *current;
}

}  // namespace lifecycle_ngin
