// include/lifecycle_ngin/trend/trend_signal_engine.hpp
#pragma once

#include <optional>
#include <vector>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/data/indicator_snapshot.hpp"
#include "lifecycle_ngin/trend/s3_scores.hpp"
#include "lifecycle_ngin/trend/trend_config.hpp"
#include "lifecycle_ngin/trend/trend_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Result of a buy check at one anchor
 */
struct BuyCheck {
    bool entry_zone_ok{false};
    bool slope_ok{false};
    bool ts_ok{false};
    double trend_strength{0.0};
    double sr_boost{0.0};

    bool passed() const {
        return entry_zone_ok && slope_ok && ts_ok;
    }
};

/**
 * @brief Per-position trend state machine (S0-S3)
 *
 * Stateless between calls: everything carried from one bar to the next
 * travels in the previous TrendOutput.
 */
class TrendSignalEngine {
public:
    explicit TrendSignalEngine(TrendEngineConfig config);

    /**
     * @brief Evaluate one bar
     * @param snapshot Indicators of the bar being evaluated
     * @param recent_bars Up to structure_lookback bars ending at the snapshot, oldest first
     * @param previous Output of the previous evaluation, if any
     * @return INSUFFICIENT_DATA if the snapshot lacks price or moving averages
     */
    Result<TrendOutput> evaluate(const IndicatorSnapshot& snapshot,
                                 const std::vector<Bar>& recent_bars,
                                 const std::optional<TrendOutput>& previous) const;

    /**
     * @brief Replay a chronological history from no state
     *
     * The final output has all action flags cleared and is provisional when
     * it lands on S1 or S2.
     */
    Result<TrendOutput> bootstrap(const std::vector<IndicatorSnapshot>& history,
                                  const std::vector<Bar>& bars) const;

    /**
     * @brief Mark an output as produced by bootstrap: no flags, provisional on S1/S2
     */
    static void mark_bootstrap(TrendOutput& output);

    double trend_strength(const IndicatorSnapshot& snapshot) const;
    double sr_boost(const IndicatorSnapshot& snapshot, double anchor, double halo_atr) const;

    /**
     * @brief Buy check anchored at EMA60 (entry) or EMA333 (retest)
     */
    BuyCheck check_buy_at_ema60(const IndicatorSnapshot& snapshot) const;
    BuyCheck check_buy_at_ema333(const IndicatorSnapshot& snapshot) const;

    static bool is_s0_order(const IndicatorSnapshot& snapshot);
    static bool is_s3_order(const IndicatorSnapshot& snapshot);

    const TrendEngineConfig& config() const {
        return config_;
    }

private:
    BuyCheck check_buy(const IndicatorSnapshot& s, double anchor, double halo_atr,
                       bool slope_ok) const;
    bool near_sr_level(const IndicatorSnapshot& s) const;
    bool first_dip_zone(const IndicatorSnapshot& s) const;

    void enter_s3(TrendOutput& out) const;
    void evaluate_s3(const IndicatorSnapshot& s, const std::vector<Bar>& recent_bars,
                     const std::optional<TrendOutput>& previous, TrendOutput& out) const;
    void evaluate_s2(const IndicatorSnapshot& s, const std::vector<Bar>& recent_bars,
                     TrendOutput& out) const;

    TrendEngineConfig config_;
};

}  // namespace lifecycle_ngin
