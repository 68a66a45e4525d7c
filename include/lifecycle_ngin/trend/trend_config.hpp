// include/lifecycle_ngin/trend/trend_config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/config_base.hpp"

namespace lifecycle_ngin {

/**
 * @brief When the first-dip entry becomes available again
 */
enum class FirstDipResetPolicy {
    PER_S3_EPISODE,        // once per entry into S3
    ON_REENTRY,            // also after a reclaim following an emergency exit
    PER_POSITION_LIFETIME  // once for the lifetime of the position
};

std::string first_dip_reset_policy_to_string(FirstDipResetPolicy policy);
std::optional<FirstDipResetPolicy> first_dip_reset_policy_from_string(const std::string& text);

/**
 * @brief Thresholds and sigmoid scales of the trend signal engine
 */
struct TrendEngineConfig : public ConfigBase {
    // Entry gates
    double ts_threshold{0.58};
    double sr_boost_max{0.15};
    double entry_halo_atr{1.0};    // EMA60 anchor
    double retest_halo_atr{0.5};   // EMA333 anchor

    // S2/S3 actions
    double ox_trim_threshold{0.65};
    double dx_buy_threshold{0.65};
    double trim_sr_proximity_atr{1.0};

    // First dip after entering S3
    double first_dip_fast_halo_atr{0.5};  // EMA20/EMA30
    double first_dip_mid_halo_atr{1.0};   // EMA60
    int first_dip_max_bars{24};
    FirstDipResetPolicy first_dip_reset{FirstDipResetPolicy::PER_S3_EPISODE};

    // OX/DX/EDX scales
    double adx_floor{18.0};
    double curvature_k{0.0008};
    double rail_fast_k{1.5};
    double rail_mid_k{2.0};
    double rail_144_k{1.5};
    double rail_250_k{2.0};
    double exp_fast_k{0.0015};
    double exp_mid_k{0.0010};
    double rsi_k{0.5};
    double adx_k{0.3};
    double edx_slow_k{0.00025};
    double edx_slow_333_k{0.0002};

    // Data requirements
    size_t structure_lookback{50};
    int64_t min_bars{350};
    size_t bootstrap_history{400};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

}  // namespace lifecycle_ngin
