// src/trend/trend_config.cpp

#include "lifecycle_ngin/trend/trend_config.hpp"

namespace lifecycle_ngin {

std::string first_dip_reset_policy_to_string(FirstDipResetPolicy policy) {
    switch (policy) {
        case FirstDipResetPolicy::PER_S3_EPISODE:
            return "per_s3_episode";
        case FirstDipResetPolicy::ON_REENTRY:
            return "on_reentry";
        case FirstDipResetPolicy::PER_POSITION_LIFETIME:
            return "per_position_lifetime";
    }
    return "per_s3_episode";
}

std::optional<FirstDipResetPolicy> first_dip_reset_policy_from_string(const std::string& text) {
    if (text == "per_s3_episode")
        return FirstDipResetPolicy::PER_S3_EPISODE;
    if (text == "on_reentry")
        return FirstDipResetPolicy::ON_REENTRY;
    if (text == "per_position_lifetime")
        return FirstDipResetPolicy::PER_POSITION_LIFETIME;
    return std::nullopt;
}

nlohmann::json TrendEngineConfig::to_json() const {
    nlohmann::json j;
    j["ts_threshold"] = ts_threshold;
    j["sr_boost_max"] = sr_boost_max;
    j["entry_halo_atr"] = entry_halo_atr;
    j["retest_halo_atr"] = retest_halo_atr;
    j["ox_trim_threshold"] = ox_trim_threshold;
    j["dx_buy_threshold"] = dx_buy_threshold;
    j["trim_sr_proximity_atr"] = trim_sr_proximity_atr;
    j["first_dip_fast_halo_atr"] = first_dip_fast_halo_atr;
    j["first_dip_mid_halo_atr"] = first_dip_mid_halo_atr;
    j["first_dip_max_bars"] = first_dip_max_bars;
    j["first_dip_reset"] = first_dip_reset_policy_to_string(first_dip_reset);
    j["adx_floor"] = adx_floor;
    j["scales"] = {{"curvature_k", curvature_k}, {"rail_fast_k", rail_fast_k},
                   {"rail_mid_k", rail_mid_k},   {"rail_144_k", rail_144_k},
                   {"rail_250_k", rail_250_k},   {"exp_fast_k", exp_fast_k},
                   {"exp_mid_k", exp_mid_k},     {"rsi_k", rsi_k},
                   {"adx_k", adx_k},             {"edx_slow_k", edx_slow_k},
                   {"edx_slow_333_k", edx_slow_333_k}};
    j["structure_lookback"] = structure_lookback;
    j["min_bars"] = min_bars;
    j["bootstrap_history"] = bootstrap_history;
    j["version"] = version;
    return j;
}

void TrendEngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("ts_threshold"))
        ts_threshold = j.at("ts_threshold").get<double>();
    if (j.contains("sr_boost_max"))
        sr_boost_max = j.at("sr_boost_max").get<double>();
    if (j.contains("entry_halo_atr"))
        entry_halo_atr = j.at("entry_halo_atr").get<double>();
    if (j.contains("retest_halo_atr"))
        retest_halo_atr = j.at("retest_halo_atr").get<double>();
    if (j.contains("ox_trim_threshold"))
        ox_trim_threshold = j.at("ox_trim_threshold").get<double>();
    if (j.contains("dx_buy_threshold"))
        dx_buy_threshold = j.at("dx_buy_threshold").get<double>();
    if (j.contains("trim_sr_proximity_atr"))
        trim_sr_proximity_atr = j.at("trim_sr_proximity_atr").get<double>();
    if (j.contains("first_dip_fast_halo_atr"))
        first_dip_fast_halo_atr = j.at("first_dip_fast_halo_atr").get<double>();
    if (j.contains("first_dip_mid_halo_atr"))
        first_dip_mid_halo_atr = j.at("first_dip_mid_halo_atr").get<double>();
    if (j.contains("first_dip_max_bars"))
        first_dip_max_bars = j.at("first_dip_max_bars").get<int>();
    if (j.contains("first_dip_reset")) {
        auto policy =
            first_dip_reset_policy_from_string(j.at("first_dip_reset").get<std::string>());
        if (policy)
            first_dip_reset = *policy;
    }
    if (j.contains("adx_floor"))
        adx_floor = j.at("adx_floor").get<double>();
    if (j.contains("scales")) {
        const auto& s = j.at("scales");
        curvature_k = s.value("curvature_k", curvature_k);
        rail_fast_k = s.value("rail_fast_k", rail_fast_k);
        rail_mid_k = s.value("rail_mid_k", rail_mid_k);
        rail_144_k = s.value("rail_144_k", rail_144_k);
        rail_250_k = s.value("rail_250_k", rail_250_k);
        exp_fast_k = s.value("exp_fast_k", exp_fast_k);
        exp_mid_k = s.value("exp_mid_k", exp_mid_k);
        rsi_k = s.value("rsi_k", rsi_k);
        adx_k = s.value("adx_k", adx_k);
        edx_slow_k = s.value("edx_slow_k", edx_slow_k);
        edx_slow_333_k = s.value("edx_slow_333_k", edx_slow_333_k);
    }
    if (j.contains("structure_lookback"))
        structure_lookback = j.at("structure_lookback").get<size_t>();
    if (j.contains("min_bars"))
        min_bars = j.at("min_bars").get<int64_t>();
    if (j.contains("bootstrap_history"))
        bootstrap_history = j.at("bootstrap_history").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> TrendEngineConfig::validate() const {
    if (ts_threshold < 0.0 || ts_threshold > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "ts_threshold must be in [0, 1]",
                                "TrendEngineConfig");
    }
    if (entry_halo_atr <= 0.0 || retest_halo_atr <= 0.0 || first_dip_fast_halo_atr <= 0.0 ||
        first_dip_mid_halo_atr <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "ATR halos must be positive",
                                "TrendEngineConfig");
    }
    if (first_dip_max_bars < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "first_dip_max_bars must be non-negative", "TrendEngineConfig");
    }
    if (structure_lookback < 2) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "structure_lookback must be at least 2", "TrendEngineConfig");
    }
    if (min_bars <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "min_bars must be positive",
                                "TrendEngineConfig");
    }
    return Result<void>();
}

}  // namespace lifecycle_ngin
