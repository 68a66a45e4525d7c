// src/data/indicator_snapshot.cpp

#include "lifecycle_ngin/data/indicator_snapshot.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

namespace {

void read_double(const nlohmann::json& j, const char* key, double& target) {
    if (j.contains(key) && j.at(key).is_number()) {
        target = j.at(key).get<double>();
    }
}

}  // namespace

nlohmann::json IndicatorSnapshot::to_json() const {
    nlohmann::json j;
    j["timestamp"] = core::format_iso8601(timestamp);
    j["close"] = close;

    j["ema"] = {{"ema20", ema20},   {"ema30", ema30},   {"ema60", ema60},
                {"ema144", ema144}, {"ema250", ema250}, {"ema333", ema333}};
    j["ema_slopes"] = {{"ema20_slope", ema20_slope},   {"ema60_slope", ema60_slope},
                       {"ema144_slope", ema144_slope}, {"ema250_slope", ema250_slope},
                       {"ema333_slope", ema333_slope}, {"d_ema144_slope", d_ema144_slope}};
    j["atr"] = {{"atr", atr}, {"atr_mean20", atr_mean20}};
    j["momentum"] = {{"rsi_slope10", rsi_slope10}, {"adx", adx}, {"adx_slope10", adx_slope10}};
    j["separations"] = {{"dsep_fast", dsep_fast}, {"dsep_mid", dsep_mid}};
    j["volume_z"] = volume_z;

    nlohmann::json levels = nlohmann::json::array();
    for (const auto& level : sr_levels) {
        levels.push_back({{"price", level.price}, {"strength", level.strength}});
    }
    j["sr_levels"] = levels;
    return j;
}

void IndicatorSnapshot::from_json(const nlohmann::json& j) {
    if (j.contains("timestamp") && j.at("timestamp").is_string()) {
        auto parsed = core::parse_iso8601(j.at("timestamp").get<std::string>());
        if (parsed) {
            timestamp = *parsed;
        }
    }
    read_double(j, "close", close);

    if (j.contains("ema")) {
        const auto& ema = j.at("ema");
        read_double(ema, "ema20", ema20);
        read_double(ema, "ema30", ema30);
        read_double(ema, "ema60", ema60);
        read_double(ema, "ema144", ema144);
        read_double(ema, "ema250", ema250);
        read_double(ema, "ema333", ema333);
    }
    if (j.contains("ema_slopes")) {
        const auto& slopes = j.at("ema_slopes");
        read_double(slopes, "ema20_slope", ema20_slope);
        read_double(slopes, "ema60_slope", ema60_slope);
        read_double(slopes, "ema144_slope", ema144_slope);
        read_double(slopes, "ema250_slope", ema250_slope);
        read_double(slopes, "ema333_slope", ema333_slope);
        read_double(slopes, "d_ema144_slope", d_ema144_slope);
    }
    if (j.contains("atr")) {
        read_double(j.at("atr"), "atr", atr);
        read_double(j.at("atr"), "atr_mean20", atr_mean20);
    }
    if (j.contains("momentum")) {
        const auto& mom = j.at("momentum");
        read_double(mom, "rsi_slope10", rsi_slope10);
        read_double(mom, "adx", adx);
        read_double(mom, "adx_slope10", adx_slope10);
    }
    if (j.contains("separations")) {
        read_double(j.at("separations"), "dsep_fast", dsep_fast);
        read_double(j.at("separations"), "dsep_mid", dsep_mid);
    }
    read_double(j, "volume_z", volume_z);

    if (j.contains("sr_levels") && j.at("sr_levels").is_array()) {
        sr_levels.clear();
        for (const auto& item : j.at("sr_levels")) {
            SrLevel level;
            read_double(item, "price", level.price);
            read_double(item, "strength", level.strength);
            sr_levels.push_back(level);
        }
    }
}

}  // namespace lifecycle_ngin
