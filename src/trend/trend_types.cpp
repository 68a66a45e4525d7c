// src/trend/trend_types.cpp

#include "lifecycle_ngin/trend/trend_types.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

std::string trend_state_to_string(TrendState state) {
    switch (state) {
        case TrendState::S0:
            return "S0";
        case TrendState::S1:
            return "S1";
        case TrendState::S2:
            return "S2";
        case TrendState::S3:
            return "S3";
        default:
            return "NONE";
    }
}

std::optional<TrendState> trend_state_from_string(const std::string& text) {
    if (text == "NONE")
        return TrendState::NONE;
    if (text == "S0")
        return TrendState::S0;
    if (text == "S1")
        return TrendState::S1;
    if (text == "S2")
        return TrendState::S2;
    if (text == "S3")
        return TrendState::S3;
    return std::nullopt;
}

nlohmann::json TrendOutput::to_json() const {
    nlohmann::json j;
    j["state"] = trend_state_to_string(state);
    j["previous_state"] = trend_state_to_string(previous_state);
    j["flags"] = {{"buy_signal", flags.buy_signal},
                  {"buy_flag", flags.buy_flag},
                  {"first_dip_buy_flag", flags.first_dip_buy_flag},
                  {"trim_flag", flags.trim_flag},
                  {"emergency_exit", flags.emergency_exit},
                  {"exit_position", flags.exit_position},
                  {"reclaimed_ema333", flags.reclaimed_ema333}};
    j["scores"] = {{"ox", scores.ox},
                   {"dx", scores.dx},
                   {"edx", scores.edx},
                   {"ts", scores.trend_strength},
                   {"sr_boost", scores.sr_boost},
                   {"dx_threshold", scores.dx_threshold}};
    j["meta"] = {{"s1_buy_taken", memory.s1_buy_taken},
                 {"first_dip_buy_taken", memory.first_dip_buy_taken},
                 {"bars_in_s3", memory.bars_in_s3}};
    j["provisional"] = provisional;
    j["reason"] = reason;
    j["price"] = price;
    j["bar_time"] = core::format_iso8601(bar_time);
    j["computed_at"] = core::format_iso8601(computed_at);
    return j;
}

void TrendOutput::from_json(const nlohmann::json& j) {
    if (j.contains("state")) {
        state = trend_state_from_string(j.at("state").get<std::string>())
                    .value_or(TrendState::NONE);
    }
    if (j.contains("previous_state")) {
        previous_state = trend_state_from_string(j.at("previous_state").get<std::string>())
                             .value_or(TrendState::NONE);
    }
    if (j.contains("flags")) {
        const auto& f = j.at("flags");
        flags.buy_signal = f.value("buy_signal", false);
        flags.buy_flag = f.value("buy_flag", false);
        flags.first_dip_buy_flag = f.value("first_dip_buy_flag", false);
        flags.trim_flag = f.value("trim_flag", false);
        flags.emergency_exit = f.value("emergency_exit", false);
        flags.exit_position = f.value("exit_position", false);
        flags.reclaimed_ema333 = f.value("reclaimed_ema333", false);
    }
    if (j.contains("scores")) {
        const auto& s = j.at("scores");
        scores.ox = s.value("ox", 0.0);
        scores.dx = s.value("dx", 0.0);
        scores.edx = s.value("edx", 0.0);
        scores.trend_strength = s.value("ts", 0.0);
        scores.sr_boost = s.value("sr_boost", 0.0);
        scores.dx_threshold = s.value("dx_threshold", 0.0);
    }
    if (j.contains("meta")) {
        const auto& m = j.at("meta");
        memory.s1_buy_taken = m.value("s1_buy_taken", false);
        memory.first_dip_buy_taken = m.value("first_dip_buy_taken", false);
        memory.bars_in_s3 = m.value("bars_in_s3", 0);
    }
    provisional = j.value("provisional", false);
    reason = j.value("reason", std::string());
    price = j.value("price", 0.0);
    if (j.contains("bar_time")) {
        bar_time = core::parse_iso8601(j.at("bar_time").get<std::string>()).value_or(Timestamp{});
    }
    if (j.contains("computed_at")) {
        computed_at =
            core::parse_iso8601(j.at("computed_at").get<std::string>()).value_or(Timestamp{});
    }
}

}  // namespace lifecycle_ngin
