// src/risk/risk_types.cpp

#include "lifecycle_ngin/risk/risk_types.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::DIP:
            return "DIP";
        case Phase::DOUBLE_DIP:
            return "DOUBLE_DIP";
        case Phase::OH_SHIT:
            return "OH_SHIT";
        case Phase::RECOVER:
            return "RECOVER";
        case Phase::GOOD:
            return "GOOD";
        case Phase::EUPHORIA:
            return "EUPHORIA";
    }
    return "GOOD";
}

std::optional<Phase> phase_from_string(const std::string& text) {
    if (text == "DIP")
        return Phase::DIP;
    if (text == "DOUBLE_DIP")
        return Phase::DOUBLE_DIP;
    if (text == "OH_SHIT")
        return Phase::OH_SHIT;
    if (text == "RECOVER")
        return Phase::RECOVER;
    if (text == "GOOD")
        return Phase::GOOD;
    if (text == "EUPHORIA")
        return Phase::EUPHORIA;
    return std::nullopt;
}

std::string tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::AGGRESSIVE:
            return "aggressive";
        case Tier::NORMAL:
            return "normal";
        case Tier::PATIENT:
            return "patient";
    }
    return "normal";
}

namespace {

Tier tier_from_string(const std::string& text) {
    if (text == "aggressive")
        return Tier::AGGRESSIVE;
    if (text == "patient")
        return Tier::PATIENT;
    return Tier::NORMAL;
}

}  // namespace

nlohmann::json ScoreSnapshot::to_json() const {
    nlohmann::json j;
    j["a"] = a;
    j["e"] = e;
    j["a_tier"] = tier_to_string(a_tier);
    j["e_tier"] = tier_to_string(e_tier);
    j["deployed_fraction"] = deployed_fraction;
    j["realized_profit_fraction"] = realized_profit_fraction;
    j["phase_macro"] = phase_to_string(macro);
    j["phase_meso"] = phase_to_string(meso);
    j["cut_pressure"] = cut_pressure;
    j["active_positions"] = active_positions;
    j["computed_at"] = core::format_iso8601(computed_at);
    j["fallback"] = fallback;
    return j;
}

void ScoreSnapshot::from_json(const nlohmann::json& j) {
    a = j.value("a", 0.5);
    e = j.value("e", 0.5);
    a_tier = tier_from_string(j.value("a_tier", std::string("normal")));
    e_tier = tier_from_string(j.value("e_tier", std::string("normal")));
    deployed_fraction = j.value("deployed_fraction", 0.0);
    realized_profit_fraction = j.value("realized_profit_fraction", 0.0);
    macro = phase_from_string(j.value("phase_macro", std::string("GOOD"))).value_or(Phase::GOOD);
    meso = phase_from_string(j.value("phase_meso", std::string("GOOD"))).value_or(Phase::GOOD);
    cut_pressure = j.value("cut_pressure", 0.0);
    active_positions = j.value("active_positions", 0);
    if (j.contains("computed_at")) {
        computed_at =
            core::parse_iso8601(j.at("computed_at").get<std::string>()).value_or(Timestamp{});
    }
    fallback = j.value("fallback", false);
}

}  // namespace lifecycle_ngin
