// src/risk/sizing.cpp

#include "lifecycle_ngin/risk/sizing.hpp"
#include <algorithm>

namespace lifecycle_ngin {

namespace {

constexpr double MIN_FRACTION = 1e-6;

double clamp_fraction(double x) {
    return std::min(1.0, std::max(MIN_FRACTION, x));
}

}  // namespace

std::string entry_kind_to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::S1:
            return "s1";
        case EntryKind::LATER_STAGE:
            return "later_stage";
        case EntryKind::FIRST_DIP:
            return "first_dip";
        case EntryKind::REENTRY:
            return "reentry";
    }
    return "later_stage";
}

double TierTable::for_tier(Tier tier) const {
    switch (tier) {
        case Tier::AGGRESSIVE:
            return aggressive;
        case Tier::NORMAL:
            return normal;
        case Tier::PATIENT:
            return patient;
    }
    return normal;
}

nlohmann::json TierTable::to_json() const {
    return {{"aggressive", aggressive}, {"normal", normal}, {"patient", patient}};
}

void TierTable::from_json(const nlohmann::json& j) {
    aggressive = j.value("aggressive", aggressive);
    normal = j.value("normal", normal);
    patient = j.value("patient", patient);
}

nlohmann::json SizingConfig::to_json() const {
    nlohmann::json j;
    j["s1_entry"] = s1_entry.to_json();
    j["later_entry"] = later_entry.to_json();
    j["first_dip_entry"] = first_dip_entry.to_json();
    j["trim"] = trim.to_json();
    j["min_multiplier"] = min_multiplier;
    j["max_underwater_boost"] = max_underwater_boost;
    j["trim_deploy_knee"] = trim_deploy_knee;
    j["max_trim_boost"] = max_trim_boost;
    j["version"] = version;
    return j;
}

void SizingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("s1_entry"))
        s1_entry.from_json(j.at("s1_entry"));
    if (j.contains("later_entry"))
        later_entry.from_json(j.at("later_entry"));
    if (j.contains("first_dip_entry"))
        first_dip_entry.from_json(j.at("first_dip_entry"));
    if (j.contains("trim"))
        trim.from_json(j.at("trim"));
    if (j.contains("min_multiplier"))
        min_multiplier = j.at("min_multiplier").get<double>();
    if (j.contains("max_underwater_boost"))
        max_underwater_boost = j.at("max_underwater_boost").get<double>();
    if (j.contains("trim_deploy_knee"))
        trim_deploy_knee = j.at("trim_deploy_knee").get<double>();
    if (j.contains("max_trim_boost"))
        max_trim_boost = j.at("max_trim_boost").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> SizingConfig::validate() const {
    for (const TierTable* table : {&s1_entry, &later_entry, &first_dip_entry, &trim}) {
        if (table->patient <= 0.0 || table->aggressive > 1.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Tier fractions must be in (0, 1]", "SizingConfig");
        }
    }
    if (!(s1_entry.aggressive > later_entry.aggressive && s1_entry.normal > later_entry.normal &&
          s1_entry.patient > later_entry.patient)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "S1 entries must be larger than later-stage entries",
                                "SizingConfig");
    }
    if (!(trim.aggressive > trim.normal && trim.normal > trim.patient)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Trim fractions must increase with the exit-pressure tier",
                                "SizingConfig");
    }
    if (min_multiplier <= 0.0 || min_multiplier > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "min_multiplier must be in (0, 1]",
                                "SizingConfig");
    }
    if (trim_deploy_knee <= 0.0 || trim_deploy_knee >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "trim_deploy_knee must be in (0, 1)", "SizingConfig");
    }
    return Result<void>();
}

PositionSizer::PositionSizer(SizingConfig config) : config_(std::move(config)) {}

const TierTable& PositionSizer::entry_table(EntryKind kind) const {
    switch (kind) {
        case EntryKind::S1:
            return config_.s1_entry;
        case EntryKind::FIRST_DIP:
            return config_.first_dip_entry;
        case EntryKind::LATER_STAGE:
        case EntryKind::REENTRY:
            return config_.later_entry;
    }
    return config_.later_entry;
}

double PositionSizer::entry_multiplier(const Position& position, Price price) const {
    double rpf = position.holdings.realized_profit_fraction(position.allocation_cap);
    if (rpf >= 1.0) {
        return config_.min_multiplier;
    }
    if (rpf > 0.0) {
        return 1.0 - (1.0 - config_.min_multiplier) * rpf;
    }
    if (position.holdings.quantity > 0.0) {
        double unrealised = position.holdings.unrealised_return(price);
        if (unrealised < 0.0) {
            return 1.0 + std::min(config_.max_underwater_boost, -unrealised);
        }
    }
    return 1.0;
}

double PositionSizer::trim_multiplier(const Position& position) const {
    double rpf = position.holdings.realized_profit_fraction(position.allocation_cap);
    if (rpf >= 1.0) {
        return config_.min_multiplier;
    }
    double deployed = position.holdings.deployed_fraction(position.allocation_cap);
    double ramp = (deployed - config_.trim_deploy_knee) / (1.0 - config_.trim_deploy_knee);
    double deploy_mult = 1.0 + config_.max_trim_boost * std::min(1.0, std::max(0.0, ramp));
    return deploy_mult + (config_.min_multiplier - deploy_mult) * rpf;
}

double PositionSizer::entry_size(EntryKind kind, Tier a_tier, double multiplier) const {
    return clamp_fraction(entry_table(kind).for_tier(a_tier) * multiplier);
}

double PositionSizer::trim_size(Tier e_tier, double multiplier) const {
    return clamp_fraction(config_.trim.for_tier(e_tier) * multiplier);
}

double PositionSizer::entry_fraction(EntryKind kind, const ScoreSnapshot& scores,
                                     const Position& position, Price price) const {
    return entry_size(kind, scores.a_tier, entry_multiplier(position, price));
}

double PositionSizer::trim_fraction(const ScoreSnapshot& scores, const Position& position) const {
    return trim_size(scores.e_tier, trim_multiplier(position));
}

}  // namespace lifecycle_ngin
