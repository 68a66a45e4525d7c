// src/risk/risk_scorer.cpp

#include "lifecycle_ngin/risk/risk_scorer.hpp"
#include <algorithm>
#include <cmath>
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/core/state_manager.hpp"

namespace lifecycle_ngin {

namespace {

nlohmann::json weights_to_json(const std::map<Phase, PhaseWeights>& table) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [phase, weights] : table) {
        j[phase_to_string(phase)] = {weights.a, weights.e};
    }
    return j;
}

void weights_from_json(const nlohmann::json& j, std::map<Phase, PhaseWeights>& table) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto phase = phase_from_string(it.key());
        if (!phase || !it.value().is_array() || it.value().size() != 2) {
            continue;
        }
        table[*phase] = PhaseWeights{it.value()[0].get<double>(), it.value()[1].get<double>()};
    }
}

double clamp_score(double x) {
    return std::min(1.0, std::max(0.0, x));
}

}  // namespace

nlohmann::json RiskScorerConfig::to_json() const {
    nlohmann::json j;
    j["meso_policy"] = weights_to_json(meso_policy);
    j["macro_multipliers"] = weights_to_json(macro_multipliers);
    j["cut_pressure_weight"] = cut_pressure_weight;
    j["target_book_size"] = target_book_size;
    j["book_deficit_step"] = book_deficit_step;
    j["book_excess_decay"] = book_excess_decay;
    j["aggressive_threshold"] = aggressive_threshold;
    j["normal_threshold"] = normal_threshold;
    j["fallback_score"] = fallback_score;
    j["cache_ttl_seconds"] = cache_ttl.count();
    j["phase_max_age_seconds"] = phase_max_age.count();
    j["version"] = version;
    return j;
}

void RiskScorerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("meso_policy"))
        weights_from_json(j.at("meso_policy"), meso_policy);
    if (j.contains("macro_multipliers"))
        weights_from_json(j.at("macro_multipliers"), macro_multipliers);
    if (j.contains("cut_pressure_weight"))
        cut_pressure_weight = j.at("cut_pressure_weight").get<double>();
    if (j.contains("target_book_size"))
        target_book_size = j.at("target_book_size").get<int>();
    if (j.contains("book_deficit_step"))
        book_deficit_step = j.at("book_deficit_step").get<double>();
    if (j.contains("book_excess_decay"))
        book_excess_decay = j.at("book_excess_decay").get<double>();
    if (j.contains("aggressive_threshold"))
        aggressive_threshold = j.at("aggressive_threshold").get<double>();
    if (j.contains("normal_threshold"))
        normal_threshold = j.at("normal_threshold").get<double>();
    if (j.contains("fallback_score"))
        fallback_score = j.at("fallback_score").get<double>();
    if (j.contains("cache_ttl_seconds"))
        cache_ttl = std::chrono::seconds(j.at("cache_ttl_seconds").get<int64_t>());
    if (j.contains("phase_max_age_seconds"))
        phase_max_age = std::chrono::seconds(j.at("phase_max_age_seconds").get<int64_t>());
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> RiskScorerConfig::validate() const {
    if (normal_threshold < 0.0 || aggressive_threshold > 1.0 ||
        normal_threshold >= aggressive_threshold) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Tier thresholds must satisfy 0 <= normal < aggressive <= 1",
                                "RiskScorerConfig");
    }
    if (cut_pressure_weight < 0.0 || cut_pressure_weight > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "cut_pressure_weight must be in [0, 1]", "RiskScorerConfig");
    }
    if (target_book_size < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "target_book_size must be non-negative", "RiskScorerConfig");
    }
    if (cache_ttl.count() < 0 || phase_max_age.count() < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Durations must be non-negative",
                                "RiskScorerConfig");
    }
    for (Phase phase : {Phase::DIP, Phase::DOUBLE_DIP, Phase::OH_SHIT, Phase::RECOVER,
                        Phase::GOOD, Phase::EUPHORIA}) {
        if (meso_policy.count(phase) == 0 || macro_multipliers.count(phase) == 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Missing phase weights for " + phase_to_string(phase),
                                    "RiskScorerConfig");
        }
    }
    return Result<void>();
}

RiskScorer::RiskScorer(std::shared_ptr<PhaseProvider> phase_provider, RiskScorerConfig config)
    : phase_provider_(std::move(phase_provider)),
      config_(std::move(config)),
      component_id_(StateManager::make_component_id("RISK_SCORER")) {
    ComponentInfo info{ComponentType::RISK_SCORER,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register risk scorer: " << registered.error()->what());
    }
}

RiskScorer::~RiskScorer() {
    auto result = StateManager::instance().unregister_component(component_id_);
    if (result.is_error()) {
        DEBUG("Risk scorer was not registered: " << result.error()->what());
    }
}

std::pair<double, double> RiskScorer::compute_ae(const PhaseContext& context) const {
    PhaseWeights meso = config_.meso_policy.count(context.meso)
                            ? config_.meso_policy.at(context.meso)
                            : PhaseWeights{config_.fallback_score, config_.fallback_score};
    PhaseWeights macro = config_.macro_multipliers.count(context.macro)
                             ? config_.macro_multipliers.at(context.macro)
                             : PhaseWeights{1.0, 1.0};

    double a = meso.a * macro.a;
    double e = meso.e * macro.e;

    double cp = clamp_score(context.cut_pressure);
    a *= 1.0 - config_.cut_pressure_weight * cp;
    e *= 1.0 + config_.cut_pressure_weight * cp;

    int gap = config_.target_book_size - context.active_positions;
    if (gap > 0) {
        a *= 1.0 + config_.book_deficit_step * gap;
        e *= 1.0 - config_.book_deficit_step * gap;
    } else if (gap < 0) {
        int excess = -gap;
        a *= std::exp(-config_.book_excess_decay * excess);
        e *= std::exp(config_.book_excess_decay * excess);
    }

    return {clamp_score(a), clamp_score(e)};
}

bool RiskScorer::is_fresh(const ScoreSnapshot& snapshot, Timestamp now) const {
    if (snapshot.fallback) {
        return false;
    }
    auto age = now - snapshot.computed_at;
    return age >= Timestamp::duration::zero() && age < config_.cache_ttl;
}

void RiskScorer::fill_position_context(ScoreSnapshot& snapshot, const Position& position) const {
    snapshot.deployed_fraction = position.holdings.deployed_fraction(position.allocation_cap);
    snapshot.realized_profit_fraction =
        position.holdings.realized_profit_fraction(position.allocation_cap);
}

ScoreSnapshot RiskScorer::compute(const Position& position, Timestamp now) {
    ScoreSnapshot snapshot;
    snapshot.computed_at = now;
    fill_position_context(snapshot, position);

    auto context = phase_provider_->get_phase_context();
    bool stale = false;
    if (context.is_ok() && config_.phase_max_age.count() > 0) {
        stale = now - context.value().as_of > config_.phase_max_age;
    }

    if (context.is_error() || stale) {
        if (context.is_error()) {
            WARN("Phase context unavailable for " << position.id() << ", using neutral scores: "
                                                  << context.error()->what());
        } else {
            WARN("Phase context is stale for " << position.id() << ", using neutral scores");
        }
        snapshot.a = config_.fallback_score;
        snapshot.e = config_.fallback_score;
        snapshot.fallback = true;
    } else {
        const auto& ctx = context.value();
        auto [a, e] = compute_ae(ctx);
        snapshot.a = a;
        snapshot.e = e;
        snapshot.macro = ctx.macro;
        snapshot.meso = ctx.meso;
        snapshot.cut_pressure = ctx.cut_pressure;
        snapshot.active_positions = ctx.active_positions;
    }

    snapshot.a_tier =
        score_tier(snapshot.a, config_.aggressive_threshold, config_.normal_threshold);
    snapshot.e_tier =
        score_tier(snapshot.e, config_.aggressive_threshold, config_.normal_threshold);
    return snapshot;
}

ScoreResult RiskScorer::score(const Position& position, Timestamp now) {
    ScoreResult result;
    const auto& cached = position.features.scores;
    if (cached && is_fresh(*cached, now)) {
        result.snapshot = *cached;
        fill_position_context(result.snapshot, position);
        return result;
    }
    result.snapshot = compute(position, now);
    result.recomputed = true;
    return result;
}

}  // namespace lifecycle_ngin
