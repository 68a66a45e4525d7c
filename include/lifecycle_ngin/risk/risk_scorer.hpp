// include/lifecycle_ngin/risk/risk_scorer.hpp
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include "lifecycle_ngin/core/config_base.hpp"
#include "lifecycle_ngin/data/phase_provider.hpp"
#include "lifecycle_ngin/position/position.hpp"
#include "lifecycle_ngin/risk/risk_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief (A, E) pair attached to a phase
 */
struct PhaseWeights {
    double a{1.0};
    double e{1.0};
};

/**
 * @brief Configuration for A/E scoring
 */
struct RiskScorerConfig : public ConfigBase {
    std::map<Phase, PhaseWeights> meso_policy{
        {Phase::DIP, {0.2, 0.8}},     {Phase::DOUBLE_DIP, {0.4, 0.7}},
        {Phase::OH_SHIT, {0.9, 0.8}}, {Phase::RECOVER, {1.0, 0.5}},
        {Phase::GOOD, {0.5, 0.3}},    {Phase::EUPHORIA, {0.4, 0.5}}};
    std::map<Phase, PhaseWeights> macro_multipliers{
        {Phase::DIP, {0.6, 1.4}},     {Phase::DOUBLE_DIP, {0.8, 1.2}},
        {Phase::OH_SHIT, {1.2, 0.8}}, {Phase::RECOVER, {1.3, 1.0}},
        {Phase::GOOD, {1.1, 1.1}},    {Phase::EUPHORIA, {1.0, 1.4}}};

    double cut_pressure_weight{0.33};
    int target_book_size{9};
    double book_deficit_step{0.05};  // linear, per missing position
    double book_excess_decay{0.10};  // exponential, per extra position

    double aggressive_threshold{0.7};
    double normal_threshold{0.3};

    double fallback_score{0.5};
    std::chrono::seconds cache_ttl{300};
    std::chrono::seconds phase_max_age{0};  // 0 disables the staleness check

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Score snapshot together with whether it was recomputed
 */
struct ScoreResult {
    ScoreSnapshot snapshot;
    bool recomputed{false};
};

/**
 * @brief Computes aggression (A) and exit pressure (E) from the portfolio phase
 *
 * Scores cached on a position are reused while younger than cache_ttl. A
 * failing or stale phase provider never surfaces as an error: both scores fall
 * back to a neutral value and the snapshot is flagged.
 */
class RiskScorer {
public:
    RiskScorer(std::shared_ptr<PhaseProvider> phase_provider, RiskScorerConfig config);
    ~RiskScorer();

    RiskScorer(const RiskScorer&) = delete;
    RiskScorer& operator=(const RiskScorer&) = delete;

    /**
     * @brief Return the cached scores if fresh, otherwise recompute
     */
    ScoreResult score(const Position& position, Timestamp now);

    /**
     * @brief Recompute scores unconditionally
     */
    ScoreSnapshot compute(const Position& position, Timestamp now);

    /**
     * @brief A and E for a phase context, clamped to [0, 1]
     */
    std::pair<double, double> compute_ae(const PhaseContext& context) const;

    bool is_fresh(const ScoreSnapshot& snapshot, Timestamp now) const;

    const RiskScorerConfig& config() const {
        return config_;
    }

private:
    void fill_position_context(ScoreSnapshot& snapshot, const Position& position) const;

    std::shared_ptr<PhaseProvider> phase_provider_;
    RiskScorerConfig config_;
    std::string component_id_;
};

}  // namespace lifecycle_ngin
