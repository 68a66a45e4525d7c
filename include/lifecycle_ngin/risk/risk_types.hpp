// include/lifecycle_ngin/risk/risk_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Coarse market phase classification from the phase provider
 */
enum class Phase { DIP, DOUBLE_DIP, OH_SHIT, RECOVER, GOOD, EUPHORIA };

std::string phase_to_string(Phase phase);
std::optional<Phase> phase_from_string(const std::string& text);

/**
 * @brief Portfolio-wide context supplied read-only to the scorer
 */
struct PhaseContext {
    Phase macro{Phase::GOOD};
    Phase meso{Phase::GOOD};
    double cut_pressure{0.0};  // [0, 1]
    int active_positions{0};
    Timestamp as_of;
};

/**
 * @brief Sizing tier for a score
 */
enum class Tier { PATIENT, NORMAL, AGGRESSIVE };

std::string tier_to_string(Tier tier);

/**
 * @brief Map a score to its tier (thresholds are inclusive lower bounds)
 */
inline Tier score_tier(double score, double aggressive_threshold = 0.7,
                       double normal_threshold = 0.3) {
    if (score >= aggressive_threshold)
        return Tier::AGGRESSIVE;
    if (score >= normal_threshold)
        return Tier::NORMAL;
    return Tier::PATIENT;
}

/**
 * @brief Cached result of one A/E computation
 */
struct ScoreSnapshot {
    double a{0.5};  // aggression
    double e{0.5};  // exit pressure
    Tier a_tier{Tier::NORMAL};
    Tier e_tier{Tier::NORMAL};
    double deployed_fraction{0.0};
    double realized_profit_fraction{0.0};
    Phase macro{Phase::GOOD};
    Phase meso{Phase::GOOD};
    double cut_pressure{0.0};
    int active_positions{0};
    Timestamp computed_at;
    bool fallback{false};  // phase context was unavailable

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

}  // namespace lifecycle_ngin
