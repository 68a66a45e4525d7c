// include/lifecycle_ngin/trend/trend_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Discrete trend classification
 *
 * NONE means no clear state could be established yet (watch only).
 */
enum class TrendState { NONE, S0, S1, S2, S3 };

std::string trend_state_to_string(TrendState state);
std::optional<TrendState> trend_state_from_string(const std::string& text);

/**
 * @brief Independent action flags raised by one evaluation
 */
struct TrendFlags {
    bool buy_signal{false};          // S1 entry
    bool buy_flag{false};            // S2 retest or S3 discount entry
    bool first_dip_buy_flag{false};  // first pullback after entering S3
    bool trim_flag{false};
    bool emergency_exit{false};      // price below EMA333 while in S3
    bool exit_position{false};       // structural invalidation, any state
    bool reclaimed_ema333{false};    // reclaim after an emergency exit

    bool any_entry() const {
        return buy_signal || buy_flag || first_dip_buy_flag;
    }

    bool any() const {
        return any_entry() || trim_flag || emergency_exit || exit_position || reclaimed_ema333;
    }

    void clear() {
        *this = TrendFlags{};
    }
};

/**
 * @brief Continuous diagnostic sub-scores, all in [0, 1] except the thresholds
 */
struct TrendScores {
    double ox{0.0};
    double dx{0.0};
    double edx{0.0};
    double trend_strength{0.0};
    double sr_boost{0.0};
    double dx_threshold{0.0};
};

/**
 * @brief State the engine carries between evaluations of the same position
 */
struct TrendMemory {
    bool s1_buy_taken{false};
    bool first_dip_buy_taken{false};
    int bars_in_s3{0};
};

/**
 * @brief Output of one trend engine evaluation, cached on the position
 */
struct TrendOutput {
    TrendState state{TrendState::NONE};
    TrendState previous_state{TrendState::NONE};
    TrendFlags flags;
    TrendScores scores;
    TrendMemory memory;
    bool provisional{false};  // bootstrap landed on a transitional state
    std::string reason;       // exit reason or short explanation
    Price price{0.0};
    Timestamp bar_time;
    Timestamp computed_at;

    bool state_changed() const {
        return state != previous_state;
    }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

}  // namespace lifecycle_ngin
