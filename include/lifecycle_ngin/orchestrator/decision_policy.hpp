// include/lifecycle_ngin/orchestrator/decision_policy.hpp
#pragma once

#include <chrono>
#include <optional>
#include "lifecycle_ngin/orchestrator/decision.hpp"
#include "lifecycle_ngin/position/position.hpp"
#include "lifecycle_ngin/risk/risk_types.hpp"
#include "lifecycle_ngin/risk/sizing.hpp"
#include "lifecycle_ngin/trend/signal_precedence.hpp"
#include "lifecycle_ngin/trend/trend_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Decision together with the signal it came from and the price used to size it
 */
struct PolicyResult {
    Decision decision{HoldDecision{hold_reason::NO_SIGNAL}};
    TrendSignal signal{TrendSignal::HOLD};
    Price reference_price{0.0};
};

/**
 * @brief Turns engine output and scores into one sized decision
 */
class DecisionPolicy {
public:
    /**
     * @param sizer Table-driven sizer
     * @param max_output_age Engine output older than this is ignored (0 disables)
     */
    DecisionPolicy(PositionSizer sizer, std::chrono::seconds max_output_age);

    PolicyResult decide(const Position& position, const std::optional<TrendOutput>& output,
                        const ScoreSnapshot& scores, Timestamp now) const;

    static EntryKind entry_kind_for(TrendSignal signal);

    const PositionSizer& sizer() const {
        return sizer_;
    }

private:
    PositionSizer sizer_;
    std::chrono::seconds max_output_age_;
};

}  // namespace lifecycle_ngin
