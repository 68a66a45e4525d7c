// src/orchestrator/decision_policy.cpp

#include "lifecycle_ngin/orchestrator/decision_policy.hpp"

namespace lifecycle_ngin {

namespace {
constexpr double MIN_REMAINING_ALLOCATION = 1e-9;
}

DecisionPolicy::DecisionPolicy(PositionSizer sizer, std::chrono::seconds max_output_age)
    : sizer_(std::move(sizer)), max_output_age_(max_output_age) {}

EntryKind DecisionPolicy::entry_kind_for(TrendSignal signal) {
    switch (signal) {
        case TrendSignal::ENTRY_S1:
            return EntryKind::S1;
        case TrendSignal::ENTRY_FIRST_DIP:
            return EntryKind::FIRST_DIP;
        case TrendSignal::REENTRY:
            return EntryKind::REENTRY;
        default:
            return EntryKind::LATER_STAGE;
    }
}

PolicyResult DecisionPolicy::decide(const Position& position,
                                    const std::optional<TrendOutput>& output,
                                    const ScoreSnapshot& scores, Timestamp now) const {
    PolicyResult result;

    if (!output) {
        result.decision = HoldDecision{hold_reason::NO_ENGINE_OUTPUT};
        return result;
    }
    if (max_output_age_.count() > 0 && now - output->computed_at > max_output_age_) {
        result.decision = HoldDecision{hold_reason::STALE_ENGINE_OUTPUT};
        return result;
    }
    if (output->provisional || output->state == TrendState::NONE) {
        result.decision = HoldDecision{hold_reason::PROVISIONAL_STATE};
        return result;
    }

    result.signal = select_signal(output->flags);
    result.reference_price = output->price > 0.0 ? output->price : position.last_price;
    const auto& holdings = position.holdings;

    if (result.signal == TrendSignal::HOLD) {
        result.decision = HoldDecision{hold_reason::NO_SIGNAL};
        return result;
    }

    if (is_exit_signal(result.signal)) {
        if (holdings.quantity <= 0.0) {
            result.decision = HoldDecision{hold_reason::NO_POSITION_FOR_EXIT};
        } else {
            std::string reason = output->reason.empty() ? trend_signal_to_string(result.signal)
                                                        : output->reason;
            result.decision = ExitDecision{reason};
        }
        return result;
    }

    if (result.reference_price <= 0.0) {
        result.decision = HoldDecision{hold_reason::INSUFFICIENT_DATA};
        return result;
    }

    if (result.signal == TrendSignal::TRIM) {
        if (holdings.quantity <= 0.0) {
            result.decision = HoldDecision{hold_reason::NO_POSITION_FOR_TRIM};
        } else {
            result.decision = TrimDecision{sizer_.trim_fraction(scores, position)};
        }
        return result;
    }

    // Entries
    if (holdings.remaining_allocation(position.allocation_cap) <= MIN_REMAINING_ALLOCATION) {
        result.decision = HoldDecision{hold_reason::ALLOCATION_EXHAUSTED};
        return result;
    }
    EntryKind kind = entry_kind_for(result.signal);
    result.decision =
        AddDecision{sizer_.entry_fraction(kind, scores, position, result.reference_price), kind};
    return result;
}

}  // namespace lifecycle_ngin
