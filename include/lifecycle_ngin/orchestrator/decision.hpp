// include/lifecycle_ngin/orchestrator/decision.hpp
#pragma once

#include <string>
#include <variant>
#include "lifecycle_ngin/risk/sizing.hpp"

namespace lifecycle_ngin {

namespace hold_reason {
constexpr const char* NO_SIGNAL = "no_signal";
constexpr const char* NO_POSITION_FOR_TRIM = "no_position_for_trim";
constexpr const char* NO_POSITION_FOR_EXIT = "no_position_for_exit";
constexpr const char* ALLOCATION_EXHAUSTED = "allocation_exhausted";
constexpr const char* PROVISIONAL_STATE = "provisional_state";
constexpr const char* NO_ENGINE_OUTPUT = "no_engine_output";
constexpr const char* STALE_ENGINE_OUTPUT = "stale_engine_output";
constexpr const char* INSUFFICIENT_DATA = "insufficient_data";
}  // namespace hold_reason

struct HoldDecision {
    std::string reason;
};

/**
 * @brief Buy a fraction of the remaining allocation
 */
struct AddDecision {
    double size_fraction{0.0};
    EntryKind entry_kind{EntryKind::S1};
};

/**
 * @brief Sell a fraction of current holdings
 */
struct TrimDecision {
    double size_fraction{0.0};
};

/**
 * @brief Sell all holdings
 */
struct ExitDecision {
    std::string reason;
};

using Decision = std::variant<HoldDecision, AddDecision, TrimDecision, ExitDecision>;

/**
 * @brief "hold", "add", "trim" or "exit"
 */
std::string decision_type(const Decision& decision);

/**
 * @brief Size fraction carried by the decision (0 for hold, 1 for exit)
 */
double decision_size(const Decision& decision);

std::string decision_reason(const Decision& decision);

inline bool is_hold(const Decision& decision) {
    return std::holds_alternative<HoldDecision>(decision);
}

}  // namespace lifecycle_ngin
