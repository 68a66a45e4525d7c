// include/lifecycle_ngin/trend/signal_precedence.hpp
#pragma once

#include <string>
#include "lifecycle_ngin/trend/trend_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief The single action selected from a set of flags
 */
enum class TrendSignal {
    HOLD,
    EXIT_POSITION,
    EMERGENCY_EXIT,
    TRIM,
    ENTRY_FIRST_DIP,
    ENTRY_S1,
    ENTRY_DIP,   // S2 retest or S3 discount buy
    REENTRY     // reclaim of EMA333 after an emergency exit
};

std::string trend_signal_to_string(TrendSignal signal);

/**
 * @brief Apply the precedence order exit > emergency > trim > entry > reclaim > hold
 *
 * Among entries, a first dip wins over an S1 buy, which wins over a dip buy.
 */
TrendSignal select_signal(const TrendFlags& flags);

inline bool is_entry_signal(TrendSignal signal) {
    return signal == TrendSignal::ENTRY_FIRST_DIP || signal == TrendSignal::ENTRY_S1 ||
           signal == TrendSignal::ENTRY_DIP || signal == TrendSignal::REENTRY;
}

inline bool is_exit_signal(TrendSignal signal) {
    return signal == TrendSignal::EXIT_POSITION || signal == TrendSignal::EMERGENCY_EXIT;
}

}  // namespace lifecycle_ngin
