// src/trend/signal_precedence.cpp

#include "lifecycle_ngin/trend/signal_precedence.hpp"

namespace lifecycle_ngin {

std::string trend_signal_to_string(TrendSignal signal) {
    switch (signal) {
        case TrendSignal::HOLD:
            return "hold";
        case TrendSignal::EXIT_POSITION:
            return "exit_position";
        case TrendSignal::EMERGENCY_EXIT:
            return "emergency_exit";
        case TrendSignal::TRIM:
            return "trim";
        case TrendSignal::ENTRY_FIRST_DIP:
            return "first_dip_buy";
        case TrendSignal::ENTRY_S1:
            return "buy_signal";
        case TrendSignal::ENTRY_DIP:
            return "buy_flag";
        case TrendSignal::REENTRY:
            return "reclaimed_ema333";
    }
    return "hold";
}

TrendSignal select_signal(const TrendFlags& flags) {
    if (flags.exit_position)
        return TrendSignal::EXIT_POSITION;
    if (flags.emergency_exit)
        return TrendSignal::EMERGENCY_EXIT;
    if (flags.trim_flag)
        return TrendSignal::TRIM;
    if (flags.first_dip_buy_flag)
        return TrendSignal::ENTRY_FIRST_DIP;
    if (flags.buy_signal)
        return TrendSignal::ENTRY_S1;
    if (flags.buy_flag)
        return TrendSignal::ENTRY_DIP;
    if (flags.reclaimed_ema333)
        return TrendSignal::REENTRY;
    return TrendSignal::HOLD;
}

}  // namespace lifecycle_ngin
