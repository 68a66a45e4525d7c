// include/lifecycle_ngin/core/types.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lifecycle_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price in the venue's native quote currency
 */
using Price = double;

/**
 * @brief Token quantity, fractional
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "buy";
        case Side::SELL:
            return "sell";
        default:
            return "none";
    }
}

/**
 * @brief Timeframes a position can be carved on
 */
enum class Timeframe {
    MINUTE_1,   // 1m
    MINUTE_15,  // 15m
    HOUR_1,     // 1h
    HOUR_4      // 4h
};

/**
 * @brief Convert Timeframe to its short label (also used as table suffix)
 */
inline std::string timeframe_to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::MINUTE_1:
            return "1m";
        case Timeframe::MINUTE_15:
            return "15m";
        case Timeframe::HOUR_1:
            return "1h";
        case Timeframe::HOUR_4:
            return "4h";
        default:
            return "1h";
    }
}

/**
 * @brief Parse a short timeframe label
 * @return The timeframe, or std::nullopt if the label is unknown
 */
inline std::optional<Timeframe> timeframe_from_string(const std::string& label) {
    if (label == "1m")
        return Timeframe::MINUTE_1;
    if (label == "15m")
        return Timeframe::MINUTE_15;
    if (label == "1h")
        return Timeframe::HOUR_1;
    if (label == "4h")
        return Timeframe::HOUR_4;
    return std::nullopt;
}

/**
 * @brief Duration of a single bar on the timeframe
 */
inline std::chrono::seconds timeframe_duration(Timeframe tf) {
    switch (tf) {
        case Timeframe::MINUTE_1:
            return std::chrono::seconds(60);
        case Timeframe::MINUTE_15:
            return std::chrono::seconds(15 * 60);
        case Timeframe::HOUR_1:
            return std::chrono::seconds(3600);
        case Timeframe::HOUR_4:
            return std::chrono::seconds(4 * 3600);
        default:
            return std::chrono::seconds(3600);
    }
}

inline const std::vector<Timeframe>& all_timeframes() {
    static const std::vector<Timeframe> timeframes{Timeframe::MINUTE_1, Timeframe::MINUTE_15,
                                                   Timeframe::HOUR_1, Timeframe::HOUR_4};
    return timeframes;
}

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

}  // namespace lifecycle_ngin
