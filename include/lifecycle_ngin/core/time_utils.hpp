// include/lifecycle_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

/**
 * @brief Format a timestamp as UTC ISO-8601 with second precision ("2024-01-02T03:04:05Z")
 */
inline std::string format_iso8601(const Timestamp& ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t_value, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

/**
 * @brief Parse a UTC timestamp in "YYYY-MM-DDTHH:MM:SS" or "YYYY-MM-DD HH:MM:SS" form
 *
 * A trailing "Z", "+00" or fractional seconds are ignored.
 *
 * @return The parsed timestamp, or std::nullopt if the text is not a timestamp
 */
inline std::optional<Timestamp> parse_iso8601(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }
    std::string normalized = text.substr(0, 19);
    if (normalized[10] == 'T') {
        normalized[10] = ' ';
    }
    std::tm time_info{};
    std::istringstream ss(normalized);
    ss >> std::get_time(&time_info, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

inline int64_t to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace lifecycle_ngin
