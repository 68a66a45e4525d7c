// include/lifecycle_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "lifecycle_ngin/core/config_base.hpp"

namespace lifecycle_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // Per-position decisions and engine transitions
    INFO,     // Tick summaries and lifecycle events
    WARNING,  // Recoverable problems (skipped positions, fallbacks)
    ERR,      // Execution failures and invariant violations
    FATAL     // Setup failures that stop the job
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<LogLevel> level_from_string(const std::string& text) {
    if (text == "TRACE")
        return LogLevel::TRACE;
    if (text == "DEBUG")
        return LogLevel::DEBUG;
    if (text == "INFO")
        return LogLevel::INFO;
    if (text == "WARNING" || text == "WARN")
        return LogLevel::WARNING;
    if (text == "ERROR")
        return LogLevel::ERR;
    if (text == "FATAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<LogDestination> log_destination_from_string(const std::string& text) {
    if (text == "CONSOLE")
        return LogDestination::CONSOLE;
    if (text == "FILE")
        return LogDestination::FILE;
    if (text == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};  // Minimum level to log
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};              // Directory for log files
    std::string filename_prefix{"lifecycle_ngin"};  // Prefix for log files
    bool include_timestamp{true};                   // Include timestamp in logs
    bool include_level{true};                       // Include log level in logs
    size_t max_file_size{50 * 1024 * 1024};         // Max log file size (50MB)
    size_t max_files{10};                           // Maximum number of log files to keep

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_level"] = level_to_string(min_level);
        j["destination"] = log_destination_to_string(destination);
        j["log_directory"] = log_directory;
        j["filename_prefix"] = filename_prefix;
        j["include_timestamp"] = include_timestamp;
        j["include_level"] = include_level;
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_level")) {
            auto level = level_from_string(j.at("min_level").get<std::string>());
            if (level)
                min_level = *level;
        }
        if (j.contains("destination")) {
            auto dest = log_destination_from_string(j.at("destination").get<std::string>());
            if (dest)
                destination = *dest;
        }
        if (j.contains("log_directory"))
            log_directory = j.at("log_directory").get<std::string>();
        if (j.contains("filename_prefix"))
            filename_prefix = j.at("filename_prefix").get<std::string>();
        if (j.contains("include_timestamp"))
            include_timestamp = j.at("include_timestamp").get<bool>();
        if (j.contains("include_level"))
            include_level = j.at("include_level").get<bool>();
        if (j.contains("max_file_size"))
            max_file_size = j.at("max_file_size").get<size_t>();
        if (j.contains("max_files"))
            max_files = j.at("max_files").get<size_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override {
        if (max_files == 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_files must be positive",
                                    "LoggerConfig");
        }
        if (max_file_size == 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "max_file_size must be positive", "LoggerConfig");
        }
        return Result<void>();
    }
};

/**
 * @brief Thread-safe logging class
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests() {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().initialized_ = false;
        if (instance().log_file_.is_open()) {
            instance().log_file_.close();
        }
        instance().current_session_timestamp_.clear();
        instance().current_part_number_ = 1;
        current_component_.clear();
    }

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void enforce_retention(const std::filesystem::path& log_dir);
    void open_current_part(const std::filesystem::path& log_dir);
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // Format: YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::lifecycle_ngin::Logger::instance().get_min_level()) {   \
            std::ostringstream os;                                             \
            os << message;                                                     \
            ::lifecycle_ngin::Logger::instance().log(level, os.str());         \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::lifecycle_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::lifecycle_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::lifecycle_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::lifecycle_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::lifecycle_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::lifecycle_ngin::LogLevel::FATAL, message)
}  // namespace lifecycle_ngin
