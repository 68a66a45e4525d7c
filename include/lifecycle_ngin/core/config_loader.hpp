// include/lifecycle_ngin/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/execution/paper_order_executor.hpp"
#include "lifecycle_ngin/orchestrator/decision_orchestrator.hpp"
#include "lifecycle_ngin/risk/risk_scorer.hpp"
#include "lifecycle_ngin/risk/sizing.hpp"
#include "lifecycle_ngin/trend/trend_config.hpp"

namespace lifecycle_ngin {

/**
 * @brief Database configuration
 *
 * An empty password is read from the LIFECYCLE_DB_PASSWORD environment variable.
 */
struct DatabaseConfig {
    std::string host;
    std::string port{"5432"};
    std::string username;
    std::string password;
    std::string name;

    std::string get_connection_string() const;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["username"] = username;
        j["password"] = password;
        j["name"] = name;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = j.at("port").get<std::string>();
        if (j.contains("username"))
            username = j.at("username").get<std::string>();
        if (j.contains("password"))
            password = j.at("password").get<std::string>();
        if (j.contains("name"))
            name = j.at("name").get<std::string>();
    }
};

/**
 * @brief Where audit records go
 */
struct AuditConfig {
    std::string destination{"postgres"};  // "postgres" or "file"
    std::string file_path{"audit/position_audit.jsonl"};
    size_t max_queue_size{10000};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["destination"] = destination;
        j["file_path"] = file_path;
        j["max_queue_size"] = max_queue_size;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("destination"))
            destination = j.at("destination").get<std::string>();
        if (j.contains("file_path"))
            file_path = j.at("file_path").get<std::string>();
        if (j.contains("max_queue_size"))
            max_queue_size = j.at("max_queue_size").get<size_t>();
    }
};

/**
 * @brief Consolidated application configuration
 *
 * Loaded from config/defaults.json, overridden by config/profiles/{profile}.json.
 */
struct AppConfig {
    std::string profile;
    std::string executor{"paper"};  // only the paper executor ships with the engine

    DatabaseConfig database;
    LoggerConfig logger;
    TrendEngineConfig trend;
    RiskScorerConfig risk;
    SizingConfig sizing;
    OrchestratorConfig orchestrator;
    PaperExecutorConfig paper_executor;
    AuditConfig audit;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["profile"] = profile;
        j["executor"] = executor;
        j["database"] = database.to_json();
        j["logger"] = logger.to_json();
        j["trend_engine"] = trend.to_json();
        j["risk_scoring"] = risk.to_json();
        j["sizing"] = sizing.to_json();
        j["orchestrator"] = orchestrator.to_json();
        j["paper_executor"] = paper_executor.to_json();
        j["audit"] = audit.to_json();
        return j;
    }
};

/**
 * @brief Loads the layered JSON configuration
 *
 * Values in the profile file override defaults; nested objects are merged.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration for a profile
     * @param config_base_path Base path to config directory (e.g., "./config")
     * @param profile Profile name (e.g., "paper"); empty loads defaults only
     * @return Result containing AppConfig or error
     */
    static Result<AppConfig> load(const std::filesystem::path& config_base_path,
                                  const std::string& profile);

    /**
     * @brief Load and parse a JSON file
     */
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    /**
     * @brief Recursively merge JSON objects
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

    /**
     * @brief Extract AppConfig from merged JSON
     */
    static Result<AppConfig> extract_config(const nlohmann::json& merged);

    /**
     * @brief Validate required fields and every section after extraction
     */
    static Result<void> validate_config(const AppConfig& config);

private:
    static void log_config_summary(const AppConfig& config);
};

}  // namespace lifecycle_ngin
