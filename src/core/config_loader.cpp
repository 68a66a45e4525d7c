// src/core/config_loader.cpp

#include "lifecycle_ngin/core/config_loader.hpp"

#include <cstdlib>
#include <fstream>

namespace lifecycle_ngin {

std::string DatabaseConfig::get_connection_string() const {
    std::string secret = password;
    if (secret.empty()) {
        const char* env = std::getenv("LIFECYCLE_DB_PASSWORD");
        if (env) {
            secret = env;
        }
    }
    return "postgresql://" + username + ":" + secret + "@" + host + ":" + port + "/" + name;
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() +
                                              ": " + e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    try {
        AppConfig config;

        if (merged.contains("profile"))
            config.profile = merged.at("profile").get<std::string>();
        if (merged.contains("executor"))
            config.executor = merged.at("executor").get<std::string>();
        if (merged.contains("database"))
            config.database.from_json(merged.at("database"));
        if (merged.contains("logger"))
            config.logger.from_json(merged.at("logger"));
        if (merged.contains("trend_engine"))
            config.trend.from_json(merged.at("trend_engine"));
        if (merged.contains("risk_scoring"))
            config.risk.from_json(merged.at("risk_scoring"));
        if (merged.contains("sizing"))
            config.sizing.from_json(merged.at("sizing"));
        if (merged.contains("orchestrator"))
            config.orchestrator.from_json(merged.at("orchestrator"));
        if (merged.contains("paper_executor"))
            config.paper_executor.from_json(merged.at("paper_executor"));
        if (merged.contains("audit"))
            config.audit.from_json(merged.at("audit"));

        // The engine and the orchestrator must agree on when history is sufficient
        config.trend.min_bars = config.orchestrator.bars_threshold;

        return config;

    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    if (config.database.host.empty() || config.database.username.empty() ||
        config.database.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Missing required database configuration fields", "ConfigLoader");
    }
    if (config.executor != "paper") {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Unknown executor '" + config.executor + "'", "ConfigLoader");
    }
    if (config.audit.destination != "postgres" && config.audit.destination != "file") {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "audit.destination must be 'postgres' or 'file'", "ConfigLoader");
    }
    if (config.audit.max_queue_size == 0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "audit.max_queue_size must be positive",
                                "ConfigLoader");
    }

    const ConfigBase* sections[] = {&config.logger,       &config.trend,
                                    &config.risk,         &config.sizing,
                                    &config.orchestrator, &config.paper_executor};
    for (const ConfigBase* section : sections) {
        auto result = section->validate();
        if (result.is_error()) {
            return result;
        }
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    const std::string profile = config.profile.empty() ? "defaults" : config.profile;
    const std::string dry_run = config.orchestrator.dry_run ? "true" : "false";
    INFO("Config summary: profile=" << profile << ", executor=" << config.executor
                                    << ", dry_run=" << dry_run);
    INFO("Config summary: db=" << config.database.host << ":" << config.database.port << "/"
                               << config.database.name << ", audit=" << config.audit.destination);
    INFO("Config summary: bars_threshold=" << config.orchestrator.bars_threshold
                                           << ", idempotency_window="
                                           << config.orchestrator.idempotency_window.count()
                                           << "s, score_cache_ttl=" << config.risk.cache_ttl.count()
                                           << "s, max_parallel_positions="
                                           << config.orchestrator.max_parallel_positions);
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_base_path,
                                     const std::string& profile) {
    // 1. Load defaults.json
    auto defaults_path = config_base_path / "defaults.json";
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<AppConfig>(defaults_result.error()->code(),
                                     "Failed to load defaults.json: " +
                                         std::string(defaults_result.error()->what()),
                                     "ConfigLoader");
    }
    nlohmann::json merged = defaults_result.value();

    // 2. Overlay the profile
    if (!profile.empty()) {
        auto profile_path = config_base_path / "profiles" / (profile + ".json");
        auto profile_result = load_json_file(profile_path);
        if (profile_result.is_error()) {
            return make_error<AppConfig>(profile_result.error()->code(),
                                         "Failed to load profile " + profile + ": " +
                                             std::string(profile_result.error()->what()),
                                         "ConfigLoader");
        }
        merge_json(merged, profile_result.value());
        merged["profile"] = profile;
    }

    // 3. Extract and validate
    auto config_result = extract_config(merged);
    if (config_result.is_error()) {
        return config_result;
    }

    auto validation_result = validate_config(config_result.value());
    if (validation_result.is_error()) {
        return make_error<AppConfig>(validation_result.error()->code(),
                                     validation_result.error()->what(), "ConfigLoader");
    }

    log_config_summary(config_result.value());
    return config_result;
}

}  // namespace lifecycle_ngin
