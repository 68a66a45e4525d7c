// src/data/postgres_connection.cpp

#include "lifecycle_ngin/data/postgres_connection.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include "lifecycle_ngin/core/state_manager.hpp"

namespace lifecycle_ngin {

PostgresConnection::PostgresConnection(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

Result<void> PostgresConnection::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (connection_ && connection_->is_open()) {
        return Result<void>();
    }

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresConnection");
        }

        std::string unique_id = StateManager::make_component_id("POSTGRES");
        ComponentInfo info{ComponentType::POSITION_STORE,
                           ComponentState::INITIALIZED,
                           unique_id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};

        auto register_result = StateManager::instance().register_component(info);
        if (register_result.is_error()) {
            // The connection is still usable without a registry entry
            WARN("Failed to register database with StateManager: " +
                 std::string(register_result.error()->what()));
        } else {
            component_id_ = unique_id;
            auto running = StateManager::instance().update_state(component_id_,
                                                                 ComponentState::RUNNING);
            if (running.is_error()) {
                WARN("Failed to mark database as running: " +
                     std::string(running.error()->what()));
            }
            INFO("Connected to PostgreSQL database with ID: " + component_id_);
        }
        return Result<void>();

    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresConnection");
    }
}

void PostgresConnection::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection_) {
        return;
    }

    if (connection_->is_open()) {
        connection_->close();
    }
    connection_.reset();

    if (!component_id_.empty()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            WARN("Error unregistering database component: " +
                 std::string(result.error()->what()));
        }
        component_id_.clear();
    }
    INFO("Disconnected from PostgreSQL database");
}

bool PostgresConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

Result<void> PostgresConnection::validate_connection() const {
    // Caller holds mutex_
    if (!connection_ || !connection_->is_open()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresConnection");
    }
    return Result<void>();
}

Result<void> PostgresConnection::validate_table_name(const std::string& table_name) {
    if (table_name.empty() || table_name.size() > 100) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table_name: must be 1-100 characters",
                                "PostgresConnection");
    }

    // schema.table
    for (char c : table_name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains invalid characters",
                                    "PostgresConnection");
        }
    }

    std::string lower_name = table_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::vector<std::string> forbidden = {"drop",   "delete", "insert", "alter",
                                                       "create", "union",  "select"};
    for (const auto& word : forbidden) {
        if (lower_name.find(word) != std::string::npos) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid table_name: contains forbidden SQL keywords",
                                    "PostgresConnection");
        }
    }
    return Result<void>();
}

}  // namespace lifecycle_ngin
