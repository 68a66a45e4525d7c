// include/lifecycle_ngin/data/postgres_connection.hpp

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/logger.hpp"

namespace lifecycle_ngin {

/**
 * @brief Shared PostgreSQL connection used by the Postgres-backed stores and providers
 *
 * libpqxx connections are not thread-safe, so every transaction runs under the
 * connection's mutex.
 */
class PostgresConnection {
public:
    /**
     * @brief Constructor
     * @param connection_string Connection string for PostgreSQL
     */
    explicit PostgresConnection(std::string connection_string);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;
    PostgresConnection(PostgresConnection&&) = delete;
    PostgresConnection& operator=(PostgresConnection&&) = delete;

    /**
     * @brief Connect to the database and register with the StateManager
     * @return Result indicating success or failure
     */
    Result<void> connect();

    void disconnect();

    bool is_connected() const;

    /**
     * @brief Run body inside a transaction, committing when it returns success
     *
     * libpqxx exceptions are converted to DATABASE_ERROR results tagged with component.
     */
    template <typename T>
    Result<T> with_transaction(const std::string& component,
                               const std::function<Result<T>(pqxx::work&)>& body) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto validation = validate_connection();
        if (validation.is_error()) {
            return forward_error<T>(validation, component);
        }

        try {
            pqxx::work txn(*connection_);
            auto result = body(txn);
            if (result.is_ok()) {
                txn.commit();
            }
            return result;
        } catch (const std::exception& e) {
            return make_error<T>(ErrorCode::DATABASE_ERROR,
                                 "Database operation failed: " + std::string(e.what()), component);
        }
    }

    /**
     * @brief Validate a (schema-qualified) table name before splicing it into SQL
     */
    static Result<void> validate_table_name(const std::string& table_name);

private:
    Result<void> validate_connection() const;

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace lifecycle_ngin
