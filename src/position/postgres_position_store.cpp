// src/position/postgres_position_store.cpp

#include "lifecycle_ngin/position/postgres_position_store.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

namespace {

const char* COMPONENT = "PostgresPositionStore";

const char* POSITION_COLUMNS =
    "instrument, venue, timeframe, status, allocation_cap, quantity, invested, extracted, "
    "bars_count, features, last_price, "
    "EXTRACT(EPOCH FROM last_execution_at)::bigint AS last_execution_epoch, "
    "EXTRACT(EPOCH FROM execution_claimed_at)::bigint AS execution_claimed_epoch, "
    "EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch, "
    "EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch";

std::string optional_timestamp(const std::optional<Timestamp>& ts) {
    return ts ? core::format_iso8601(*ts) : std::string();
}

}  // namespace

PostgresPositionStore::PostgresPositionStore(std::shared_ptr<PostgresConnection> connection,
                                             std::string table_name)
    : connection_(std::move(connection)), table_name_(std::move(table_name)) {}

Result<Position> PostgresPositionStore::row_to_position(const pqxx::row& row) {
    try {
        Position position;
        position.key.instrument = row["instrument"].as<std::string>();
        position.key.venue = row["venue"].as<std::string>();

        auto tf = timeframe_from_string(row["timeframe"].as<std::string>());
        if (!tf) {
            return make_error<Position>(ErrorCode::INVALID_DATA,
                                        "Unknown timeframe " + row["timeframe"].as<std::string>(),
                                        COMPONENT);
        }
        position.key.timeframe = *tf;

        auto status = position_status_from_string(row["status"].as<std::string>());
        if (!status) {
            return make_error<Position>(ErrorCode::INVALID_DATA,
                                        "Unknown status " + row["status"].as<std::string>(),
                                        COMPONENT);
        }
        position.status = *status;

        position.allocation_cap = row["allocation_cap"].as<double>();
        position.holdings.quantity = row["quantity"].as<double>();
        position.holdings.invested = row["invested"].as<double>();
        position.holdings.extracted = row["extracted"].as<double>();
        position.bars_count = row["bars_count"].as<int64_t>();
        position.last_price = row["last_price"].is_null() ? 0.0 : row["last_price"].as<double>();

        if (!row["features"].is_null()) {
            position.features.from_json(nlohmann::json::parse(row["features"].as<std::string>()));
        }
        if (!row["last_execution_epoch"].is_null()) {
            position.last_execution_at =
                core::from_epoch_seconds(row["last_execution_epoch"].as<int64_t>());
        }
        if (!row["execution_claimed_epoch"].is_null()) {
            position.execution_claimed_at =
                core::from_epoch_seconds(row["execution_claimed_epoch"].as<int64_t>());
        }
        if (!row["created_epoch"].is_null()) {
            position.created_at = core::from_epoch_seconds(row["created_epoch"].as<int64_t>());
        }
        if (!row["updated_epoch"].is_null()) {
            position.updated_at = core::from_epoch_seconds(row["updated_epoch"].as<int64_t>());
        }
        return position;

    } catch (const std::exception& e) {
        return make_error<Position>(ErrorCode::CONVERSION_ERROR,
                                    "Failed to read position row: " + std::string(e.what()),
                                    COMPONENT);
    }
}

Result<void> PostgresPositionStore::create_position(const Position& position) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return table_check;
    }
    auto invariants = check_invariants(position);
    if (invariants.is_error()) {
        return invariants;
    }

    return connection_->with_transaction<void>(COMPONENT, [&](pqxx::work& txn) -> Result<void> {
        std::string query = "INSERT INTO " + table_name_ +
                            " (instrument, venue, timeframe, status, allocation_cap, quantity, "
                            "invested, extracted, bars_count, features, last_price, "
                            "last_execution_at, created_at, updated_at) "
                            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::jsonb, $11, "
                            "NULLIF($12, '')::timestamptz, now(), now()) "
                            "ON CONFLICT (instrument, venue, timeframe) DO NOTHING";
        auto result = txn.exec_params(
            query, position.key.instrument, position.key.venue,
            timeframe_to_string(position.key.timeframe), position_status_to_string(position.status),
            position.allocation_cap, position.holdings.quantity, position.holdings.invested,
            position.holdings.extracted, position.bars_count, position.features.to_json().dump(),
            position.last_price, optional_timestamp(position.last_execution_at));

        if (result.affected_rows() == 0) {
            return make_error<void>(ErrorCode::DUPLICATE_POSITION,
                                    "Position already exists: " + position.id(), COMPONENT);
        }
        return Result<void>();
    });
}

Result<Position> PostgresPositionStore::get_position(const PositionKey& key) const {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return forward_error<Position>(table_check, COMPONENT);
    }

    return connection_->with_transaction<Position>(
        COMPONENT, [&](pqxx::work& txn) -> Result<Position> {
            std::string query = std::string("SELECT ") + POSITION_COLUMNS + " FROM " +
                                table_name_ +
                                " WHERE instrument = $1 AND venue = $2 AND timeframe = $3";
            auto result = txn.exec_params(query, key.instrument, key.venue,
                                          timeframe_to_string(key.timeframe));
            if (result.empty()) {
                return make_error<Position>(ErrorCode::POSITION_NOT_FOUND,
                                            "Position not found: " + key.id(), COMPONENT);
            }
            return row_to_position(result[0]);
        });
}

Result<std::vector<Position>> PostgresPositionStore::select_by_status(
    Timeframe timeframe, const std::string& status_list) const {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return forward_error<std::vector<Position>>(table_check, COMPONENT);
    }

    return connection_->with_transaction<std::vector<Position>>(
        COMPONENT, [&](pqxx::work& txn) -> Result<std::vector<Position>> {
            std::string query = std::string("SELECT ") + POSITION_COLUMNS + " FROM " +
                                table_name_ + " WHERE timeframe = $1 AND status IN (" +
                                status_list + ") ORDER BY instrument, venue";
            auto result = txn.exec_params(query, timeframe_to_string(timeframe));

            std::vector<Position> positions;
            positions.reserve(result.size());
            for (const auto& row : result) {
                auto position = row_to_position(row);
                if (position.is_error()) {
                    // One malformed row must not hide the others
                    ERROR("Skipping unreadable position row: " +
                          std::string(position.error()->what()));
                    continue;
                }
                positions.push_back(position.take_value());
            }
            return positions;
        });
}

Result<std::vector<Position>> PostgresPositionStore::get_eligible_positions(
    Timeframe timeframe) const {
    return select_by_status(timeframe, "'watchlist', 'active'");
}

Result<std::vector<Position>> PostgresPositionStore::get_bootstrap_positions(
    Timeframe timeframe) const {
    return select_by_status(timeframe, "'dormant'");
}

Result<Position> PostgresPositionStore::load_locked(pqxx::work& txn,
                                                    const PositionKey& key) const {
    std::string query = std::string("SELECT ") + POSITION_COLUMNS + " FROM " + table_name_ +
                        " WHERE instrument = $1 AND venue = $2 AND timeframe = $3 FOR UPDATE";
    auto result =
        txn.exec_params(query, key.instrument, key.venue, timeframe_to_string(key.timeframe));
    if (result.empty()) {
        return make_error<Position>(ErrorCode::POSITION_NOT_FOUND,
                                    "Position not found: " + key.id(), COMPONENT);
    }
    return row_to_position(result[0]);
}

void PostgresPositionStore::write_holdings(pqxx::work& txn, const Position& position) const {
    std::string query = "UPDATE " + table_name_ +
                        " SET status = $4, quantity = $5, invested = $6, extracted = $7, "
                        "last_price = $8, last_execution_at = NULLIF($9, '')::timestamptz, "
                        "updated_at = now() "
                        "WHERE instrument = $1 AND venue = $2 AND timeframe = $3";
    txn.exec_params(query, position.key.instrument, position.key.venue,
                    timeframe_to_string(position.key.timeframe),
                    position_status_to_string(position.status), position.holdings.quantity,
                    position.holdings.invested, position.holdings.extracted, position.last_price,
                    optional_timestamp(position.last_execution_at));
}

Result<Position> PostgresPositionStore::record_execution(const PositionKey& key,
                                                         const Fill& fill) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return forward_error<Position>(table_check, COMPONENT);
    }

    return connection_->with_transaction<Position>(
        COMPONENT, [&](pqxx::work& txn) -> Result<Position> {
            auto current = load_locked(txn, key);
            if (current.is_error()) {
                return current;
            }
            auto updated = apply_fill(current.value(), fill);
            if (updated.is_error()) {
                return updated;
            }
            write_holdings(txn, updated.value());
            return updated;
        });
}

Result<std::optional<Position>> PostgresPositionStore::claim_execution(
    const PositionKey& key, Timestamp now, std::chrono::seconds window) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return forward_error<std::optional<Position>>(table_check, COMPONENT);
    }

    // Conditional update: concurrent claimers serialise on the row and only one
    // of them finds the window still open
    return connection_->with_transaction<std::optional<Position>>(
        COMPONENT, [&](pqxx::work& txn) -> Result<std::optional<Position>> {
            std::string query =
                "UPDATE " + table_name_ +
                " SET execution_claimed_at = $4::timestamptz, updated_at = now() "
                "WHERE instrument = $1 AND venue = $2 AND timeframe = $3 "
                "AND (last_execution_at IS NULL OR "
                "last_execution_at <= $4::timestamptz - make_interval(secs => $5)) "
                "AND (execution_claimed_at IS NULL OR "
                "execution_claimed_at <= $4::timestamptz - make_interval(secs => $5)) "
                "RETURNING " +
                POSITION_COLUMNS;
            auto result = txn.exec_params(query, key.instrument, key.venue,
                                          timeframe_to_string(key.timeframe),
                                          core::format_iso8601(now),
                                          static_cast<int64_t>(window.count()));
            if (!result.empty()) {
                auto claimed = row_to_position(result[0]);
                if (claimed.is_error()) {
                    return forward_error<std::optional<Position>>(claimed, COMPONENT);
                }
                return std::optional<Position>(claimed.take_value());
            }

            auto exists = txn.exec_params(
                "SELECT 1 FROM " + table_name_ +
                    " WHERE instrument = $1 AND venue = $2 AND timeframe = $3",
                key.instrument, key.venue, timeframe_to_string(key.timeframe));
            if (exists.empty()) {
                return make_error<std::optional<Position>>(
                    ErrorCode::POSITION_NOT_FOUND, "Position not found: " + key.id(), COMPONENT);
            }
            return std::optional<Position>();
        });
}

Result<Position> PostgresPositionStore::update_status(const PositionKey& key,
                                                      PositionStatus status,
                                                      TransitionOrigin origin) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return forward_error<Position>(table_check, COMPONENT);
    }

    return connection_->with_transaction<Position>(
        COMPONENT, [&](pqxx::work& txn) -> Result<Position> {
            auto current = load_locked(txn, key);
            if (current.is_error()) {
                return current;
            }
            auto transition = validate_status_transition(current.value().status, status, origin);
            if (transition.is_error()) {
                return forward_error<Position>(transition, COMPONENT);
            }

            Position updated = current.take_value();
            updated.status = status;
            auto invariants = check_invariants(updated);
            if (invariants.is_error()) {
                return forward_error<Position>(invariants, COMPONENT);
            }

            txn.exec_params("UPDATE " + table_name_ +
                                " SET status = $4, updated_at = now() "
                                "WHERE instrument = $1 AND venue = $2 AND timeframe = $3",
                            key.instrument, key.venue, timeframe_to_string(key.timeframe),
                            position_status_to_string(status));
            updated.updated_at = std::chrono::system_clock::now();
            return updated;
        });
}

Result<void> PostgresPositionStore::set_feature(const PositionKey& key, const std::string& path,
                                                const nlohmann::json& value) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return table_check;
    }

    return connection_->with_transaction<void>(COMPONENT, [&](pqxx::work& txn) -> Result<void> {
        std::string query = "UPDATE " + table_name_ +
                            " SET features = jsonb_set(COALESCE(features, '{}'::jsonb), "
                            "$4::text[], $5::jsonb, true), updated_at = now() "
                            "WHERE instrument = $1 AND venue = $2 AND timeframe = $3";
        auto result =
            txn.exec_params(query, key.instrument, key.venue, timeframe_to_string(key.timeframe),
                            "{" + path + "}", value.dump());
        if (result.affected_rows() == 0) {
            return make_error<void>(ErrorCode::POSITION_NOT_FOUND,
                                    "Position not found: " + key.id(), COMPONENT);
        }
        return Result<void>();
    });
}

Result<void> PostgresPositionStore::refresh_trend_output(const PositionKey& key,
                                                         const TrendOutput& output) {
    return set_feature(key, "trend_engine", output.to_json());
}

Result<void> PostgresPositionStore::refresh_scores(const PositionKey& key,
                                                   const ScoreSnapshot& scores) {
    return set_feature(key, "scores", scores.to_json());
}

Result<void> PostgresPositionStore::refresh_indicators(const PositionKey& key,
                                                       const IndicatorSnapshot& snapshot) {
    return set_feature(key, "indicators", snapshot.to_json());
}

Result<void> PostgresPositionStore::update_bars_count(const PositionKey& key,
                                                      int64_t bars_count) {
    if (bars_count < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bars_count must be non-negative",
                                COMPONENT);
    }
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return table_check;
    }

    return connection_->with_transaction<void>(COMPONENT, [&](pqxx::work& txn) -> Result<void> {
        auto result = txn.exec_params("UPDATE " + table_name_ +
                                          " SET bars_count = $4, updated_at = now() "
                                          "WHERE instrument = $1 AND venue = $2 AND timeframe = $3",
                                      key.instrument, key.venue,
                                      timeframe_to_string(key.timeframe), bars_count);
        if (result.affected_rows() == 0) {
            return make_error<void>(ErrorCode::POSITION_NOT_FOUND,
                                    "Position not found: " + key.id(), COMPONENT);
        }
        return Result<void>();
    });
}

}  // namespace lifecycle_ngin
