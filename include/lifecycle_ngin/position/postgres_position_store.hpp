// include/lifecycle_ngin/position/postgres_position_store.hpp
#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include "lifecycle_ngin/data/postgres_connection.hpp"
#include "lifecycle_ngin/position/position_store.hpp"

namespace lifecycle_ngin {

/**
 * @brief Position store backed by the PostgreSQL positions table
 *
 * Mutations of a single position run in one transaction holding the row lock
 * (SELECT ... FOR UPDATE), so a fill and its status change land together.
 */
class PostgresPositionStore : public PositionStore {
public:
    PostgresPositionStore(std::shared_ptr<PostgresConnection> connection,
                          std::string table_name = "positions");

    Result<void> create_position(const Position& position) override;
    Result<Position> get_position(const PositionKey& key) const override;
    Result<std::vector<Position>> get_eligible_positions(Timeframe timeframe) const override;
    Result<std::vector<Position>> get_bootstrap_positions(Timeframe timeframe) const override;
    Result<Position> record_execution(const PositionKey& key, const Fill& fill) override;
    Result<std::optional<Position>> claim_execution(const PositionKey& key, Timestamp now,
                                                    std::chrono::seconds window) override;
    Result<Position> update_status(const PositionKey& key, PositionStatus status,
                                   TransitionOrigin origin) override;
    Result<void> refresh_trend_output(const PositionKey& key, const TrendOutput& output) override;
    Result<void> refresh_scores(const PositionKey& key, const ScoreSnapshot& scores) override;
    Result<void> refresh_indicators(const PositionKey& key,
                                    const IndicatorSnapshot& snapshot) override;
    Result<void> update_bars_count(const PositionKey& key, int64_t bars_count) override;

private:
    Result<std::vector<Position>> select_by_status(Timeframe timeframe,
                                                   const std::string& status_list) const;
    Result<Position> load_locked(pqxx::work& txn, const PositionKey& key) const;
    void write_holdings(pqxx::work& txn, const Position& position) const;
    Result<void> set_feature(const PositionKey& key, const std::string& path,
                             const nlohmann::json& value);
    static Result<Position> row_to_position(const pqxx::row& row);

    std::shared_ptr<PostgresConnection> connection_;
    std::string table_name_;
};

}  // namespace lifecycle_ngin
