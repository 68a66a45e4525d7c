// include/lifecycle_ngin/data/postgres_market_data.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "lifecycle_ngin/data/market_data_provider.hpp"
#include "lifecycle_ngin/data/postgres_connection.hpp"

namespace lifecycle_ngin {

/**
 * @brief Market data provider reading the OHLC and indicator tables
 *
 * Rows are materialised as Arrow tables and converted by DataConversionUtils.
 */
class PostgresMarketData : public MarketDataProvider {
public:
    PostgresMarketData(std::shared_ptr<PostgresConnection> connection,
                       std::string bars_table = "ohlc_bars",
                       std::string indicators_table = "indicator_snapshots");

    Result<IndicatorSnapshot> get_latest_indicators(const PositionKey& key) override;
    Result<std::vector<IndicatorSnapshot>> get_indicator_history(const PositionKey& key,
                                                                 size_t limit) override;
    Result<std::vector<Bar>> get_recent_bars(const PositionKey& key, size_t limit) override;
    Result<int64_t> get_bars_count(const PositionKey& key) override;

private:
    /**
     * @brief Build an Arrow table from a result with an epoch "time" column
     * @param double_columns Columns materialised as float64 (nulls preserved)
     * @param string_columns Columns materialised as utf8
     */
    static Result<std::shared_ptr<arrow::Table>> convert_to_arrow_table(
        const pqxx::result& result, const std::vector<std::string>& double_columns,
        const std::vector<std::string>& string_columns);

    std::shared_ptr<PostgresConnection> connection_;
    std::string bars_table_;
    std::string indicators_table_;
};

}  // namespace lifecycle_ngin
