// src/data/postgres_market_data.cpp

#include "lifecycle_ngin/data/postgres_market_data.hpp"
#include "lifecycle_ngin/data/conversion_utils.hpp"

namespace lifecycle_ngin {

namespace {

const char* COMPONENT = "PostgresMarketData";

std::string join_columns(const std::vector<std::string>& columns) {
    std::string joined;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += columns[i];
    }
    return joined;
}

}  // namespace

PostgresMarketData::PostgresMarketData(std::shared_ptr<PostgresConnection> connection,
                                       std::string bars_table, std::string indicators_table)
    : connection_(std::move(connection)),
      bars_table_(std::move(bars_table)),
      indicators_table_(std::move(indicators_table)) {}

Result<std::shared_ptr<arrow::Table>> PostgresMarketData::convert_to_arrow_table(
    const pqxx::result& result, const std::vector<std::string>& double_columns,
    const std::vector<std::string>& string_columns) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    auto handle_builder_error = [](const std::string& operation, const arrow::Status& status) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Arrow builder error during " + operation + ": " + status.ToString(), COMPONENT);
    };

    try {
        arrow::TimestampBuilder time_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
        std::vector<std::unique_ptr<arrow::DoubleBuilder>> double_builders;
        std::vector<std::unique_ptr<arrow::StringBuilder>> string_builders;
        for (size_t i = 0; i < double_columns.size(); ++i) {
            double_builders.push_back(std::make_unique<arrow::DoubleBuilder>(pool));
        }
        for (size_t i = 0; i < string_columns.size(); ++i) {
            string_builders.push_back(std::make_unique<arrow::StringBuilder>(pool));
        }

        auto status = time_builder.Reserve(result.size());
        if (!status.ok()) {
            return handle_builder_error("reserve", status);
        }

        for (const auto& row : result) {
            status = time_builder.Append(row["time"].as<int64_t>());
            if (!status.ok()) {
                return handle_builder_error("append", status);
            }

            for (size_t c = 0; c < double_columns.size(); ++c) {
                const auto& field = row[double_columns[c]];
                status = field.is_null() ? double_builders[c]->AppendNull()
                                         : double_builders[c]->Append(field.as<double>());
                if (!status.ok()) {
                    return handle_builder_error("append", status);
                }
            }

            for (size_t c = 0; c < string_columns.size(); ++c) {
                const auto& field = row[string_columns[c]];
                status = field.is_null() ? string_builders[c]->AppendNull()
                                         : string_builders[c]->Append(field.as<std::string>());
                if (!status.ok()) {
                    return handle_builder_error("append", status);
                }
            }
        }

        std::vector<std::shared_ptr<arrow::Field>> fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;

        std::shared_ptr<arrow::Array> time_array;
        status = time_builder.Finish(&time_array);
        if (!status.ok()) {
            return handle_builder_error("finish", status);
        }
        fields.push_back(arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND)));
        arrays.push_back(time_array);

        for (size_t c = 0; c < double_columns.size(); ++c) {
            std::shared_ptr<arrow::Array> array;
            status = double_builders[c]->Finish(&array);
            if (!status.ok()) {
                return handle_builder_error("finish", status);
            }
            fields.push_back(arrow::field(double_columns[c], arrow::float64()));
            arrays.push_back(array);
        }

        for (size_t c = 0; c < string_columns.size(); ++c) {
            std::shared_ptr<arrow::Array> array;
            status = string_builders[c]->Finish(&array);
            if (!status.ok()) {
                return handle_builder_error("finish", status);
            }
            fields.push_back(arrow::field(string_columns[c], arrow::utf8()));
            arrays.push_back(array);
        }

        return Result<std::shared_ptr<arrow::Table>>(
            arrow::Table::Make(arrow::schema(fields), arrays));

    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Exception during Arrow table conversion: " + std::string(e.what()), COMPONENT);
    }
}

Result<std::vector<Bar>> PostgresMarketData::get_recent_bars(const PositionKey& key,
                                                             size_t limit) {
    auto table_check = PostgresConnection::validate_table_name(bars_table_);
    if (table_check.is_error()) {
        return forward_error<std::vector<Bar>>(table_check, COMPONENT);
    }

    auto rows = connection_->with_transaction<pqxx::result>(
        COMPONENT, [&](pqxx::work& txn) -> Result<pqxx::result> {
            // Newest N, returned oldest first
            std::string query =
                "SELECT * FROM (SELECT EXTRACT(EPOCH FROM ts)::bigint AS time, instrument AS "
                "symbol, open, high, low, close, volume FROM " +
                bars_table_ +
                " WHERE instrument = $1 AND venue = $2 AND timeframe = $3 "
                "ORDER BY ts DESC LIMIT $4) recent ORDER BY time ASC";
            return txn.exec_params(query, key.instrument, key.venue,
                                   timeframe_to_string(key.timeframe),
                                   static_cast<int64_t>(limit));
        });
    if (rows.is_error()) {
        return forward_error<std::vector<Bar>>(rows, COMPONENT);
    }

    auto table = convert_to_arrow_table(rows.value(), {"open", "high", "low", "close", "volume"},
                                        {"symbol"});
    if (table.is_error()) {
        return forward_error<std::vector<Bar>>(table, COMPONENT);
    }
    return DataConversionUtils::arrow_table_to_bars(table.value());
}

Result<std::vector<IndicatorSnapshot>> PostgresMarketData::get_indicator_history(
    const PositionKey& key, size_t limit) {
    auto table_check = PostgresConnection::validate_table_name(indicators_table_);
    if (table_check.is_error()) {
        return forward_error<std::vector<IndicatorSnapshot>>(table_check, COMPONENT);
    }

    const auto& columns = DataConversionUtils::indicator_columns();
    auto rows = connection_->with_transaction<pqxx::result>(
        COMPONENT, [&](pqxx::work& txn) -> Result<pqxx::result> {
            std::string query = "SELECT * FROM (SELECT EXTRACT(EPOCH FROM ts)::bigint AS time, " +
                                join_columns(columns) + ", sr_levels::text AS sr_levels FROM " +
                                indicators_table_ +
                                " WHERE instrument = $1 AND venue = $2 AND timeframe = $3 "
                                "ORDER BY ts DESC LIMIT $4) recent ORDER BY time ASC";
            return txn.exec_params(query, key.instrument, key.venue,
                                   timeframe_to_string(key.timeframe),
                                   static_cast<int64_t>(limit));
        });
    if (rows.is_error()) {
        return forward_error<std::vector<IndicatorSnapshot>>(rows, COMPONENT);
    }

    auto table = convert_to_arrow_table(rows.value(), columns, {"sr_levels"});
    if (table.is_error()) {
        return forward_error<std::vector<IndicatorSnapshot>>(table, COMPONENT);
    }
    return DataConversionUtils::arrow_table_to_indicators(table.value());
}

Result<IndicatorSnapshot> PostgresMarketData::get_latest_indicators(const PositionKey& key) {
    auto history = get_indicator_history(key, 1);
    if (history.is_error()) {
        return forward_error<IndicatorSnapshot>(history, COMPONENT);
    }
    if (history.value().empty()) {
        return make_error<IndicatorSnapshot>(ErrorCode::DATA_NOT_FOUND,
                                             "No indicators for " + key.id(), COMPONENT);
    }
    return history.value().back();
}

Result<int64_t> PostgresMarketData::get_bars_count(const PositionKey& key) {
    auto table_check = PostgresConnection::validate_table_name(bars_table_);
    if (table_check.is_error()) {
        return forward_error<int64_t>(table_check, COMPONENT);
    }

    return connection_->with_transaction<int64_t>(
        COMPONENT, [&](pqxx::work& txn) -> Result<int64_t> {
            auto row = txn.exec_params1("SELECT COUNT(*) FROM " + bars_table_ +
                                            " WHERE instrument = $1 AND venue = $2 AND "
                                            "timeframe = $3",
                                        key.instrument, key.venue,
                                        timeframe_to_string(key.timeframe));
            return row[0].as<int64_t>();
        });
}

}  // namespace lifecycle_ngin
