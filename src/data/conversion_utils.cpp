// src/data/conversion_utils.cpp
#include "lifecycle_ngin/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include <nlohmann/json.hpp>
#include <utility>

namespace lifecycle_ngin {

namespace {

using IndicatorField = std::pair<std::string, double IndicatorSnapshot::*>;

const std::vector<IndicatorField>& indicator_fields() {
    static const std::vector<IndicatorField> fields{
        {"close", &IndicatorSnapshot::close},
        {"ema20", &IndicatorSnapshot::ema20},
        {"ema30", &IndicatorSnapshot::ema30},
        {"ema60", &IndicatorSnapshot::ema60},
        {"ema144", &IndicatorSnapshot::ema144},
        {"ema250", &IndicatorSnapshot::ema250},
        {"ema333", &IndicatorSnapshot::ema333},
        {"ema20_slope", &IndicatorSnapshot::ema20_slope},
        {"ema60_slope", &IndicatorSnapshot::ema60_slope},
        {"ema144_slope", &IndicatorSnapshot::ema144_slope},
        {"ema250_slope", &IndicatorSnapshot::ema250_slope},
        {"ema333_slope", &IndicatorSnapshot::ema333_slope},
        {"d_ema144_slope", &IndicatorSnapshot::d_ema144_slope},
        {"atr", &IndicatorSnapshot::atr},
        {"atr_mean20", &IndicatorSnapshot::atr_mean20},
        {"rsi_slope10", &IndicatorSnapshot::rsi_slope10},
        {"adx", &IndicatorSnapshot::adx},
        {"adx_slope10", &IndicatorSnapshot::adx_slope10},
        {"dsep_fast", &IndicatorSnapshot::dsep_fast},
        {"dsep_mid", &IndicatorSnapshot::dsep_mid},
        {"volume_z", &IndicatorSnapshot::volume_z}};
    return fields;
}

}  // namespace

const std::vector<std::string>& DataConversionUtils::indicator_columns() {
    static const std::vector<std::string> columns = [] {
        std::vector<std::string> names;
        for (const auto& field : indicator_fields()) {
            names.push_back(field.first);
        }
        return names;
    }();
    return columns;
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    const std::vector<std::string> required_columns = {"time", "symbol", "open", "high",
                                                       "low",  "close",  "volume"};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col,
                                                "DataConversionUtils");
        }
    }

    try {
        auto time_col = table->GetColumnByName("time");
        auto symbol_col = table->GetColumnByName("symbol");
        auto open_col = table->GetColumnByName("open");
        auto high_col = table->GetColumnByName("high");
        auto low_col = table->GetColumnByName("low");
        auto close_col = table->GetColumnByName("close");
        auto volume_col = table->GetColumnByName("volume");

        std::vector<Bar> bars;
        bars.reserve(table->num_rows());

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_col, i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<Bar>>(ts_result, "DataConversionUtils");
            }

            auto symbol_result = extract_string(symbol_col, i);
            if (symbol_result.is_error()) {
                return forward_error<std::vector<Bar>>(symbol_result, "DataConversionUtils");
            }

            auto open_result = extract_double(open_col, i);
            auto high_result = extract_double(high_col, i);
            auto low_result = extract_double(low_col, i);
            auto close_result = extract_double(close_col, i);
            auto volume_result = extract_double(volume_col, i);

            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<std::vector<Bar>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                              low_result.value(), close_result.value(), volume_result.value(),
                              symbol_result.value());
        }

        return Result<std::vector<Bar>>(std::move(bars));

    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), "DataConversionUtils");
    }
}

Result<std::vector<IndicatorSnapshot>> DataConversionUtils::arrow_table_to_indicators(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<IndicatorSnapshot>>(
            ErrorCode::INVALID_ARGUMENT, "Table pointer is null", "DataConversionUtils");
    }

    auto time_col = table->GetColumnByName("time");
    if (time_col == nullptr) {
        return make_error<std::vector<IndicatorSnapshot>>(
            ErrorCode::INVALID_DATA, "Missing required column: time", "DataConversionUtils");
    }

    std::vector<std::pair<std::shared_ptr<arrow::ChunkedArray>, double IndicatorSnapshot::*>>
        columns;
    for (const auto& [name, member] : indicator_fields()) {
        auto column = table->GetColumnByName(name);
        if (column == nullptr) {
            return make_error<std::vector<IndicatorSnapshot>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + name,
                "DataConversionUtils");
        }
        columns.emplace_back(column, member);
    }
    auto sr_col = table->GetColumnByName("sr_levels");

    try {
        std::vector<IndicatorSnapshot> snapshots;
        snapshots.reserve(table->num_rows());

        for (int64_t i = 0; i < table->num_rows(); ++i) {
            IndicatorSnapshot snapshot;

            auto ts_result = extract_timestamp(time_col, i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<IndicatorSnapshot>>(ts_result,
                                                                     "DataConversionUtils");
            }
            snapshot.timestamp = ts_result.value();

            for (const auto& [column, member] : columns) {
                auto value = extract_double(column, i);
                // Indicators still warming up are reported as null; leave them at zero
                if (value.is_ok()) {
                    snapshot.*member = value.value();
                } else if (value.error()->code() != ErrorCode::INVALID_DATA) {
                    return forward_error<std::vector<IndicatorSnapshot>>(value,
                                                                         "DataConversionUtils");
                }
            }

            if (sr_col) {
                auto levels_text = extract_string(sr_col, i);
                if (levels_text.is_ok() && !levels_text.value().empty()) {
                    nlohmann::json levels = nlohmann::json::parse(levels_text.value());
                    snapshot.from_json({{"sr_levels", levels}});
                }
            }

            snapshots.push_back(std::move(snapshot));
        }

        return Result<std::vector<IndicatorSnapshot>>(std::move(snapshots));

    } catch (const std::exception& e) {
        return make_error<std::vector<IndicatorSnapshot>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to indicators: ") + e.what(),
            "DataConversionUtils");
    }
}

std::pair<std::shared_ptr<arrow::Array>, int64_t> DataConversionUtils::locate(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    int64_t offset = index;
    for (const auto& chunk : column->chunks()) {
        if (offset < chunk->length()) {
            return {chunk, offset};
        }
        offset -= chunk->length();
    }
    return {nullptr, -1};
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    if (!column || index < 0 || index >= column->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    auto [array, offset] = locate(column, index);
    if (!array || array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Failed to cast to timestamp array", "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(offset)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    // Tables are built with second resolution
    return Result<Timestamp>(
        std::chrono::system_clock::time_point(std::chrono::seconds(ts_array->Value(offset))));
}

Result<double> DataConversionUtils::extract_double(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    if (!column || index < 0 || index >= column->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    auto [array, offset] = locate(column, index);
    if (!array || array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR, "Failed to cast to double array",
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(offset)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }
    return Result<double>(double_array->Value(offset));
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    if (!column || index < 0 || index >= column->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    auto [array, offset] = locate(column, index);
    if (!array || array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Failed to cast to string array", "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(offset)) {
        return Result<std::string>(std::string());
    }
    return Result<std::string>(string_array->GetString(offset));
}

}  // namespace lifecycle_ngin
