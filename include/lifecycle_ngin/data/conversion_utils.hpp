// include/lifecycle_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/data/indicator_snapshot.hpp"

namespace lifecycle_ngin {

class DataConversionUtils {
public:
    /**
     * @brief Convert Arrow Table to vector of Bars
     * @param table Arrow table with time, symbol, open, high, low, close, volume
     * @return Result containing vector of Bars
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert Arrow Table to indicator snapshots
     * @param table Arrow table with time, close, the indicator columns and an optional
     *        sr_levels column holding a JSON array
     */
    static Result<std::vector<IndicatorSnapshot>> arrow_table_to_indicators(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Indicator columns expected in an indicator table, in schema order
     */
    static const std::vector<std::string>& indicator_columns();

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::ChunkedArray>& column,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::ChunkedArray>& column,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::ChunkedArray>& column,
                                              int64_t index);

    /**
     * @brief Locate the chunk holding a row
     * @return The chunk and the row offset inside it
     */
    static std::pair<std::shared_ptr<arrow::Array>, int64_t> locate(
        const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index);
};

}  // namespace lifecycle_ngin
