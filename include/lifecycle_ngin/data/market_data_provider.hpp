// include/lifecycle_ngin/data/market_data_provider.hpp
#pragma once

#include <cstdint>
#include <vector>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/data/indicator_snapshot.hpp"
#include "lifecycle_ngin/position/position.hpp"

namespace lifecycle_ngin {

/**
 * @brief Read-only source of bars and precomputed indicators
 *
 * All series are returned oldest first.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual Result<IndicatorSnapshot> get_latest_indicators(const PositionKey& key) = 0;

    /**
     * @brief Up to limit most recent indicator snapshots, used to replay the engine
     */
    virtual Result<std::vector<IndicatorSnapshot>> get_indicator_history(const PositionKey& key,
                                                                         size_t limit) = 0;

    virtual Result<std::vector<Bar>> get_recent_bars(const PositionKey& key, size_t limit) = 0;

    virtual Result<int64_t> get_bars_count(const PositionKey& key) = 0;
};

}  // namespace lifecycle_ngin
