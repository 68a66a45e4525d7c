// include/lifecycle_ngin/position/position_store.hpp
#pragma once

#include <chrono>
#include <optional>
#include <vector>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/position/position.hpp"

namespace lifecycle_ngin {

/**
 * @brief Durable storage of positions
 *
 * Every mutation is atomic with respect to a single position.
 */
class PositionStore {
public:
    virtual ~PositionStore() = default;

    /**
     * @brief Insert a new position
     * @return DUPLICATE_POSITION if the key already exists
     */
    virtual Result<void> create_position(const Position& position) = 0;

    virtual Result<Position> get_position(const PositionKey& key) const = 0;

    /**
     * @brief Watchlist and active positions for a timeframe
     */
    virtual Result<std::vector<Position>> get_eligible_positions(Timeframe timeframe) const = 0;

    /**
     * @brief Dormant positions for a timeframe
     */
    virtual Result<std::vector<Position>> get_bootstrap_positions(Timeframe timeframe) const = 0;

    /**
     * @brief Apply a fill and the resulting status change in one step
     * @return The updated position
     */
    virtual Result<Position> record_execution(const PositionKey& key, const Fill& fill) = 0;

    /**
     * @brief Atomically reserve a position for one execution at now
     *
     * The claim is persisted before any order is sent, so every process sharing
     * the store sees it. It fails while an execution or another claim lies inside
     * the window.
     *
     * @return The claimed position as stored, or std::nullopt if it is already taken
     */
    virtual Result<std::optional<Position>> claim_execution(const PositionKey& key,
                                                            Timestamp now,
                                                            std::chrono::seconds window) = 0;

    /**
     * @brief Change status after validating the transition and the invariants
     * @return The updated position
     */
    virtual Result<Position> update_status(const PositionKey& key, PositionStatus status,
                                           TransitionOrigin origin) = 0;

    virtual Result<void> refresh_trend_output(const PositionKey& key,
                                              const TrendOutput& output) = 0;

    virtual Result<void> refresh_scores(const PositionKey& key, const ScoreSnapshot& scores) = 0;

    virtual Result<void> refresh_indicators(const PositionKey& key,
                                            const IndicatorSnapshot& snapshot) = 0;

    virtual Result<void> update_bars_count(const PositionKey& key, int64_t bars_count) = 0;
};

}  // namespace lifecycle_ngin
