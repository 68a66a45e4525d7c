// include/lifecycle_ngin/position/in_memory_position_store.hpp
#pragma once

#include <mutex>
#include <unordered_map>
#include "lifecycle_ngin/position/position_store.hpp"

namespace lifecycle_ngin {

/**
 * @brief Process-local position store for paper runs and tests
 */
class InMemoryPositionStore : public PositionStore {
public:
    InMemoryPositionStore() = default;

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

    size_t size() const;

private:
    std::vector<Position> select(Timeframe timeframe,
                                 std::initializer_list<PositionStatus> statuses) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Position> positions_;
};

}  // namespace lifecycle_ngin
