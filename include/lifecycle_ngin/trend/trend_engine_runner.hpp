// include/lifecycle_ngin/trend/trend_engine_runner.hpp
#pragma once

#include <memory>
#include <string>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/data/market_data_provider.hpp"
#include "lifecycle_ngin/position/position_store.hpp"
#include "lifecycle_ngin/trend/trend_signal_engine.hpp"

namespace lifecycle_ngin {

/**
 * @brief Counts from one engine run over a timeframe
 */
struct EngineRunSummary {
    size_t evaluated{0};     // eligible positions evaluated live
    size_t bootstrapped{0};  // dormant positions replayed or stepped
    size_t state_changes{0};
    size_t skipped{0};       // missing or insufficient data
    size_t failed{0};
};

/**
 * @brief Scheduled job running the trend engine over every position of a timeframe
 *
 * Eligible positions are evaluated on their latest bar. Dormant positions are
 * replayed from history the first time and stepped afterwards, with their
 * flags suppressed so they never carry a tradable signal.
 */
class TrendEngineRunner {
public:
    TrendEngineRunner(std::shared_ptr<PositionStore> store,
                      std::shared_ptr<MarketDataProvider> market_data, TrendEngineConfig config);
    ~TrendEngineRunner();

    TrendEngineRunner(const TrendEngineRunner&) = delete;
    TrendEngineRunner& operator=(const TrendEngineRunner&) = delete;

    Result<EngineRunSummary> run(Timeframe timeframe);

    const std::string& component_id() const {
        return component_id_;
    }

private:
    /**
     * @return true if the state changed
     */
    Result<bool> evaluate_live(const Position& position);
    Result<bool> evaluate_bootstrap(const Position& position);
    /**
     * @return The provider's bar count, written to the store when it changed
     */
    Result<int64_t> sync_bars_count(const Position& position);
    void publish_metrics(const EngineRunSummary& summary);

    std::shared_ptr<PositionStore> store_;
    std::shared_ptr<MarketDataProvider> market_data_;
    TrendSignalEngine engine_;
    std::string component_id_;
};

}  // namespace lifecycle_ngin
