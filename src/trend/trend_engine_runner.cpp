// src/trend/trend_engine_runner.cpp

#include "lifecycle_ngin/trend/trend_engine_runner.hpp"
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/core/state_manager.hpp"

namespace lifecycle_ngin {

TrendEngineRunner::TrendEngineRunner(std::shared_ptr<PositionStore> store,
                                     std::shared_ptr<MarketDataProvider> market_data,
                                     TrendEngineConfig config)
    : store_(std::move(store)),
      market_data_(std::move(market_data)),
      engine_(std::move(config)),
      component_id_(StateManager::make_component_id("TREND_ENGINE")) {
    ComponentInfo info{ComponentType::TREND_ENGINE,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register trend engine: " << registered.error()->what());
    }
    INFO("Trend engine runner initialized with ID: " << component_id_);
}

TrendEngineRunner::~TrendEngineRunner() {
    auto result = StateManager::instance().unregister_component(component_id_);
    if (result.is_error()) {
        DEBUG("Trend engine was not registered: " << result.error()->what());
    }
}

Result<int64_t> TrendEngineRunner::sync_bars_count(const Position& position) {
    auto count = market_data_->get_bars_count(position.key);
    if (count.is_error()) {
        return count;
    }
    if (count.value() != position.bars_count) {
        auto updated = store_->update_bars_count(position.key, count.value());
        if (updated.is_error()) {
            return forward_error<int64_t>(updated, "TrendEngineRunner");
        }
    }
    return count;
}

Result<bool> TrendEngineRunner::evaluate_live(const Position& position) {
    if (position.bars_count < engine_.config().min_bars) {
        return make_error<bool>(ErrorCode::INSUFFICIENT_DATA,
                                "Only " + std::to_string(position.bars_count) +
                                    " bars available for " + position.id(),
                                "TrendEngineRunner");
    }

    auto snapshot = market_data_->get_latest_indicators(position.key);
    if (snapshot.is_error()) {
        return forward_error<bool>(snapshot, "TrendEngineRunner");
    }
    auto bars = market_data_->get_recent_bars(position.key, engine_.config().structure_lookback);
    if (bars.is_error()) {
        return forward_error<bool>(bars, "TrendEngineRunner");
    }

    auto output = engine_.evaluate(snapshot.value(), bars.value(), position.features.trend);
    if (output.is_error()) {
        return forward_error<bool>(output, "TrendEngineRunner");
    }

    auto indicators_written = store_->refresh_indicators(position.key, snapshot.value());
    if (indicators_written.is_error()) {
        return forward_error<bool>(indicators_written, "TrendEngineRunner");
    }
    auto written = store_->refresh_trend_output(position.key, output.value());
    if (written.is_error()) {
        return forward_error<bool>(written, "TrendEngineRunner");
    }

    const auto& out = output.value();
    if (out.state_changed()) {
        DEBUG(position.id() << " " << trend_state_to_string(out.previous_state) << " -> "
                            << trend_state_to_string(out.state)
                            << (out.reason.empty() ? "" : " (" + out.reason + ")"));
    }
    return out.state_changed();
}

Result<bool> TrendEngineRunner::evaluate_bootstrap(const Position& position) {
    const auto& config = engine_.config();
    Result<TrendOutput> output = make_error<TrendOutput>(ErrorCode::UNKNOWN_ERROR, "unset");

    if (!position.features.trend) {
        auto history = market_data_->get_indicator_history(position.key, config.bootstrap_history);
        if (history.is_error()) {
            return forward_error<bool>(history, "TrendEngineRunner");
        }
        auto bars = market_data_->get_recent_bars(
            position.key, config.bootstrap_history + config.structure_lookback);
        if (bars.is_error()) {
            return forward_error<bool>(bars, "TrendEngineRunner");
        }
        output = engine_.bootstrap(history.value(), bars.value());
    } else {
        auto snapshot = market_data_->get_latest_indicators(position.key);
        if (snapshot.is_error()) {
            return forward_error<bool>(snapshot, "TrendEngineRunner");
        }
        auto bars = market_data_->get_recent_bars(position.key, config.structure_lookback);
        if (bars.is_error()) {
            return forward_error<bool>(bars, "TrendEngineRunner");
        }
        output = engine_.evaluate(snapshot.value(), bars.value(), position.features.trend);
        if (output.is_ok()) {
            TrendOutput stepped = output.take_value();
            TrendSignalEngine::mark_bootstrap(stepped);
            output = Result<TrendOutput>(std::move(stepped));
        }
    }

    if (output.is_error()) {
        return forward_error<bool>(output, "TrendEngineRunner");
    }

    auto written = store_->refresh_trend_output(position.key, output.value());
    if (written.is_error()) {
        return forward_error<bool>(written, "TrendEngineRunner");
    }

    const auto& out = output.value();
    bool changed = !position.features.trend || position.features.trend->state != out.state;
    if (changed) {
        DEBUG(position.id() << " bootstrap state " << trend_state_to_string(out.state)
                            << (out.provisional ? " (provisional)" : ""));
    }
    return changed;
}

Result<EngineRunSummary> TrendEngineRunner::run(Timeframe timeframe) {
    Logger::register_component("TrendEngine");
    auto& state_manager = StateManager::instance();
    auto running = state_manager.ensure_running(component_id_);
    if (running.is_error()) {
        DEBUG("State update skipped: " << running.error()->what());
    }

    EngineRunSummary summary;
    INFO("Trend engine run started for timeframe " << timeframe_to_string(timeframe));

    auto eligible = store_->get_eligible_positions(timeframe);
    if (eligible.is_error()) {
        ERROR("Failed to load eligible positions: " << eligible.error()->what());
        auto failed = state_manager.update_state(component_id_, ComponentState::ERR_STATE,
                                                 eligible.error()->what());
        if (failed.is_error()) {
            DEBUG("State update skipped: " << failed.error()->what());
        }
        return forward_error<EngineRunSummary>(eligible, "TrendEngineRunner");
    }

    for (Position position : eligible.value()) {
        auto synced = sync_bars_count(position);
        if (synced.is_error()) {
            WARN("Bars count not refreshed for " << position.id() << ": "
                                                 << synced.error()->what());
        } else {
            position.bars_count = synced.value();
        }

        auto result = evaluate_live(position);
        if (result.is_error()) {
            ErrorCode code = result.error()->code();
            if (code == ErrorCode::INSUFFICIENT_DATA || code == ErrorCode::DATA_NOT_FOUND) {
                WARN("Skipping " << position.id() << ": " << result.error()->what());
                ++summary.skipped;
            } else {
                ERROR("Engine evaluation failed for " << position.id() << ": "
                                                      << result.error()->what());
                ++summary.failed;
            }
            continue;
        }
        ++summary.evaluated;
        if (result.value()) {
            ++summary.state_changes;
        }
    }

    auto dormant = store_->get_bootstrap_positions(timeframe);
    if (dormant.is_error()) {
        ERROR("Failed to load bootstrap positions: " << dormant.error()->what());
        ++summary.failed;
    } else {
        for (Position position : dormant.value()) {
            auto synced = sync_bars_count(position);
            if (synced.is_error()) {
                WARN("Bars count not refreshed for " << position.id() << ": "
                                                     << synced.error()->what());
            } else {
                position.bars_count = synced.value();
            }

            auto result = evaluate_bootstrap(position);
            if (result.is_error()) {
                DEBUG("Bootstrap skipped for " << position.id() << ": "
                                               << result.error()->what());
                ++summary.skipped;
                continue;
            }
            ++summary.bootstrapped;
            if (result.value()) {
                ++summary.state_changes;
            }
        }
    }

    publish_metrics(summary);
    INFO("Trend engine run finished for " << timeframe_to_string(timeframe) << ": evaluated="
                                          << summary.evaluated
                                          << " bootstrapped=" << summary.bootstrapped
                                          << " state_changes=" << summary.state_changes
                                          << " skipped=" << summary.skipped
                                          << " failed=" << summary.failed);
    return summary;
}

void TrendEngineRunner::publish_metrics(const EngineRunSummary& summary) {
    std::unordered_map<std::string, double> metrics{
        {"positions_processed", static_cast<double>(summary.evaluated + summary.bootstrapped)},
        {"state_changes", static_cast<double>(summary.state_changes)},
        {"skipped", static_cast<double>(summary.skipped)},
        {"failures", static_cast<double>(summary.failed)}};
    auto updated = StateManager::instance().update_metrics(component_id_, metrics);
    if (updated.is_error()) {
        DEBUG("Metrics not published: " << updated.error()->what());
    }
}

}  // namespace lifecycle_ngin
