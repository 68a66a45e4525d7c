// src/orchestrator/decision_orchestrator.cpp

#include "lifecycle_ngin/orchestrator/decision_orchestrator.hpp"
#include <algorithm>
#include <optional>
#include <thread>
#include <vector>
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/core/state_manager.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

nlohmann::json OrchestratorConfig::to_json() const {
    nlohmann::json j;
    j["dry_run"] = dry_run;
    j["max_parallel_positions"] = max_parallel_positions;
    j["idempotency_window_seconds"] = idempotency_window.count();
    j["bars_threshold"] = bars_threshold;
    j["max_output_age_bars"] = max_output_age_bars;
    j["version"] = version;
    return j;
}

void OrchestratorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("dry_run"))
        dry_run = j.at("dry_run").get<bool>();
    if (j.contains("max_parallel_positions"))
        max_parallel_positions = j.at("max_parallel_positions").get<size_t>();
    if (j.contains("idempotency_window_seconds"))
        idempotency_window =
            std::chrono::seconds(j.at("idempotency_window_seconds").get<int64_t>());
    if (j.contains("bars_threshold"))
        bars_threshold = j.at("bars_threshold").get<int64_t>();
    if (j.contains("max_output_age_bars"))
        max_output_age_bars = j.at("max_output_age_bars").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> OrchestratorConfig::validate() const {
    if (max_parallel_positions == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_parallel_positions must be at least 1", "OrchestratorConfig");
    }
    if (idempotency_window.count() <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "idempotency_window must be positive", "OrchestratorConfig");
    }
    if (bars_threshold <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bars_threshold must be positive",
                                "OrchestratorConfig");
    }
    if (max_output_age_bars < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_output_age_bars must be non-negative", "OrchestratorConfig");
    }
    return Result<void>();
}

DecisionOrchestrator::DecisionOrchestrator(OrchestratorConfig config,
                                           std::shared_ptr<PositionStore> store,
                                           std::shared_ptr<RiskScorer> scorer,
                                           DecisionPolicy policy,
                                           std::shared_ptr<OrderExecutor> executor,
                                           std::shared_ptr<AuditSink> audit_sink)
    : config_(std::move(config)),
      store_(std::move(store)),
      scorer_(std::move(scorer)),
      policy_(std::move(policy)),
      executor_(std::move(executor)),
      audit_sink_(std::move(audit_sink)),
      guard_(store_, config_.idempotency_window),
      component_id_(StateManager::make_component_id("ORCHESTRATOR")) {
    ComponentInfo info{ComponentType::ORCHESTRATOR,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register orchestrator: " << registered.error()->what());
    }
    INFO("Decision orchestrator initialized with ID: " << component_id_
                                                        << (config_.dry_run ? " (dry run)" : ""));
}

DecisionOrchestrator::~DecisionOrchestrator() {
    auto result = StateManager::instance().unregister_component(component_id_);
    if (result.is_error()) {
        DEBUG("Orchestrator was not registered: " << result.error()->what());
    }
}

AuditRecord DecisionOrchestrator::make_record(const Position& position, Timestamp now) const {
    AuditRecord record;
    record.record_id = position.id() + "_" + std::to_string(core::to_epoch_seconds(now)) + "_" +
                       std::to_string(++record_sequence_);
    record.key = position.key;
    record.created_at = now;
    return record;
}

void DecisionOrchestrator::record_status_transition(const Position& position,
                                                    PositionStatus from, PositionStatus to,
                                                    const std::string& reason, Timestamp now) {
    AuditRecord record = make_record(position, now);
    record.kind = AuditKind::STATUS_TRANSITION;
    record.decision_type = "status_transition";
    record.reason = reason;
    record.outcome = AuditOutcome::RECORDED;
    record.from_status = from;
    record.to_status = to;
    record.justification = {{"bars_count", position.bars_count},
                            {"quantity", position.holdings.quantity}};
    audit_sink_->append(std::move(record));
    INFO(position.id() << " status " << position_status_to_string(from) << " -> "
                       << position_status_to_string(to) << " (" << reason << ")");
}

void DecisionOrchestrator::gate_by_history(Timeframe timeframe, Timestamp now,
                                           TickSummary& summary) {
    auto dormant = store_->get_bootstrap_positions(timeframe);
    if (dormant.is_error()) {
        ERROR("Failed to load dormant positions: " << dormant.error()->what());
    } else {
        for (const auto& position : dormant.value()) {
            if (position.bars_count < config_.bars_threshold) {
                continue;
            }
            auto promoted = store_->update_status(position.key, PositionStatus::WATCHLIST,
                                                  TransitionOrigin::AUTOMATIC);
            if (promoted.is_error()) {
                ERROR("Failed to promote " << position.id() << ": "
                                           << promoted.error()->what());
                continue;
            }
            ++summary.promoted;
            record_status_transition(promoted.value(), PositionStatus::DORMANT,
                                     PositionStatus::WATCHLIST, "history_sufficient", now);
        }
    }

    auto eligible = store_->get_eligible_positions(timeframe);
    if (eligible.is_error()) {
        return;
    }
    for (const auto& position : eligible.value()) {
        if (position.status != PositionStatus::WATCHLIST ||
            position.bars_count >= config_.bars_threshold || position.holdings.quantity > 0.0) {
            continue;
        }
        auto demoted = store_->update_status(position.key, PositionStatus::DORMANT,
                                             TransitionOrigin::AUTOMATIC);
        if (demoted.is_error()) {
            ERROR("Failed to demote " << position.id() << ": " << demoted.error()->what());
            continue;
        }
        ++summary.demoted;
        record_status_transition(demoted.value(), PositionStatus::WATCHLIST,
                                 PositionStatus::DORMANT, "history_insufficient", now);
    }
}

OrderCommand DecisionOrchestrator::build_command(const Position& position,
                                                 const PolicyResult& policy,
                                                 Timestamp now) const {
    OrderCommand command;
    command.instrument = position.key.instrument;
    command.venue = position.key.venue;
    command.timeframe = position.key.timeframe;
    command.reference_price = policy.reference_price;
    command.client_order_id = position.id() + "_" + std::to_string(core::to_epoch_seconds(now));

    const auto& holdings = position.holdings;
    if (const auto* add = std::get_if<AddDecision>(&policy.decision)) {
        command.side = Side::BUY;
        command.notional = holdings.remaining_allocation(position.allocation_cap) *
                           add->size_fraction;
    } else if (const auto* trim = std::get_if<TrimDecision>(&policy.decision)) {
        command.side = Side::SELL;
        command.quantity = holdings.quantity * trim->size_fraction;
    } else {
        command.side = Side::SELL;
        command.quantity = holdings.quantity;
    }
    return command;
}

DecisionOrchestrator::Outcome DecisionOrchestrator::execute_decision(
    const Position& position, const PolicyResult& policy, AuditRecord& record, Timestamp now,
    std::optional<Position>& after) {
    if (config_.dry_run) {
        record.outcome = AuditOutcome::DRY_RUN;
        DEBUG(position.id() << " dry run " << record.decision_type << " "
                            << record.size_fraction);
        return Outcome::DRY_RUN;
    }

    auto claim = guard_.try_claim(position.key, now);
    if (claim.is_error()) {
        record.outcome = AuditOutcome::FAILED;
        record.error_code = error_code_to_string(claim.error()->code());
        record.error_message = "Execution claim failed: " + std::string(claim.error()->what());
        ERROR("Could not claim " << position.id() << " for " << record.decision_type << ": "
                                 << claim.error()->what());
        return Outcome::FAILED;
    }
    if (!claim.value()) {
        record.outcome = AuditOutcome::SKIPPED_DUPLICATE;
        WARN(position.id() << " executed or claimed within the last " << guard_.window().count()
                           << "s, skipping duplicate " << record.decision_type);
        return Outcome::SKIPPED_DUPLICATE;
    }

    // Size from the row as claimed, not the snapshot loaded at tick start
    const Position& claimed = *claim.value();
    OrderCommand command = build_command(claimed, policy, now);
    auto receipt = executor_->execute(command);
    if (receipt.is_error()) {
        record.outcome = AuditOutcome::FAILED;
        record.error_code = error_code_to_string(receipt.error()->code());
        record.error_message = receipt.error()->what();
        ERROR("Execution failed for " << position.id() << " (" << record.decision_type
                                      << "): " << receipt.error()->to_string());
        return Outcome::FAILED;
    }

    const auto& r = receipt.value();
    record.outcome = AuditOutcome::SUCCESS;
    record.tx_reference = r.tx_reference;
    record.filled_quantity = r.filled_quantity;
    record.realized_price = r.realized_price;
    record.notional = r.notional;

    Fill fill;
    fill.side = command.side;
    fill.quantity = r.filled_quantity;
    fill.notional = r.notional;
    fill.price = r.realized_price;
    fill.tx_reference = r.tx_reference;
    fill.executed_at = now;

    auto updated = store_->record_execution(position.key, fill);
    if (updated.is_error()) {
        // The order settled but holdings were not persisted: needs operator attention
        record.error_code = error_code_to_string(updated.error()->code());
        record.error_message = "Fill not recorded: " + std::string(updated.error()->what());
        ERROR("Executed " << r.tx_reference << " for " << position.id()
                          << " but failed to record it: " << updated.error()->what());
        return Outcome::FAILED;
    }

    INFO(position.id() << " " << record.decision_type << " executed: " << r.tx_reference << " "
                       << side_to_string(command.side) << " " << r.filled_quantity << " @ "
                       << r.realized_price);

    after = updated.take_value();
    return Outcome::EXECUTED;
}

DecisionOrchestrator::Outcome DecisionOrchestrator::process_position(const Position& position,
                                                                     Timestamp now) {
    auto invariants = check_invariants(position);
    if (invariants.is_error()) {
        ERROR("Skipping " << position.id() << ": " << invariants.error()->what());
        return Outcome::INVARIANT_VIOLATION;
    }

    ScoreResult scores = scorer_->score(position, now);
    if (scores.recomputed) {
        auto cached = store_->refresh_scores(position.key, scores.snapshot);
        if (cached.is_error()) {
            WARN("Failed to cache scores for " << position.id() << ": "
                                               << cached.error()->what());
        }
    }

    PolicyResult policy = policy_.decide(position, position.features.trend, scores.snapshot, now);
    // Short history only blocks risk-adding decisions; full exits of held coins still go out
    if (position.bars_count < config_.bars_threshold &&
        !std::holds_alternative<ExitDecision>(policy.decision)) {
        policy.decision = HoldDecision{hold_reason::INSUFFICIENT_DATA};
    }

    AuditRecord record = make_record(position, now);
    record.decision_type = decision_type(policy.decision);
    record.size_fraction = decision_size(policy.decision);
    record.reason = decision_reason(policy.decision);
    record.signal = trend_signal_to_string(policy.signal);
    record.a = scores.snapshot.a;
    record.e = scores.snapshot.e;
    record.scores_fallback = scores.snapshot.fallback;
    record.justification["scores"] = scores.snapshot.to_json();
    record.justification["trend"] =
        position.features.trend ? position.features.trend->to_json() : nlohmann::json();
    record.justification["holdings"] = {
        {"quantity", position.holdings.quantity},
        {"invested", position.holdings.invested},
        {"extracted", position.holdings.extracted},
        {"allocation_cap", position.allocation_cap},
        {"status", position_status_to_string(position.status)}};

    DEBUG(position.id() << " decision " << record.decision_type << " size "
                        << record.size_fraction << " (" << record.reason << ", signal "
                        << record.signal << ", A=" << record.a << " E=" << record.e << ")");

    Outcome outcome = Outcome::HOLD;
    std::optional<Position> after;
    if (is_hold(policy.decision)) {
        record.kind = AuditKind::HOLD;
        record.outcome = AuditOutcome::NONE;
    } else {
        record.kind = AuditKind::DECISION;
        outcome = execute_decision(position, policy, record, now, after);
    }
    audit_sink_->append(std::move(record));

    if (after && after->status != position.status) {
        record_status_transition(*after, position.status, after->status,
                                 after->status == PositionStatus::ACTIVE ? "first_entry"
                                                                         : "full_exit",
                                 now);
    }
    return outcome;
}

Result<TickSummary> DecisionOrchestrator::run_tick(Timeframe timeframe, Timestamp now) {
    Logger::register_component("Orchestrator");
    auto& state_manager = StateManager::instance();
    auto running = state_manager.ensure_running(component_id_);
    if (running.is_error()) {
        DEBUG("State update skipped: " << running.error()->what());
    }

    INFO("Decision tick started for timeframe " << timeframe_to_string(timeframe)
                                                << (config_.dry_run ? " (dry run)" : ""));
    TickSummary summary;
    gate_by_history(timeframe, now, summary);

    auto eligible = store_->get_eligible_positions(timeframe);
    if (eligible.is_error()) {
        ERROR("Failed to load eligible positions: " << eligible.error()->what());
        auto failed = state_manager.update_state(component_id_, ComponentState::ERR_STATE,
                                                 eligible.error()->what());
        if (failed.is_error()) {
            DEBUG("State update skipped: " << failed.error()->what());
        }
        return forward_error<TickSummary>(eligible, "DecisionOrchestrator");
    }

    const auto& positions = eligible.value();
    std::mutex summary_mutex;
    auto tally = [&](Outcome outcome) {
        std::lock_guard<std::mutex> lock(summary_mutex);
        ++summary.evaluated;
        switch (outcome) {
            case Outcome::HOLD:
                ++summary.holds;
                break;
            case Outcome::EXECUTED:
                ++summary.executed;
                break;
            case Outcome::FAILED:
                ++summary.failed;
                break;
            case Outcome::SKIPPED_DUPLICATE:
                ++summary.skipped_duplicate;
                break;
            case Outcome::DRY_RUN:
                ++summary.dry_run;
                break;
            case Outcome::INVARIANT_VIOLATION:
                ++summary.invariant_violations;
                break;
        }
    };

    auto process_isolated = [&](const Position& position) {
        try {
            tally(process_position(position, now));
        } catch (const std::exception& e) {
            ERROR("Unexpected failure processing " << position.id() << ": " << e.what());
            tally(Outcome::FAILED);
        }
    };

    size_t workers = std::min(config_.max_parallel_positions, positions.size());
    if (workers <= 1) {
        for (const auto& position : positions) {
            process_isolated(position);
        }
    } else {
        std::atomic<size_t> next{0};
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back([&] {
                Logger::register_component("Orchestrator");
                for (size_t idx = next++; idx < positions.size(); idx = next++) {
                    process_isolated(positions[idx]);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    publish_metrics(summary);
    INFO("Decision tick finished for " << timeframe_to_string(timeframe)
                                       << ": evaluated=" << summary.evaluated
                                       << " holds=" << summary.holds
                                       << " executed=" << summary.executed
                                       << " failed=" << summary.failed
                                       << " skipped_duplicate=" << summary.skipped_duplicate
                                       << " dry_run=" << summary.dry_run
                                       << " promoted=" << summary.promoted
                                       << " demoted=" << summary.demoted
                                       << " invariant_violations="
                                       << summary.invariant_violations);
    return summary;
}

void DecisionOrchestrator::publish_metrics(const TickSummary& summary) {
    std::unordered_map<std::string, double> metrics{
        {"positions_processed", static_cast<double>(summary.evaluated)},
        {"holds", static_cast<double>(summary.holds)},
        {"executions", static_cast<double>(summary.executed)},
        {"failures", static_cast<double>(summary.failed)},
        {"skipped_duplicates", static_cast<double>(summary.skipped_duplicate)},
        {"dry_runs", static_cast<double>(summary.dry_run)},
        {"promoted", static_cast<double>(summary.promoted)},
        {"invariant_violations", static_cast<double>(summary.invariant_violations)}};
    auto updated = StateManager::instance().update_metrics(component_id_, metrics);
    if (updated.is_error()) {
        DEBUG("Metrics not published: " << updated.error()->what());
    }
}

}  // namespace lifecycle_ngin
