// include/lifecycle_ngin/orchestrator/decision_orchestrator.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/config_base.hpp"
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/execution/order_executor.hpp"
#include "lifecycle_ngin/orchestrator/decision_policy.hpp"
#include "lifecycle_ngin/orchestrator/idempotency_guard.hpp"
#include "lifecycle_ngin/position/position_store.hpp"
#include "lifecycle_ngin/risk/risk_scorer.hpp"
#include "lifecycle_ngin/storage/audit_sink.hpp"

namespace lifecycle_ngin {

/**
 * @brief Configuration for the decision orchestrator
 */
struct OrchestratorConfig : public ConfigBase {
    bool dry_run{false};  // compute and audit decisions without executing
    size_t max_parallel_positions{1};
    std::chrono::seconds idempotency_window{180};
    int64_t bars_threshold{350};  // dormant -> watchlist gate
    int max_output_age_bars{3};   // engine output older than this many bars is ignored

    std::string version{"1.0.0"};

    /**
     * @brief Output age limit for a timeframe (0 when disabled)
     */
    std::chrono::seconds max_output_age(Timeframe timeframe) const {
        return timeframe_duration(timeframe) * max_output_age_bars;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Counts from one orchestrator tick
 */
struct TickSummary {
    size_t evaluated{0};
    size_t holds{0};
    size_t executed{0};
    size_t failed{0};
    size_t skipped_duplicate{0};
    size_t dry_run{0};
    size_t promoted{0};
    size_t demoted{0};
    size_t invariant_violations{0};
};

/**
 * @brief Scheduled tick turning engine output into executed, audited trades
 *
 * Each tick gates dormant/watchlist positions on bars_count, then evaluates
 * every eligible position: score, decide, claim, execute, record. Failures
 * are isolated per position.
 */
class DecisionOrchestrator {
public:
    DecisionOrchestrator(OrchestratorConfig config, std::shared_ptr<PositionStore> store,
                         std::shared_ptr<RiskScorer> scorer, DecisionPolicy policy,
                         std::shared_ptr<OrderExecutor> executor,
                         std::shared_ptr<AuditSink> audit_sink);
    ~DecisionOrchestrator();

    DecisionOrchestrator(const DecisionOrchestrator&) = delete;
    DecisionOrchestrator& operator=(const DecisionOrchestrator&) = delete;

    /**
     * @brief Run one tick for a timeframe
     * @param now Tick time, used for cache freshness and the idempotency window
     * @return DATABASE_ERROR if the position list cannot be loaded
     */
    Result<TickSummary> run_tick(Timeframe timeframe, Timestamp now);

    Result<TickSummary> run_tick(Timeframe timeframe) {
        return run_tick(timeframe, std::chrono::system_clock::now());
    }

    const OrchestratorConfig& config() const {
        return config_;
    }

    const std::string& component_id() const {
        return component_id_;
    }

private:
    enum class Outcome {
        HOLD,
        EXECUTED,
        FAILED,
        SKIPPED_DUPLICATE,
        DRY_RUN,
        INVARIANT_VIOLATION
    };

    void gate_by_history(Timeframe timeframe, Timestamp now, TickSummary& summary);
    Outcome process_position(const Position& position, Timestamp now);
    /**
     * @param after Set to the updated position when a fill was recorded
     */
    Outcome execute_decision(const Position& position, const PolicyResult& policy,
                             AuditRecord& record, Timestamp now, std::optional<Position>& after);
    OrderCommand build_command(const Position& position, const PolicyResult& policy,
                               Timestamp now) const;

    AuditRecord make_record(const Position& position, Timestamp now) const;
    void record_status_transition(const Position& position, PositionStatus from,
                                  PositionStatus to, const std::string& reason, Timestamp now);
    void publish_metrics(const TickSummary& summary);

    OrchestratorConfig config_;
    std::shared_ptr<PositionStore> store_;
    std::shared_ptr<RiskScorer> scorer_;
    DecisionPolicy policy_;
    std::shared_ptr<OrderExecutor> executor_;
    std::shared_ptr<AuditSink> audit_sink_;
    IdempotencyGuard guard_;
    std::string component_id_;
    mutable std::atomic<uint64_t> record_sequence_{0};
};

}  // namespace lifecycle_ngin
