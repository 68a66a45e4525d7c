#include <gtest/gtest.h>
#include "lifecycle_ngin/core/time_utils.hpp"
#include "lifecycle_ngin/storage/audit_record.hpp"

using namespace lifecycle_ngin;

namespace {

AuditRecord make_decision_record() {
    AuditRecord record;
    record.record_id = "JUP_orca_1h_1704164645_1";
    record.key = PositionKey{"JUP", "orca", Timeframe::HOUR_1};
    record.kind = AuditKind::DECISION;
    record.decision_type = "add";
    record.size_fraction = 0.3;
    record.reason = "s1";
    record.signal = "buy_signal";
    record.a = 0.5;
    record.e = 0.42;
    record.justification = {{"trend", {{"state", "S1"}}}};
    record.outcome = AuditOutcome::SUCCESS;
    record.tx_reference = "PAPER_1";
    record.filled_quantity = 30.0;
    record.realized_price = 10.0;
    record.notional = 300.0;
    record.created_at = core::from_epoch_seconds(1704164645);
    return record;
}

}  // namespace

TEST(AuditRecordTest, DecisionJsonLayout) {
    auto j = make_decision_record().to_json();

    EXPECT_EQ(j.at("position_id"), "JUP_orca_1h");
    EXPECT_EQ(j.at("kind"), "decision");
    EXPECT_EQ(j.at("decision_type"), "add");
    EXPECT_DOUBLE_EQ(j.at("scores").at("e").get<double>(), 0.42);
    EXPECT_EQ(j.at("execution").at("outcome"), "success");
    EXPECT_EQ(j.at("execution").at("tx_reference"), "PAPER_1");
    EXPECT_FALSE(j.at("execution").contains("error_code"));
    EXPECT_FALSE(j.contains("from_status"));
    EXPECT_EQ(j.at("created_at"), "2024-01-02T03:04:05Z");
    EXPECT_EQ(j.at("justification").at("trend").at("state"), "S1");
}

TEST(AuditRecordTest, ParsesBackFromJson) {
    auto original = make_decision_record();
    AuditRecord parsed;
    parsed.from_json(original.to_json());

    EXPECT_EQ(parsed.record_id, original.record_id);
    EXPECT_EQ(parsed.key, original.key);
    EXPECT_EQ(parsed.kind, AuditKind::DECISION);
    EXPECT_EQ(parsed.outcome, AuditOutcome::SUCCESS);
    EXPECT_DOUBLE_EQ(parsed.notional, 300.0);
    EXPECT_EQ(parsed.created_at, original.created_at);
    EXPECT_EQ(parsed.justification, original.justification);
}

TEST(AuditRecordTest, FailureAndTransitionFields) {
    AuditRecord failed = make_decision_record();
    failed.outcome = AuditOutcome::FAILED;
    failed.tx_reference.clear();
    failed.error_code = "EXECUTION_FAILED";
    failed.error_message = "route not found";
    auto j = failed.to_json();
    EXPECT_EQ(j.at("execution").at("outcome"), "failed");
    EXPECT_FALSE(j.at("execution").contains("tx_reference"));
    EXPECT_EQ(j.at("execution").at("error_code"), "EXECUTION_FAILED");

    AuditRecord transition;
    transition.key = PositionKey{"JUP", "orca", Timeframe::HOUR_4};
    transition.kind = AuditKind::STATUS_TRANSITION;
    transition.outcome = AuditOutcome::RECORDED;
    transition.from_status = PositionStatus::DORMANT;
    transition.to_status = PositionStatus::WATCHLIST;

    AuditRecord parsed;
    parsed.from_json(transition.to_json());
    EXPECT_EQ(parsed.key.timeframe, Timeframe::HOUR_4);
    EXPECT_EQ(parsed.from_status, PositionStatus::DORMANT);
    EXPECT_EQ(parsed.to_status, PositionStatus::WATCHLIST);
    EXPECT_EQ(parsed.outcome, AuditOutcome::RECORDED);
}

TEST(AuditRecordTest, OutcomeNames) {
    EXPECT_EQ(audit_outcome_to_string(AuditOutcome::SKIPPED_DUPLICATE), "skipped: duplicate");
    EXPECT_EQ(audit_outcome_from_string("skipped: duplicate"), AuditOutcome::SKIPPED_DUPLICATE);
    EXPECT_FALSE(audit_outcome_from_string("bogus").has_value());
    EXPECT_EQ(audit_kind_from_string("status_transition"), AuditKind::STATUS_TRANSITION);
}
