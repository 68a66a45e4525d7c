// src/storage/audit_record.cpp

#include "lifecycle_ngin/storage/audit_record.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

std::string audit_kind_to_string(AuditKind kind) {
    switch (kind) {
        case AuditKind::DECISION:
            return "decision";
        case AuditKind::HOLD:
            return "hold";
        case AuditKind::STATUS_TRANSITION:
            return "status_transition";
    }
    return "hold";
}

std::string audit_outcome_to_string(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::NONE:
            return "none";
        case AuditOutcome::SUCCESS:
            return "success";
        case AuditOutcome::FAILED:
            return "failed";
        case AuditOutcome::SKIPPED_DUPLICATE:
            return "skipped: duplicate";
        case AuditOutcome::DRY_RUN:
            return "dry_run";
        case AuditOutcome::RECORDED:
            return "recorded";
    }
    return "none";
}

std::optional<AuditKind> audit_kind_from_string(const std::string& text) {
    if (text == "decision")
        return AuditKind::DECISION;
    if (text == "hold")
        return AuditKind::HOLD;
    if (text == "status_transition")
        return AuditKind::STATUS_TRANSITION;
    return std::nullopt;
}

std::optional<AuditOutcome> audit_outcome_from_string(const std::string& text) {
    if (text == "none")
        return AuditOutcome::NONE;
    if (text == "success")
        return AuditOutcome::SUCCESS;
    if (text == "failed")
        return AuditOutcome::FAILED;
    if (text == "skipped: duplicate")
        return AuditOutcome::SKIPPED_DUPLICATE;
    if (text == "dry_run")
        return AuditOutcome::DRY_RUN;
    if (text == "recorded")
        return AuditOutcome::RECORDED;
    return std::nullopt;
}

nlohmann::json AuditRecord::to_json() const {
    nlohmann::json j;
    j["record_id"] = record_id;
    j["position_id"] = position_id();
    j["instrument"] = key.instrument;
    j["venue"] = key.venue;
    j["timeframe"] = timeframe_to_string(key.timeframe);
    j["kind"] = audit_kind_to_string(kind);
    j["decision_type"] = decision_type;
    j["size_fraction"] = size_fraction;
    j["reason"] = reason;
    j["signal"] = signal;
    j["scores"] = {{"a", a}, {"e", e}, {"fallback", scores_fallback}};
    j["justification"] = justification.is_null() ? nlohmann::json::object() : justification;

    nlohmann::json execution;
    execution["outcome"] = audit_outcome_to_string(outcome);
    if (!tx_reference.empty()) {
        execution["tx_reference"] = tx_reference;
        execution["filled_quantity"] = filled_quantity;
        execution["realized_price"] = realized_price;
        execution["notional"] = notional;
    }
    if (!error_code.empty()) {
        execution["error_code"] = error_code;
        execution["error_message"] = error_message;
    }
    j["execution"] = execution;

    if (from_status)
        j["from_status"] = position_status_to_string(*from_status);
    if (to_status)
        j["to_status"] = position_status_to_string(*to_status);

    j["created_at"] = core::format_iso8601(created_at);
    return j;
}

void AuditRecord::from_json(const nlohmann::json& j) {
    record_id = j.value("record_id", std::string());
    key.instrument = j.value("instrument", std::string());
    key.venue = j.value("venue", std::string());
    key.timeframe =
        timeframe_from_string(j.value("timeframe", std::string("1h"))).value_or(Timeframe::HOUR_1);
    kind = audit_kind_from_string(j.value("kind", std::string("hold"))).value_or(AuditKind::HOLD);
    decision_type = j.value("decision_type", std::string());
    size_fraction = j.value("size_fraction", 0.0);
    reason = j.value("reason", std::string());
    signal = j.value("signal", std::string());

    if (j.contains("scores")) {
        const auto& s = j.at("scores");
        a = s.value("a", 0.0);
        e = s.value("e", 0.0);
        scores_fallback = s.value("fallback", false);
    }
    justification = j.value("justification", nlohmann::json::object());

    if (j.contains("execution")) {
        const auto& x = j.at("execution");
        outcome = audit_outcome_from_string(x.value("outcome", std::string("none")))
                      .value_or(AuditOutcome::NONE);
        tx_reference = x.value("tx_reference", std::string());
        filled_quantity = x.value("filled_quantity", 0.0);
        realized_price = x.value("realized_price", 0.0);
        notional = x.value("notional", 0.0);
        error_code = x.value("error_code", std::string());
        error_message = x.value("error_message", std::string());
    }

    from_status.reset();
    to_status.reset();
    if (j.contains("from_status"))
        from_status = position_status_from_string(j.at("from_status").get<std::string>());
    if (j.contains("to_status"))
        to_status = position_status_from_string(j.at("to_status").get<std::string>());

    auto ts = core::parse_iso8601(j.value("created_at", std::string()));
    if (ts)
        created_at = *ts;
}

}  // namespace lifecycle_ngin
