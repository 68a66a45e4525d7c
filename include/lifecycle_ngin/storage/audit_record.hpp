// include/lifecycle_ngin/storage/audit_record.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/position/position.hpp"

namespace lifecycle_ngin {

/**
 * @brief The three audit record variants
 */
enum class AuditKind {
    DECISION,          // add, trim or exit, with the execution outcome
    HOLD,              // reasoning only
    STATUS_TRANSITION  // lifecycle status change
};

enum class AuditOutcome {
    NONE,               // hold
    SUCCESS,
    FAILED,
    SKIPPED_DUPLICATE,
    DRY_RUN,
    RECORDED            // status transition
};

std::string audit_kind_to_string(AuditKind kind);
std::string audit_outcome_to_string(AuditOutcome outcome);
std::optional<AuditKind> audit_kind_from_string(const std::string& text);
std::optional<AuditOutcome> audit_outcome_from_string(const std::string& text);

/**
 * @brief Immutable record of one orchestrator evaluation or status change
 */
struct AuditRecord {
    std::string record_id;
    PositionKey key;
    AuditKind kind{AuditKind::HOLD};
    std::string decision_type;  // hold, add, trim, exit, status_transition
    double size_fraction{0.0};
    std::string reason;
    std::string signal;

    // Scores used
    double a{0.0};
    double e{0.0};
    bool scores_fallback{false};

    nlohmann::json justification;  // trend output and scores that led to the decision

    AuditOutcome outcome{AuditOutcome::NONE};
    std::string tx_reference;
    Quantity filled_quantity{0.0};
    Price realized_price{0.0};
    double notional{0.0};
    std::string error_code;
    std::string error_message;

    std::optional<PositionStatus> from_status;
    std::optional<PositionStatus> to_status;

    Timestamp created_at;

    std::string position_id() const {
        return key.id();
    }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

}  // namespace lifecycle_ngin
