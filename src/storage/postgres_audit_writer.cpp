// src/storage/postgres_audit_writer.cpp

#include "lifecycle_ngin/storage/postgres_audit_writer.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

namespace {
constexpr const char* COMPONENT = "PostgresAuditWriter";
}

PostgresAuditWriter::PostgresAuditWriter(std::shared_ptr<PostgresConnection> connection,
                                         std::string table_name)
    : connection_(std::move(connection)), table_name_(std::move(table_name)) {}

Result<void> PostgresAuditWriter::write(const AuditRecord& record) {
    auto table_check = PostgresConnection::validate_table_name(table_name_);
    if (table_check.is_error()) {
        return table_check;
    }

    std::string payload;
    try {
        payload = record.to_json().dump();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Failed to serialise audit record: " + std::string(e.what()),
                                COMPONENT);
    }

    return connection_->with_transaction<void>(COMPONENT, [&](pqxx::work& txn) -> Result<void> {
        std::string query = "INSERT INTO " + table_name_ +
                            " (record_id, position_id, instrument, venue, timeframe, kind, "
                            "decision_type, size_fraction, outcome, tx_reference, payload, "
                            "created_at) "
                            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, NULLIF($10, ''), "
                            "$11::jsonb, $12::timestamptz)";
        txn.exec_params(query, record.record_id, record.position_id(), record.key.instrument,
                        record.key.venue, timeframe_to_string(record.key.timeframe),
                        audit_kind_to_string(record.kind), record.decision_type,
                        record.size_fraction, audit_outcome_to_string(record.outcome),
                        record.tx_reference, payload, core::format_iso8601(record.created_at));
        return Result<void>();
    });
}

}  // namespace lifecycle_ngin
