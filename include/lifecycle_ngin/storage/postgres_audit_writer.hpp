// include/lifecycle_ngin/storage/postgres_audit_writer.hpp
#pragma once

#include <memory>
#include <string>
#include "lifecycle_ngin/data/postgres_connection.hpp"
#include "lifecycle_ngin/storage/audit_sink.hpp"

namespace lifecycle_ngin {

/**
 * @brief Appends audit records to the position_audit table
 *
 * Queryable columns are stored alongside the full record as JSONB.
 */
class PostgresAuditWriter : public AuditWriter {
public:
    PostgresAuditWriter(std::shared_ptr<PostgresConnection> connection,
                        std::string table_name = "position_audit");

    Result<void> write(const AuditRecord& record) override;

private:
    std::shared_ptr<PostgresConnection> connection_;
    std::string table_name_;
};

}  // namespace lifecycle_ngin
