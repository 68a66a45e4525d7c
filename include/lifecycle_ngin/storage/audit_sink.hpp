// include/lifecycle_ngin/storage/audit_sink.hpp
#pragma once

#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/storage/audit_record.hpp"

namespace lifecycle_ngin {

/**
 * @brief Durable destination for audit records (append only)
 */
class AuditWriter {
public:
    virtual ~AuditWriter() = default;

    virtual Result<void> write(const AuditRecord& record) = 0;

    virtual Result<void> flush() {
        return Result<void>();
    }
};

/**
 * @brief Entry point used by the trade path
 *
 * append() never blocks on storage and never fails the caller.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void append(AuditRecord record) = 0;

    /**
     * @brief Block until every record appended so far has been handed to storage
     */
    virtual void flush() = 0;
};

}  // namespace lifecycle_ngin
