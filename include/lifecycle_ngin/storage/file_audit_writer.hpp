// include/lifecycle_ngin/storage/file_audit_writer.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include "lifecycle_ngin/storage/audit_sink.hpp"

namespace lifecycle_ngin {

/**
 * @brief Appends audit records to a JSON-lines file
 */
class FileAuditWriter : public AuditWriter {
public:
    explicit FileAuditWriter(std::filesystem::path path);
    ~FileAuditWriter() override;

    Result<void> write(const AuditRecord& record) override;
    Result<void> flush() override;

    const std::filesystem::path& path() const {
        return path_;
    }

    /**
     * @brief Read back every record in a JSON-lines audit file
     */
    static Result<std::vector<AuditRecord>> read_all(const std::filesystem::path& path);

private:
    Result<void> open_unsafe();

    std::filesystem::path path_;
    std::ofstream out_;
    std::mutex mutex_;
};

}  // namespace lifecycle_ngin
