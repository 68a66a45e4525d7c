// src/storage/file_audit_writer.cpp

#include "lifecycle_ngin/storage/file_audit_writer.hpp"

namespace lifecycle_ngin {

FileAuditWriter::FileAuditWriter(std::filesystem::path path) : path_(std::move(path)) {}

FileAuditWriter::~FileAuditWriter() {
    if (out_.is_open()) {
        out_.close();
    }
}

Result<void> FileAuditWriter::open_unsafe() {
    if (out_.is_open()) {
        return Result<void>();
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create audit directory " +
                                        path_.parent_path().string() + ": " + ec.message(),
                                    "FileAuditWriter");
        }
    }

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open audit file " + path_.string(), "FileAuditWriter");
    }
    return Result<void>();
}

Result<void> FileAuditWriter::write(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto opened = open_unsafe();
    if (opened.is_error()) {
        return opened;
    }

    try {
        out_ << record.to_json().dump() << '\n';
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Failed to serialise audit record: " + std::string(e.what()),
                                "FileAuditWriter");
    }
    if (!out_.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to append to audit file " + path_.string(),
                                "FileAuditWriter");
    }
    return Result<void>();
}

Result<void> FileAuditWriter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
        if (!out_.good()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to flush audit file " + path_.string(),
                                    "FileAuditWriter");
        }
    }
    return Result<void>();
}

Result<std::vector<AuditRecord>> FileAuditWriter::read_all(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return make_error<std::vector<AuditRecord>>(
            ErrorCode::FILE_NOT_FOUND, "Audit file not found: " + path.string(), "FileAuditWriter");
    }

    std::vector<AuditRecord> records;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            AuditRecord record;
            record.from_json(nlohmann::json::parse(line));
            records.push_back(std::move(record));
        } catch (const nlohmann::json::exception& e) {
            return make_error<std::vector<AuditRecord>>(
                ErrorCode::JSON_PARSE_ERROR,
                "Invalid audit line " + std::to_string(line_number) + ": " + e.what(),
                "FileAuditWriter");
        }
    }
    return records;
}

}  // namespace lifecycle_ngin
