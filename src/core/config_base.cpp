// src/core/config_base.cpp

#include "lifecycle_ngin/core/config_base.hpp"
#include <filesystem>
#include <iomanip>

namespace lifecycle_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    auto valid = validate();
    if (valid.is_error()) {
        return valid;
    }

    // Written beside the target and renamed so a reader never sees a half file
    const std::filesystem::path target(filepath);
    std::filesystem::path staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging);
        if (!out.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write config " + filepath,
                                    "ConfigBase");
        }
        out << std::setw(4) << to_json() << '\n';
        if (!out.good()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Short write on config " + staging.string(), "ConfigBase");
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(staging, cleanup);
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot replace config " + filepath + ": " + ec.message(),
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config not found: " + filepath,
                                "ConfigBase");
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Malformed config ") + filepath + ": " + e.what(),
                                "ConfigBase");
    }

    try {
        from_json(document);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Config ") + filepath + " has a bad field: " + e.what(),
                                "ConfigBase");
    }

    return validate();
}

}  // namespace lifecycle_ngin
