// src/core/error.cpp

#include "lifecycle_ngin/core/error.hpp"

namespace lifecycle_ngin {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::STALE_DATA:
            return "STALE_DATA";
        case ErrorCode::POSITION_NOT_FOUND:
            return "POSITION_NOT_FOUND";
        case ErrorCode::DUPLICATE_POSITION:
            return "DUPLICATE_POSITION";
        case ErrorCode::INVALID_STATUS_TRANSITION:
            return "INVALID_STATUS_TRANSITION";
        case ErrorCode::INVARIANT_VIOLATION:
            return "INVARIANT_VIOLATION";
        case ErrorCode::ORDER_REJECTED:
            return "ORDER_REJECTED";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::EXECUTION_FAILED:
            return "EXECUTION_FAILED";
        case ErrorCode::ALLOCATION_EXHAUSTED:
            return "ALLOCATION_EXHAUSTED";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::INVALID_RISK_CALCULATION:
            return "INVALID_RISK_CALCULATION";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

}  // namespace lifecycle_ngin
