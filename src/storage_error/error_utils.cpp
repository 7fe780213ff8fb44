//src/storage_error/error_utils.cpp

#include "storage_error/error_utils.h"
#include <magic_enum/magic_enum.hpp>

namespace storage {
namespace error_utils {

// ErrorCode values are spread past magic_enum's default range, so the
// code names keep an explicit table.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        // Storage Engine Errors
        case ErrorCode::STORAGE_CORRUPTION: return "STORAGE_CORRUPTION";
        case ErrorCode::STORAGE_FULL: return "STORAGE_FULL";
        case ErrorCode::STORAGE_PANIC: return "STORAGE_PANIC";
        case ErrorCode::STORAGE_NOT_INITIALIZED: return "STORAGE_NOT_INITIALIZED";
        case ErrorCode::STORAGE_OPEN_FAILED: return "STORAGE_OPEN_FAILED";
        case ErrorCode::STORAGE_VERSION_MISMATCH: return "STORAGE_VERSION_MISMATCH";
        case ErrorCode::STORAGE_ENGINE_ERROR: return "STORAGE_ENGINE_ERROR";

        // Bucket Errors
        case ErrorCode::BUCKET_NAME_EMPTY: return "BUCKET_NAME_EMPTY";
        case ErrorCode::BUCKET_NOT_FOUND: return "BUCKET_NOT_FOUND";
        case ErrorCode::BUCKET_LIMIT_REACHED: return "BUCKET_LIMIT_REACHED";

        // Transaction Errors
        case ErrorCode::TXN_TOO_LARGE: return "TXN_TOO_LARGE";
        case ErrorCode::TXN_NOT_ACTIVE: return "TXN_NOT_ACTIVE";
        case ErrorCode::TXN_READ_ONLY: return "TXN_READ_ONLY";
        case ErrorCode::TXN_NESTING_VIOLATION: return "TXN_NESTING_VIOLATION";
        case ErrorCode::TXN_THREAD_MISMATCH: return "TXN_THREAD_MISMATCH";
        case ErrorCode::TXN_STILL_OPEN: return "TXN_STILL_OPEN";
        case ErrorCode::TXN_READERS_FULL: return "TXN_READERS_FULL";
        case ErrorCode::TXN_COMMIT_FAILED: return "TXN_COMMIT_FAILED";
        case ErrorCode::TXN_DRY_RUN: return "TXN_DRY_RUN";

        // Cursor Errors
        case ErrorCode::CURSOR_NOT_POSITIONED: return "CURSOR_NOT_POSITIONED";
        case ErrorCode::CURSOR_CLOSED: return "CURSOR_CLOSED";

        // I/O Errors
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::DISK_FULL: return "DISK_FULL";

        // Data Validation Errors
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";

        // Memory Errors
        case ErrorCode::OUT_OF_MEMORY: return "OUT_OF_MEMORY";

        // Configuration Errors
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::MISSING_REQUIRED_OPTION: return "MISSING_REQUIRED_OPTION";
        case ErrorCode::OPTION_OUT_OF_RANGE: return "OPTION_OUT_OF_RANGE";

        // Generic Errors
        case ErrorCode::APPLICATION_ERROR: return "APPLICATION_ERROR";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";

        default: return "UNKNOWN_ERROR_CODE_DETAIL";
    }
}

std::string_view severityToString(ErrorSeverity severity) {
    auto name = magic_enum::enum_name(severity);
    return name.empty() ? std::string_view("UNKNOWN_SEVERITY") : name;
}

std::string_view categoryToString(ErrorCategory category) {
    auto name = magic_enum::enum_name(category);
    return name.empty() ? std::string_view("UNKNOWN_CATEGORY") : name;
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        // Corruption and programmer errors: never retried.
        case ErrorCode::STORAGE_CORRUPTION:
        case ErrorCode::STORAGE_PANIC:
        case ErrorCode::STORAGE_VERSION_MISMATCH:
        case ErrorCode::STORAGE_NOT_INITIALIZED:
        case ErrorCode::BUCKET_NOT_FOUND:
        case ErrorCode::TXN_NOT_ACTIVE:
        case ErrorCode::TXN_READ_ONLY:
        case ErrorCode::TXN_NESTING_VIOLATION:
        case ErrorCode::TXN_THREAD_MISMATCH:
        case ErrorCode::TXN_STILL_OPEN:
        case ErrorCode::CURSOR_NOT_POSITIONED:
        case ErrorCode::CURSOR_CLOSED:
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::FATAL;

        // Resource exhaustion and engine failures.
        case ErrorCode::STORAGE_FULL:
        case ErrorCode::STORAGE_ENGINE_ERROR:
        case ErrorCode::BUCKET_LIMIT_REACHED:
        case ErrorCode::TXN_TOO_LARGE:
        case ErrorCode::TXN_READERS_FULL:
        case ErrorCode::TXN_COMMIT_FAILED:
        case ErrorCode::IO_ERROR:
        case ErrorCode::DISK_FULL:
        case ErrorCode::OUT_OF_MEMORY:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::OPTION_OUT_OF_RANGE:
            return ErrorSeverity::WARNING;

        case ErrorCode::KEY_NOT_FOUND:
        case ErrorCode::TXN_DRY_RUN:
        case ErrorCode::CANCELLED:
            return ErrorSeverity::INFO;

        default: // Application, configuration and validation errors
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::STORAGE_ENGINE;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::BUCKET;
    } else if (code_value >= 3000 && code_value < 4000) {
        return ErrorCategory::TRANSACTION;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::CURSOR;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 7000 && code_value < 8000) {
        return ErrorCategory::MEMORY;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

bool isStorageError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::STORAGE_ENGINE; }
bool isTransactionError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::TRANSACTION; }
bool isIoError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::IO_FILESYSTEM; }
bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}
bool isCritical(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity == ErrorSeverity::CRITICAL || severity == ErrorSeverity::FATAL;
}

} // namespace error_utils
} // namespace storage
