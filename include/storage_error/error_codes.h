// include/storage_error/error_codes.h
#pragma once

namespace storage {

/**
 * @brief Error codes for the nested transaction and patch layer.
 * Codes are grouped by thousands; the group decides the category.
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Storage Engine Errors (1000-1999)
    STORAGE_CORRUPTION = 1001,
    STORAGE_FULL = 1002,          // map full
    STORAGE_PANIC = 1003,
    STORAGE_NOT_INITIALIZED = 1004,
    STORAGE_OPEN_FAILED = 1005,
    STORAGE_VERSION_MISMATCH = 1006,
    STORAGE_ENGINE_ERROR = 1007,  // any other engine return code

    // Bucket Errors (2000-2999)
    BUCKET_NAME_EMPTY = 2001,
    BUCKET_NOT_FOUND = 2002,
    BUCKET_LIMIT_REACHED = 2003,

    // Transaction Errors (3000-3999)
    TXN_TOO_LARGE = 3001,
    TXN_NOT_ACTIVE = 3002,
    TXN_READ_ONLY = 3003,
    TXN_NESTING_VIOLATION = 3004,
    TXN_THREAD_MISMATCH = 3005,
    TXN_STILL_OPEN = 3006,
    TXN_READERS_FULL = 3007,
    TXN_COMMIT_FAILED = 3008,
    TXN_DRY_RUN = 3009,

    // Cursor Errors (4000-4999)
    CURSOR_NOT_POSITIONED = 4001,
    CURSOR_CLOSED = 4002,

    // I/O and File System Errors (5000-5999)
    IO_ERROR = 5001,
    FILE_NOT_FOUND = 5002,
    FILE_PERMISSION_DENIED = 5003,
    DISK_FULL = 5004,

    // Data Validation Errors (6000-6999)
    INVALID_KEY = 6001,
    INVALID_VALUE = 6002,
    KEY_NOT_FOUND = 6003,
    INVALID_DATA_FORMAT = 6004,
    ENCODING_ERROR = 6005,
    CHECKSUM_MISMATCH = 6006,

    // Memory Errors (7000-7999)
    OUT_OF_MEMORY = 7001,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,
    MISSING_REQUIRED_OPTION = 8002,
    OPTION_OUT_OF_RANGE = 8003,

    // Generic Errors (10000+)
    APPLICATION_ERROR = 10001,
    CANCELLED = 10002,
    INTERNAL_ERROR = 10003,
    UNKNOWN_ERROR = 10004
};

/**
 * @brief Error severity levels. FATAL and CRITICAL errors are thrown,
 * everything below is returned through Result.
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Warning, operation succeeded but with issues
    ERROR,      // Error, operation failed but system is stable
    CRITICAL,   // Resource exhaustion, needs operator intervention
    FATAL       // Usage error or corruption, never retried
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    STORAGE_ENGINE,
    BUCKET,
    TRANSACTION,
    CURSOR,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    MEMORY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
