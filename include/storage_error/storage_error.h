//include/storage_error/storage_error.h

#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <exception>
#include <map>

namespace storage {

/**
 * @brief Detailed error information with context.
 *
 * Recoverable errors travel inside Result<T>. Fatal ones (severity FATAL or
 * CRITICAL) are thrown as-is, so the class also derives from std::exception.
 */
class StorageError : public std::exception {
public:
    ErrorCode code;
    ErrorSeverity severity; // Set from code
    ErrorCategory category; // Set from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<int> engine_code; // raw libmdbx return code, if any
    std::map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withEngineCode(int rc);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    bool isRecoverable() const;
    bool isFatal() const { return !isRecoverable(); }
    std::string toString() const;
    std::string toDetailedString() const;
    std::string toJson() const;

    const char* what() const noexcept override { return message.c_str(); }

    // Static factory methods for common errors
    static StorageError corruption(const std::string& details);
    static StorageError bucketNotFound(const std::string& bucket);
    static StorageError usage(ErrorCode code, const std::string& message);
    static StorageError application(const std::string& message);
};

} // namespace storage
