// src/storage_error/storage_error.cpp
#include "storage_error/storage_error.h"
#include "storage_error/error_utils.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

StorageError& StorageError::withEngineCode(int rc) {
    this->engine_code = rc;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

bool StorageError::isRecoverable() const {
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    } else if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }
    if (engine_code) {
        oss << "  Engine Code: " << *engine_code << "\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);
    oss << "  Timestamp: " << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << "\n";

    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = static_cast<int>(code);
    j["code_name"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;

    if (!details.empty()) j["details"] = details;
    if (!suggested_action.empty()) j["suggested_action"] = suggested_action;
    if (file_path && line_number && function_name) {
        j["location"] = {{"file", *file_path}, {"line", *line_number}, {"function", *function_name}};
    } else if (file_path) {
        j["file_path"] = *file_path;
    }
    if (engine_code) j["engine_code"] = *engine_code;
    if (!context.empty()) j["context"] = context;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    j["timestamp_ms"] = ms.count();
    // Keys and values may carry raw bytes.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StorageError StorageError::corruption(const std::string& details_param) {
    return StorageError(ErrorCode::STORAGE_CORRUPTION, "Storage corruption detected")
        .withDetails(details_param)
        .withSuggestedAction("Restore the database file from a backup");
}

StorageError StorageError::bucketNotFound(const std::string& bucket) {
    return StorageError(ErrorCode::BUCKET_NOT_FOUND, "Unknown bucket '" + bucket + "'")
        .withContext("bucket", bucket)
        .withSuggestedAction("Pass the bucket name to Database::open");
}

StorageError StorageError::usage(ErrorCode code, const std::string& message) {
    StorageError err(code, message);
    // Usage errors are programmer errors regardless of the code's default.
    err.severity = ErrorSeverity::FATAL;
    return err;
}

StorageError StorageError::application(const std::string& message) {
    return StorageError(ErrorCode::APPLICATION_ERROR, message);
}

} // namespace storage
