//include/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h"
#include "result.h"

#include <string>
#include <string_view>

namespace storage {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    bool isStorageError(ErrorCode code);
    bool isTransactionError(ErrorCode code);
    bool isIoError(ErrorCode code);
    bool isRecoverable(ErrorCode code);
    bool isCritical(ErrorCode code);

} // namespace error_utils

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define STORAGE_ERROR_WITH_DETAILS(code, message, details) \
    storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

// Convenience macros for common patterns with Result<T>
#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// var must be declared before use
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

// Usage: ASSIGN_OR_RETURN_AUTO(my_value, function_that_returns_result());
#define ASSIGN_OR_RETURN_AUTO(var_name, result_expression) \
    auto _tmp_auto_macro_result_##var_name = (result_expression); \
    if (!_tmp_auto_macro_result_##var_name.isOk()) { \
        return std::move(_tmp_auto_macro_result_##var_name.error()); \
    } \
    auto var_name = std::move(_tmp_auto_macro_result_##var_name.value())

} // namespace storage
