// include/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h" // STORAGE_ERROR macros
#include "result.h"        // RETURN_IF_ERROR macros

#include <string_view>

namespace elastic {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

} // namespace error_utils

// Error construction stamped with the call site.
#define STORAGE_ERROR(code, message) \
    elastic::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

// Early return of the error held by a Result or Status.
#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Assigns the value to an already declared `var`, or returns the error.
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

} // namespace elastic
