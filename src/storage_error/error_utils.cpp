// src/storage_error/error_utils.cpp
#include "storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace elastic {
namespace error_utils {

namespace {

template<typename E>
std::string_view enumName(E value, std::string_view fallback) {
    std::string_view name = magic_enum::enum_name(value);
    return name.empty() ? fallback : name;
}

} // namespace

std::string_view errorCodeToString(ErrorCode code) {
    return enumName(code, "UNRECOGNIZED_ERROR_CODE");
}

std::string_view severityToString(ErrorSeverity severity) {
    return enumName(severity, "UNKNOWN_SEVERITY");
}

std::string_view categoryToString(ErrorCategory category) {
    return enumName(category, "UNKNOWN_CATEGORY");
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        // The engine failed to produce its own output.
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::FATAL;
        case ErrorCode::FILE_NOT_FOUND:
            return ErrorSeverity::WARNING;
        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    switch (static_cast<int>(code) / 10) {
        case 1: return ErrorCategory::TREE;
        case 2: return ErrorCategory::STORAGE_IO;
        case 3: return ErrorCategory::DATA_FORMAT;
        case 4: return ErrorCategory::CONFIGURATION;
        default: return ErrorCategory::INTERNAL;
    }
}

} // namespace error_utils
} // namespace elastic
