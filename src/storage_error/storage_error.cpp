// src/storage_error/storage_error.cpp
#include "storage_error/storage_error.h"
#include "storage_error/error_utils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace elastic {

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
    details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    location = SourceLocation{file, line, function};
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    file_path = path;
    return *this;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] " << error_utils::errorCodeToString(code) << " ("
        << static_cast<int>(code) << "): " << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;
    oss << "Error Details:\n"
        << "  Code: " << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << ")\n"
        << "  Severity: " << error_utils::severityToString(severity) << "\n"
        << "  Category: " << error_utils::categoryToString(category) << "\n"
        << "  Message: " << message << "\n";
    if (!details.empty()) oss << "  Details: " << details << "\n";
    if (!suggested_action.empty()) oss << "  Suggested Action: " << suggested_action << "\n";
    if (file_path) oss << "  File Path: " << *file_path << "\n";
    if (location) {
        oss << "  Location: " << location->function << " at " << location->file << ":" << location->line << "\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";
    return oss.str();
}

// --- Factories ---

StorageError StorageError::ioError(ErrorCode code, const std::string& operation, const std::string& path) {
    return StorageError(code, "Snapshot " + operation + " failed")
        .withFilePath(path)
        .withContext("operation", operation)
        .withSuggestedAction("Check permissions and free space for the snapshot location");
}

StorageError StorageError::fileNotFound(const std::string& path) {
    return StorageError(ErrorCode::FILE_NOT_FOUND, "Snapshot file does not exist")
        .withFilePath(path)
        .withSuggestedAction("Start from an empty tree or check STORAGE_PATH");
}

StorageError StorageError::malformedSnapshot(const std::string& details_param) {
    return StorageError(ErrorCode::INVALID_DATA_FORMAT, "Snapshot content is malformed")
        .withDetails(details_param)
        .withSuggestedAction("Restore the snapshot from a backup or remove it");
}

StorageError StorageError::invalidDegree(long long degree) {
    return StorageError(ErrorCode::BTREE_INVALID_DEGREE, "B-tree degree must be at least 2")
        .withDetails("Requested degree: " + std::to_string(degree))
        .withContext("degree", std::to_string(degree));
}

StorageError StorageError::invalidConfiguration(const std::string& option, const std::string& value,
                                                const std::string& reason) {
    return StorageError(ErrorCode::INVALID_CONFIGURATION, "Invalid " + option + ": " + value)
        .withDetails(reason)
        .withContext("option", option)
        .withContext("value", value);
}

} // namespace elastic
