// include/storage_error/storage_error.h
#pragma once

#include "error_codes.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace elastic {

// Where in this codebase an error was raised.
struct SourceLocation {
    std::string file;
    size_t line = 0;
    std::string function;
};

/**
 * @brief A recoverable failure: bad input, bad configuration or a failed
 * snapshot read/write. Severity and category are derived from the code.
 */
class StorageError {
public:
    ErrorCode code;
    ErrorSeverity severity;
    ErrorCategory category;
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path; // snapshot or directory the error concerns
    std::optional<SourceLocation> location;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    // One line: "[SEVERITY] CODE (n): message - details"
    std::string toString() const;
    std::string toDetailedString() const;

    static StorageError ioError(ErrorCode code, const std::string& operation, const std::string& path);
    static StorageError fileNotFound(const std::string& path);
    static StorageError malformedSnapshot(const std::string& details);
    static StorageError invalidDegree(long long degree);
    static StorageError invalidConfiguration(const std::string& option, const std::string& value,
                                             const std::string& reason);
};

/**
 * @brief Raised by the fatal invariant tier when aborting is not wanted.
 *
 * The tree core never returns this as a Result: a broken node graph is a bug
 * in the engine, not a condition the caller can act on.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace elastic
