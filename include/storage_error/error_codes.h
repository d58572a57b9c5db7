// include/storage_error/error_codes.h
#pragma once

namespace elastic {

/**
 * @brief Failure kinds reported through Result/Status.
 *
 * The tens digit selects the ErrorCategory. Values stay inside magic_enum's
 * default reflection range so every code has a printable name.
 */
enum class ErrorCode : int {
    // Tree construction (1x)
    BTREE_INVALID_DEGREE = 11,

    // Snapshot file I/O (2x)
    FILE_NOT_FOUND = 20,
    IO_READ_ERROR = 21,
    IO_WRITE_ERROR = 22,
    DIRECTORY_CREATE_FAILED = 23,

    // Snapshot content and command-line input (3x)
    INVALID_DATA_FORMAT = 30,
    INVALID_KEY = 31,

    // Startup configuration (4x)
    INVALID_CONFIGURATION = 40,
    OPTION_OUT_OF_RANGE = 41,

    // Everything else (9x)
    INTERNAL_ERROR = 90
};

enum class ErrorSeverity {
    WARNING,  // expected condition the caller usually handles (missing snapshot)
    ERROR,    // the operation failed; the tree is untouched
    FATAL     // the engine itself is inconsistent
};

enum class ErrorCategory {
    TREE,
    STORAGE_IO,
    DATA_FORMAT,
    CONFIGURATION,
    INTERNAL
};

} // namespace elastic
