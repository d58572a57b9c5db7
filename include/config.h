// include/config.h
#pragma once

#include "debug_utils.h"
#include "storage_error/result.h"
#include "types.h"

#include <functional>
#include <optional>
#include <string>

namespace elastic {

// Application configuration, read from the environment at startup.
struct Config {
    static constexpr const char* ENV_TREE_DEGREE = "TREE_DEGREE";
    static constexpr const char* ENV_STORAGE_PATH = "STORAGE_PATH";
    static constexpr const char* ENV_LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* DEFAULT_STORAGE_PATH = "data/tree.json";

    int tree_degree = DEFAULT_TREE_DEGREE;
    std::string storage_path = DEFAULT_STORAGE_PATH;
    LogLevel log_level = LogLevel::INFO;

    // Returns the value of a variable, or std::nullopt when unset.
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    static Result<Config> fromEnvironment();
    static Result<Config> fromLookup(const Lookup& lookup);

    std::string toString() const;
};

} // namespace elastic
