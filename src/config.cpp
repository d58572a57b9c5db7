#include "config.h"
#include "storage_error/error_utils.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace elastic {

namespace {

// Whole-string integer parse; trailing garbage is rejected.
std::optional<long long> parseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

Result<Config> Config::fromEnvironment() {
    return fromLookup([](const std::string& name) -> std::optional<std::string> {
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) return std::nullopt;
        return std::string(raw);
    });
}

Result<Config> Config::fromLookup(const Lookup& lookup) {
    Config cfg;

    auto degree_str = lookup(ENV_TREE_DEGREE);
    if (degree_str && !degree_str->empty()) {
        auto degree = parseInteger(*degree_str);
        if (!degree) {
            return StorageError::invalidConfiguration(ENV_TREE_DEGREE, *degree_str, "must be an integer >= 2")
                .withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
        if (*degree < MIN_TREE_DEGREE || *degree > std::numeric_limits<int>::max()) {
            return STORAGE_ERROR(ErrorCode::OPTION_OUT_OF_RANGE,
                                 "Invalid " + std::string(ENV_TREE_DEGREE) + ": " + *degree_str)
                .withDetails("must be an integer >= 2")
                .withContext("option", ENV_TREE_DEGREE)
                .withContext("value", *degree_str);
        }
        cfg.tree_degree = static_cast<int>(*degree);
    }

    auto level_str = lookup(ENV_LOG_LEVEL);
    if (level_str && !level_str->empty()) {
        auto level = parseLogLevel(*level_str);
        if (!level) {
            return StorageError::invalidConfiguration(ENV_LOG_LEVEL, *level_str,
                                                      "expected one of debug, info, warn, error")
                .withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
        cfg.log_level = *level;
    }

    auto path_str = lookup(ENV_STORAGE_PATH);
    if (path_str && !path_str->empty()) {
        cfg.storage_path = *path_str;
    }

    return cfg;
}

std::string Config::toString() const {
    std::ostringstream oss;
    oss << "Config{degree=" << tree_degree << ", storage_path=" << storage_path
        << ", log_level=" << logLevelName(log_level) << "}";
    return oss.str();
}

} // namespace elastic
