// @include/types.h

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace elastic {

// --- Foundational Data Types ---
using Key = int64_t;
using Value = std::string;

// Strict weak ordering over keys ("less than"). Equality is derived as
// !less(a, b) && !less(b, a).
using KeyComparator = std::function<bool(Key, Key)>;

inline KeyComparator defaultKeyComparator() {
    return [](Key a, Key b) { return a < b; };
}

// --- Tree defaults ---
static constexpr int MIN_TREE_DEGREE = 2;
static constexpr int DEFAULT_TREE_DEGREE = 3;

} // namespace elastic
