// include/snapshot_store.h
#pragma once

#include "btree.h"
#include "storage_error/result.h"
#include "types.h"

#include <nlohmann/json.hpp> // External JSON library

#include <functional>
#include <memory>
#include <string>

namespace elastic {

/**
 * @brief Converts a whole tree to and from its JSON snapshot document.
 *
 * Document: {"root": node|null, "degree": d, "size": n, "height": h}
 * Node:     {"keys", "values", "children", "isLeaf", "size", "minKeys", "maxKeys"}
 *
 * Parent references and the comparator are not part of the document; they are
 * restored on decode.
 */
class SnapshotCodec {
public:
    using Sink = std::function<Status(const std::string&)>;

    // Serializes under the tree's shared lock and hands the bytes to `sink`
    // while the lock is still held.
    static Status writeSnapshot(const BTree& tree, const Sink& sink);

    static Result<std::string> serialize(const BTree& tree);
    static Result<std::unique_ptr<BTree>> deserialize(const std::string& text,
                                                      KeyComparator comparator = defaultKeyComparator());

private:
    static nlohmann::json treeToJson(const BTree& tree);
    static nlohmann::json nodeToJson(const Node& node);
    static Result<std::unique_ptr<Node>> nodeFromJson(const nlohmann::json& j, int degree, const std::string& where);
};

inline Result<std::string> serializeTree(const BTree& tree) {
    return SnapshotCodec::serialize(tree);
}

inline Result<std::unique_ptr<BTree>> deserializeTree(const std::string& text,
                                                      KeyComparator comparator = defaultKeyComparator()) {
    return SnapshotCodec::deserialize(text, std::move(comparator));
}

/**
 * @brief Persists tree snapshots to a single file.
 */
class SnapshotStore {
public:
    explicit SnapshotStore(std::string path);

    // Creates missing parent directories; the file is replaced atomically.
    Status save(const BTree& tree) const;
    // FILE_NOT_FOUND when absent, INVALID_DATA_FORMAT when undecodable.
    Result<std::unique_ptr<BTree>> load(KeyComparator comparator = defaultKeyComparator()) const;
    bool exists() const;
    // Removing an absent snapshot is not an error.
    Status remove() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;

    Status writeFile(const std::string& contents) const;
};

} // namespace elastic
