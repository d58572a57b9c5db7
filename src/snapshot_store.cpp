#include "snapshot_store.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace elastic {

// --- Encoding ---

Status SnapshotCodec::writeSnapshot(const BTree& tree, const Sink& sink) {
    std::shared_lock<std::shared_mutex> lock(tree.tree_mutex_);
    std::string text;
    try {
        text = treeToJson(tree).dump();
    } catch (const json::exception& e) {
        return STORAGE_ERROR(ErrorCode::INTERNAL_ERROR, "Failed to serialize tree").withDetails(e.what());
    }
    return sink(text);
}

Result<std::string> SnapshotCodec::serialize(const BTree& tree) {
    std::string out;
    RETURN_IF_ERROR(writeSnapshot(tree, [&out](const std::string& text) -> Status {
        out = text;
        return Status();
    }));
    return out;
}

json SnapshotCodec::treeToJson(const BTree& tree) {
    json j;
    j["root"] = tree.root_ ? nodeToJson(*tree.root_) : json(nullptr);
    j["degree"] = tree.degree_;
    j["size"] = tree.size_;
    j["height"] = tree.height_;
    return j;
}

json SnapshotCodec::nodeToJson(const Node& node) {
    json children = json::array();
    for (const auto& child : node.children) {
        children.push_back(nodeToJson(*child));
    }
    json j;
    j["keys"] = node.keys;
    j["children"] = std::move(children);
    j["isLeaf"] = node.is_leaf;
    j["size"] = node.keys.size();
    j["maxKeys"] = node.max_keys;
    j["minKeys"] = node.min_keys;
    j["values"] = node.values;
    return j;
}

// --- Decoding ---

Result<std::unique_ptr<BTree>> SnapshotCodec::deserialize(const std::string& text, KeyComparator comparator) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return StorageError::malformedSnapshot(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.is_object()) {
        return StorageError::malformedSnapshot("document is not an object");
    }

    for (const char* field : {"degree", "size", "height"}) {
        if (!doc.contains(field) || !doc[field].is_number_integer()) {
            return StorageError::malformedSnapshot(std::string("field '") + field + "' is missing or not an integer");
        }
    }
    const auto degree = doc["degree"].get<long long>();
    const auto size = doc["size"].get<long long>();
    const auto height = doc["height"].get<long long>();
    if (degree < MIN_TREE_DEGREE || degree > 1'000'000) {
        return StorageError::malformedSnapshot("degree " + std::to_string(degree) + " is out of range");
    }
    if (size < 0 || height < 0) {
        return StorageError::malformedSnapshot("size and height must not be negative");
    }

    std::unique_ptr<Node> root;
    if (doc.contains("root") && !doc["root"].is_null()) {
        ASSIGN_OR_RETURN(root, nodeFromJson(doc["root"], static_cast<int>(degree), "root"));
    }

    auto tree = std::make_unique<BTree>(static_cast<int>(degree), std::move(comparator));
    tree->root_ = std::move(root);
    tree->size_ = static_cast<size_t>(size);
    tree->height_ = static_cast<int>(height);
    tree->rebuildParentPointers();
    LOG_DEBUG("Snapshot decoded: degree ", degree, ", size ", size, ", height ", height);
    return std::move(tree);
}

Result<std::unique_ptr<Node>> SnapshotCodec::nodeFromJson(const json& j, int degree, const std::string& where) {
    if (!j.is_object()) {
        return StorageError::malformedSnapshot(where + " is not an object");
    }
    for (const char* field : {"keys", "values", "children"}) {
        if (!j.contains(field) || !j[field].is_array()) {
            return StorageError::malformedSnapshot(where + ": field '" + field + "' is missing or not an array");
        }
    }
    if (!j.contains("isLeaf") || !j["isLeaf"].is_boolean()) {
        return StorageError::malformedSnapshot(where + ": field 'isLeaf' is missing or not a boolean");
    }

    auto node = std::make_unique<Node>(degree, j["isLeaf"].get<bool>());
    try {
        for (const auto& key : j["keys"]) {
            if (!key.is_number_integer()) {
                return StorageError::malformedSnapshot(where + ": key " + key.dump() + " is not an integer");
            }
            node->keys.push_back(key.get<Key>());
        }
        for (const auto& value : j["values"]) {
            if (!value.is_string()) {
                return StorageError::malformedSnapshot(where + ": value " + value.dump() + " is not a string");
            }
            node->values.push_back(value.get<Value>());
        }
        // Stored bounds are kept as written so the validator can report a mismatch.
        if (j.contains("minKeys") && j["minKeys"].is_number_unsigned()) {
            node->min_keys = j["minKeys"].get<size_t>();
        }
        if (j.contains("maxKeys") && j["maxKeys"].is_number_unsigned()) {
            node->max_keys = j["maxKeys"].get<size_t>();
        }
        if (j.contains("size") && (!j["size"].is_number_unsigned() || j["size"].get<size_t>() != node->keys.size())) {
            return StorageError::malformedSnapshot(where + ": size does not match the number of keys");
        }
    } catch (const json::exception& e) {
        return StorageError::malformedSnapshot(where + ": " + e.what());
    }

    if (node->values.size() != node->keys.size()) {
        return StorageError::malformedSnapshot(where + ": " + std::to_string(node->keys.size()) + " keys but " +
                                               std::to_string(node->values.size()) + " values");
    }

    const json& children = j["children"];
    if (node->is_leaf != children.empty()) {
        return StorageError::malformedSnapshot(where + ": isLeaf disagrees with the children list");
    }
    if (!node->is_leaf && children.size() != node->keys.size() + 1) {
        return StorageError::malformedSnapshot(where + ": " + std::to_string(children.size()) + " children for " +
                                               std::to_string(node->keys.size()) + " keys");
    }
    for (size_t i = 0; i < children.size(); ++i) {
        std::unique_ptr<Node> child;
        ASSIGN_OR_RETURN(child, nodeFromJson(children[i], degree, where + ".children[" + std::to_string(i) + "]"));
        node->children.push_back(std::move(child));
    }
    return std::move(node);
}

// --- File storage ---

SnapshotStore::SnapshotStore(std::string path) : path_(std::move(path)) {}

bool SnapshotStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

Status SnapshotStore::save(const BTree& tree) const {
    RETURN_IF_ERROR(SnapshotCodec::writeSnapshot(tree, [this](const std::string& text) {
        return writeFile(text);
    }));
    LOG_DEBUG("Snapshot saved to ", path_);
    return Status();
}

Status SnapshotStore::writeFile(const std::string& contents) const {
    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return StorageError::ioError(ErrorCode::DIRECTORY_CREATE_FAILED, "create_directories",
                                         target.parent_path().string())
                .withDetails(ec.message())
                .withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "open", temp.string())
                .withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
        file << contents;
        file.flush();
        if (!file.good()) {
            fs::remove(temp, ec);
            return StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "write", temp.string())
                .withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "rename", target.string())
            .withDetails(ec.message())
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    return Status();
}

Result<std::unique_ptr<BTree>> SnapshotStore::load(KeyComparator comparator) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return StorageError::fileNotFound(path_).withLocation(__FILE__, __LINE__, __FUNCTION__);
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return StorageError::ioError(ErrorCode::IO_READ_ERROR, "open", path_)
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return StorageError::ioError(ErrorCode::IO_READ_ERROR, "read", path_)
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }

    auto tree = SnapshotCodec::deserialize(buffer.str(), std::move(comparator));
    if (!tree.isOk()) {
        return std::move(tree.error().withFilePath(path_));
    }
    LOG_DEBUG("Snapshot loaded from ", path_);
    return std::move(tree);
}

Status SnapshotStore::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "remove", path_)
            .withDetails(ec.message())
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    return Status();
}

} // namespace elastic
