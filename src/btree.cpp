// @src/btree.cpp
#include "btree.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <algorithm>
#include <deque>
#include <iterator>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace elastic {

BTree::BTree(int degree, KeyComparator comparator)
    : degree_(degree), less_(comparator ? std::move(comparator) : defaultKeyComparator()) {
    if (degree_ < MIN_TREE_DEGREE) {
        throw std::invalid_argument("BTree: degree must be at least 2, got " + std::to_string(degree));
    }
}

BTree::~BTree() = default;

Result<std::unique_ptr<BTree>> BTree::create(int degree, KeyComparator comparator) {
    if (degree < MIN_TREE_DEGREE) {
        return StorageError::invalidDegree(degree).withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    return std::make_unique<BTree>(degree, std::move(comparator));
}

// --- Key helpers ---

size_t BTree::lowerBound(const Node* node, Key key) const {
    auto it = std::lower_bound(node->keys.begin(), node->keys.end(), key, less_);
    return static_cast<size_t>(it - node->keys.begin());
}

size_t BTree::upperBound(const Node* node, Key key) const {
    auto it = std::upper_bound(node->keys.begin(), node->keys.end(), key, less_);
    return static_cast<size_t>(it - node->keys.begin());
}

// --- Search ---

std::optional<Value> BTree::search(Key key) const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return searchUnlocked(key);
}

bool BTree::contains(Key key) const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return searchUnlocked(key).has_value();
}

std::optional<Value> BTree::searchUnlocked(Key key) const {
    const Node* node = root_.get();
    while (node) {
        size_t i = lowerBound(node, key);
        if (i < node->keys.size() && keysEqual(node->keys[i], key)) {
            return node->values[i];
        }
        if (node->is_leaf) {
            return std::nullopt;
        }
        node = node->children[i].get();
    }
    return std::nullopt;
}

// --- Insertion ---

void BTree::insert(Key key, const Value& value) {
    std::unique_lock<std::shared_mutex> lock(tree_mutex_);

    if (!root_) {
        root_ = std::make_unique<Node>(degree_, true);
        root_->keys.push_back(key);
        root_->values.push_back(value);
        size_ = 1;
        height_ = 1;
        LOG_INFO("Insert: created new root with key ", key);
        return;
    }

    checkInvariants(root_.get(), "insert(before)");
    LOG_INFO("Insert: inserting key ", key);

    if (root_->isFull()) {
        // Old root becomes the sole child of a new empty root, then splits.
        auto new_root = std::make_unique<Node>(degree_, false);
        root_->parent = new_root.get();
        new_root->children.push_back(std::move(root_));
        root_ = std::move(new_root);
        splitChild(root_.get(), 0);
        ++height_;
        LOG_DEBUG("Insert: root split, new root keys ", formatKeys(root_->keys), ", height ", height_);
    }

    insertNonFull(root_.get(), key, value);
    ++size_;

    checkInvariants(root_.get(), "insert(after)");
    LOG_DEBUG("Insert: finished inserting key ", key);
}

void BTree::insertNonFull(Node* node, Key key, const Value& value) {
    // Equal keys go after existing ones.
    size_t i = upperBound(node, key);

    if (node->is_leaf) {
        node->keys.insert(node->keys.begin() + static_cast<std::ptrdiff_t>(i), key);
        node->values.insert(node->values.begin() + static_cast<std::ptrdiff_t>(i), value);
        return;
    }

    if (node->children[i]->isFull()) {
        splitChild(node, i);
        // The promoted median now sits at keys[i]; pick the side the key belongs to.
        if (less_(node->keys[i], key)) {
            ++i;
        }
    }
    insertNonFull(node->children[i].get(), key, value);
}

void BTree::splitChild(Node* parent, size_t index) {
    Node* child = parent->children[index].get();
    LOG_DEBUG("splitChild: splitting child ", index, " with keys ", formatKeys(child->keys));
    checkInvariants(child, "splitChild(before)");
    if (!child->isFull()) {
        invariantFailure("splitChild", "child at index " + std::to_string(index) + " has " +
                                           std::to_string(child->size()) + " keys, expected a full node");
    }

    const size_t t = static_cast<size_t>(degree_);
    const auto mid = static_cast<std::ptrdiff_t>(t - 1);
    const auto upper = static_cast<std::ptrdiff_t>(t);

    Key median_key = child->keys[t - 1];
    Value median_value = std::move(child->values[t - 1]);

    auto sibling = std::make_unique<Node>(degree_, child->is_leaf);
    sibling->parent = parent;
    sibling->keys.assign(child->keys.begin() + upper, child->keys.end());
    sibling->values.assign(std::make_move_iterator(child->values.begin() + upper),
                           std::make_move_iterator(child->values.end()));
    if (!child->is_leaf) {
        for (auto it = child->children.begin() + upper; it != child->children.end(); ++it) {
            (*it)->parent = sibling.get();
            sibling->children.push_back(std::move(*it));
        }
        child->children.resize(t);
    }

    child->keys.resize(static_cast<size_t>(mid));
    child->values.resize(static_cast<size_t>(mid));

    Node* sibling_raw = sibling.get();
    parent->keys.insert(parent->keys.begin() + static_cast<std::ptrdiff_t>(index), median_key);
    parent->values.insert(parent->values.begin() + static_cast<std::ptrdiff_t>(index), std::move(median_value));
    parent->children.insert(parent->children.begin() + static_cast<std::ptrdiff_t>(index + 1), std::move(sibling));

    LOG_DEBUG("splitChild: promoted ", median_key, ", parent keys ", formatKeys(parent->keys),
              ", children ", parent->children.size());
    checkInvariants(child, "splitChild(after, left)");
    checkInvariants(sibling_raw, "splitChild(after, right)");
    checkInvariants(parent, "splitChild(after, parent)");
}

// --- Accessors ---

size_t BTree::size() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return size_;
}

int BTree::height() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return height_;
}

bool BTree::empty() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return root_ == nullptr;
}

void BTree::setComparator(KeyComparator comparator) {
    std::unique_lock<std::shared_mutex> lock(tree_mutex_);
    less_ = comparator ? std::move(comparator) : defaultKeyComparator();
}

// --- Printing ---

void BTree::printTreeStructure(std::ostream& os) const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);

    if (!root_) {
        os << "Tree is empty" << std::endl;
        return;
    }

    // Level-order traversal
    std::deque<const Node*> queue{root_.get()};
    int level = 0;
    while (!queue.empty()) {
        size_t level_size = queue.size();
        for (size_t i = 0; i < level_size; ++i) {
            const Node* node = queue.front();
            queue.pop_front();
            os << "Level " << level << ": " << formatKeys(node->keys) << "\n";
            for (const auto& child : node->children) {
                queue.push_back(child.get());
            }
        }
        ++level;
    }
    os.flush();
}

std::string BTree::toString() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);

    std::ostringstream oss;
    oss << "Tree (degree=" << degree_ << ", size=" << size_ << ", height=" << height_ << "):\n";
    printNodeToString(oss, root_.get(), 0);
    return oss.str();
}

void BTree::printNodeToString(std::ostream& os, const Node* node, int level) const {
    if (!node) {
        return;
    }
    os << "Level " << level << ": " << formatKeys(node->keys) << "\n";
    for (const auto& child : node->children) {
        printNodeToString(os, child.get(), level + 1);
    }
}

void BTree::visitNodes(const std::function<void(const Node&, int)>& visitor) const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    if (root_) {
        visitNode(*root_, 0, visitor);
    }
}

void BTree::visitNode(const Node& node, int level, const std::function<void(const Node&, int)>& visitor) const {
    visitor(node, level);
    for (const auto& child : node.children) {
        visitNode(*child, level + 1, visitor);
    }
}

void BTree::rebuildParentPointers() {
    std::unique_lock<std::shared_mutex> lock(tree_mutex_);
    if (!root_) {
        return;
    }
    root_->parent = nullptr;
    rebuildParents(root_.get());
}

void BTree::rebuildParents(Node* node) {
    for (auto& child : node->children) {
        child->parent = node;
        rebuildParents(child.get());
    }
}

} // namespace elastic
