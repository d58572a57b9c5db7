// @src/btree_balance.cpp
// Deletion and post-deletion rebalancing.
#include "btree.h"
#include "debug_utils.h"

#include <iterator>
#include <mutex>
#include <string>

namespace elastic {

bool BTree::remove(Key key) {
    std::unique_lock<std::shared_mutex> lock(tree_mutex_);

    if (!root_) {
        return false;
    }
    checkInvariants(root_.get(), "remove(before)");
    LOG_INFO("Delete: deleting key ", key);

    bool removed = deleteFromNode(root_.get(), key);
    collapseRootIfEmpty();

    if (removed) {
        --size_;
        LOG_DEBUG("Delete: finished deleting key ", key);
    } else {
        LOG_DEBUG("Delete: key ", key, " not present");
    }
    if (root_) {
        checkInvariants(root_.get(), "remove(after)");
    }
    return removed;
}

void BTree::collapseRootIfEmpty() {
    if (!root_ || !root_->keys.empty()) {
        return;
    }
    if (root_->is_leaf) {
        root_.reset();
        height_ = 0;
        LOG_DEBUG("Delete: last key removed, tree is empty");
        return;
    }
    // A keyless internal root has exactly one child left after a merge.
    std::unique_ptr<Node> child = std::move(root_->children.front());
    child->parent = nullptr;
    root_ = std::move(child);
    --height_;
    LOG_DEBUG("Delete: root became empty, new root keys ", formatKeys(root_->keys), ", height ", height_);
}

// `node` may be destroyed by a merge during the recursive call; it must not be
// touched once the call below it returns.
bool BTree::deleteFromNode(Node* node, Key key) {
    size_t i = lowerBound(node, key);

    if (i < node->keys.size() && keysEqual(node->keys[i], key)) {
        if (node->is_leaf) {
            LOG_DEBUG("deleteNode: deleting key ", key, " from leaf ", formatKeys(node->keys));
            removeFromLeaf(node, i);
        } else {
            LOG_DEBUG("deleteNode: deleting key ", key, " from internal node ", formatKeys(node->keys));
            deleteInternal(node, i);
        }
        return true;
    }

    if (node->is_leaf) {
        return false;
    }
    return deleteFromNode(node->children[i].get(), key);
}

void BTree::deleteInternal(Node* node, size_t index) {
    Node* left_child = node->children[index].get();
    Node* right_child = node->children[index + 1].get();

    // Case 1: replace with the predecessor, the last entry of the rightmost leaf.
    if (left_child->hasSpare()) {
        Node* leaf = left_child;
        while (!leaf->is_leaf) {
            leaf = leaf->children.back().get();
        }
        size_t last = leaf->keys.size() - 1;
        node->keys[index] = leaf->keys[last];
        node->values[index] = leaf->values[last];
        LOG_DEBUG("deleteInternal: replaced with predecessor ", leaf->keys[last]);
        removeFromLeaf(leaf, last);
        return;
    }

    // Case 2: replace with the successor, the first entry of the leftmost leaf.
    if (right_child->hasSpare()) {
        Node* leaf = right_child;
        while (!leaf->is_leaf) {
            leaf = leaf->children.front().get();
        }
        node->keys[index] = leaf->keys.front();
        node->values[index] = leaf->values.front();
        LOG_DEBUG("deleteInternal: replaced with successor ", leaf->keys.front());
        removeFromLeaf(leaf, 0);
        return;
    }

    // Case 3: both children are minimal. Pull the separator down into the merged
    // child; the key is guaranteed to be found there.
    Key key = node->keys[index];
    LOG_DEBUG("deleteInternal: merging children for key ", key, " at index ", index);
    mergeChildren(node, index);
    Node* merged = node->children[index].get();
    deleteFromNode(merged, key);

    // The merged child held 2t-1 keys and loses at most one, so `node` is still
    // alive here. It gave up a key of its own and may now need its siblings.
    rebalance(node);
}

void BTree::removeFromLeaf(Node* leaf, size_t index) {
    leaf->keys.erase(leaf->keys.begin() + static_cast<std::ptrdiff_t>(index));
    leaf->values.erase(leaf->values.begin() + static_cast<std::ptrdiff_t>(index));
    checkInvariants(leaf, "removeFromLeaf");
    if (leaf->isUnderflowed()) {
        rebalance(leaf);
    }
}

// --- Balance ---

void BTree::rebalance(Node* node) {
    // The root is exempt from the minimum; an emptied root is collapsed by remove().
    if (node->parent == nullptr || !node->isUnderflowed()) {
        return;
    }

    Node* parent = node->parent;
    size_t index = childIndexInParent(parent, node);

    if (index > 0 && parent->children[index - 1]->hasSpare()) {
        borrowFromLeftSibling(parent, index);
        return;
    }
    if (index + 1 < parent->children.size() && parent->children[index + 1]->hasSpare()) {
        borrowFromRightSibling(parent, index);
        return;
    }

    if (index > 0) {
        mergeChildren(parent, index - 1);
    } else if (index + 1 < parent->children.size()) {
        mergeChildren(parent, index);
    } else {
        invariantFailure("rebalance", "underflowed node " + formatKeys(node->keys) + " has no siblings");
    }

    // Propagate upward; this is how a deep deletion can shrink the tree.
    if (parent->isUnderflowed()) {
        rebalance(parent);
    }
}

void BTree::borrowFromLeftSibling(Node* parent, size_t index) {
    if (index == 0 || index >= parent->children.size()) {
        invariantFailure("borrowFromLeftSibling", "invalid index " + std::to_string(index) + " with " +
                                                      std::to_string(parent->children.size()) + " children");
    }
    Node* node = parent->children[index].get();
    Node* left = parent->children[index - 1].get();
    LOG_DEBUG("borrowFromLeftSibling: before, node ", formatKeys(node->keys), ", left ", formatKeys(left->keys));

    // Separator moves down to the front of node, left's last entry moves up.
    node->keys.insert(node->keys.begin(), parent->keys[index - 1]);
    node->values.insert(node->values.begin(), std::move(parent->values[index - 1]));
    parent->keys[index - 1] = left->keys.back();
    parent->values[index - 1] = std::move(left->values.back());
    left->keys.pop_back();
    left->values.pop_back();

    if (!node->is_leaf) {
        std::unique_ptr<Node> borrowed = std::move(left->children.back());
        left->children.pop_back();
        borrowed->parent = node;
        node->children.insert(node->children.begin(), std::move(borrowed));
    }

    LOG_DEBUG("borrowFromLeftSibling: after, node ", formatKeys(node->keys), ", left ", formatKeys(left->keys));
    checkInvariants(parent, "borrowFromLeftSibling");
}

void BTree::borrowFromRightSibling(Node* parent, size_t index) {
    if (index + 1 >= parent->children.size()) {
        invariantFailure("borrowFromRightSibling", "invalid index " + std::to_string(index) + " with " +
                                                       std::to_string(parent->children.size()) + " children");
    }
    Node* node = parent->children[index].get();
    Node* right = parent->children[index + 1].get();
    LOG_DEBUG("borrowFromRightSibling: before, node ", formatKeys(node->keys), ", right ", formatKeys(right->keys));

    node->keys.push_back(parent->keys[index]);
    node->values.push_back(std::move(parent->values[index]));
    parent->keys[index] = right->keys.front();
    parent->values[index] = std::move(right->values.front());
    right->keys.erase(right->keys.begin());
    right->values.erase(right->values.begin());

    if (!node->is_leaf) {
        std::unique_ptr<Node> borrowed = std::move(right->children.front());
        right->children.erase(right->children.begin());
        borrowed->parent = node;
        node->children.push_back(std::move(borrowed));
    }

    LOG_DEBUG("borrowFromRightSibling: after, node ", formatKeys(node->keys), ", right ", formatKeys(right->keys));
    checkInvariants(parent, "borrowFromRightSibling");
}

// Folds children[left_index + 1] and the separator keys[left_index] into
// children[left_index]. The absorbed node is destroyed.
void BTree::mergeChildren(Node* parent, size_t left_index) {
    if (left_index + 1 >= parent->children.size() || left_index >= parent->keys.size()) {
        invariantFailure("mergeChildren", "invalid index " + std::to_string(left_index) + " (parent has " +
                                              std::to_string(parent->keys.size()) + " keys, " +
                                              std::to_string(parent->children.size()) + " children)");
    }
    Node* left = parent->children[left_index].get();
    std::unique_ptr<Node> right = std::move(parent->children[left_index + 1]);
    if (left->is_leaf != right->is_leaf) {
        invariantFailure("mergeChildren", "siblings " + formatKeys(left->keys) + " and " +
                                              formatKeys(right->keys) + " are on different levels");
    }
    LOG_DEBUG("mergeChildren: before, separator ", parent->keys[left_index], ", left ", formatKeys(left->keys),
              ", right ", formatKeys(right->keys));

    left->keys.push_back(parent->keys[left_index]);
    left->values.push_back(std::move(parent->values[left_index]));
    left->keys.insert(left->keys.end(), right->keys.begin(), right->keys.end());
    left->values.insert(left->values.end(), std::make_move_iterator(right->values.begin()),
                        std::make_move_iterator(right->values.end()));
    for (auto& child : right->children) {
        child->parent = left;
        left->children.push_back(std::move(child));
    }

    parent->keys.erase(parent->keys.begin() + static_cast<std::ptrdiff_t>(left_index));
    parent->values.erase(parent->values.begin() + static_cast<std::ptrdiff_t>(left_index));
    parent->children.erase(parent->children.begin() + static_cast<std::ptrdiff_t>(left_index + 1));

    LOG_DEBUG("mergeChildren: after, parent keys ", formatKeys(parent->keys), ", children ",
              parent->children.size(), ", merged ", formatKeys(left->keys));
    if (left->size() > left->max_keys) {
        invariantFailure("mergeChildren", "merged node " + formatKeys(left->keys) + " exceeds " +
                                              std::to_string(left->max_keys) + " keys");
    }
    checkInvariants(parent, "mergeChildren");
}

size_t BTree::childIndexInParent(const Node* parent, const Node* child) const {
    for (size_t i = 0; i < parent->children.size(); ++i) {
        if (parent->children[i].get() == child) {
            return i;
        }
    }
    invariantFailure("childIndexInParent", "node " + formatKeys(child->keys) + " not found among children of " +
                                               formatKeys(parent->keys));
}

} // namespace elastic
