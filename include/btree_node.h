// include/btree_node.h
#pragma once

#include "types.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace elastic {

/**
 * @brief A vertex of the B-tree.
 *
 * Keys and values live at every level, not only in leaves. A node owns its
 * children; `parent` is a non-owning back-reference used only to walk upward
 * during rebalancing and must always name the node that owns this one
 * (nullptr for the root).
 */
struct Node {
    std::vector<Key> keys;                        // non-decreasing under the tree comparator
    std::vector<Value> values;                    // parallel to keys
    std::vector<std::unique_ptr<Node>> children;  // internal: keys.size() + 1, leaf: empty
    bool is_leaf;
    size_t min_keys;  // degree - 1
    size_t max_keys;  // 2 * degree - 1
    Node* parent = nullptr;

    Node(int degree, bool leaf)
        : is_leaf(leaf),
          min_keys(static_cast<size_t>(degree) - 1),
          max_keys(2 * static_cast<size_t>(degree) - 1) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    size_t size() const { return keys.size(); }
    bool isFull() const { return keys.size() >= max_keys; }
    bool hasSpare() const { return keys.size() > min_keys; }
    bool isUnderflowed() const { return keys.size() < min_keys; }
};

} // namespace elastic
