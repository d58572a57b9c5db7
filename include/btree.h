// include/btree.h
#pragma once

#include "btree_node.h"
#include "storage_error/result.h"
#include "types.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace elastic {

class SnapshotCodec;

/**
 * @brief Outcome of a non-fatal structural check.
 */
struct ValidationReport {
    bool valid = true;
    std::vector<std::string> problems;

    void addProblem(std::string problem) {
        valid = false;
        problems.push_back(std::move(problem));
    }
};

/**
 * @brief In-memory B-tree keyed by Key with opaque string values.
 *
 * Insertion splits full nodes preemptively on the way down. Deletion is
 * reactive: it removes first and then repairs underflowed nodes by walking
 * parent links upward (borrow from a sibling, else merge).
 *
 * Every public method takes the tree mutex exactly once (exclusive for
 * mutations, shared for reads). Private helpers assume the lock is held and
 * must never call a public method.
 */
class BTree {
public:
    explicit BTree(int degree = DEFAULT_TREE_DEGREE, KeyComparator comparator = defaultKeyComparator());
    ~BTree();

    BTree(const BTree&) = delete;
    BTree& operator=(const BTree&) = delete;

    // Checked construction: degree < 2 is reported as BTREE_INVALID_DEGREE.
    static Result<std::unique_ptr<BTree>> create(int degree, KeyComparator comparator = defaultKeyComparator());

    // --- Public API ---
    // Duplicate keys are stored as additional entries, never merged or rejected.
    void insert(Key key, const Value& value);
    std::optional<Value> search(Key key) const;
    bool contains(Key key) const;
    // Returns false (and changes nothing) when the key is absent.
    bool remove(Key key);

    size_t size() const;
    int height() const;
    int degree() const { return degree_; }
    bool empty() const;

    void setComparator(KeyComparator comparator);

    // --- Validation & Debugging ---
    ValidationReport validateTree() const;
    bool isValid() const;
    void printTreeStructure(std::ostream& os) const;
    std::string toString() const;
    // Pre-order walk over every node with its level (root = 0).
    void visitNodes(const std::function<void(const Node&, int)>& visitor) const;
    void rebuildParentPointers();

private:
    friend class SnapshotCodec;

    std::unique_ptr<Node> root_;
    int degree_;
    size_t size_ = 0;
    int height_ = 0;
    KeyComparator less_;
    mutable std::shared_mutex tree_mutex_;

    // --- Key helpers ---
    bool keysEqual(Key a, Key b) const { return !less_(a, b) && !less_(b, a); }
    size_t lowerBound(const Node* node, Key key) const;
    size_t upperBound(const Node* node, Key key) const;

    // --- Search ---
    std::optional<Value> searchUnlocked(Key key) const;

    // --- Insertion ---
    void insertNonFull(Node* node, Key key, const Value& value);
    void splitChild(Node* parent, size_t index);

    // --- Deletion ---
    bool deleteFromNode(Node* node, Key key);
    void deleteInternal(Node* node, size_t index);
    void removeFromLeaf(Node* leaf, size_t index);
    void collapseRootIfEmpty();

    // --- Balance ---
    void rebalance(Node* node);
    void borrowFromLeftSibling(Node* parent, size_t index);
    void borrowFromRightSibling(Node* parent, size_t index);
    void mergeChildren(Node* parent, size_t left_index);
    size_t childIndexInParent(const Node* parent, const Node* child) const;

    // --- Invariants ---
    // Fatal tier: logs the violation with the subtree and aborts.
    void checkInvariants(const Node* node, const char* where) const;
    std::optional<std::string> findShapeViolation(const Node* node) const;
    [[noreturn]] void invariantFailure(const char* where, const std::string& detail) const;
    ValidationReport validateUnlocked() const;
    void validateNode(const Node* node, bool is_root, int depth,
                      const std::optional<Key>& lower, const std::optional<Key>& upper,
                      ValidationReport& report, std::optional<int>& leaf_depth, size_t& key_count) const;

    // --- Printing ---
    void printNodeToString(std::ostream& os, const Node* node, int level) const;
    void visitNode(const Node& node, int level, const std::function<void(const Node&, int)>& visitor) const;
    static void rebuildParents(Node* node);
};

} // namespace elastic
