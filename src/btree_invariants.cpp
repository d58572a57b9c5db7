// @src/btree_invariants.cpp
// Structural checks: the fatal tier used inside mutations and the
// non-fatal report used by operators and tests.
#include "btree.h"
#include "debug_utils.h"
#include "storage_error/storage_error.h"

#include <cstdlib>
#include <mutex>
#include <sstream>

namespace elastic {

void BTree::checkInvariants(const Node* node, const char* where) const {
    if (node == nullptr) {
        return;
    }
    if (auto violation = findShapeViolation(node)) {
        invariantFailure(where, *violation);
    }
}

// Shape, order, upper bound and parent links. The minimum occupancy is left
// out: it is legitimately broken while a deletion is still in flight.
std::optional<std::string> BTree::findShapeViolation(const Node* node) const {
    std::ostringstream oss;
    if (node->values.size() != node->keys.size()) {
        oss << "node " << formatKeys(node->keys) << " has " << node->keys.size() << " keys but "
            << node->values.size() << " values";
        return oss.str();
    }
    if (node->keys.size() > node->max_keys) {
        oss << "node " << formatKeys(node->keys) << " exceeds " << node->max_keys << " keys";
        return oss.str();
    }
    for (size_t i = 1; i < node->keys.size(); ++i) {
        if (less_(node->keys[i], node->keys[i - 1])) {
            oss << "node " << formatKeys(node->keys) << " keys out of order at position " << i;
            return oss.str();
        }
    }
    if (node->is_leaf) {
        if (!node->children.empty()) {
            oss << "leaf " << formatKeys(node->keys) << " has " << node->children.size() << " children";
            return oss.str();
        }
        return std::nullopt;
    }
    if (node->children.size() != node->keys.size() + 1) {
        oss << "node " << formatKeys(node->keys) << " has " << node->keys.size() << " keys but "
            << node->children.size() << " children (expected " << node->keys.size() + 1 << ")";
        return oss.str();
    }
    for (const auto& child : node->children) {
        if (!child) {
            oss << "node " << formatKeys(node->keys) << " has a null child";
            return oss.str();
        }
        if (child->parent != node) {
            oss << "child " << formatKeys(child->keys) << " does not point back to parent "
                << formatKeys(node->keys);
            return oss.str();
        }
        if (auto violation = findShapeViolation(child.get())) {
            return violation;
        }
    }
    return std::nullopt;
}

void BTree::invariantFailure(const char* where, const std::string& detail) const {
    std::ostringstream dump;
    printNodeToString(dump, root_.get(), 0);
    LOG_FATAL("Invariant violation in ", where, ": ", detail);
    LOG_FATAL("Tree (degree=", degree_, ", size=", size_, ", height=", height_, "):\n", dump.str());
#ifdef ELASTIC_THROW_ON_INVARIANT_VIOLATION
    throw InvariantViolation(std::string(where) + ": " + detail);
#else
    std::abort();
#endif
}

// --- Non-fatal validation ---

ValidationReport BTree::validateTree() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    ValidationReport report = validateUnlocked();
    for (const auto& problem : report.problems) {
        LOG_ERROR("Invalid tree: ", problem);
    }
    return report;
}

bool BTree::isValid() const {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    return validateUnlocked().valid;
}

ValidationReport BTree::validateUnlocked() const {
    ValidationReport report;

    if (!root_) {
        // An empty tree is valid.
        if (size_ != 0) report.addProblem("empty tree reports size " + std::to_string(size_));
        if (height_ != 0) report.addProblem("empty tree reports height " + std::to_string(height_));
        return report;
    }

    if (root_->parent != nullptr) {
        report.addProblem("root has a parent reference");
    }

    std::optional<int> leaf_depth;
    size_t key_count = 0;
    validateNode(root_.get(), true, 1, std::nullopt, std::nullopt, report, leaf_depth, key_count);

    if (leaf_depth && *leaf_depth != height_) {
        report.addProblem("height is " + std::to_string(height_) + " but leaves are at depth " +
                          std::to_string(*leaf_depth));
    }
    if (key_count != size_) {
        report.addProblem("size is " + std::to_string(size_) + " but the nodes hold " +
                          std::to_string(key_count) + " keys");
    }
    return report;
}

void BTree::validateNode(const Node* node, bool is_root, int depth,
                         const std::optional<Key>& lower, const std::optional<Key>& upper,
                         ValidationReport& report, std::optional<int>& leaf_depth, size_t& key_count) const {
    const std::string label = "node " + formatKeys(node->keys) + " at depth " + std::to_string(depth);
    key_count += node->keys.size();

    const size_t t = static_cast<size_t>(degree_);
    if (node->min_keys != t - 1 || node->max_keys != 2 * t - 1) {
        report.addProblem(label + " has bounds [" + std::to_string(node->min_keys) + ", " +
                          std::to_string(node->max_keys) + "] for degree " + std::to_string(degree_));
    }
    if (node->values.size() != node->keys.size()) {
        report.addProblem(label + " has " + std::to_string(node->values.size()) + " values for " +
                          std::to_string(node->keys.size()) + " keys");
    }

    // Occupancy
    if (node->keys.size() > node->max_keys) {
        report.addProblem(label + " holds " + std::to_string(node->keys.size()) + " keys, above the maximum " +
                          std::to_string(node->max_keys));
    }
    if (!is_root && node->keys.size() < node->min_keys) {
        report.addProblem(label + " holds " + std::to_string(node->keys.size()) + " keys, below the minimum " +
                          std::to_string(node->min_keys));
    }
    if (is_root && node->keys.empty()) {
        report.addProblem("root holds no keys");
    }

    // Order, within the node and against the separators above it. Equal keys
    // are allowed because insert() stores duplicates.
    for (size_t i = 0; i < node->keys.size(); ++i) {
        if (i > 0 && less_(node->keys[i], node->keys[i - 1])) {
            report.addProblem(label + " keys are not sorted at position " + std::to_string(i));
        }
        if ((lower && less_(node->keys[i], *lower)) || (upper && less_(*upper, node->keys[i]))) {
            report.addProblem(label + " key " + std::to_string(node->keys[i]) +
                              " lies outside the range set by its parent separators");
        }
    }

    if (node->is_leaf != node->children.empty()) {
        report.addProblem(label + (node->is_leaf ? " is marked leaf but has children"
                                                 : " is marked internal but has no children"));
    }

    if (node->children.empty()) {
        if (!leaf_depth) {
            leaf_depth = depth;
        } else if (*leaf_depth != depth) {
            report.addProblem(label + " is a leaf at depth " + std::to_string(depth) +
                              ", other leaves are at depth " + std::to_string(*leaf_depth));
        }
        return;
    }

    if (node->children.size() != node->keys.size() + 1) {
        report.addProblem(label + " has " + std::to_string(node->children.size()) + " children for " +
                          std::to_string(node->keys.size()) + " keys");
        return;
    }

    for (size_t i = 0; i < node->children.size(); ++i) {
        const Node* child = node->children[i].get();
        if (child->parent != node) {
            report.addProblem("child " + std::to_string(i) + " of " + label + " has a mismatched parent reference");
        }
        std::optional<Key> child_lower = i > 0 ? std::optional<Key>(node->keys[i - 1]) : lower;
        std::optional<Key> child_upper = i < node->keys.size() ? std::optional<Key>(node->keys[i]) : upper;
        validateNode(child, false, depth + 1, child_lower, child_upper, report, leaf_depth, key_count);
    }
}

} // namespace elastic
