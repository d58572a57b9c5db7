// @src/test/btree_delete.test.cpp
#include "gtest/gtest.h"
#include "btree.h"
#include "test_helpers.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace elastic;
using namespace elastic::testing_utils;

namespace {

std::unique_ptr<BTree> buildTree(int degree, const std::vector<Key>& keys) {
    auto tree = std::make_unique<BTree>(degree);
    for (Key k : keys) {
        tree->insert(k, "v" + std::to_string(k));
    }
    return tree;
}

std::vector<Key> multimapKeys(const std::multimap<Key, Value>& model) {
    std::vector<Key> keys;
    for (const auto& entry : model) {
        keys.push_back(entry.first);
    }
    return keys;
}

} // namespace

TEST(BTreeDeleteTest, RemoveFromEmptyTreeIsNoOp) {
    BTree tree(3);
    EXPECT_FALSE(tree.remove(5));
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.height(), 0);
}

TEST(BTreeDeleteTest, RemovingAbsentKeyChangesNothing) {
    auto tree = buildTree(2, {10, 20, 30, 40, 50, 60});
    const std::string before = tree->toString();
    EXPECT_FALSE(tree->remove(35));
    EXPECT_FALSE(tree->remove(-1));
    EXPECT_FALSE(tree->remove(1000));
    EXPECT_EQ(tree->size(), 6u);
    EXPECT_EQ(tree->toString(), before);
}

TEST(BTreeDeleteTest, RemovingLastKeyEmptiesTheTree) {
    BTree tree(3);
    tree.insert(1, "one");
    EXPECT_TRUE(tree.remove(1));
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.size(), 0u);
    EXPECT_EQ(tree.height(), 0);
    EXPECT_FALSE(tree.contains(1));
    EXPECT_TRUE(tree.isValid());

    // The tree is reusable afterwards.
    tree.insert(2, "two");
    EXPECT_EQ(tree.height(), 1);
    EXPECT_EQ(*tree.search(2), "two");
}

TEST(BTreeDeleteTest, CascadingMergeCollapsesRoot) {
    auto tree = buildTree(2, {10, 20, 30, 40, 50});
    ASSERT_EQ(tree->height(), 2);
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{20}}));
    EXPECT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {30, 40, 50}}));

    EXPECT_TRUE(tree->remove(50));
    EXPECT_EQ(tree->height(), 2);
    EXPECT_TRUE(tree->isValid());

    EXPECT_TRUE(tree->remove(40));
    EXPECT_EQ(tree->height(), 2);
    EXPECT_TRUE(tree->isValid());

    // The right leaf underflows, its sibling has nothing to spare, so the two
    // merge around the separator and the emptied root collapses.
    EXPECT_TRUE(tree->remove(30));
    EXPECT_EQ(tree->height(), 1);
    EXPECT_EQ(tree->size(), 2u);
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{10, 20}}));
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, BorrowFromLeftSibling) {
    // Root [30], leaves [10 20] and [40].
    auto tree = buildTree(2, {10, 30, 40, 20});
    ASSERT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10, 20}, {40}}));

    EXPECT_TRUE(tree->remove(40));
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{20}}));
    EXPECT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {30}}));
    EXPECT_EQ(*tree->search(30), "v30");
    EXPECT_EQ(*tree->search(20), "v20");
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, BorrowFromRightSibling) {
    auto tree = buildTree(2, {10, 20, 30, 40});
    ASSERT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {30, 40}}));

    EXPECT_TRUE(tree->remove(10));
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{30}}));
    EXPECT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{20}, {40}}));
    EXPECT_EQ(*tree->search(30), "v30");
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, DeleteFromInternalNodeUsesPredecessor) {
    auto tree = buildTree(2, {10, 30, 40, 20});
    ASSERT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{30}}));

    EXPECT_TRUE(tree->remove(30));
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{20}}));
    EXPECT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {40}}));
    EXPECT_EQ(*tree->search(20), "v20");
    EXPECT_FALSE(tree->contains(30));
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, DeleteFromInternalNodeUsesSuccessor) {
    auto tree = buildTree(2, {10, 20, 30, 40});
    EXPECT_TRUE(tree->remove(20));
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{30}}));
    EXPECT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {40}}));
    EXPECT_EQ(*tree->search(30), "v30");
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, DeleteFromInternalNodeMergesMinimalChildren) {
    auto tree = buildTree(2, {10, 20, 30});
    tree->insert(40, "v40");
    ASSERT_TRUE(tree->remove(40));
    // Root [20] over two minimal leaves.
    ASSERT_EQ(keysAtLevel(*tree, 1), (std::vector<std::vector<Key>>{{10}, {30}}));

    EXPECT_TRUE(tree->remove(20));
    EXPECT_EQ(tree->height(), 1);
    EXPECT_EQ(keysAtLevel(*tree, 0), (std::vector<std::vector<Key>>{{10, 30}}));
    EXPECT_TRUE(tree->isValid());
}

TEST(BTreeDeleteTest, DeletingEverythingShrinksHeightToZero) {
    for (int degree : {2, 3, 5}) {
        std::vector<Key> keys(300);
        std::iota(keys.begin(), keys.end(), 0);
        auto tree = buildTree(degree, keys);

        std::shuffle(keys.begin(), keys.end(), std::mt19937(static_cast<unsigned>(degree) * 31u));
        int previous_height = tree->height();
        for (Key k : keys) {
            ASSERT_TRUE(tree->remove(k)) << "key " << k;
            ASSERT_TRUE(tree->isValid()) << "after removing " << k << " at degree " << degree;
            EXPECT_LE(tree->height(), previous_height);
            EXPECT_GE(tree->height(), previous_height - 1);
            previous_height = tree->height();
        }
        EXPECT_TRUE(tree->empty());
        EXPECT_EQ(tree->height(), 0);
    }
}

TEST(BTreeDeleteTest, DuplicatesAreRemovedOneAtATime) {
    BTree tree(2);
    for (int i = 0; i < 5; ++i) {
        tree.insert(9, "nine");
    }
    tree.insert(1, "one");
    tree.insert(20, "twenty");

    for (int remaining = 4; remaining >= 0; --remaining) {
        EXPECT_TRUE(tree.remove(9));
        auto keys = inOrderKeys(tree);
        EXPECT_EQ(std::count(keys.begin(), keys.end(), 9), remaining);
        EXPECT_TRUE(tree.isValid());
    }
    EXPECT_FALSE(tree.remove(9));
    EXPECT_EQ(tree.size(), 2u);
}

TEST(BTreeDeleteTest, RandomizedWorkloadMatchesMultimap) {
    for (int degree : {2, 3, 4, 7}) {
        std::mt19937 rng(static_cast<unsigned>(degree) * 7919u);
        std::uniform_int_distribution<Key> key_dist(0, 150);
        std::uniform_int_distribution<int> op_dist(0, 99);

        BTree tree(degree);
        std::multimap<Key, Value> model;

        for (int step = 0; step < 3000; ++step) {
            Key key = key_dist(rng);
            if (op_dist(rng) < 55) {
                tree.insert(key, "v" + std::to_string(key));
                model.emplace(key, "v" + std::to_string(key));
            } else {
                auto it = model.find(key);
                bool expected = it != model.end();
                if (expected) {
                    model.erase(it);
                }
                ASSERT_EQ(tree.remove(key), expected) << "step " << step << " key " << key;
            }

            ASSERT_EQ(tree.size(), model.size()) << "step " << step;
            if (step % 50 == 0) {
                ASSERT_TRUE(tree.isValid()) << "step " << step << " degree " << degree << "\n" << tree.toString();
                ASSERT_EQ(inOrderKeys(tree), multimapKeys(model)) << "step " << step;
            }
        }

        ASSERT_TRUE(tree.isValid());
        EXPECT_EQ(inOrderKeys(tree), multimapKeys(model));
        for (Key k = 0; k <= 150; ++k) {
            EXPECT_EQ(tree.contains(k), model.count(k) > 0) << "key " << k;
        }
    }
}
