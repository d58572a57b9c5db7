// @src/test/btree.bench.cpp
// Timed workloads on a degree-100 tree. Every mutation re-checks the tree's
// invariants, so the key count is kept moderate; ELASTIC_BENCH_KEYS overrides it.
#include "gtest/gtest.h"
#include "btree.h"
#include "snapshot_store.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace elastic;

namespace {

constexpr int kBenchDegree = 100;
constexpr int kDefaultKeys = 20000;
constexpr int kSaveEvery = 1000;

int benchKeyCount() {
    const char* raw = std::getenv("ELASTIC_BENCH_KEYS");
    if (raw == nullptr) {
        return kDefaultKeys;
    }
    int parsed = std::atoi(raw);
    return parsed > 0 ? parsed : kDefaultKeys;
}

std::vector<Key> shuffledKeys(int count, unsigned seed) {
    std::vector<Key> keys(count);
    std::iota(keys.begin(), keys.end(), 0);
    std::shuffle(keys.begin(), keys.end(), std::mt19937(seed));
    return keys;
}

std::unique_ptr<BTree> preloadedTree(int count) {
    auto tree = std::make_unique<BTree>(kBenchDegree);
    for (Key k = 0; k < count; ++k) {
        tree->insert(k, "value" + std::to_string(k));
    }
    return tree;
}

// Runs `body`, prints and records nanoseconds per operation.
template<typename Fn>
void timeOps(const std::string& name, int ops, Fn&& body) {
    auto start = std::chrono::steady_clock::now();
    body();
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    long long per_op = ops > 0 ? elapsed.count() / ops : 0;
    std::cout << "[ BENCH    ] " << name << ": " << ops << " ops, " << per_op << " ns/op" << std::endl;
    ::testing::Test::RecordProperty("ops", ops);
    ::testing::Test::RecordProperty("ns_per_op", std::to_string(per_op));
}

} // namespace

TEST(BTreeBenchmark, InsertSequential) {
    const int n = benchKeyCount();
    BTree tree(kBenchDegree);
    timeOps("InsertSequential", n, [&]() {
        for (Key k = 0; k < n; ++k) {
            tree.insert(k, "value");
        }
    });
    EXPECT_EQ(tree.size(), static_cast<size_t>(n));
}

TEST(BTreeBenchmark, InsertRandom) {
    const int n = benchKeyCount();
    std::vector<Key> keys = shuffledKeys(n, 42);
    BTree tree(kBenchDegree);
    timeOps("InsertRandom", n, [&]() {
        for (Key k : keys) {
            tree.insert(k, "value");
        }
    });
    EXPECT_EQ(tree.size(), static_cast<size_t>(n));
}

TEST(BTreeBenchmark, Search) {
    const int n = benchKeyCount();
    auto tree = preloadedTree(n);
    std::mt19937 rng(7);
    std::uniform_int_distribution<Key> pick(0, n - 1);
    const int lookups = n * 10;
    size_t found = 0;
    timeOps("Search", lookups, [&]() {
        for (int i = 0; i < lookups; ++i) {
            if (tree->search(pick(rng))) {
                ++found;
            }
        }
    });
    EXPECT_EQ(found, static_cast<size_t>(lookups));
}

TEST(BTreeBenchmark, Delete) {
    const int n = benchKeyCount();
    auto tree = preloadedTree(n);
    std::vector<Key> keys = shuffledKeys(n, 99);
    timeOps("Delete", n, [&]() {
        for (Key k : keys) {
            tree->remove(k);
        }
    });
    EXPECT_TRUE(tree->empty());
}

TEST(BTreeBenchmark, BulkInsertAndSave) {
    const int n = benchKeyCount();
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("elastic_btree_bench_" + std::to_string(stamp));
    SnapshotStore store((dir / "tree.json").string());

    BTree tree(kBenchDegree);
    int saves = 0;
    timeOps("BulkInsertAndSave", n, [&]() {
        for (Key k = 0; k < n; ++k) {
            tree.insert(k, "value" + std::to_string(k));
            if ((k + 1) % kSaveEvery == 0) {
                Status status = store.save(tree);
                ASSERT_TRUE(status.isOk()) << status.error().toString();
                ++saves;
            }
        }
    });
    EXPECT_EQ(saves, n / kSaveEvery);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
