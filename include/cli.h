// include/cli.h
#pragma once

#include "btree.h"
#include "config.h"
#include "snapshot_store.h"
#include "storage_error/result.h"
#include "types.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace elastic {

void printUsage(std::ostream& os);

// Parses a whole argument as a signed 64-bit key; INVALID_KEY otherwise.
Result<Key> parseKey(std::string_view text);

/**
 * @brief Command dispatcher behind elastic_btree_cli.
 *
 * Owns the working tree and the snapshot store at config.storage_path.
 * insert and delete write the snapshot back after they succeed. Command
 * results go to `out`, usage text for bad invocations goes to `err`.
 * Every handler returns the process exit code.
 */
class Cli {
public:
    Cli(Config config, std::unique_ptr<BTree> tree, std::ostream& out, std::ostream& err);

    int run(const std::vector<std::string>& args);

    const BTree& tree() const { return *tree_; }

private:
    Config config_;
    SnapshotStore store_;
    std::unique_ptr<BTree> tree_;
    std::ostream& out_;
    std::ostream& err_;

    int handleInsert(const std::vector<std::string>& args);
    int handleDelete(const std::vector<std::string>& args);
    int handleSearch(const std::vector<std::string>& args);
    int handleSave();
    int handleLoad();
    int handleValidate();

    Result<Key> requireKey(const std::vector<std::string>& args, const char* command);
};

// Loads the snapshot at config.storage_path, or starts a fresh tree of
// config.tree_degree when none exists yet.
Result<std::unique_ptr<BTree>> loadOrCreateTree(const Config& config);

// Full command-line flow after configuration: usage checks, tree startup
// and dispatch. `args` excludes the program name.
int runCli(const Config& config, const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace elastic
