// src/cli.cpp
#include "cli.h"
#include "debug_utils.h"
#include "storage_error/error_utils.h"

#include <charconv>
#include <ostream>
#include <utility>

namespace elastic {

void printUsage(std::ostream& os) {
    os << "Usage: elastic_btree_cli <command> [arguments]\n"
       << "Commands:\n"
       << "  insert <key> <value> - Insert a key-value pair\n"
       << "  delete <key>         - Delete a key\n"
       << "  search <key>         - Search for a key\n"
       << "  save                 - Save tree to disk\n"
       << "  load                 - Load tree from disk\n"
       << "  print                - Print tree structure\n"
       << "  validate             - Validate tree properties\n"
       << "  help                 - Show this message\n"
       << "Environment: " << Config::ENV_TREE_DEGREE << ", " << Config::ENV_STORAGE_PATH << ", "
       << Config::ENV_LOG_LEVEL << "\n";
}

Result<Key> parseKey(std::string_view text) {
    Key key = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, key);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return STORAGE_ERROR(ErrorCode::INVALID_KEY, "Key must be a 64-bit integer")
            .withContext("input", std::string(text));
    }
    return key;
}

Cli::Cli(Config config, std::unique_ptr<BTree> tree, std::ostream& out, std::ostream& err)
    : config_(std::move(config)),
      store_(config_.storage_path),
      tree_(std::move(tree)),
      out_(out),
      err_(err) {}

int Cli::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage(err_);
        return 1;
    }
    const std::string& command = args[0];
    if (command == "insert") return handleInsert(args);
    if (command == "delete") return handleDelete(args);
    if (command == "search") return handleSearch(args);
    if (command == "save") return handleSave();
    if (command == "load") return handleLoad();
    if (command == "validate") return handleValidate();
    if (command == "print") {
        tree_->printTreeStructure(out_);
        return 0;
    }
    if (command == "help") {
        printUsage(out_);
        return 0;
    }
    LOG_ERROR("Unknown command: ", command);
    printUsage(err_);
    return 1;
}

Result<Key> Cli::requireKey(const std::vector<std::string>& args, const char* command) {
    if (args.size() < 2) {
        LOG_ERROR("The ", command, " command requires a key");
        printUsage(err_);
        return STORAGE_ERROR(ErrorCode::INVALID_KEY, "Missing key argument").withContext("command", command);
    }
    auto key = parseKey(args[1]);
    if (!key.isOk()) {
        LOG_ERROR("Invalid key '", args[1], "': ", key.error().toString());
        printUsage(err_);
    }
    return key;
}

int Cli::handleInsert(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        LOG_ERROR("The insert command requires a key and a value");
        printUsage(err_);
        return 1;
    }
    auto key = requireKey(args, "insert");
    if (!key.isOk()) return 1;

    tree_->insert(*key, args[2]);
    out_ << "Inserted key " << *key << " with value: " << args[2] << std::endl;
    return handleSave();
}

int Cli::handleDelete(const std::vector<std::string>& args) {
    auto key = requireKey(args, "delete");
    if (!key.isOk()) return 1;

    if (tree_->remove(*key)) {
        out_ << "Deleted key " << *key << std::endl;
    } else {
        out_ << "Key " << *key << " not found" << std::endl;
    }
    return handleSave();
}

int Cli::handleSearch(const std::vector<std::string>& args) {
    auto key = requireKey(args, "search");
    if (!key.isOk()) return 1;

    if (auto value = tree_->search(*key)) {
        out_ << "Found key " << *key << ": " << *value << std::endl;
    } else {
        out_ << "Key " << *key << " not found" << std::endl;
    }
    return 0;
}

int Cli::handleSave() {
    Status status = store_.save(*tree_);
    if (!status.isOk()) {
        LOG_ERROR("Save failed: ", status.error().toString());
        return 1;
    }
    LOG_INFO("Tree saved to ", store_.path());
    return 0;
}

int Cli::handleLoad() {
    auto loaded = store_.load();
    if (!loaded.isOk()) {
        LOG_ERROR("Load failed: ", loaded.error().toString());
        return 1;
    }
    tree_ = std::move(loaded).value();
    out_ << "Tree loaded: " << tree_->size() << " entries, height " << tree_->height() << std::endl;
    return 0;
}

int Cli::handleValidate() {
    ValidationReport report = tree_->validateTree();
    if (!report.valid) {
        for (const auto& problem : report.problems) {
            out_ << "  " << problem << "\n";
        }
        out_ << "Tree validation failed (" << report.problems.size() << " problems)" << std::endl;
        return 1;
    }
    out_ << "Tree validation successful" << std::endl;
    return 0;
}

Result<std::unique_ptr<BTree>> loadOrCreateTree(const Config& config) {
    SnapshotStore store(config.storage_path);
    auto loaded = store.load();
    if (loaded.isOk()) {
        LOG_INFO("Tree loaded from ", store.path());
        return loaded;
    }
    if (loaded.error().code != ErrorCode::FILE_NOT_FOUND) {
        return loaded;
    }
    LOG_INFO("No existing tree found at ", store.path(), ", creating a new one (degree ", config.tree_degree, ")");
    return BTree::create(config.tree_degree);
}

int runCli(const Config& config, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        printUsage(err);
        return 1;
    }
    // help does not need the snapshot.
    if (args[0] == "help") {
        printUsage(out);
        return 0;
    }

    auto tree = loadOrCreateTree(config);
    if (!tree.isOk()) {
        LOG_ERROR("Failed to load tree: ", tree.error().toDetailedString());
        err << "Error: " << tree.error().toString() << std::endl;
        return 1;
    }

    Cli cli(config, std::move(tree).value(), out, err);
    return cli.run(args);
}

} // namespace elastic
