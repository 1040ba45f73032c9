// SceneX CLI Commands
// Handles: scenex tree, scenex sync, scenex dump, scenex --version

#pragma once

#include <string>

namespace scenex::cli {

// Parse arguments and run the selected subcommand; returns the process exit code
int run(int argc, char** argv);

// Print the model tree of a scene document
int treeCommand(const std::string& path);

// Materialize a document in the headless backend and print the native tree
int syncCommand(const std::string& path, bool asJson, bool debug);

// Load a document and write it back out
int dumpCommand(const std::string& path, bool excludeDefaults);

} // namespace scenex::cli
