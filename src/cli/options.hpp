#pragma once
#include "gro/model.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gro::cli {

// Options given before the subcommand
struct GlobalOptions {
  std::optional<std::filesystem::path> config_path;
  bool dry_run = false;
  bool verbose = false;
};

GlobalOptions &options();

// Consume leading global options; returns the index of the subcommand in argv
// (argc if none), or -1 on a malformed option.
int parse_global_options(int argc, char **argv);

auto config_path() -> std::filesystem::path;

// Load the config, printing "<cmd>: ..." to stderr on failure
auto load_config_or_report(const char *cmd) -> std::optional<Config>;

// Workspaces selected by an optional -w name (all when empty). Prints and returns
// nullopt for an unknown name.
auto select_workspaces(Config &config, const std::string &name, const char *cmd)
    -> std::optional<std::vector<Workspace *>>;

} // namespace gro::cli
