#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/config.hpp"
#include "gro/fs.hpp"
#include "gro/scanner.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

int cmd_init(int argc, char **argv) {
  std::optional<std::filesystem::path> code;
  std::vector<std::filesystem::path> workspaces;
  bool scan = false;
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--code" && i + 1 < argc) {
      code = argv[++i];
    } else if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      workspaces.emplace_back(argv[++i]);
    } else if (arg == "--scan") {
      scan = true;
    } else if (arg == "--force") {
      force = true;
    } else {
      return gro::cli::usage_error("init");
    }
  }

  const bool dry_run = gro::cli::options().dry_run;
  const auto path = gro::cli::config_path();
  if (gro::fs::exists(path) && !force) {
    std::cerr << "init: config already exists at " << path.string()
              << " (use --force to overwrite)\n";
    return 1;
  }

  try {
    auto config = gro::create_default_config(code, workspaces);

    if (!gro::fs::exists(config.store)) {
      if (dry_run) {
        std::cout << "Would create: " << config.store.string() << "\n";
      } else {
        std::filesystem::create_directories(config.store);
        std::cout << "Created: " << config.store.string() << "\n";
      }
    }

    if (scan) {
      const auto repos = gro::scan_store(config.store);
      if (!repos.empty() && !config.workspaces.empty()) {
        auto &ws = config.workspaces.front();
        for (const auto &r : repos)
          ws.add_entry(".", gro::RepoEntry{.repo_name = r, .alias = std::nullopt});
        std::cout << "Added " << repos.size() << " repos to '" << ws.name() << "' workspace\n";
      }
    }

    if (dry_run) {
      std::cout << "Would save config to: " << path.string() << "\n";
    } else {
      gro::save_config(config, path);
      std::cout << "Config saved to: " << path.string() << "\n";
    }

    for (const auto &w : gro::validate_config(config))
      std::cout << "Warning: " << w << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
