#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/config.hpp"
#include "gro/scanner.hpp"

#include <iostream>
#include <string>

int cmd_sync(int argc, char **argv) {
  std::string ws_name;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else {
      return gro::cli::usage_error("sync");
    }
  }

  auto config = gro::cli::load_config_or_report("sync");
  if (!config)
    return 1;
  if (config->workspaces.empty()) {
    std::cerr << "sync: no workspaces configured\n";
    return 1;
  }

  gro::Workspace *ws = ws_name.empty() ? &config->workspaces.front()
                                       : config->find_workspace(ws_name);
  if (!ws) {
    std::cerr << "sync: unknown workspace: " << ws_name << "\n";
    return 1;
  }

  try {
    const auto declared = config->all_repos();
    std::size_t added = 0;
    for (const auto &repo : gro::scan_store(config->store)) {
      if (declared.contains(repo))
        continue;
      ws->add_entry(".", gro::RepoEntry{.repo_name = repo, .alias = std::nullopt});
      std::cout << "  + " << repo << " -> " << ws->name() << "/.\n";
      ++added;
    }
    if (added == 0) {
      std::cout << "All repos are categorized!\n";
      return 0;
    }

    if (gro::cli::options().dry_run) {
      std::cout << "\nWould add " << added << " repos to config\n";
    } else {
      gro::save_config(*config, gro::cli::config_path());
      std::cout << "\nAdded " << added << " repos to config\n";
      std::cout << "Run 'gro apply' to create symlinks\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
