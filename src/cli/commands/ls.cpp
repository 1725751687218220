#include "cli/options.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <string>

int cmd_ls(int argc, char **argv) {
  std::string ws_name;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else {
      return gro::cli::usage_error("ls");
    }
  }

  auto config = gro::cli::load_config_or_report("ls");
  if (!config)
    return 1;
  const auto selected = gro::cli::select_workspaces(*config, ws_name, "ls");
  if (!selected)
    return 1;

  for (const auto *ws : *selected) {
    std::cout << ws->name() << " (" << ws->path().string() << ")\n";
    if (ws->categories().empty())
      std::cout << "  (no categories)\n";
    for (const auto &[path, cat] : ws->categories())
      std::cout << "  " << (cat.is_root() ? ". (root)" : path) << "  " << cat.entries.size()
                << (cat.entries.size() == 1 ? " repo\n" : " repos\n");
  }
  return 0;
}
