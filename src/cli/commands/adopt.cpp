#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/adopt.hpp"
#include "gro/config.hpp"

#include <iostream>
#include <string>

int cmd_adopt(int argc, char **argv) {
  std::string ws_name;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else {
      return gro::cli::usage_error("adopt");
    }
  }

  auto config = gro::cli::load_config_or_report("adopt");
  if (!config)
    return 1;
  const auto selected = gro::cli::select_workspaces(*config, ws_name, "adopt");
  if (!selected)
    return 1;

  try {
    std::size_t total = 0;
    for (auto *ws : *selected) {
      const auto adoption = gro::adopt_workspace(*ws, config->store);
      for (const auto &w : adoption.warnings)
        std::cout << "Warning: " << ws->name() << ": " << w << "\n";
      const auto added = gro::merge_adopted(*ws, adoption);
      if (added)
        std::cout << "Adopted " << added << " symlinks from '" << ws->name() << "'\n";
      total += added;
    }

    if (total == 0) {
      std::cout << "Nothing to adopt\n";
      return 0;
    }
    if (gro::cli::options().dry_run) {
      std::cout << "Dry run - config not saved\n";
    } else {
      gro::save_config(*config, gro::cli::config_path());
      std::cout << "Config updated\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "adopt: " << e.what() << "\n";
    return 1;
  }
}
