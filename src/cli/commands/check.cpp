#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/config.hpp"
#include "gro/reconcile.hpp"

#include <iostream>

int cmd_check(int argc, char ** /*argv*/) {
  if (argc > 1)
    return gro::cli::usage_error("check");

  auto config = gro::cli::load_config_or_report("check");
  if (!config)
    return 1;

  try {
    const auto warnings = gro::validate_config(*config);
    for (const auto &w : warnings)
      std::cout << "Warning: " << w << "\n";

    std::size_t conflicts = 0;
    for (const auto &ws : config->workspaces) {
      const auto plan = gro::reconcile_workspace(*config, ws);
      for (const auto &c : plan.conflicts)
        std::cout << "Conflict: " << plan.workspace << ": " << gro::describe(c) << "\n";
      conflicts += plan.conflicts.size();
    }

    if (conflicts) {
      std::cout << "\n" << conflicts << " conflict(s) found\n";
      return 1;
    }
    std::cout << (warnings.empty() ? "Config is valid\n" : "Config is valid (with warnings)\n");
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "check: " << e.what() << "\n";
    return 1;
  }
}
