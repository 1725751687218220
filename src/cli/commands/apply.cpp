#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/executor.hpp"
#include "gro/reconcile.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

int cmd_apply(int argc, char **argv) {
  gro::ReconcileOptions opts;
  std::string ws_name;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--prune") {
      opts.prune = true;
    } else if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else {
      return gro::cli::usage_error("apply");
    }
  }

  auto config = gro::cli::load_config_or_report("apply");
  if (!config)
    return 1;
  const auto selected = gro::cli::select_workspaces(*config, ws_name, "apply");
  if (!selected)
    return 1;

  try {
    std::vector<std::pair<const gro::Workspace *, gro::Plan>> plans;
    bool blocked = false;
    bool any = false;
    for (const auto *ws : *selected) {
      auto plan = gro::reconcile_workspace(*config, *ws, opts);
      for (const auto &c : plan.conflicts) {
        std::cerr << "apply: " << plan.workspace << ": " << gro::describe(c) << "\n";
        blocked = true;
      }
      for (const auto &w : plan.warnings)
        std::cout << "Warning: " << w << "\n";
      any = any || !plan.empty();
      plans.emplace_back(ws, std::move(plan));
    }
    if (blocked) {
      std::cerr << "apply: refusing to apply while conflicts exist (see 'gro check')\n";
      return 1;
    }
    if (!any) {
      std::cout << "Nothing to do - everything is in sync!\n";
      return 0;
    }

    for (const auto &[ws, plan] : plans)
      for (const auto &a : plan.actions)
        std::cout << "  " << plan.workspace << ": " << gro::describe(a) << "\n";

    const bool dry_run = gro::cli::options().dry_run;
    if (dry_run) {
      std::cout << "\nDry run - no changes made\n";
      return 0;
    }

    gro::ApplyResult total;
    for (const auto &[ws, plan] : plans) {
      auto res = gro::apply_plan(ws->path(), config->store, plan);
      auto append = [](auto &dst, auto &src) { dst.insert(dst.end(), src.begin(), src.end()); };
      append(total.created, res.created);
      append(total.updated, res.updated);
      append(total.removed, res.removed);
      append(total.errors, res.errors);
      gro::cleanup_empty_directories(ws->path());
    }

    if (!total.created.empty())
      std::cout << "\nCreated " << total.created.size() << " symlinks\n";
    if (!total.updated.empty())
      std::cout << "Updated " << total.updated.size() << " symlinks\n";
    if (!total.removed.empty())
      std::cout << "Removed " << total.removed.size() << " symlinks\n";
    if (!total.errors.empty()) {
      std::cerr << "\nErrors:\n";
      for (const auto &e : total.errors)
        std::cerr << "  " << e << "\n";
      return 1;
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "apply: " << e.what() << "\n";
    return 1;
  }
}
