#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/plan.hpp"
#include "gro/reconcile.hpp"
#include "gro/scanner.hpp"

#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

int cmd_status(int argc, char **argv) {
  std::string ws_name;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else {
      return gro::cli::usage_error("status");
    }
  }

  auto config = gro::cli::load_config_or_report("status");
  if (!config)
    return 1;
  const auto selected = gro::cli::select_workspaces(*config, ws_name, "status");
  if (!selected)
    return 1;

  try {
    const auto store_list = gro::scan_store(config->store);
    const std::set<std::string> store_repos(store_list.begin(), store_list.end());
    const auto declared = config->all_repos();

    auto print_section = [](const char *header, const std::vector<std::string> &lines) {
      if (lines.empty())
        return;
      std::cout << "\n" << header << "\n";
      for (const auto &l : lines)
        std::cout << "  " << l << "\n";
    };

    std::vector<std::string> uncategorized, missing;
    for (const auto &r : store_repos)
      if (!declared.contains(r))
        uncategorized.push_back("? " + r);
    for (const auto &r : declared)
      if (!store_repos.contains(r))
        missing.push_back("! " + r);

    std::vector<std::string> creates, relinks, orphans, conflicts, clones;
    for (const auto *ws : *selected) {
      const auto snap = gro::snapshot_workspace(*ws, config->store);
      const auto plan = gro::reconcile(*ws, snap, store_repos);
      for (const auto &a : plan.actions) {
        const auto [category, name] = gro::action_location(a);
        const auto shown = gro::display_path(plan.workspace, category, name);
        if (std::holds_alternative<gro::CreateAction>(a))
          creates.push_back("+ " + shown);
        else if (std::holds_alternative<gro::RelinkAction>(a))
          relinks.push_back("~ " + shown);
      }
      for (const auto &rel : plan.orphans)
        orphans.push_back("- " + plan.workspace + "/" + rel);
      for (const auto &c : plan.conflicts)
        conflicts.push_back("! " + plan.workspace + ": " + gro::describe(c));
      for (const auto &rel : snap.clones())
        clones.push_back("? " + plan.workspace + "/" + rel);
    }

    std::vector<std::string> non_repos;
    for (const auto &d : gro::scan_store_non_repos(config->store))
      non_repos.push_back("? " + d);

    print_section("Uncategorized repos in code directory:", uncategorized);
    print_section("Missing repos (in config but not in code):", missing);
    print_section("Symlinks to create:", creates);
    print_section("Symlinks to update:", relinks);
    print_section("Orphaned symlinks (not in config):", orphans);
    print_section("Conflicts:", conflicts);
    print_section("Non-symlink repositories in workspace:", clones);
    print_section("Non-repo directories in code directory:", non_repos);

    const bool changes = !creates.empty() || !relinks.empty() || !orphans.empty();
    const bool attention = !uncategorized.empty() || !missing.empty() || !conflicts.empty() ||
                           !clones.empty() || !non_repos.empty();
    if (!changes && !attention)
      std::cout << "\nEverything is in sync!\n";
    else if (!orphans.empty())
      std::cout << "\nRun 'gro apply --prune' to sync symlinks\n";
    else if (changes)
      std::cout << "\nRun 'gro apply' to sync symlinks\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
