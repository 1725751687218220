#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/config.hpp"
#include "gro/fs.hpp"
#include "gro/model.hpp"
#include "gro/plan.hpp"
#include "gro/scanner.hpp"

#include <filesystem>
#include <iostream>
#include <string>

// Point at a clone living inside a workspace, so the user can move it to the store
static void hint_workspace_clone(const gro::Config &config, const std::string &repo) {
  for (const auto &ws : config.workspaces) {
    const auto snap = gro::snapshot_workspace(ws, config.store);
    for (const auto &rel : snap.clones()) {
      if (gro::split_link_relpath(rel).second == repo) {
        std::cerr << "add: found '" << repo << "' in workspace: " << (ws.path() / rel).string()
                  << "\n";
        std::cerr << "add: move it to " << (config.store / repo).string() << " first\n";
        return;
      }
    }
  }
}

int cmd_add(int argc, char **argv) {
  std::string entry_text;
  std::string ws_name;
  std::string category = ".";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-w" || arg == "--workspace") && i + 1 < argc) {
      ws_name = argv[++i];
    } else if ((arg == "--category" || arg == "-C") && i + 1 < argc) {
      category = argv[++i];
    } else if (entry_text.empty() && !arg.starts_with('-')) {
      entry_text = arg;
    } else {
      entry_text.clear();
      break;
    }
  }
  if (entry_text.empty())
    return gro::cli::usage_error("add");

  const auto entry = gro::RepoEntry::parse(entry_text);
  if (const auto problem = entry.problem()) {
    std::cerr << "add: " << *problem << "\n";
    return 1;
  }
  if (const auto problem = gro::category_problem(category)) {
    std::cerr << "add: " << *problem << "\n";
    return 1;
  }

  auto config = gro::cli::load_config_or_report("add");
  if (!config)
    return 1;
  if (config->workspaces.empty()) {
    std::cerr << "add: no workspaces configured\n";
    return 1;
  }

  try {
    const auto repo_path = config->store / entry.repo_name;
    if (!gro::fs::exists(repo_path)) {
      std::cerr << "add: repo not found: " << repo_path.string() << "\n";
      hint_workspace_clone(*config, entry.repo_name);
      return 1;
    }
    if (!gro::fs::has_repo_marker(repo_path)) {
      std::cerr << "add: not a git repo: " << repo_path.string() << "\n";
      return 1;
    }

    gro::Workspace *ws = ws_name.empty() ? &config->workspaces.front()
                                         : config->find_workspace(ws_name);
    if (!ws) {
      std::cerr << "add: unknown workspace: " << ws_name << "\n";
      return 1;
    }

    const auto cat_path = gro::normalize_category_path(category);
    const auto *cat = ws->find_category(cat_path);
    if (cat && cat->symlink_names().contains(entry.symlink_name())) {
      std::cout << "Already in " << gro::display_path(ws->name(), cat_path, entry.symlink_name())
                << "\n";
      return 0;
    }

    for (const auto &[other_ws, other_cat] : config->find_repo_locations(entry.repo_name))
      std::cout << "Note: '" << entry.repo_name << "' is also in " << other_ws << "/" << other_cat
                << "\n";

    ws->add_entry(cat_path, entry);
    std::cout << "Added " << entry.to_string() << " to "
              << gro::display_path(ws->name(), cat_path, entry.symlink_name()) << "\n";

    if (gro::cli::options().dry_run) {
      std::cout << "Dry run - config not saved\n";
    } else {
      gro::save_config(*config, gro::cli::config_path());
      std::cout << "Config updated\n";
      std::cout << "Run 'gro apply' to create symlinks\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
