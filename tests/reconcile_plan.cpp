#include "gro/model.hpp"
#include "gro/plan.hpp"
#include "gro/reconcile.hpp"
#include "gro/scanner.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <variant>

namespace fs = std::filesystem;

static void make_repo(const fs::path &p) { fs::create_directories(p / ".git"); }

static gro::Config make_config(const fs::path &store, const fs::path &ws_root) {
  gro::Config cfg;
  cfg.store = store;
  cfg.workspaces.emplace_back(ws_root);
  return cfg;
}

template <class T> static std::size_t count_of(const gro::Plan &plan) {
  std::size_t n = 0;
  for (const auto &a : plan.actions)
    if (std::holds_alternative<T>(a))
      ++n;
  return n;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gro_reconcile_" + std::to_string(std::random_device{}()));
  const fs::path store = root / "code";
  const fs::path ws_root = root / "Projects";

  try {
    for (const char *r : {"repo-a", "repo-b", "acme-git", "govc"})
      make_repo(store / r);

    auto cfg = make_config(store, ws_root);
    auto &ws = cfg.workspaces.front();
    ws.add_entry(".", gro::RepoEntry::parse("repo-a"));
    ws.add_entry(".", gro::RepoEntry::parse("acme-git:git"));
    ws.add_entry("tools/cli", gro::RepoEntry::parse("govc"));

    // 1) Fresh workspace (not even created): one Create per entry, sorted by location
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (plan.actions.size() != 3 || count_of<gro::CreateAction>(plan) != 3) {
        std::cerr << "fresh: expected 3 creates, got " << plan.actions.size() << "\n";
        return 1;
      }
      const auto &first = std::get<gro::CreateAction>(plan.actions[0]);
      if (first.category != "." || first.symlink_name != "git" || first.repo_name != "acme-git") {
        std::cerr << "fresh: alias should produce link 'git' first, got "
                  << gro::describe(plan.actions[0]) << "\n";
        return 1;
      }
      if (gro::action_relpath(plan.actions[2]) != "tools/cli/govc") {
        std::cerr << "fresh: nested link should sort last\n";
        return 1;
      }
      if (!plan.conflicts.empty() || !plan.warnings.empty()) {
        std::cerr << "fresh: unexpected conflicts or warnings\n";
        return 1;
      }
      if (gro::describe(plan.actions[0]) != "+ git -> acme-git") {
        std::cerr << "describe: got '" << gro::describe(plan.actions[0]) << "'\n";
        return 1;
      }
    }

    // 2) Satisfied links (absolute and relative) produce no actions
    fs::create_directories(ws_root / "tools" / "cli");
    fs::create_directory_symlink(store / "repo-a", ws_root / "repo-a");
    fs::create_directory_symlink("../code/acme-git", ws_root / "git");
    fs::create_directory_symlink(store / "govc", ws_root / "tools" / "cli" / "govc");
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (!plan.empty() || !plan.conflicts.empty() || !plan.warnings.empty()) {
        std::cerr << "satisfied: expected empty plan, got " << plan.actions.size()
                  << " actions\n";
        return 1;
      }
    }

    // 3) A link to the wrong repo is relinked
    fs::remove(ws_root / "repo-a");
    fs::create_directory_symlink(store / "repo-b", ws_root / "repo-a");
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (plan.actions.size() != 1 || count_of<gro::RelinkAction>(plan) != 1) {
        std::cerr << "relink: expected a single relink\n";
        return 1;
      }
      const auto &r = std::get<gro::RelinkAction>(plan.actions[0]);
      if (r.repo_name != "repo-a" || r.old_target.filename() != "repo-b" ||
          r.new_target.filename() != "repo-a") {
        std::cerr << "relink: wrong targets: " << gro::describe(plan.actions[0]) << "\n";
        return 1;
      }
    }
    fs::remove(ws_root / "repo-a");
    fs::create_directory_symlink(store / "repo-a", ws_root / "repo-a");

    // 4) Undeclared link: orphan by default, Remove under prune
    fs::create_directory_symlink(store / "repo-b", ws_root / "tools" / "extra");
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (!plan.empty() || plan.orphans != std::vector<std::string>{"tools/extra"}) {
        std::cerr << "orphan: expected tools/extra reported and left alone\n";
        return 1;
      }
      if (plan.warnings.size() != 1 ||
          plan.warnings[0] != "orphaned symlink 'Projects/tools/extra' (not in config)") {
        std::cerr << "orphan: unexpected warning text\n";
        return 1;
      }

      const auto pruned = gro::reconcile_workspace(cfg, ws, gro::ReconcileOptions{.prune = true});
      if (pruned.actions.size() != 1 || count_of<gro::RemoveAction>(pruned) != 1 ||
          gro::action_relpath(pruned.actions[0]) != "tools/extra" || !pruned.orphans.empty()) {
        std::cerr << "prune: expected one remove of tools/extra\n";
        return 1;
      }
    }
    fs::remove(ws_root / "tools" / "extra");

    // 5) Dangling orphan is flagged as broken
    fs::create_directory_symlink(store / "nowhere", ws_root / "stale");
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (plan.warnings.size() != 1 ||
          plan.warnings[0] != "orphaned symlink 'Projects/stale' (not in config, broken)") {
        std::cerr << "broken orphan: unexpected warnings\n";
        return 1;
      }
    }
    fs::remove(ws_root / "stale");

    // 6) Declared repo missing from the store: still planned, with a warning
    ws.add_entry("tools", gro::RepoEntry::parse("not-cloned"));
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (plan.actions.size() != 1 || count_of<gro::CreateAction>(plan) != 1) {
        std::cerr << "missing repo: expected one create\n";
        return 1;
      }
      if (plan.warnings.size() != 1 ||
          plan.warnings[0].find("repo 'not-cloned' not found in store") != 0) {
        std::cerr << "missing repo: expected a warning\n";
        return 1;
      }
    }

    // 7) Same entry in two categories yields two independent links
    ws.add_entry("mirror", gro::RepoEntry::parse("repo-b"));
    ws.add_entry("tools", gro::RepoEntry::parse("repo-b"));
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      std::vector<std::string> rels;
      for (const auto &a : plan.actions)
        rels.push_back(gro::action_relpath(a));
      const std::vector<std::string> want{"mirror/repo-b", "tools/not-cloned", "tools/repo-b"};
      if (rels != want) {
        std::cerr << "multi-category: unexpected actions\n";
        return 1;
      }
    }

    // 8) Determinism: same inputs, same plan
    {
      const auto a = gro::reconcile_workspace(cfg, ws);
      const auto b = gro::reconcile_workspace(cfg, ws);
      if (a.actions.size() != b.actions.size() || a.warnings != b.warnings) {
        std::cerr << "determinism: plans differ\n";
        return 1;
      }
      for (std::size_t i = 0; i < a.actions.size(); ++i) {
        if (gro::describe(a.actions[i]) != gro::describe(b.actions[i])) {
          std::cerr << "determinism: action " << i << " differs\n";
          return 1;
        }
      }
    }

    std::cout << "reconcile_plan OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
