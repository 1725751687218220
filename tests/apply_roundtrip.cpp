#include "gro/executor.hpp"
#include "gro/model.hpp"
#include "gro/reconcile.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void make_repo(const fs::path &p) { fs::create_directories(p / ".git"); }

static bool points_to(const fs::path &link, const fs::path &target) {
  std::error_code ec;
  return fs::is_symlink(fs::symlink_status(link)) &&
         fs::equivalent(link, target, ec) && !ec;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gro_apply_" + std::to_string(std::random_device{}()));
  const fs::path store = root / "code";
  const fs::path ws_root = root / "Projects";

  try {
    for (const char *r : {"repo-a", "repo-b", "acme-git", "govc"})
      make_repo(store / r);

    gro::Config cfg;
    cfg.store = store;
    cfg.workspaces.emplace_back(ws_root);
    auto &ws = cfg.workspaces.front();
    ws.add_entry(".", gro::RepoEntry::parse("repo-a"));
    ws.add_entry(".", gro::RepoEntry::parse("acme-git:git"));
    ws.add_entry("tools/cli", gro::RepoEntry::parse("govc"));

    // Dry run reports but touches nothing
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      const auto res = gro::apply_plan(ws_root, store, plan, /*dry_run=*/true);
      if (res.created.size() != 3 || !res.errors.empty()) {
        std::cerr << "dry run: expected 3 would-be creates\n";
        return 1;
      }
      if (fs::exists(ws_root)) {
        std::cerr << "dry run created the workspace\n";
        return 1;
      }
    }

    // Apply creates relative links, directories on demand
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      const auto res = gro::apply_plan(ws_root, store, plan);
      if (res.created.size() != 3 || !res.errors.empty()) {
        std::cerr << "apply: expected 3 creates, errors=" << res.errors.size() << "\n";
        return 1;
      }
      if (res.created[0] != "Projects/git") {
        std::cerr << "apply: created paths should be displayed per workspace\n";
        return 1;
      }
      if (!points_to(ws_root / "git", store / "acme-git") ||
          !points_to(ws_root / "tools" / "cli" / "govc", store / "govc")) {
        std::cerr << "apply: links do not reach the store\n";
        return 1;
      }
      if (fs::read_symlink(ws_root / "tools" / "cli" / "govc").is_absolute()) {
        std::cerr << "apply: links should be relative\n";
        return 1;
      }
    }

    // Idempotent: a second reconcile finds nothing to do
    if (!gro::reconcile_workspace(cfg, ws).empty()) {
      std::cerr << "second reconcile should be empty\n";
      return 1;
    }

    // Relink a link that points at the wrong repo
    fs::remove(ws_root / "repo-a");
    fs::create_directory_symlink(store / "repo-b", ws_root / "repo-a");
    {
      const auto res = gro::apply_plan(ws_root, store, gro::reconcile_workspace(cfg, ws));
      if (res.updated.size() != 1 || !points_to(ws_root / "repo-a", store / "repo-a")) {
        std::cerr << "relink failed\n";
        return 1;
      }
    }

    // Prune removes undeclared links, then empty directories can be cleaned up
    fs::create_directories(ws_root / "old" / "deep");
    fs::create_directory_symlink(store / "repo-b", ws_root / "old" / "deep" / "b");
    make_repo(ws_root / "clone");
    {
      const auto plan = gro::reconcile_workspace(cfg, ws, {.prune = true});
      const auto res = gro::apply_plan(ws_root, store, plan);
      if (res.removed != std::vector<std::string>{"Projects/old/deep/b"}) {
        std::cerr << "prune should remove old/deep/b\n";
        return 1;
      }
      const auto dry = gro::cleanup_empty_directories(ws_root, /*dry_run=*/true);
      if (dry.size() != 2 || !fs::exists(ws_root / "old")) {
        std::cerr << "cleanup dry run: expected old and old/deep listed and kept\n";
        return 1;
      }
      const auto gone = gro::cleanup_empty_directories(ws_root);
      if (gone.size() != 2 || fs::exists(ws_root / "old") || !fs::exists(ws_root / "clone") ||
          !fs::exists(ws_root / "tools" / "cli")) {
        std::cerr << "cleanup should drop old/ only\n";
        return 1;
      }
    }

    // A repo that is itself a symlink inside the store: links go through the store
    // and stay satisfied on the next run
    make_repo(root / "mnt" / "mounted");
    fs::create_directory_symlink(root / "mnt" / "mounted", store / "mounted");
    ws.add_entry("tools", gro::RepoEntry::parse("mounted"));
    {
      const auto res = gro::apply_plan(ws_root, store, gro::reconcile_workspace(cfg, ws));
      if (res.created != std::vector<std::string>{"Projects/tools/mounted"} ||
          !res.errors.empty()) {
        std::cerr << "symlinked store repo: expected one create\n";
        return 1;
      }
      if (fs::read_symlink(ws_root / "tools" / "mounted") != fs::path("../../code/mounted")) {
        std::cerr << "symlinked store repo: link should go through the store, got "
                  << fs::read_symlink(ws_root / "tools" / "mounted") << "\n";
        return 1;
      }
      const auto again = gro::reconcile_workspace(cfg, ws);
      if (!again.empty() || !again.conflicts.empty()) {
        std::cerr << "symlinked store repo: second reconcile should be empty, got "
                  << (again.actions.empty() ? "conflicts" : gro::describe(again.actions[0]))
                  << "\n";
        return 1;
      }
    }

    // Non-empty obstruction at a link path: reported as a conflict, file untouched
    ws.add_entry(".", gro::RepoEntry::parse("repo-b"));
    std::ofstream(ws_root / "repo-b") << "notes\n";
    {
      const auto plan = gro::reconcile_workspace(cfg, ws);
      if (plan.conflicts.size() != 1 || !plan.empty()) {
        std::cerr << "file at link path should conflict\n";
        return 1;
      }
    }

    // Executor refuses to clobber content even when handed a stale plan
    {
      gro::Plan stale;
      stale.workspace = "Projects";
      stale.actions.emplace_back(
          gro::CreateAction{.category = ".", .symlink_name = "repo-b", .repo_name = "repo-b"});
      stale.actions.emplace_back(gro::RemoveAction{.category = "tools", .symlink_name = "cli"});
      const auto res = gro::apply_plan(ws_root, store, stale);
      if (res.errors.size() != 2 || fs::is_symlink(fs::symlink_status(ws_root / "repo-b")) ||
          !fs::is_directory(ws_root / "tools" / "cli")) {
        std::cerr << "executor should refuse to overwrite files or remove directories\n";
        return 1;
      }
    }

    std::cout << "apply_roundtrip OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
